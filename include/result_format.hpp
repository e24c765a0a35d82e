// ===================== include/result_format.hpp =====================
#pragma once
#include <string>

#include "ip_resolver.hpp"

namespace ipwho
{
    constexpr const char *kPlaceholder = "-";

    // One tab-separated line:
    // ip  asnCC:asn:cidr  geoCC  domain  lat,lon  host/alt  country, region, city
    std::string format_line(const ResolutionResult &r);
} // namespace ipwho
