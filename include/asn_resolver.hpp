// ===================== include/asn_resolver.hpp =====================
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "address.hpp"
#include "dns_resolver.hpp"

namespace ipwho
{
    class DiagLogger;

    struct AsnRecord
    {
        std::optional<std::string> number; // e.g. "15169"
        std::optional<Cidr> cidr;
        std::optional<std::string> country_code;
    };

    struct AsnRegistries
    {
        std::string registry_a = "routeviews.org"; // <rev>.asn.<a>: "asn" "prefix" "width"
        std::string registry_b = "cymru.com";      // <rev>.origin.asn.<b>: "asn | prefix/width | ..."
    };

    // "64500" "203.0.113.0" "24"
    std::optional<AsnRecord> parse_registry_a(const std::vector<std::string> &fields);
    // "64500 | 203.0.113.0/24 | ..."
    std::optional<AsnRecord> parse_registry_b(const std::vector<std::string> &fields);
    // "64500 | US | ..."
    std::optional<std::string> parse_asn_country(const std::vector<std::string> &fields);

    class AsnResolver
    {
    public:
        AsnResolver(DnsClient &dns, AsnRegistries registries, std::chrono::seconds timeout,
                    DiagLogger *diag = nullptr);

        // reversed: the reverse-label form of the address, e.g. "3.2.1.10".
        // Never throws on lookup misses; absent fields stay disengaged.
        AsnRecord resolve(const std::string &reversed) const;

    private:
        std::optional<std::vector<std::string>> firstTxt(const std::string &name) const;

        DnsClient &dns_;
        AsnRegistries registries_;
        std::chrono::seconds timeout_;
        DiagLogger *diag_;
    };
} // namespace ipwho
