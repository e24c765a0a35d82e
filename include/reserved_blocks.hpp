// ===================== include/reserved_blocks.hpp =====================
#pragma once
#include <optional>
#include <vector>

#include "address.hpp"

namespace ipwho
{
    // IANA blocks that never reach the registries: this-network, private, loopback, link-local.
    const std::vector<Cidr> &reserved_blocks();

    // First block (in list order) that wholly contains addr.
    std::optional<Cidr> classify_reserved(const Ipv4Address &addr, const std::vector<Cidr> &blocks);
} // namespace ipwho
