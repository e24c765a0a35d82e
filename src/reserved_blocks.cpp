// ===================== src/reserved_blocks.cpp =====================
#include "reserved_blocks.hpp"

namespace ipwho
{
    const std::vector<Cidr> &reserved_blocks()
    {
        static const std::vector<Cidr> blocks = {
            Cidr(Ipv4Address(0x00000000), 8),  // 0.0.0.0/8
            Cidr(Ipv4Address(0x0A000000), 8),  // 10.0.0.0/8
            Cidr(Ipv4Address(0x7F000000), 8),  // 127.0.0.0/8
            Cidr(Ipv4Address(0xA9FE0000), 16), // 169.254.0.0/16
            Cidr(Ipv4Address(0xAC100000), 12), // 172.16.0.0/12
            Cidr(Ipv4Address(0xC0A80000), 16), // 192.168.0.0/16
        };
        return blocks;
    }

    std::optional<Cidr> classify_reserved(const Ipv4Address &addr, const std::vector<Cidr> &blocks)
    {
        const Cidr self = host_cidr(addr);
        for (const auto &b : blocks)
            if (b.contains(self))
                return b;
        return std::nullopt;
    }
} // namespace ipwho
