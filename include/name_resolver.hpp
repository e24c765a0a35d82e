// ===================== include/name_resolver.hpp =====================
#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "address.hpp"
#include "dns_resolver.hpp"

namespace ipwho
{
    class DiagLogger;

    using clk = std::chrono::steady_clock;

    struct NameResult
    {
        std::optional<std::string> primary_name;   // direct PTR of the address
        std::optional<std::string> alternate_name; // CIDR base or neighbourhood scan
    };

    struct NameResolverOptions
    {
        std::chrono::seconds query_timeout{30};
        std::chrono::seconds scan_budget{60};
    };

    class NameResolver
    {
    public:
        using Clock = std::function<clk::time_point()>;

        NameResolver(DnsClient &dns, NameResolverOptions options, DiagLogger *diag = nullptr,
                     Clock now = &clk::now);

        NameResult resolve(const Ipv4Address &addr, const std::optional<Cidr> &block) const;

        // Blocks narrower than /18 are scanned whole; wider ones only in their first /24.
        static Cidr scanRange(const Cidr &block);

    private:
        std::optional<std::string> lookupPtr(const Ipv4Address &addr, std::chrono::seconds timeout) const;
        std::optional<std::string> scan(const Ipv4Address &addr, const Cidr &block) const;

        DnsClient &dns_;
        NameResolverOptions options_;
        DiagLogger *diag_;
        Clock now_;
    };
} // namespace ipwho
