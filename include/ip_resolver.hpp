// ===================== include/ip_resolver.hpp =====================
#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "address.hpp"
#include "asn_resolver.hpp"
#include "dns_resolver.hpp"
#include "geo_resolver.hpp"
#include "name_resolver.hpp"
#include "suffix_tree.hpp"

namespace ipwho
{
    class DiagLogger;

    // Sentinels for addresses inside a reserved block.
    constexpr const char *kReservedAsn = "RESERVED";
    constexpr const char *kReservedCountry = "--";
    // Domain when neither a name nor an ASN came back.
    constexpr const char *kUnknownDomain = "#UNKNOWN";

    struct AsnSummary
    {
        std::string cidr;
        std::string number;
        std::string country_code;
    };

    struct NameSummary
    {
        std::string domain; // never empty
        std::string host;   // PTR name, or the address itself
        std::string alt;    // neighbour-derived name, empty if unused
    };

    struct ResolutionResult
    {
        std::string ip_address;
        GeoRecord geo;
        AsnSummary asn;
        NameSummary name;
    };

    struct ResolverSettings
    {
        AsnRegistries registries;
        std::chrono::seconds query_timeout{30};
        std::chrono::seconds scan_budget{60};
    };

    // Long-lived collaborators; all must outlive the IpResolver.
    struct ResolverContext
    {
        DnsClient &dns;
        GeoSource &geo;
        const SuffixTree &suffixes;
        const std::vector<Cidr> &reserved;
        ResolverSettings settings;
        DiagLogger *diag = nullptr;
        NameResolver::Clock clock = &clk::now;
    };

    class IpResolver
    {
    public:
        explicit IpResolver(const ResolverContext &ctx);

        ResolutionResult resolve(const Ipv4Address &addr) const;
        // Throws std::invalid_argument for a malformed address.
        ResolutionResult resolve(const std::string &text) const;

    private:
        std::string domainFor(const std::string &name) const;

        GeoSource &geo_;
        const SuffixTree &suffixes_;
        const std::vector<Cidr> &reserved_;
        DiagLogger *diag_;
        AsnResolver asn_;
        NameResolver names_;
    };
} // namespace ipwho
