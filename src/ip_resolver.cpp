// ===================== src/ip_resolver.cpp =====================
#include "ip_resolver.hpp"
#include "diag_logger.hpp"
#include "reserved_blocks.hpp"

#include <algorithm>
#include <cctype>

namespace ipwho
{
    IpResolver::IpResolver(const ResolverContext &ctx)
        : geo_(ctx.geo),
          suffixes_(ctx.suffixes),
          reserved_(ctx.reserved),
          diag_(ctx.diag),
          asn_(ctx.dns, ctx.settings.registries, ctx.settings.query_timeout, ctx.diag),
          names_(ctx.dns, NameResolverOptions{ctx.settings.query_timeout, ctx.settings.scan_budget}, ctx.diag, ctx.clock)
    {
    }

    std::string IpResolver::domainFor(const std::string &name) const
    {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return suffixes_.registrableDomain(lower);
    }

    ResolutionResult IpResolver::resolve(const std::string &text) const
    {
        return resolve(Ipv4Address::parse(text));
    }

    ResolutionResult IpResolver::resolve(const Ipv4Address &addr) const
    {
        ResolutionResult r;
        r.ip_address = addr.toString();

        AsnRecord asn;
        NameResult names;
        std::string domain;

        if (auto block = classify_reserved(addr, reserved_))
        {
            asn.cidr = *block;
            asn.number = kReservedAsn;
            asn.country_code = kReservedCountry;
            domain = block->toString();
            if (diag_)
                diag_->info("RESOLVE " + r.ip_address + ": reserved " + domain);
        }
        else
        {
            asn = asn_.resolve(addr.reversedLabels());
            names = names_.resolve(addr, asn.cidr);
        }

        if (domain.empty())
        {
            if (names.primary_name)
                domain = domainFor(*names.primary_name);
            else if (names.alternate_name)
                domain = domainFor(*names.alternate_name);
            else if (asn.number)
                domain = "#AS" + *asn.number;
        }
        if (domain.empty())
            domain = kUnknownDomain;

        r.asn.cidr = asn.cidr ? asn.cidr->toString() : std::string();
        r.asn.number = asn.number.value_or("");
        r.asn.country_code = asn.country_code.value_or("");
        r.name.domain = domain;
        r.name.host = names.primary_name.value_or(r.ip_address);
        r.name.alt = names.alternate_name.value_or("");

        if (auto g = geo_.lookup(r.ip_address))
            r.geo = *g;

        if (diag_)
            diag_->info("RESOLVE " + r.ip_address + ": AS" + (r.asn.number.empty() ? "-" : r.asn.number) +
                        " domain=" + r.name.domain + " host=" + r.name.host);
        return r;
    }
} // namespace ipwho
