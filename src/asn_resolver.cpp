// ===================== src/asn_resolver.cpp =====================
#include "asn_resolver.hpp"
#include "diag_logger.hpp"

#include <functional>
#include <regex>
#include <stdexcept>
#include <utility>

namespace ipwho
{
    namespace
    {
        bool all_digits(const std::string &s)
        {
            if (s.empty())
                return false;
            for (char c : s)
                if (c < '0' || c > '9')
                    return false;
            return true;
        }
    } // namespace

    std::optional<AsnRecord> parse_registry_a(const std::vector<std::string> &fields)
    {
        if (fields.size() != 3 || !all_digits(fields[0]))
            return std::nullopt;
        AsnRecord rec;
        rec.number = fields[0];
        try
        {
            rec.cidr = Cidr::fromParts(fields[1], fields[2]);
        }
        catch (const std::invalid_argument &)
        {
            return std::nullopt;
        }
        return rec;
    }

    std::optional<AsnRecord> parse_registry_b(const std::vector<std::string> &fields)
    {
        if (fields.size() != 1)
            return std::nullopt;
        static const std::regex re(R"(^\s*(\d+)(?:\s+\d+)*\s*\|\s*([0-9.]+)/(\d+)\s*\|)");
        std::smatch m;
        if (!std::regex_search(fields[0], m, re))
            return std::nullopt;
        AsnRecord rec;
        rec.number = m[1].str();
        try
        {
            rec.cidr = Cidr::fromParts(m[2].str(), m[3].str());
        }
        catch (const std::invalid_argument &)
        {
            return std::nullopt;
        }
        return rec;
    }

    std::optional<std::string> parse_asn_country(const std::vector<std::string> &fields)
    {
        if (fields.size() != 1)
            return std::nullopt;
        static const std::regex re(R"(^\s*(\d+)\s*\|\s*([A-Za-z]{2})\s*\|)");
        std::smatch m;
        if (!std::regex_search(fields[0], m, re))
            return std::nullopt;
        return m[2].str();
    }

    AsnResolver::AsnResolver(DnsClient &dns, AsnRegistries registries, std::chrono::seconds timeout,
                             DiagLogger *diag)
        : dns_(dns), registries_(std::move(registries)), timeout_(timeout), diag_(diag)
    {
    }

    std::optional<std::vector<std::string>> AsnResolver::firstTxt(const std::string &name) const
    {
        DnsReply reply = dns_.query(name, RecordType::TXT, timeout_);
        if (!reply.hasAnswer())
            return std::nullopt;
        return reply.records.front();
    }

    AsnRecord AsnResolver::resolve(const std::string &reversed) const
    {
        using Attempt = std::function<std::optional<AsnRecord>()>;
        const std::vector<std::pair<const char *, Attempt>> attempts = {
            {"registry-a", [&]() -> std::optional<AsnRecord>
             {
                 auto txt = firstTxt(reversed + ".asn." + registries_.registry_a);
                 return txt ? parse_registry_a(*txt) : std::nullopt;
             }},
            {"registry-b", [&]() -> std::optional<AsnRecord>
             {
                 auto txt = firstTxt(reversed + ".origin.asn." + registries_.registry_b);
                 return txt ? parse_registry_b(*txt) : std::nullopt;
             }},
        };

        AsnRecord rec;
        for (const auto &attempt : attempts)
        {
            if (auto hit = attempt.second())
            {
                rec = *hit;
                if (diag_)
                    diag_->info(std::string("ASN ") + reversed + ": " + attempt.first + " -> AS" + *rec.number +
                                " " + (rec.cidr ? rec.cidr->toString() : std::string("-")));
                break;
            }
            if (diag_)
                diag_->debug(std::string("ASN ") + reversed + ": " + attempt.first + " gave no data");
        }

        if (!rec.number)
            return rec;

        if (auto txt = firstTxt("as" + *rec.number + ".asn." + registries_.registry_b))
            rec.country_code = parse_asn_country(*txt);
        if (diag_ && !rec.country_code)
            diag_->debug("ASN AS" + *rec.number + ": no country");
        return rec;
    }
} // namespace ipwho
