// ===================== src/name_resolver.cpp =====================
#include "name_resolver.hpp"
#include "diag_logger.hpp"

#include <algorithm>
#include <utility>

namespace ipwho
{
    namespace
    {
        std::string strip_root_dot(std::string name)
        {
            while (!name.empty() && name.back() == '.')
                name.pop_back();
            return name;
        }
    } // namespace

    NameResolver::NameResolver(DnsClient &dns, NameResolverOptions options, DiagLogger *diag, Clock now)
        : dns_(dns), options_(options), diag_(diag), now_(std::move(now))
    {
    }

    Cidr NameResolver::scanRange(const Cidr &block)
    {
        if (block.prefix() > 18)
            return block;
        return Cidr(block.base(), 24);
    }

    std::optional<std::string> NameResolver::lookupPtr(const Ipv4Address &addr, std::chrono::seconds timeout) const
    {
        DnsReply reply = dns_.query(addr.ptrName(), RecordType::PTR, timeout);
        if (!reply.hasAnswer() || reply.records.front().empty())
            return std::nullopt;
        std::string name = strip_root_dot(reply.records.front().front());
        if (name.empty())
            return std::nullopt;
        return name;
    }

    std::optional<std::string> NameResolver::scan(const Ipv4Address &addr, const Cidr &block) const
    {
        using std::chrono::duration_cast;
        using std::chrono::seconds;

        const Cidr range = scanRange(block);
        const auto start = now_();
        const auto deadline = start + options_.scan_budget;
        if (diag_)
            diag_->info("SCAN " + range.toString() + " for " + addr.toString());

        uint64_t queried = 0;
        for (uint64_t i = 0; i < range.size(); ++i)
        {
            const Ipv4Address candidate = range.at(i);
            // both already came back empty before the scan started
            if (candidate == addr || candidate == block.base())
                continue;

            const auto now = now_();
            const auto remaining = duration_cast<seconds>(deadline - now);
            if (now >= deadline || remaining.count() < 1)
            {
                if (diag_)
                    diag_->info("SCAN " + range.toString() + ": budget spent after " + std::to_string(queried) + " queries");
                return std::nullopt;
            }

            ++queried;
            if (auto name = lookupPtr(candidate, std::min(options_.query_timeout, remaining)))
            {
                if (diag_)
                    diag_->info("SCAN " + range.toString() + ": " + candidate.toString() + " -> " + *name);
                return name;
            }
        }
        if (diag_)
            diag_->info("SCAN " + range.toString() + ": exhausted, " + std::to_string(queried) + " queries");
        return std::nullopt;
    }

    NameResult NameResolver::resolve(const Ipv4Address &addr, const std::optional<Cidr> &block) const
    {
        NameResult result;
        result.primary_name = lookupPtr(addr, options_.query_timeout);
        if (result.primary_name)
            return result;

        if (!block)
            return result;

        if (block->base() != addr)
            result.alternate_name = lookupPtr(block->base(), options_.query_timeout);
        if (!result.alternate_name)
            result.alternate_name = scan(addr, *block);
        return result;
    }
} // namespace ipwho
