// ===================== src/app_config.cpp =====================
#include "app_config.hpp"

#include <stdexcept>

namespace ipwho
{
    namespace
    {
        std::chrono::seconds parse_seconds(const char *name, const std::string &v)
        {
            if (v.empty() || v.size() > 6 || v.find_first_not_of("0123456789") != std::string::npos)
                throw std::invalid_argument(std::string(name) + ": expected a positive number of seconds, got '" + v + "'");
            const int n = std::stoi(v);
            if (n <= 0)
                throw std::invalid_argument(std::string(name) + ": must be greater than zero");
            return std::chrono::seconds(n);
        }

        bool parse_flag(const char *name, const std::string &v)
        {
            if (v == "1" || v == "true" || v == "yes")
                return true;
            if (v == "0" || v == "false" || v == "no" || v.empty())
                return false;
            throw std::invalid_argument(std::string(name) + ": expected 0/1, got '" + v + "'");
        }
    } // namespace

    AppConfig AppConfig::fromEnvironment(const std::function<const char *(const char *)> &lookup)
    {
        AppConfig cfg;
        auto get = [&](const char *name, std::string &out)
        {
            const char *v = lookup(name);
            if (v == nullptr)
                return false;
            out = v;
            return true;
        };

        std::string v;
        if (get("IPWHO_SUFFIX_LIST", v) && !v.empty())
            cfg.suffix_list = v;
        if (get("IPWHO_SUFFIX_PRIVATE", v))
            cfg.suffix_private = parse_flag("IPWHO_SUFFIX_PRIVATE", v);
        if (get("IPWHO_GEO_URL", v) && !v.empty())
            cfg.geo_url = v;
        if (get("IPWHO_ASN_REGISTRY_A", v) && !v.empty())
            cfg.registries.registry_a = v;
        if (get("IPWHO_ASN_REGISTRY_B", v) && !v.empty())
            cfg.registries.registry_b = v;
        if (get("IPWHO_DNS_TIMEOUT", v))
            cfg.dns_timeout = parse_seconds("IPWHO_DNS_TIMEOUT", v);
        if (get("IPWHO_SCAN_BUDGET", v))
            cfg.scan_budget = parse_seconds("IPWHO_SCAN_BUDGET", v);
        if (get("IPWHO_LOG", v))
            cfg.log_path = v;
        if (get("IPWHO_LOG_LEVEL", v))
            cfg.log_level = parse_diag_level(v);
        return cfg;
    }
} // namespace ipwho
