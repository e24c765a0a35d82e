// ===================== include/app_config.hpp =====================
#pragma once
#include <chrono>
#include <functional>
#include <string>

#include "asn_resolver.hpp"
#include "diag_logger.hpp"

namespace ipwho
{
    // Runtime settings. The CLI takes only addresses, so everything else
    // comes from IPWHO_* environment variables.
    struct AppConfig
    {
        std::string suffix_list = "/usr/share/publicsuffix/public_suffix_list.dat";
        bool suffix_private = false;
        std::string geo_url = "http://ip-api.com/json/";
        AsnRegistries registries;
        std::chrono::seconds dns_timeout{30};
        std::chrono::seconds scan_budget{60};
        std::string log_path;
        DiagLevel log_level = DiagLevel::Info;

        // lookup returns nullptr for unset variables (std::getenv shape).
        // Throws std::invalid_argument on malformed values.
        static AppConfig fromEnvironment(const std::function<const char *(const char *)> &lookup);
    };
} // namespace ipwho
