// ===================== include/parsed_url.hpp =====================
#pragma once
#include <string>

namespace ipwho
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "ip-api.com"
        int port = 80;      // explicit ":port" or the scheme default
        std::string path;   // e.g., "/json/"

        // Throws std::invalid_argument for an unsupported scheme, empty host or bad port.
        explicit ParsedURL(const std::string &url);

        bool secure() const { return scheme == "https"; }
        std::string hostHeader() const;
        std::string toGetRequestString(const std::string &target) const;
    };
} // namespace ipwho
