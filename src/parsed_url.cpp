// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"

#include <stdexcept>

namespace ipwho
{
    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        size_t scheme_end = url.find("://");
        size_t host_start = 0;
        if (scheme_end != std::string::npos)
        {
            scheme = url.substr(0, scheme_end);
            host_start = scheme_end + 3;
        }
        if (scheme != "http" && scheme != "https")
            throw std::invalid_argument("unsupported URL scheme: " + scheme);
        port = secure() ? 443 : 80;

        size_t path_start = url.find('/', host_start);
        std::string authority;
        if (path_start != std::string::npos)
        {
            authority = url.substr(host_start, path_start - host_start);
            path = url.substr(path_start);
        }
        else
        {
            authority = url.substr(host_start);
        }

        size_t colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            const std::string p = authority.substr(colon + 1);
            if (p.empty() || p.find_first_not_of("0123456789") != std::string::npos || p.size() > 5)
                throw std::invalid_argument("bad port in URL: " + url);
            port = std::stoi(p);
            if (port < 1 || port > 65535)
                throw std::invalid_argument("bad port in URL: " + url);
            authority.resize(colon);
        }
        host = authority;
        if (host.empty())
            throw std::invalid_argument("URL has no host: " + url);
    }

    std::string ParsedURL::hostHeader() const
    {
        const int def = secure() ? 443 : 80;
        return port == def ? host : host + ":" + std::to_string(port);
    }

    // target is appended to the base path: "/json/" + "8.8.8.8?fields=..."
    std::string ParsedURL::toGetRequestString(const std::string &target) const
    {
        return std::string("GET ") + path + target + " HTTP/1.1\r\n" +
               "Host: " + hostHeader() + "\r\n" +
               "Accept: application/json\r\n" +
               "User-Agent: ipwho\r\n" +
               "Connection: close\r\n\r\n";
    }
} // namespace ipwho
