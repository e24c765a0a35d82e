//// ===================== File: src/geo_resolver.cpp =====================
#include "geo_resolver.hpp"
#include "diag_logger.hpp"
#include "dns_resolver.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"

#include <regex>
#include <stdexcept>
#include <string>

namespace ipwho
{
    static const char *kFields = "?fields=status,countryCode,country,continentCode,regionName,city,lat,lon";

    bool GeoRecord::empty() const
    {
        return !country_code && !country_name && !continent_code && !region && !city && !latitude && !longitude;
    }

    std::string extract_body(const std::string &resp)
    {
        auto p = resp.find("\r\n\r\n");

        if (p == std::string::npos)
            return resp;
        const std::string headers = resp.substr(0, p);
        std::string body = resp.substr(p + 4);

        static const std::regex chunked("transfer-encoding:\\s*chunked", std::regex::icase);
        if (!std::regex_search(headers, chunked))
            return body;

        std::string decoded;
        size_t pos = 0;
        while (pos < body.size())
        {
            size_t line_end = body.find("\r\n", pos);
            if (line_end == std::string::npos)
                break;
            const std::string size_str = body.substr(pos, line_end - pos);
            size_t chunk_size = 0;
            try
            {
                chunk_size = std::stoul(size_str, nullptr, 16);
            }
            catch (const std::logic_error &)
            {
                break; // not a chunk header; keep what was decoded
            }
            pos = line_end + 2;
            if (chunk_size == 0)
                break;
            if (pos + chunk_size > body.size())
                break;
            decoded.append(body, pos, chunk_size);
            pos += chunk_size + 2; // skip CRLF
        }
        return decoded;
    }

    std::optional<GeoRecord> parse_geo_body(const std::string &body)
    {
        if (!std::regex_search(body, std::regex("\"status\"\\s*:\\s*\"success\"")))
            return std::nullopt;

        GeoRecord g{};
        std::smatch m;
        auto grab = [&](const char *key) -> std::optional<std::string>
        {
            const std::regex re(std::string("\"") + key + "\"\\s*:\\s*\"([^\"]*)\"");
            if (!std::regex_search(body, m, re) || m[1].length() == 0)
                return std::nullopt;
            return m[1].str();
        };
        auto grab_num = [&](const char *key) -> std::optional<double>
        {
            const std::regex re(std::string("\"") + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?)");
            if (!std::regex_search(body, m, re))
                return std::nullopt;
            try
            {
                return std::stod(m[1].str());
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        };

        g.country_code = grab("countryCode");
        g.country_name = grab("country");
        g.continent_code = grab("continentCode");
        g.region = grab("regionName");
        g.city = grab("city");
        g.latitude = grab_num("lat");
        g.longitude = grab_num("lon");
        return g;
    }

    GeoResolver::GeoResolver(const std::string &endpoint_url, std::chrono::seconds timeout, DiagLogger *diag)
        : endpoint_(endpoint_url), timeout_(timeout), diag_(diag)
    {
        // an unreachable data source must stop start-up rather than blank every row
        auto addrs = DNSResolver::resolve(endpoint_.host, endpoint_.port);
        if (diag_)
            diag_->info("GEO endpoint " + endpoint_.scheme + "://" + endpoint_.hostHeader() + endpoint_.path +
                        " (" + std::to_string(addrs.size()) + " addresses)");
    }

    std::string GeoResolver::httpGet(const std::string &target)
    {
        const std::string req = endpoint_.toGetRequestString(target);
        auto addrs = DNSResolver::resolve(endpoint_.host, endpoint_.port);
        for (const auto &ra : addrs)
        {
            TcpSocket tcp(timeout_);
            if (!tcp.connectTo(ra))
                continue;

            if (endpoint_.secure())
            {
                SslSession tls;
                if (!tls.handshake(tcp.fd(), endpoint_.host))
                {
                    if (diag_)
                        diag_->warn("GEO TLS handshake with " + endpoint_.host + " failed: " + tls.lastError());
                    return {};
                }
                if (!tls.sendAll(req))
                    return {};
                return tls.recvAll();
            }

            if (!tcp.sendAll(req))
                return {};
            return tcp.recvAll();
        }
        if (diag_)
            diag_->warn("GEO connect failed for all addresses of " + endpoint_.host);
        return {};
    }

    std::optional<GeoRecord> GeoResolver::lookup(const std::string &ip)
    {
        std::string resp;
        try
        {
            resp = httpGet(ip + kFields);
        }
        catch (const std::runtime_error &e)
        {
            if (diag_)
                diag_->warn(std::string("GEO ") + ip + ": " + e.what());
            return std::nullopt;
        }
        if (resp.empty())
            return std::nullopt;

        auto g = parse_geo_body(extract_body(resp));
        if (diag_)
            diag_->debug("GEO " + ip + (g ? " -> hit" : " -> miss"));
        return g;
    }
} // namespace ipwho
