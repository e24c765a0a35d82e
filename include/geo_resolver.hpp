//// ===================== File: include/geo_resolver.hpp =====================
#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "parsed_url.hpp"


namespace ipwho {
class DiagLogger;

// All fields optional; a default-constructed record means "no geolocation".
struct GeoRecord {
std::optional<std::string> country_code; // e.g., "US"
std::optional<std::string> country_name; // e.g., "United States"
std::optional<std::string> continent_code; // e.g., "NA"
std::optional<std::string> region; // e.g., "Virginia"
std::optional<std::string> city;
std::optional<double> latitude;
std::optional<double> longitude;

bool empty() const;
};


// Read-only geolocation lookup keyed by the textual IP address.
class GeoSource {
public:
virtual ~GeoSource() = default;
virtual std::optional<GeoRecord> lookup(const std::string& ip) = 0;
};


// Parses an ip-api style JSON body; nullopt unless "status":"success".
std::optional<GeoRecord> parse_geo_body(const std::string& body);

// Strips the HTTP head and undoes chunked transfer encoding.
std::string extract_body(const std::string& resp);


// ip-api compatible service over HTTP or HTTPS.
// Example: GET /json/8.8.8.8?fields=status,countryCode,country,...
class GeoResolver : public GeoSource {
public:
// Throws std::invalid_argument for a bad URL and std::runtime_error
// when the endpoint host does not resolve.
explicit GeoResolver(const std::string& endpoint_url,
std::chrono::seconds timeout = std::chrono::seconds(30),
DiagLogger* diag = nullptr);

std::optional<GeoRecord> lookup(const std::string& ip) override;

private:
std::string httpGet(const std::string& target);

ParsedURL endpoint_;
std::chrono::seconds timeout_;
DiagLogger* diag_;
};
} // namespace ipwho
