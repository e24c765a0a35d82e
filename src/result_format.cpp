// ===================== src/result_format.cpp =====================
#include "result_format.hpp"

#include <iomanip>
#include <sstream>

namespace ipwho
{
    namespace
    {
        std::string or_placeholder(const std::string &s)
        {
            return s.empty() ? std::string(kPlaceholder) : s;
        }

        std::string or_placeholder(const std::optional<std::string> &s)
        {
            return s && !s->empty() ? *s : std::string(kPlaceholder);
        }

        std::string coord(const std::optional<double> &v)
        {
            if (!v)
                return kPlaceholder;
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(4) << *v;
            return oss.str();
        }
    } // namespace

    std::string format_line(const ResolutionResult &r)
    {
        std::ostringstream out;
        out << r.ip_address << '\t'
            << or_placeholder(r.asn.country_code) << ':' << or_placeholder(r.asn.number) << ':'
            << or_placeholder(r.asn.cidr) << '\t'
            << or_placeholder(r.geo.country_code) << '\t'
            << or_placeholder(r.name.domain) << '\t'
            << coord(r.geo.latitude) << ',' << coord(r.geo.longitude) << '\t'
            << or_placeholder(r.name.host) << '/' << or_placeholder(r.name.alt) << '\t'
            << or_placeholder(r.geo.country_name) << ", " << or_placeholder(r.geo.region) << ", "
            << or_placeholder(r.geo.city);
        return out.str();
    }
} // namespace ipwho
