#include "ip_resolver.hpp"
#include "reserved_blocks.hpp"
#include "fakes.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace ipwho;
using ipwho::test::FakeClock;
using ipwho::test::FakeDnsClient;
using ipwho::test::FakeGeoSource;
using ipwho::test::full_geo;
using namespace std::chrono_literals;

namespace
{
    struct Fixture
    {
        FakeDnsClient dns;
        FakeGeoSource geo;
        FakeClock clock;
        SuffixTree suffixes;

        Fixture()
        {
            suffixes.addRule("com");
            suffixes.addRule("org");
            suffixes.addRule("uk");
            suffixes.addRule("co.uk");
        }

        IpResolver resolver()
        {
            ResolverSettings settings;
            settings.scan_budget = 60s;
            return IpResolver(ResolverContext{dns, geo, suffixes, reserved_blocks(), settings, nullptr, clock.fn()});
        }
    };
} // namespace

TEST_CASE("reserved address never touches DNS", "[resolve]")
{
    Fixture f;
    auto r = f.resolver().resolve("10.1.2.3");

    CHECK(f.dns.calls.empty());
    CHECK(r.ip_address == "10.1.2.3");
    CHECK(r.asn.number == kReservedAsn);
    CHECK(r.asn.country_code == kReservedCountry);
    CHECK(r.asn.cidr == "10.0.0.0/8");
    CHECK(r.name.domain == "10.0.0.0/8");
    CHECK(r.name.host == "10.1.2.3");
    CHECK(r.name.alt.empty());
    // geolocation is still consulted
    CHECK(f.geo.asked == std::vector<std::string>{"10.1.2.3"});
}

TEST_CASE("every reserved block short-circuits", "[resolve]")
{
    Fixture f;
    auto resolver = f.resolver();
    for (const char *ip : {"0.1.2.3", "127.0.0.1", "169.254.1.1", "172.20.0.1", "192.168.0.10"})
    {
        auto r = resolver.resolve(ip);
        CHECK(r.asn.number == "RESERVED");
        CHECK(r.asn.country_code == "--");
        CHECK(r.name.domain == r.asn.cidr);
    }
    CHECK(f.dns.calls.empty());
}

TEST_CASE("full resolution merges asn, names and geolocation", "[resolve]")
{
    Fixture f;
    f.dns.txt("8.8.8.8.asn.routeviews.org", {"15169", "8.8.8.0", "24"});
    f.dns.txt("as15169.asn.cymru.com", {"15169 | US | arin | 2000-03-30 | GOOGLE, US"});
    f.dns.ptr("8.8.8.8.in-addr.arpa", "Dns.Example.COM.");
    f.geo.queue.push_back(full_geo());

    auto r = f.resolver().resolve("8.8.8.8");

    CHECK(r.asn.number == "15169");
    CHECK(r.asn.cidr == "8.8.8.0/24");
    CHECK(r.asn.country_code == "US");
    CHECK(r.name.host == "Dns.Example.COM");
    CHECK(r.name.domain == "example.com");
    CHECK(r.name.alt.empty());
    CHECK(r.geo.city == std::string("Mountain View"));
}

TEST_CASE("alternate name supplies the domain when no direct PTR", "[resolve]")
{
    Fixture f;
    f.dns.txt("9.113.0.203.asn.routeviews.org", {"64500", "203.0.113.0", "24"});
    f.dns.ptr("0.113.0.203.in-addr.arpa", "gw.Provider.co.uk");

    auto r = f.resolver().resolve("203.0.113.9");

    CHECK(r.name.host == "203.0.113.9");
    CHECK(r.name.alt == "gw.Provider.co.uk");
    CHECK(r.name.domain == "provider.co.uk");
}

TEST_CASE("domain is synthesized from the ASN when no name resolves", "[resolve]")
{
    Fixture f;
    f.dns.txt("1.0.51.198.origin.asn.cymru.com", {"64496 | 198.51.0.0/24 | ZZ | x"});

    auto r = f.resolver().resolve("198.51.0.1");

    CHECK(r.name.domain == "#AS64496");
    CHECK(r.name.host == "198.51.0.1");
    CHECK(r.name.alt.empty());
    CHECK(r.asn.country_code.empty());
}

TEST_CASE("host and domain stay non-empty when everything upstream fails", "[resolve]")
{
    Fixture f;
    auto r = f.resolver().resolve("192.0.2.44");

    CHECK(r.name.host == "192.0.2.44");
    CHECK(r.name.domain == kUnknownDomain);
    CHECK(r.asn.number.empty());
    CHECK(r.asn.cidr.empty());
    CHECK(r.asn.country_code.empty());
    CHECK(r.geo.empty());
}

TEST_CASE("malformed address is an input error", "[resolve]")
{
    Fixture f;
    auto resolver = f.resolver();
    CHECK_THROWS_AS(resolver.resolve(std::string("300.1.1.1")), std::invalid_argument);
    CHECK(f.dns.calls.empty());
}

TEST_CASE("geolocation of one result is not shared with the next", "[resolve]")
{
    Fixture f;
    f.geo.queue.push_back(full_geo());
    f.geo.queue.push_back(GeoRecord{});
    auto resolver = f.resolver();

    auto first = resolver.resolve("10.0.0.1");
    const auto snapshot = first.geo;
    auto second = resolver.resolve("10.0.0.2");

    CHECK(second.geo.empty());
    CHECK_FALSE(first.geo.empty());
    CHECK(first.geo.country_code == snapshot.country_code);
    CHECK(first.geo.latitude == snapshot.latitude);
    CHECK(first.geo.city == std::string("Mountain View"));
}
