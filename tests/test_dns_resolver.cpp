#include "dns_resolver.hpp"

#include <catch2/catch.hpp>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace ipwho;
using namespace std::chrono_literals;

namespace
{
    using Bytes = std::vector<unsigned char>;

    void put16(Bytes &b, unsigned v)
    {
        b.push_back(static_cast<unsigned char>((v >> 8) & 0xff));
        b.push_back(static_cast<unsigned char>(v & 0xff));
    }

    void put_name(Bytes &b, const std::string &dotted)
    {
        size_t start = 0;
        while (start < dotted.size())
        {
            size_t dot = dotted.find('.', start);
            if (dot == std::string::npos)
                dot = dotted.size();
            b.push_back(static_cast<unsigned char>(dot - start));
            b.insert(b.end(), dotted.begin() + static_cast<long>(start), dotted.begin() + static_cast<long>(dot));
            start = dot + 1;
        }
        b.push_back(0);
    }

    // Response header and question; answers are appended with put_rr.
    Bytes message(unsigned rcode, unsigned ancount, const std::string &qname, unsigned qtype)
    {
        Bytes b;
        put16(b, 0x1234);
        put16(b, 0x8180 | rcode); // QR RD RA
        put16(b, 1);
        put16(b, ancount);
        put16(b, 0);
        put16(b, 0);
        put_name(b, qname);
        put16(b, qtype);
        put16(b, ns_c_in);
        return b;
    }

    // Owner is a pointer to the question name at offset 12.
    void put_rr(Bytes &b, unsigned type, const Bytes &rdata)
    {
        b.push_back(0xc0);
        b.push_back(0x0c);
        put16(b, type);
        put16(b, ns_c_in);
        put16(b, 0);
        put16(b, 300);
        put16(b, static_cast<unsigned>(rdata.size()));
        b.insert(b.end(), rdata.begin(), rdata.end());
    }

    Bytes txt_rdata(const std::vector<std::string> &strings)
    {
        Bytes r;
        for (const auto &s : strings)
        {
            r.push_back(static_cast<unsigned char>(s.size()));
            r.insert(r.end(), s.begin(), s.end());
        }
        return r;
    }

    Bytes name_rdata(const std::string &dotted)
    {
        Bytes r;
        put_name(r, dotted);
        return r;
    }

    DnsReply parse(const Bytes &b, RecordType type)
    {
        return parse_answer(b.data(), static_cast<int>(b.size()), type);
    }

    // Answer to `query` (id and question copied) with one PTR, or an empty truncated one.
    Bytes answer_for(const Bytes &query, const std::string &target, bool truncated)
    {
        Bytes b(query.begin(), query.begin() + 2);
        put16(b, truncated ? 0x8380 : 0x8180);
        put16(b, 1);
        put16(b, truncated ? 0 : 1);
        put16(b, 0);
        put16(b, 0);
        b.insert(b.end(), query.begin() + 12, query.end());
        if (!truncated)
            put_rr(b, ns_t_ptr, name_rdata(target));
        return b;
    }

    // Socket on 127.0.0.1; port 0 picks a free one.
    struct LocalSocket
    {
        int fd = -1;
        ResolvedAddress addr{};

        LocalSocket(int socktype, uint16_t port = 0)
        {
            fd = ::socket(AF_INET, socktype, 0);
            if (fd == -1)
                return;
            sockaddr_in sin{};
            sin.sin_family = AF_INET;
            sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            sin.sin_port = htons(port);
            if (::bind(fd, reinterpret_cast<sockaddr *>(&sin), sizeof(sin)) != 0 ||
                (socktype == SOCK_STREAM && ::listen(fd, 1) != 0))
            {
                ::close(fd);
                fd = -1;
                return;
            }
            socklen_t len = sizeof(sin);
            ::getsockname(fd, reinterpret_cast<sockaddr *>(&sin), &len);
            addr.family = AF_INET;
            addr.socktype = socktype;
            addr.addrlen = sizeof(sin);
            std::memcpy(&addr.addr, &sin, sizeof(sin));

            // a responder thread must not outlive a failed test forever
            timeval tv{};
            tv.tv_sec = 5;
            ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }
        ~LocalSocket()
        {
            if (fd != -1)
                ::close(fd);
        }
        LocalSocket(const LocalSocket &) = delete;
        LocalSocket &operator=(const LocalSocket &) = delete;

        uint16_t port() const { return ntohs(reinterpret_cast<const sockaddr_in *>(&addr.addr)->sin_port); }
    };

    double seconds_since(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }
} // namespace

TEST_CASE("TXT answer keeps every character-string", "[dns]")
{
    Bytes m = message(ns_r_noerror, 1, "3.113.0.203.asn.routeviews.org", ns_t_txt);
    put_rr(m, ns_t_txt, txt_rdata({"64500", "203.0.113.0", "24"}));

    DnsReply r = parse(m, RecordType::TXT);
    CHECK(r.status == DnsStatus::Ok);
    REQUIRE(r.records.size() == 1);
    CHECK(r.records[0] == std::vector<std::string>{"64500", "203.0.113.0", "24"});
}

TEST_CASE("TXT string overrunning its record is dropped", "[dns]")
{
    Bytes m = message(ns_r_noerror, 1, "8.8.8.8.origin.asn.cymru.com", ns_t_txt);
    put_rr(m, ns_t_txt, Bytes{3, 'a', 'b', 'c', 10, 'x'});

    DnsReply r = parse(m, RecordType::TXT);
    REQUIRE(r.records.size() == 1);
    CHECK(r.records[0] == std::vector<std::string>{"abc"});
}

TEST_CASE("CNAME records in the answer chain are skipped", "[dns]")
{
    Bytes m = message(ns_r_noerror, 2, "9.113.0.203.in-addr.arpa", ns_t_ptr);
    put_rr(m, ns_t_cname, name_rdata("9.0/25.113.0.203.in-addr.arpa"));
    put_rr(m, ns_t_ptr, name_rdata("host9.example.org"));

    DnsReply r = parse(m, RecordType::PTR);
    CHECK(r.status == DnsStatus::Ok);
    REQUIRE(r.records.size() == 1);
    CHECK(r.records[0] == std::vector<std::string>{"host9.example.org"});
}

TEST_CASE("compressed PTR target is expanded", "[dns]")
{
    Bytes m = message(ns_r_noerror, 1, "1.2.0.192.in-addr.arpa", ns_t_ptr);
    // "host" + pointer to "in-addr.arpa": header 12, then 1 1 1 3 byte labels (2+2+2+4)
    put_rr(m, ns_t_ptr, Bytes{4, 'h', 'o', 's', 't', 0xc0, 22});

    DnsReply r = parse(m, RecordType::PTR);
    REQUIRE(r.hasAnswer());
    CHECK(r.records[0][0] == "host.in-addr.arpa");
}

TEST_CASE("response code decides the status", "[dns]")
{
    CHECK(parse(message(ns_r_nxdomain, 0, "x.example", ns_t_ptr), RecordType::PTR).status == DnsStatus::NxDomain);
    CHECK(parse(message(ns_r_servfail, 0, "x.example", ns_t_ptr), RecordType::PTR).status == DnsStatus::Failure);
    CHECK(parse(message(ns_r_refused, 0, "x.example", ns_t_ptr), RecordType::PTR).status == DnsStatus::Failure);
    CHECK(parse(message(ns_r_noerror, 0, "x.example", ns_t_ptr), RecordType::PTR).status == DnsStatus::NoAnswer);

    Bytes only_cname = message(ns_r_noerror, 1, "x.example", ns_t_ptr);
    put_rr(only_cname, ns_t_cname, name_rdata("y.example"));
    DnsReply r = parse(only_cname, RecordType::PTR);
    CHECK(r.status == DnsStatus::NoAnswer);
    CHECK_FALSE(r.hasAnswer());
}

TEST_CASE("malformed responses are failures", "[dns]")
{
    CHECK(parse(Bytes{1, 2, 3}, RecordType::TXT).status == DnsStatus::Failure);
    // claims an answer it does not carry
    CHECK(parse(message(ns_r_noerror, 1, "x.example", ns_t_txt), RecordType::TXT).status == DnsStatus::Failure);
    CHECK(parse_answer(nullptr, 0, RecordType::TXT).status == DnsStatus::Failure);
}

TEST_CASE("query time stays within its timeout across silent servers", "[dns][net]")
{
    LocalSocket a(SOCK_DGRAM), b(SOCK_DGRAM), c(SOCK_DGRAM);
    REQUIRE(a.fd != -1);
    REQUIRE(b.fd != -1);
    REQUIRE(c.fd != -1);

    ResolvDnsClient dns({a.addr, b.addr, c.addr});
    const auto start = std::chrono::steady_clock::now();
    DnsReply r = dns.query("4.3.2.1.in-addr.arpa", RecordType::PTR, 2s);
    const double elapsed = seconds_since(start);

    CHECK(r.status == DnsStatus::Timeout);
    CHECK(elapsed < 2.5);
    CHECK(elapsed > 1.5);
}

TEST_CASE("a silent server costs only its share of the timeout", "[dns][net]")
{
    LocalSocket silent(SOCK_DGRAM), live(SOCK_DGRAM);
    REQUIRE(silent.fd != -1);
    REQUIRE(live.fd != -1);

    std::thread responder([&]
                          {
        Bytes q(512);
        sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        const ssize_t n = ::recvfrom(live.fd, q.data(), q.size(), 0, reinterpret_cast<sockaddr *>(&peer), &plen);
        if (n < 12)
            return;
        q.resize(static_cast<size_t>(n));
        Bytes reply = answer_for(q, "responder.example", false);
        ::sendto(live.fd, reply.data(), reply.size(), 0, reinterpret_cast<sockaddr *>(&peer), plen); });

    ResolvDnsClient dns({silent.addr, live.addr});
    const auto start = std::chrono::steady_clock::now();
    DnsReply r = dns.query("4.3.2.1.in-addr.arpa", RecordType::PTR, 4s);
    const double elapsed = seconds_since(start);
    responder.join();

    CHECK(r.status == DnsStatus::Ok);
    REQUIRE(r.hasAnswer());
    CHECK(r.records[0][0] == "responder.example");
    // first server gets half of the 4s
    CHECK(elapsed < 3.0);
}

TEST_CASE("truncated UDP answer is retried over TCP", "[dns][net]")
{
    LocalSocket udp(SOCK_DGRAM);
    REQUIRE(udp.fd != -1);
    LocalSocket tcp(SOCK_STREAM, udp.port());
    REQUIRE(tcp.fd != -1);

    std::thread responder([&]
                          {
        Bytes q(512);
        sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        const ssize_t n = ::recvfrom(udp.fd, q.data(), q.size(), 0, reinterpret_cast<sockaddr *>(&peer), &plen);
        if (n < 12)
            return;
        q.resize(static_cast<size_t>(n));
        Bytes tc = answer_for(q, "", true);
        ::sendto(udp.fd, tc.data(), tc.size(), 0, reinterpret_cast<sockaddr *>(&peer), plen);

        const int conn = ::accept(tcp.fd, nullptr, nullptr);
        if (conn == -1)
            return;
        unsigned char prefix[2];
        if (::recv(conn, prefix, sizeof(prefix), MSG_WAITALL) == 2)
        {
            Bytes tq((static_cast<size_t>(prefix[0]) << 8) | prefix[1]);
            if (::recv(conn, tq.data(), tq.size(), MSG_WAITALL) == static_cast<ssize_t>(tq.size()))
            {
                Bytes full = answer_for(tq, "over-tcp.example", false);
                Bytes framed;
                put16(framed, static_cast<unsigned>(full.size()));
                framed.insert(framed.end(), full.begin(), full.end());
                ::send(conn, framed.data(), framed.size(), MSG_NOSIGNAL);
            }
        }
        ::close(conn); });

    ResolvDnsClient dns({udp.addr});
    DnsReply r = dns.query("4.3.2.1.in-addr.arpa", RecordType::PTR, 3s);
    responder.join();

    REQUIRE(r.hasAnswer());
    CHECK(r.records[0][0] == "over-tcp.example");
}

TEST_CASE("client needs a nameserver", "[dns]")
{
    CHECK_THROWS_AS(ResolvDnsClient(std::vector<ResolvedAddress>{}), std::runtime_error);
}
