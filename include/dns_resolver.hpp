// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <resolv.h>

namespace ipwho
{
    class DiagLogger;

    struct ResolvedAddress
    {
        int family;
        int socktype;
        int protocol;
        sockaddr_storage addr;
        socklen_t addrlen;
    };

    // Forward lookup through getaddrinfo; used to reach HTTP endpoints.
    class DNSResolver
    {
    public:
        // Throws std::runtime_error when the name does not resolve.
        static std::vector<ResolvedAddress> resolve(const std::string &host, int port);
    };

    enum class RecordType
    {
        TXT,
        PTR
    };

    enum class DnsStatus
    {
        Ok,
        NxDomain,
        NoAnswer,
        Timeout,
        Failure
    };

    const char *dns_status_name(DnsStatus status);
    const char *record_type_name(RecordType type);

    struct DnsReply
    {
        DnsStatus status = DnsStatus::NoAnswer;
        // TXT: the character-strings of each record. PTR: one target name per record.
        std::vector<std::vector<std::string>> records;

        bool hasAnswer() const { return status == DnsStatus::Ok && !records.empty(); }
    };

    // Decodes a complete DNS response for `type`. The rcode decides NXDOMAIN
    // and failures; records of other types (CNAME chains) are skipped.
    DnsReply parse_answer(const unsigned char *msg, int len, RecordType type);

    // Query seam for the registries and reverse zones. A miss of any kind is
    // reported through DnsReply::status, never thrown.
    class DnsClient
    {
    public:
        virtual ~DnsClient() = default;
        virtual DnsReply query(const std::string &name, RecordType type, std::chrono::seconds timeout) = 0;
    };

    // libresolv builds and decodes the messages; the exchange itself runs on
    // our own sockets so that one query never outlives its timeout, however
    // many servers are configured. Servers are tried in order, each getting an
    // equal share of what is left; a truncated UDP answer is retried over TCP
    // against the same deadline.
    class ResolvDnsClient : public DnsClient
    {
    public:
        // Servers from resolv.conf. Throws std::runtime_error if res_ninit
        // fails or no nameserver is configured.
        explicit ResolvDnsClient(DiagLogger *diag = nullptr);
        // Explicit servers (UDP/TCP port 53 or whatever the address carries).
        ResolvDnsClient(std::vector<ResolvedAddress> servers, DiagLogger *diag = nullptr);
        ~ResolvDnsClient() override;

        ResolvDnsClient(const ResolvDnsClient &) = delete;
        ResolvDnsClient &operator=(const ResolvDnsClient &) = delete;

        DnsReply query(const std::string &name, RecordType type, std::chrono::seconds timeout) override;

        const std::vector<ResolvedAddress> &servers() const { return servers_; }

    private:
        struct __res_state state_;
        std::vector<ResolvedAddress> servers_;
        DiagLogger *diag_;
    };
} // namespace ipwho
