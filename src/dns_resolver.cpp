// ===================== src/dns_resolver.cpp =====================
#include "dns_resolver.hpp"
#include "diag_logger.hpp"

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace ipwho
{
    std::vector<ResolvedAddress> DNSResolver::resolve(const std::string &host, int port)
    {
        std::vector<ResolvedAddress> results;

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_ADDRCONFIG;
        addrinfo *res = nullptr;

        const std::string portStr = std::to_string(port);
        int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
        if (status != 0)
        {
            throw std::runtime_error(std::string("DNS resolution failed for ") + host + ": " + gai_strerror(status));
        }

        for (auto *p = res; p != nullptr; p = p->ai_next)
        {
            ResolvedAddress ra{};
            ra.family = p->ai_family;
            ra.socktype = p->ai_socktype;
            ra.protocol = p->ai_protocol;
            ra.addrlen = static_cast<socklen_t>(p->ai_addrlen);
            std::memcpy(&ra.addr, p->ai_addr, p->ai_addrlen);
            results.push_back(ra);
        }
        freeaddrinfo(res);
        return results;
    }

    const char *dns_status_name(DnsStatus status)
    {
        switch (status)
        {
        case DnsStatus::Ok:
            return "ok";
        case DnsStatus::NxDomain:
            return "nxdomain";
        case DnsStatus::NoAnswer:
            return "noanswer";
        case DnsStatus::Timeout:
            return "timeout";
        case DnsStatus::Failure:
            return "failure";
        }
        return "?";
    }

    const char *record_type_name(RecordType type)
    {
        return type == RecordType::TXT ? "TXT" : "PTR";
    }

    namespace
    {
        using dns_clock = std::chrono::steady_clock;

        // TXT RDATA is a run of <len><bytes> character-strings.
        std::vector<std::string> split_txt(const unsigned char *rdata, int rdlen)
        {
            std::vector<std::string> out;
            int pos = 0;
            while (pos < rdlen)
            {
                const int n = rdata[pos];
                if (pos + 1 + n > rdlen)
                    break;
                out.emplace_back(reinterpret_cast<const char *>(rdata + pos + 1), static_cast<size_t>(n));
                pos += 1 + n;
            }
            return out;
        }

        std::string server_label(const ResolvedAddress &ra)
        {
            char host[INET6_ADDRSTRLEN] = {0};
            int port = 0;
            if (ra.family == AF_INET)
            {
                const auto *sin = reinterpret_cast<const sockaddr_in *>(&ra.addr);
                ::inet_ntop(AF_INET, &sin->sin_addr, host, sizeof(host));
                port = ntohs(sin->sin_port);
            }
            else if (ra.family == AF_INET6)
            {
                const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(&ra.addr);
                ::inet_ntop(AF_INET6, &sin6->sin6_addr, host, sizeof(host));
                port = ntohs(sin6->sin6_port);
            }
            return std::string(host) + "#" + std::to_string(port);
        }

        class ScopedFd
        {
        public:
            explicit ScopedFd(int fd) : fd_(fd) {}
            ~ScopedFd()
            {
                if (fd_ != -1)
                    ::close(fd_);
            }
            ScopedFd(const ScopedFd &) = delete;
            ScopedFd &operator=(const ScopedFd &) = delete;

            int get() const { return fd_; }

        private:
            int fd_;
        };

        enum class Exchange
        {
            Answer,
            Timeout,
            Error
        };

        int ms_left(dns_clock::time_point deadline)
        {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - dns_clock::now()).count();
            return left > 0 ? static_cast<int>(left) : 0;
        }

        // false once the deadline passes; poll errors are left for the following send/recv to report
        bool wait_for(int fd, short events, dns_clock::time_point deadline)
        {
            while (true)
            {
                const int left = ms_left(deadline);
                if (left <= 0)
                    return false;
                pollfd pfd{fd, events, 0};
                const int rc = ::poll(&pfd, 1, left);
                if (rc > 0)
                    return true;
                if (rc == 0 || errno != EINTR)
                    return false;
            }
        }

        bool matches_query(const std::vector<unsigned char> &query, const unsigned char *answer, size_t len)
        {
            // same id, QR set
            return len >= NS_HFIXEDSZ && answer[0] == query[0] && answer[1] == query[1] && (answer[2] & 0x80) != 0;
        }

        bool truncated(const std::vector<unsigned char> &answer)
        {
            return answer.size() >= NS_HFIXEDSZ && (answer[2] & 0x02) != 0;
        }

        Exchange udp_exchange(const ResolvedAddress &server, const std::vector<unsigned char> &query,
                              dns_clock::time_point deadline, std::vector<unsigned char> &answer)
        {
            ScopedFd sock(::socket(server.family, SOCK_DGRAM, 0));
            if (sock.get() == -1)
                return Exchange::Error;
            // connected, so an ICMP refusal surfaces as ECONNREFUSED
            if (::connect(sock.get(), reinterpret_cast<const sockaddr *>(&server.addr), server.addrlen) != 0)
                return Exchange::Error;
            if (::send(sock.get(), query.data(), query.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(query.size()))
                return Exchange::Error;

            answer.resize(NS_MAXMSG);
            while (wait_for(sock.get(), POLLIN, deadline))
            {
                const ssize_t n = ::recv(sock.get(), answer.data(), answer.size(), 0);
                if (n < 0)
                {
                    if (errno == EINTR)
                        continue;
                    return Exchange::Error;
                }
                // stray datagrams (late answers to an earlier id) are dropped
                if (!matches_query(query, answer.data(), static_cast<size_t>(n)))
                    continue;
                answer.resize(static_cast<size_t>(n));
                return Exchange::Answer;
            }
            return Exchange::Timeout;
        }

        Exchange send_exact(int fd, const unsigned char *data, size_t len, dns_clock::time_point deadline)
        {
            size_t sent = 0;
            while (sent < len)
            {
                if (!wait_for(fd, POLLOUT, deadline))
                    return Exchange::Timeout;
                const ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
                if (n < 0)
                {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                        continue;
                    return Exchange::Error;
                }
                sent += static_cast<size_t>(n);
            }
            return Exchange::Answer;
        }

        Exchange recv_exact(int fd, unsigned char *data, size_t len, dns_clock::time_point deadline)
        {
            size_t got = 0;
            while (got < len)
            {
                if (!wait_for(fd, POLLIN, deadline))
                    return Exchange::Timeout;
                const ssize_t n = ::recv(fd, data + got, len - got, 0);
                if (n == 0)
                    return Exchange::Error;
                if (n < 0)
                {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                        continue;
                    return Exchange::Error;
                }
                got += static_cast<size_t>(n);
            }
            return Exchange::Answer;
        }

        // RFC 1035 4.2.2 framing: two length octets ahead of each message.
        Exchange tcp_exchange(const ResolvedAddress &server, const std::vector<unsigned char> &query,
                              dns_clock::time_point deadline, std::vector<unsigned char> &answer)
        {
            ScopedFd sock(::socket(server.family, SOCK_STREAM, 0));
            if (sock.get() == -1)
                return Exchange::Error;
            const int flags = ::fcntl(sock.get(), F_GETFL, 0);
            if (flags == -1 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) == -1)
                return Exchange::Error;

            if (::connect(sock.get(), reinterpret_cast<const sockaddr *>(&server.addr), server.addrlen) != 0)
            {
                if (errno != EINPROGRESS)
                    return Exchange::Error;
                if (!wait_for(sock.get(), POLLOUT, deadline))
                    return Exchange::Timeout;
                int err = 0;
                socklen_t len = sizeof(err);
                if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0)
                    return Exchange::Error;
            }

            std::vector<unsigned char> framed;
            framed.reserve(query.size() + 2);
            framed.push_back(static_cast<unsigned char>(query.size() >> 8));
            framed.push_back(static_cast<unsigned char>(query.size() & 0xff));
            framed.insert(framed.end(), query.begin(), query.end());
            Exchange ex = send_exact(sock.get(), framed.data(), framed.size(), deadline);
            if (ex != Exchange::Answer)
                return ex;

            unsigned char prefix[2];
            ex = recv_exact(sock.get(), prefix, sizeof(prefix), deadline);
            if (ex != Exchange::Answer)
                return ex;
            answer.resize((static_cast<size_t>(prefix[0]) << 8) | prefix[1]);
            ex = recv_exact(sock.get(), answer.data(), answer.size(), deadline);
            if (ex != Exchange::Answer)
                return ex;
            return matches_query(query, answer.data(), answer.size()) ? Exchange::Answer : Exchange::Error;
        }
    } // namespace

    DnsReply parse_answer(const unsigned char *msg, int len, RecordType type)
    {
        DnsReply reply;
        ns_msg handle;
        if (msg == nullptr || len < NS_HFIXEDSZ || ns_initparse(msg, len, &handle) < 0)
        {
            reply.status = DnsStatus::Failure;
            return reply;
        }

        switch (msg[3] & 0x0f)
        {
        case ns_r_noerror:
            break;
        case ns_r_nxdomain:
            reply.status = DnsStatus::NxDomain;
            return reply;
        default:
            // SERVFAIL, REFUSED and the rest
            reply.status = DnsStatus::Failure;
            return reply;
        }

        const int qtype = type == RecordType::TXT ? ns_t_txt : ns_t_ptr;
        const int count = ns_msg_count(handle, ns_s_an);
        for (int i = 0; i < count; ++i)
        {
            ns_rr rr;
            if (ns_parserr(&handle, ns_s_an, i, &rr) < 0)
                continue;
            // CNAMEs in the answer chain carry no data for us
            if (ns_rr_type(rr) != qtype)
                continue;

            const unsigned char *rdata = ns_rr_rdata(rr);
            const int rdlen = ns_rr_rdlen(rr);
            if (type == RecordType::TXT)
            {
                reply.records.push_back(split_txt(rdata, rdlen));
            }
            else
            {
                char target[NS_MAXDNAME];
                if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), rdata, target, sizeof(target)) < 0)
                    continue;
                reply.records.push_back({std::string(target)});
            }
        }

        reply.status = reply.records.empty() ? DnsStatus::NoAnswer : DnsStatus::Ok;
        return reply;
    }

    ResolvDnsClient::ResolvDnsClient(DiagLogger *diag) : diag_(diag)
    {
        std::memset(&state_, 0, sizeof(state_));
        if (res_ninit(&state_) != 0)
            throw std::runtime_error("res_ninit failed: cannot read resolver configuration");

        for (int i = 0; i < state_.nscount && i < MAXNS; ++i)
        {
            ResolvedAddress ra{};
            ra.socktype = SOCK_DGRAM;
            const sockaddr_in &v4 = state_.nsaddr_list[i];
            const sockaddr_in6 *v6 = state_._u._ext.nsaddrs[i];
            if (v4.sin_family == AF_INET)
            {
                ra.family = AF_INET;
                ra.addrlen = sizeof(v4);
                std::memcpy(&ra.addr, &v4, sizeof(v4));
            }
            else if (v6 != nullptr && v6->sin6_family == AF_INET6)
            {
                ra.family = AF_INET6;
                ra.addrlen = sizeof(*v6);
                std::memcpy(&ra.addr, v6, sizeof(*v6));
            }
            else
            {
                continue;
            }
            servers_.push_back(ra);
        }
        if (servers_.empty())
        {
            res_nclose(&state_);
            throw std::runtime_error("no nameserver configured in resolv.conf");
        }
    }

    ResolvDnsClient::ResolvDnsClient(std::vector<ResolvedAddress> servers, DiagLogger *diag)
        : servers_(std::move(servers)), diag_(diag)
    {
        std::memset(&state_, 0, sizeof(state_));
        if (servers_.empty())
            throw std::runtime_error("ResolvDnsClient needs at least one nameserver");
        // only used to build queries
        if (res_ninit(&state_) != 0)
            throw std::runtime_error("res_ninit failed: cannot read resolver configuration");
    }

    ResolvDnsClient::~ResolvDnsClient()
    {
        res_nclose(&state_);
    }

    DnsReply ResolvDnsClient::query(const std::string &name, RecordType type, std::chrono::seconds timeout)
    {
        DnsReply reply;
        const int qtype = type == RecordType::TXT ? ns_t_txt : ns_t_ptr;

        std::vector<unsigned char> packet(NS_PACKETSZ);
        const int qlen = res_nmkquery(&state_, ns_o_query, name.c_str(), ns_c_in, qtype, nullptr, 0, nullptr,
                                      packet.data(), static_cast<int>(packet.size()));
        if (qlen < 0)
        {
            reply.status = DnsStatus::Failure;
            if (diag_)
                diag_->warn("DNS " + name + ": cannot build query");
            return reply;
        }
        packet.resize(static_cast<size_t>(qlen));

        const auto deadline = dns_clock::now() + (timeout.count() > 0 ? timeout : std::chrono::seconds(1));
        bool timed_out = false;
        std::vector<unsigned char> answer;
        for (size_t i = 0; i < servers_.size(); ++i)
        {
            const auto left = deadline - dns_clock::now();
            if (left <= dns_clock::duration::zero())
            {
                timed_out = true;
                break;
            }
            // servers still to try share what is left equally
            const auto share = left / static_cast<dns_clock::rep>(servers_.size() - i);
            const ResolvedAddress &server = servers_[i];

            Exchange ex = udp_exchange(server, packet, dns_clock::now() + share, answer);
            if (ex == Exchange::Answer && truncated(answer))
            {
                if (diag_)
                    diag_->debug("DNS " + name + ": truncated over UDP, retrying " + server_label(server) + " over TCP");
                ex = tcp_exchange(server, packet, deadline, answer);
            }
            if (ex != Exchange::Answer)
            {
                if (ex == Exchange::Timeout)
                    timed_out = true;
                if (diag_)
                    diag_->debug("DNS " + name + ": " + server_label(server) +
                                 (ex == Exchange::Timeout ? " timed out" : " exchange failed"));
                continue;
            }

            DnsReply parsed = parse_answer(answer.data(), static_cast<int>(answer.size()), type);
            if (parsed.status == DnsStatus::Failure)
            {
                if (diag_)
                    diag_->debug("DNS " + name + ": " + server_label(server) + " answered with an error");
                continue;
            }
            if (diag_)
                diag_->debug(std::string("DNS ") + record_type_name(type) + " " + name + " -> " + dns_status_name(parsed.status) +
                             " (" + std::to_string(parsed.records.size()) + " records)");
            return parsed;
        }

        reply.status = timed_out ? DnsStatus::Timeout : DnsStatus::Failure;
        if (diag_)
            diag_->debug(std::string("DNS ") + record_type_name(type) + " " + name + " -> " + dns_status_name(reply.status));
        return reply;
    }
} // namespace ipwho
