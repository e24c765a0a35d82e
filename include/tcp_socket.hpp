// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <chrono>
#include <string>
#include "dns_resolver.hpp"

namespace ipwho
{
    class TcpSocket
    {
        int sockfd_;
        std::chrono::seconds timeout_;

    public:
        // timeout bounds connect, each send and each recv
        explicit TcpSocket(std::chrono::seconds timeout = std::chrono::seconds(30));
        ~TcpSocket();

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        void closeSocket();
        bool connectTo(const ResolvedAddress &ra);
        bool sendAll(const std::string &data) const;
        std::string recvAll() const;
        int fd() const { return sockfd_; }
    };
} // namespace ipwho
