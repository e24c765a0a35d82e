// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace ipwho
{
    TcpSocket::TcpSocket(std::chrono::seconds timeout) : sockfd_(-1), timeout_(timeout) {}
    TcpSocket::~TcpSocket() { closeSocket(); }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    // Non-blocking connect bounded by timeout_, then back to blocking I/O
    // with SO_RCVTIMEO/SO_SNDTIMEO so a silent peer cannot stall a lookup.
    bool TcpSocket::connectTo(const ResolvedAddress &ra)
    {
        closeSocket();
        sockfd_ = ::socket(ra.family, ra.socktype, ra.protocol);
        if (sockfd_ == -1)
            return false;

        const int flags = ::fcntl(sockfd_, F_GETFL, 0);
        if (flags == -1 || ::fcntl(sockfd_, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            closeSocket();
            return false;
        }

        int rc = ::connect(sockfd_, reinterpret_cast<const sockaddr *>(&ra.addr), ra.addrlen);
        if (rc != 0 && errno == EINPROGRESS)
        {
            pollfd pfd{sockfd_, POLLOUT, 0};
            rc = ::poll(&pfd, 1, static_cast<int>(timeout_.count() * 1000));
            int err = 0;
            socklen_t len = sizeof(err);
            if (rc == 1 && ::getsockopt(sockfd_, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0)
                rc = 0;
            else
                rc = -1;
        }
        if (rc != 0 || ::fcntl(sockfd_, F_SETFL, flags) == -1)
        {
            closeSocket();
            return false;
        }

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout_.count());
        if (::setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
            ::setsockopt(sockfd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        {
            closeSocket();
            return false;
        }
        return true;
    }

    bool TcpSocket::sendAll(const std::string &data) const
    {
        if (sockfd_ == -1){
            return false;
        }
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
                return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    std::string TcpSocket::recvAll() const
    {
        std::string response;
        response.reserve(8192);
        char buf[4096];
        while (true)
        {
            ssize_t bytes = ::recv(sockfd_, buf, sizeof(buf), 0);
            if (bytes <= 0)
                break;
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace ipwho
