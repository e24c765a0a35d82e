// ===================== include/ssl_session.hpp =====================
#pragma once
#include <string>
#include <openssl/ssl.h>

namespace ipwho
{
    // TLS client over an already connected socket. The peer certificate is
    // verified against the system trust store and the expected host name.
    class SslSession
    {
        SSL_CTX *ctx_;
        SSL *ssl_;
        std::string last_error_;

    public:
        SslSession();
        ~SslSession();

        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        bool handshake(int sockfd, const std::string &hostname);
        bool sendAll(const std::string &data) const;
        std::string recvAll() const;
        const std::string &lastError() const { return last_error_; }
    };
} // namespace ipwho
