// ===================== src/ssl_session.cpp =====================
#include "ssl_session.hpp"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <stdexcept>

namespace ipwho
{
    namespace
    {
        std::string drain_openssl_errors()
        {
            std::string out;
            unsigned long code;
            while ((code = ERR_get_error()) != 0)
            {
                char buf[256];
                ERR_error_string_n(code, buf, sizeof(buf));
                if (!out.empty())
                    out += "; ";
                out += buf;
            }
            return out;
        }
    } // namespace

    SslSession::SslSession() : ctx_(nullptr), ssl_(nullptr)
    {
        const SSL_METHOD *method = TLS_client_method();
        ctx_ = SSL_CTX_new(method);
        if (!ctx_)
            throw std::runtime_error("Failed to create SSL_CTX: " + drain_openssl_errors());
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
        {
            SSL_CTX_free(ctx_);
            throw std::runtime_error("Failed to load system CA store: " + drain_openssl_errors());
        }
    }

    SslSession::~SslSession()
    {
        if (ssl_)
        {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    bool SslSession::handshake(int sockfd, const std::string &hostname)
    {
        ssl_ = SSL_new(ctx_);
        if (!ssl_)
        {
            last_error_ = drain_openssl_errors();
            return false;
        }
        SSL_set_fd(ssl_, sockfd);
        SSL_set_tlsext_host_name(ssl_, hostname.c_str());
        SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        if (SSL_set1_host(ssl_, hostname.c_str()) != 1)
        {
            last_error_ = "cannot set expected host " + hostname;
            return false;
        }
        if (SSL_connect(ssl_) <= 0)
        {
            last_error_ = drain_openssl_errors();
            const long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK)
                last_error_ += std::string(last_error_.empty() ? "" : "; ") +
                               X509_verify_cert_error_string(verify);
            return false;
        }
        return true;
    }

    bool SslSession::sendAll(const std::string &data) const
    {
        if (!ssl_)
            return false;
        int n = SSL_write(ssl_, data.c_str(), static_cast<int>(data.size()));
        return n == static_cast<int>(data.size());
    }

    std::string SslSession::recvAll() const
    {
        std::string response;
        if (!ssl_)
            return response;
        response.reserve(8192);
        char buf[4096];
        while (true)
        {
            int bytes = SSL_read(ssl_, buf, sizeof(buf));
            if (bytes <= 0)
                break;
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace ipwho
