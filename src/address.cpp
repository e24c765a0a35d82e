// ===================== src/address.cpp =====================
#include "address.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <stdexcept>

namespace ipwho
{
    Ipv4Address Ipv4Address::parse(const std::string &text)
    {
        in_addr a{};
        // inet_pton is strict: no octal, no short forms, no trailing junk
        if (text.empty() || inet_pton(AF_INET, text.c_str(), &a) != 1)
            throw std::invalid_argument("not an IPv4 address: '" + text + "'");
        return Ipv4Address(ntohl(a.s_addr));
    }

    std::string Ipv4Address::toString() const
    {
        in_addr a{};
        a.s_addr = htonl(value_);
        char buf[INET_ADDRSTRLEN];
        return inet_ntop(AF_INET, &a, buf, sizeof(buf)) ? std::string(buf) : std::string();
    }

    std::string Ipv4Address::reversedLabels() const
    {
        return std::to_string(value_ & 0xFF) + '.' +
               std::to_string((value_ >> 8) & 0xFF) + '.' +
               std::to_string((value_ >> 16) & 0xFF) + '.' +
               std::to_string(value_ >> 24);
    }

    std::string Ipv4Address::ptrName() const
    {
        return reversedLabels() + ".in-addr.arpa";
    }

    Cidr::Cidr(Ipv4Address base, int prefix) : prefix_(prefix)
    {
        if (prefix < 0 || prefix > 32)
            throw std::invalid_argument("prefix length out of range: " + std::to_string(prefix));
        base_ = Ipv4Address(base.value() & mask());
    }

    Cidr Cidr::fromParts(const std::string &base, const std::string &prefix)
    {
        if (prefix.empty() || prefix.size() > 2)
            throw std::invalid_argument("bad prefix length: '" + prefix + "'");
        for (char c : prefix)
            if (!std::isdigit(static_cast<unsigned char>(c)))
                throw std::invalid_argument("bad prefix length: '" + prefix + "'");
        return Cidr(Ipv4Address::parse(base), std::stoi(prefix));
    }

    Cidr Cidr::parse(const std::string &text)
    {
        auto slash = text.find('/');
        if (slash == std::string::npos)
            throw std::invalid_argument("missing '/' in CIDR: '" + text + "'");
        return fromParts(text.substr(0, slash), text.substr(slash + 1));
    }

    uint32_t Cidr::mask() const
    {
        return prefix_ == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix_));
    }

    Ipv4Address Cidr::at(uint64_t index) const
    {
        if (index >= size())
            throw std::out_of_range("index outside " + toString());
        return Ipv4Address(base_.value() + static_cast<uint32_t>(index));
    }

    bool Cidr::contains(const Ipv4Address &addr) const
    {
        return (addr.value() & mask()) == base_.value();
    }

    bool Cidr::contains(const Cidr &other) const
    {
        return other.prefix_ >= prefix_ && contains(other.base_);
    }

    std::string Cidr::toString() const
    {
        return base_.toString() + '/' + std::to_string(prefix_);
    }
} // namespace ipwho
