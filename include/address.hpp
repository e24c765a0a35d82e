// ===================== include/address.hpp =====================
#pragma once
#include <cstdint>
#include <string>

namespace ipwho
{
    // IPv4 address held in host byte order.
    class Ipv4Address
    {
    public:
        Ipv4Address() = default;
        explicit Ipv4Address(uint32_t value) : value_(value) {}

        // Throws std::invalid_argument on anything that is not a dotted-quad IPv4 literal.
        static Ipv4Address parse(const std::string &text);

        uint32_t value() const { return value_; }
        std::string toString() const;

        // "10.1.2.3" -> "3.2.1.10"
        std::string reversedLabels() const;
        // "10.1.2.3" -> "3.2.1.10.in-addr.arpa"
        std::string ptrName() const;

        bool operator==(const Ipv4Address &o) const { return value_ == o.value_; }
        bool operator!=(const Ipv4Address &o) const { return value_ != o.value_; }

    private:
        uint32_t value_ = 0;
    };

    class Cidr
    {
    public:
        Cidr() = default;
        // The base is masked down to the network address.
        Cidr(Ipv4Address base, int prefix);

        // "a.b.c.d/n"; throws std::invalid_argument.
        static Cidr parse(const std::string &text);
        static Cidr fromParts(const std::string &base, const std::string &prefix);

        Ipv4Address base() const { return base_; }
        int prefix() const { return prefix_; }
        uint32_t mask() const;
        uint64_t size() const { return uint64_t{1} << (32 - prefix_); }
        Ipv4Address first() const { return base_; }
        Ipv4Address at(uint64_t index) const;

        bool contains(const Ipv4Address &addr) const;
        bool contains(const Cidr &other) const;

        std::string toString() const;

        bool operator==(const Cidr &o) const { return base_ == o.base_ && prefix_ == o.prefix_; }
        bool operator!=(const Cidr &o) const { return !(*this == o); }

    private:
        Ipv4Address base_;
        int prefix_ = 32;
    };

    inline Cidr host_cidr(const Ipv4Address &addr) { return Cidr(addr, 32); }
} // namespace ipwho
