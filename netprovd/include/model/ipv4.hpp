#ifndef NETPROV_MODEL_IPV4_HPP
#define NETPROV_MODEL_IPV4_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace netprov
{
    namespace model
    {

        /**
         * IPv4 address in host byte order
         */
        class Ipv4Address
        {
        public:
            Ipv4Address() = default;
            explicit Ipv4Address(uint32_t value) : value_(value) {}

            // Dotted quad only; "10.0.0.1/24" and host names are rejected
            static std::optional<Ipv4Address> parse(const std::string &text);

            uint32_t value() const { return value_; }
            std::string to_string() const;

            bool operator==(const Ipv4Address &other) const { return value_ == other.value_; }
            bool operator!=(const Ipv4Address &other) const { return value_ != other.value_; }
            bool operator<(const Ipv4Address &other) const { return value_ < other.value_; }
            bool operator<=(const Ipv4Address &other) const { return value_ <= other.value_; }

        private:
            uint32_t value_ = 0;
        };

        /**
         * Network prefix, e.g. 10.0.10.0/24
         */
        class Ipv4Subnet
        {
        public:
            Ipv4Subnet(Ipv4Address address, int prefix_length);

            Ipv4Address network() const { return network_; }
            Ipv4Address broadcast() const;
            int prefix_length() const { return prefix_length_; }
            std::string netmask() const;

            bool contains(Ipv4Address address) const;
            bool overlaps(const Ipv4Subnet &other) const;

            std::string to_string() const;

        private:
            uint32_t mask() const;

            Ipv4Address network_;
            int prefix_length_;
        };

    } // namespace model
} // namespace netprov

#endif // NETPROV_MODEL_IPV4_HPP
