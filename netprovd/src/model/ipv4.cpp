#include "model/ipv4.hpp"

#include <arpa/inet.h>
#include <stdexcept>

namespace netprov
{
    namespace model
    {

        std::optional<Ipv4Address> Ipv4Address::parse(const std::string &text)
        {
            struct in_addr addr;
            if (text.empty() || inet_pton(AF_INET, text.c_str(), &addr) != 1)
            {
                return std::nullopt;
            }
            return Ipv4Address(ntohl(addr.s_addr));
        }

        std::string Ipv4Address::to_string() const
        {
            struct in_addr addr;
            addr.s_addr = htonl(value_);
            char buffer[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr)
            {
                return "";
            }
            return buffer;
        }

        Ipv4Subnet::Ipv4Subnet(Ipv4Address address, int prefix_length)
            : prefix_length_(prefix_length)
        {
            if (prefix_length < 0 || prefix_length > 32)
            {
                throw std::invalid_argument("prefix length out of range: " + std::to_string(prefix_length));
            }
            network_ = Ipv4Address(address.value() & mask());
        }

        uint32_t Ipv4Subnet::mask() const
        {
            if (prefix_length_ == 0)
            {
                return 0;
            }
            return 0xFFFFFFFFu << (32 - prefix_length_);
        }

        Ipv4Address Ipv4Subnet::broadcast() const
        {
            return Ipv4Address(network_.value() | ~mask());
        }

        std::string Ipv4Subnet::netmask() const
        {
            return Ipv4Address(mask()).to_string();
        }

        bool Ipv4Subnet::contains(Ipv4Address address) const
        {
            return (address.value() & mask()) == network_.value();
        }

        bool Ipv4Subnet::overlaps(const Ipv4Subnet &other) const
        {
            // Prefixes are either nested or disjoint
            return contains(other.network()) || other.contains(network_);
        }

        std::string Ipv4Subnet::to_string() const
        {
            return network_.to_string() + "/" + std::to_string(prefix_length_);
        }

    } // namespace model
} // namespace netprov
