#ifndef NETPROV_INFRASTRUCTURE_INTERFACE_DISCOVERY_HPP
#define NETPROV_INFRASTRUCTURE_INTERFACE_DISCOVERY_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model/network_objects.hpp"

namespace netprov
{
    namespace core
    {
        class Logger;
    }
}

namespace netprov
{
    namespace infrastructure
    {

        /**
         * Read-only view of the live link set. Implementations take no locks
         * and keep no cache; each call reflects the kernel at that moment.
         */
        class InterfaceSource
        {
        public:
            virtual ~InterfaceSource() = default;

            /**
             * Every link including loopback (diagnostics).
             */
            virtual std::vector<model::Interface> list_all() const = 0;

            /**
             * Links usable by segment drivers; loopback excluded.
             */
            std::vector<model::Interface> list_interfaces() const;

            std::optional<model::Interface> find(const std::string &name) const;
            bool exists(const std::string &name) const { return find(name).has_value(); }
        };

        /**
         * getifaddrs(3) for links and IPv4 addresses, sysfs for type, state,
         * MAC and bridge master.
         */
        class LinuxInterfaceDiscovery : public InterfaceSource
        {
        public:
            explicit LinuxInterfaceDiscovery(const std::filesystem::path &sysfs_net = "/sys/class/net",
                                             const std::filesystem::path &proc_vlan = "/proc/net/vlan");

            std::vector<model::Interface> list_all() const override;

        private:
            model::InterfaceType classify(const std::string &name, bool loopback) const;
            model::LinkStatus read_status(const std::string &name, bool flags_up) const;
            std::string read_attribute(const std::string &name, const std::string &attribute) const;
            std::optional<std::string> read_master(const std::string &name) const;

            std::filesystem::path sysfs_net_;
            std::filesystem::path proc_vlan_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace netprov

#endif // NETPROV_INFRASTRUCTURE_INTERFACE_DISCOVERY_HPP
