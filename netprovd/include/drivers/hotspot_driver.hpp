#ifndef NETPROV_DRIVERS_HOTSPOT_DRIVER_HPP
#define NETPROV_DRIVERS_HOTSPOT_DRIVER_HPP

#include <filesystem>

#include "drivers/segment_driver.hpp"
#include "infrastructure/daemon_instance.hpp"

namespace netprov
{
    namespace drivers
    {

        /**
         * Captive portal segment on one interface: gateway address, a
         * dedicated dnsmasq instance for DHCP and captive DNS, an HTTP
         * redirect to the portal, masquerading towards the uplink and
         * optional HTB shaping.
         */
        class HotspotDriver : public SegmentDriver<model::HotspotInstance>
        {
        public:
            HotspotDriver(infrastructure::CommandRunner &runner, const infrastructure::InterfaceSource &interfaces,
                          const core::EngineConfig &config);

            DriverResult apply(const model::HotspotInstance &hotspot, const StateListener &listener = nullptr) override;
            DriverResult teardown(const model::HotspotInstance &hotspot,
                                  const StateListener &listener = nullptr) override;
            bool probe(const model::HotspotInstance &hotspot) override;
            std::string digest(const model::HotspotInstance &hotspot) const override;

            std::string render_dnsmasq_config(const model::HotspotInstance &hotspot) const;

            std::filesystem::path config_path(const std::string &interface) const;
            std::filesystem::path pid_path(const std::string &interface) const;
            std::filesystem::path lease_path(const std::string &interface) const;

        private:
            infrastructure::DaemonInstance dnsmasq(const std::string &interface);
            std::vector<std::string> dnsmasq_command(const std::string &interface) const;

            std::vector<std::string> redirect_rule(const std::string &action, const std::string &interface) const;
            bool redirect_present(const std::string &interface);

            std::vector<std::string> masquerade_rule(const std::string &action,
                                                     const model::HotspotInstance &hotspot) const;
            bool masquerade_present(const model::HotspotInstance &hotspot);

            // Current net.ipv4.ip_forward, empty when unreadable
            std::string ip_forward();
            bool set_ip_forward(const std::string &value, std::string &cause);

            bool add_root_qdisc(const std::string &interface, std::string &cause);
            bool add_rate_class(const model::HotspotInstance &hotspot, std::string &cause);
            bool remove_root_qdisc(const std::string &interface, std::string &cause);
            bool shaping_present(const std::string &interface);

            static std::string gateway_cidr(const model::HotspotInstance &hotspot);
            static std::string client_subnet(const model::HotspotInstance &hotspot);
        };

    } // namespace drivers
} // namespace netprov

#endif // NETPROV_DRIVERS_HOTSPOT_DRIVER_HPP
