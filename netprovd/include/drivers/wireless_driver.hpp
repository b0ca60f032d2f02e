#ifndef NETPROV_DRIVERS_WIRELESS_DRIVER_HPP
#define NETPROV_DRIVERS_WIRELESS_DRIVER_HPP

#include <filesystem>

#include "drivers/segment_driver.hpp"
#include "infrastructure/daemon_instance.hpp"

namespace netprov
{
    namespace drivers
    {

        /**
         * Wireless Access Point Driver
         * One hostapd instance per radio, each with its own config and pid file
         */
        class WirelessDriver : public SegmentDriver<model::WirelessConfig>
        {
        public:
            WirelessDriver(infrastructure::CommandRunner &runner, const infrastructure::InterfaceSource &interfaces,
                           const core::EngineConfig &config);

            DriverResult apply(const model::WirelessConfig &ap, const StateListener &listener = nullptr) override;
            DriverResult teardown(const model::WirelessConfig &ap, const StateListener &listener = nullptr) override;
            bool probe(const model::WirelessConfig &ap) override;
            std::string digest(const model::WirelessConfig &ap) const override;

            std::string render_hostapd_config(const model::WirelessConfig &ap) const;

            std::filesystem::path config_path(const std::string &interface) const;
            std::filesystem::path pid_path(const std::string &interface) const;

        private:
            infrastructure::DaemonInstance hostapd(const std::string &interface);
            std::vector<std::string> hostapd_command(const std::string &interface) const;
            bool start_hostapd(const std::string &interface, std::string &cause);
            bool stop_hostapd(const std::string &interface, std::string &cause);
        };

    } // namespace drivers
} // namespace netprov

#endif // NETPROV_DRIVERS_WIRELESS_DRIVER_HPP
