#ifndef NETPROV_DRIVERS_BRIDGE_DRIVER_HPP
#define NETPROV_DRIVERS_BRIDGE_DRIVER_HPP

#include "drivers/segment_driver.hpp"

namespace netprov
{
    namespace drivers
    {

        /**
         * Linux software bridges. Members lose their own addresses when
         * enslaved; release leaves them present and unconfigured.
         */
        class BridgeDriver : public SegmentDriver<model::BridgeConfig>
        {
        public:
            BridgeDriver(infrastructure::CommandRunner &runner, const infrastructure::InterfaceSource &interfaces,
                         const core::EngineConfig &config);

            DriverResult apply(const model::BridgeConfig &bridge, const StateListener &listener = nullptr) override;
            DriverResult teardown(const model::BridgeConfig &bridge, const StateListener &listener = nullptr) override;
            bool probe(const model::BridgeConfig &bridge) override;
            std::string digest(const model::BridgeConfig &bridge) const override;

        private:
            bool set_stp(const std::string &bridge, bool stp, std::string &cause);
            bool enslave(const std::string &member, const std::string &bridge, std::string &cause);
            bool release(const std::string &member, std::string &cause);
        };

    } // namespace drivers
} // namespace netprov

#endif // NETPROV_DRIVERS_BRIDGE_DRIVER_HPP
