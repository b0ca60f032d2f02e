#ifndef NETPROV_DRIVERS_VLAN_DRIVER_HPP
#define NETPROV_DRIVERS_VLAN_DRIVER_HPP

#include "drivers/segment_driver.hpp"

namespace netprov
{
    namespace drivers
    {

        /**
         * 802.1Q sub-interfaces through iproute2
         */
        class VlanDriver : public SegmentDriver<model::VlanConfig>
        {
        public:
            VlanDriver(infrastructure::CommandRunner &runner, const infrastructure::InterfaceSource &interfaces,
                       const core::EngineConfig &config);

            DriverResult apply(const model::VlanConfig &vlan, const StateListener &listener = nullptr) override;
            DriverResult teardown(const model::VlanConfig &vlan, const StateListener &listener = nullptr) override;
            bool probe(const model::VlanConfig &vlan) override;
            std::string digest(const model::VlanConfig &vlan) const override;

        private:
            bool create_link(const model::VlanConfig &vlan, std::string &cause);
            bool delete_link(const std::string &name, std::string &cause);
        };

    } // namespace drivers
} // namespace netprov

#endif // NETPROV_DRIVERS_VLAN_DRIVER_HPP
