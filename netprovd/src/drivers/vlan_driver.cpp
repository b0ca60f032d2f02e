#include "drivers/vlan_driver.hpp"
#include "core/logger.hpp"
#include "infrastructure/config_digest.hpp"
#include "model/network_objects.hpp"

namespace netprov
{
    namespace drivers
    {

        VlanDriver::VlanDriver(infrastructure::CommandRunner &runner,
                               const infrastructure::InterfaceSource &interfaces, const core::EngineConfig &config)
            : SegmentDriver("VlanDriver", runner, interfaces, config)
        {
        }

        std::string VlanDriver::digest(const model::VlanConfig &vlan) const
        {
            return infrastructure::config_digest("vlan " + vlan.name + " link " + vlan.parent_interface + " id " +
                                                 std::to_string(vlan.id) + "\n");
        }

        bool VlanDriver::create_link(const model::VlanConfig &vlan, std::string &cause)
        {
            return run({"ip", "link", "add", "link", vlan.parent_interface, "name", vlan.name, "type", "vlan", "id",
                        std::to_string(vlan.id)},
                       cause);
        }

        bool VlanDriver::delete_link(const std::string &name, std::string &cause)
        {
            return run({"ip", "link", "delete", "dev", name}, cause);
        }

        DriverResult VlanDriver::apply(const model::VlanConfig &vlan, const StateListener &listener)
        {
            Activation activation(model::ObjectKind::VLAN, vlan.name, listener, activation_timeout(), logger_);

            activation.enter(DriverState::VALIDATING);
            if (!link_exists(vlan.parent_interface))
            {
                activation.fail("check parent", "parent interface " + vlan.parent_interface + " is gone");
                return activation.finish(DriverResult::Status::APPLIED);
            }

            // Nothing to render for a kernel-only object
            activation.enter(DriverState::WRITING_CONFIG);

            activation.enter(DriverState::ACTIVATING, "ip link add " + vlan.name);
            bool existed = link_exists(vlan.name);
            bool was_up = link_up(vlan.name);

            if (existed)
            {
                logger_->info("VLAN link already present, adopting", core::LogContext().add("name", vlan.name));
            }
            else
            {
                activation.step(
                    "create link", [&](std::string &cause) { return create_link(vlan, cause); },
                    [this, name = vlan.name](std::string &cause) { return delete_link(name, cause); });
            }

            activation.step(
                "link up", [&](std::string &cause) { return set_link(vlan.name, true, cause); },
                existed && !was_up ? RollbackJournal::Inverse([this, name = vlan.name](std::string &cause) {
                    return set_link(name, false, cause);
                })
                                   : RollbackJournal::Inverse());

            auto result = activation.finish(DriverResult::Status::APPLIED);
            if (result.ok())
            {
                result.meta.config_digest = digest(vlan);
                result.meta.link_was_up = was_up;
                logger_->info("VLAN applied",
                              core::LogContext().add("name", vlan.name).add("parent", vlan.parent_interface));
            }
            return result;
        }

        DriverResult VlanDriver::teardown(const model::VlanConfig &vlan, const StateListener &listener)
        {
            Activation activation(model::ObjectKind::VLAN, vlan.name, listener, activation_timeout(), logger_);

            activation.enter(DriverState::ACTIVATING, "ip link delete " + vlan.name);
            if (!link_exists(vlan.name))
            {
                logger_->warning("VLAN link already absent", core::LogContext().add("name", vlan.name));
                return activation.finish(DriverResult::Status::REMOVED);
            }

            bool parent_present = link_exists(vlan.parent_interface);
            activation.step(
                "delete link", [&](std::string &cause) { return delete_link(vlan.name, cause); },
                [this, vlan, parent_present](std::string &cause) {
                    if (!parent_present)
                    {
                        cause = "parent " + vlan.parent_interface + " vanished";
                        return false;
                    }
                    return create_link(vlan, cause) && set_link(vlan.name, true, cause);
                });

            auto result = activation.finish(DriverResult::Status::REMOVED);
            if (result.ok())
            {
                logger_->info("VLAN removed", core::LogContext().add("name", vlan.name));
            }
            return result;
        }

        bool VlanDriver::probe(const model::VlanConfig &vlan)
        {
            auto link = interfaces_.find(vlan.name);
            return link && link->type == model::InterfaceType::VLAN && link->admin_up;
        }

    } // namespace drivers
} // namespace netprov
