#include "drivers/bridge_driver.hpp"
#include "core/logger.hpp"
#include "infrastructure/config_digest.hpp"

namespace netprov
{
    namespace drivers
    {

        BridgeDriver::BridgeDriver(infrastructure::CommandRunner &runner,
                                   const infrastructure::InterfaceSource &interfaces,
                                   const core::EngineConfig &config)
            : SegmentDriver("BridgeDriver", runner, interfaces, config)
        {
        }

        std::string BridgeDriver::digest(const model::BridgeConfig &bridge) const
        {
            std::string plan = "bridge " + bridge.name + " stp " + (bridge.stp ? "1" : "0") + " members";
            for (const auto &member : model::normalize_members(bridge.members))
            {
                plan += " " + member;
            }
            return infrastructure::config_digest(plan + "\n");
        }

        bool BridgeDriver::set_stp(const std::string &bridge, bool stp, std::string &cause)
        {
            return run({"ip", "link", "set", "dev", bridge, "type", "bridge", "stp_state", stp ? "1" : "0"}, cause);
        }

        bool BridgeDriver::enslave(const std::string &member, const std::string &bridge, std::string &cause)
        {
            return run({"ip", "link", "set", "dev", member, "master", bridge}, cause);
        }

        bool BridgeDriver::release(const std::string &member, std::string &cause)
        {
            return run({"ip", "link", "set", "dev", member, "nomaster"}, cause);
        }

        DriverResult BridgeDriver::apply(const model::BridgeConfig &bridge, const StateListener &listener)
        {
            Activation activation(model::ObjectKind::BRIDGE, bridge.name, listener, activation_timeout(), logger_);
            auto members = model::normalize_members(bridge.members);

            activation.enter(DriverState::VALIDATING);
            for (const auto &member : members)
            {
                if (!link_exists(member))
                {
                    activation.fail("check members", "member " + member + " is gone");
                    return activation.finish(DriverResult::Status::APPLIED);
                }
            }

            activation.enter(DriverState::WRITING_CONFIG);

            activation.enter(DriverState::ACTIVATING, "creating bridge " + bridge.name);
            if (!link_exists(bridge.name))
            {
                activation.step(
                    "create bridge",
                    [&](std::string &cause) {
                        return run({"ip", "link", "add", "name", bridge.name, "type", "bridge"}, cause);
                    },
                    [this, name = bridge.name](std::string &cause) {
                        return run({"ip", "link", "delete", "dev", name, "type", "bridge"}, cause);
                    });
            }

            activation.step("set stp", [&](std::string &cause) { return set_stp(bridge.name, bridge.stp, cause); });

            for (const auto &member : members)
            {
                auto addresses = ipv4_addresses(member);
                bool member_was_up = link_up(member);

                activation.step(
                    "flush " + member,
                    [&](std::string &cause) { return run({"ip", "addr", "flush", "dev", member}, cause); },
                    [this, member, addresses](std::string &cause) { return add_addresses(member, addresses, cause); });

                activation.step(
                    "enslave " + member, [&](std::string &cause) { return enslave(member, bridge.name, cause); },
                    [this, member](std::string &cause) { return release(member, cause); });

                activation.step(
                    "member up " + member, [&](std::string &cause) { return set_link(member, true, cause); },
                    member_was_up ? RollbackJournal::Inverse()
                                  : RollbackJournal::Inverse([this, member](std::string &cause) {
                                        return set_link(member, false, cause);
                                    }));
            }

            activation.step("bridge up", [&](std::string &cause) { return set_link(bridge.name, true, cause); });

            auto result = activation.finish(DriverResult::Status::APPLIED);
            if (result.ok())
            {
                result.meta.config_digest = digest(bridge);
                result.meta.link_was_up = false;
                logger_->info("Bridge applied",
                              core::LogContext().add("name", bridge.name).add("members", members).add("stp", bridge.stp));
            }
            return result;
        }

        DriverResult BridgeDriver::teardown(const model::BridgeConfig &bridge, const StateListener &listener)
        {
            Activation activation(model::ObjectKind::BRIDGE, bridge.name, listener, activation_timeout(), logger_);

            activation.enter(DriverState::ACTIVATING, "releasing members of " + bridge.name);
            if (!link_exists(bridge.name))
            {
                logger_->warning("Bridge link already absent", core::LogContext().add("name", bridge.name));
                return activation.finish(DriverResult::Status::REMOVED);
            }

            for (const auto &member : model::normalize_members(bridge.members))
            {
                auto link = interfaces_.find(member);
                if (!link || !link->master || *link->master != bridge.name)
                {
                    logger_->warning("Member not enslaved, skipping",
                                     core::LogContext().add("bridge", bridge.name).add("member", member));
                    continue;
                }

                activation.step(
                    "release " + member, [&](std::string &cause) { return release(member, cause); },
                    [this, member, name = bridge.name](std::string &cause) { return enslave(member, name, cause); });
            }

            activation.step("delete bridge", [&](std::string &cause) {
                return run({"ip", "link", "delete", "dev", bridge.name, "type", "bridge"}, cause);
            });

            auto result = activation.finish(DriverResult::Status::REMOVED);
            if (result.ok())
            {
                logger_->info("Bridge removed", core::LogContext().add("name", bridge.name));
            }
            return result;
        }

        bool BridgeDriver::probe(const model::BridgeConfig &bridge)
        {
            auto link = interfaces_.find(bridge.name);
            if (!link || link->type != model::InterfaceType::BRIDGE || !link->admin_up)
            {
                return false;
            }
            for (const auto &member : bridge.members)
            {
                auto iface = interfaces_.find(member);
                if (!iface || !iface->master || *iface->master != bridge.name)
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace drivers
} // namespace netprov
