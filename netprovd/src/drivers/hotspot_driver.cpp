/**
 * Hotspot Driver
 * Per-interface dnsmasq scope, captive redirect, uplink NAT and shaping
 */

#include "drivers/hotspot_driver.hpp"
#include "core/logger.hpp"
#include "infrastructure/config_digest.hpp"
#include "infrastructure/staged_file.hpp"
#include "model/ipv4.hpp"

#include <algorithm>
#include <sstream>

namespace netprov
{
    namespace drivers
    {

        namespace
        {
            constexpr int HOTSPOT_PREFIX = 24;
        }

        HotspotDriver::HotspotDriver(infrastructure::CommandRunner &runner,
                                     const infrastructure::InterfaceSource &interfaces,
                                     const core::EngineConfig &config)
            : SegmentDriver("HotspotDriver", runner, interfaces, config)
        {
        }

        std::filesystem::path HotspotDriver::config_path(const std::string &interface) const
        {
            return std::filesystem::path(config_.paths.dnsmasq_dir) / ("netprov-" + interface + ".conf");
        }

        std::filesystem::path HotspotDriver::pid_path(const std::string &interface) const
        {
            return std::filesystem::path(config_.paths.run_dir) / ("dnsmasq-" + interface + ".pid");
        }

        std::filesystem::path HotspotDriver::lease_path(const std::string &interface) const
        {
            return std::filesystem::path(config_.paths.lease_dir) / ("dnsmasq-" + interface + ".leases");
        }

        std::string HotspotDriver::gateway_cidr(const model::HotspotInstance &hotspot)
        {
            return hotspot.ip_address + "/" + std::to_string(HOTSPOT_PREFIX);
        }

        std::string HotspotDriver::render_dnsmasq_config(const model::HotspotInstance &hotspot) const
        {
            std::string netmask = "255.255.255.0";
            if (auto gateway = model::Ipv4Address::parse(hotspot.ip_address))
            {
                netmask = model::Ipv4Subnet(*gateway, HOTSPOT_PREFIX).netmask();
            }

            std::ostringstream conf;
            conf << "# Managed by netprovd, do not edit\n";
            conf << "interface=" << hotspot.interface << "\n";
            conf << "bind-interfaces\n";
            conf << "except-interface=lo\n";
            conf << "dhcp-range=" << hotspot.dhcp_range.low << "," << hotspot.dhcp_range.high << "," << netmask << ","
                 << config_.hotspot.lease_time << "\n";
            conf << "dhcp-option=3," << hotspot.ip_address << "\n";
            conf << "dhcp-option=6," << hotspot.ip_address << "\n";
            conf << "address=/#/" << hotspot.ip_address << "\n";
            conf << "dhcp-leasefile=" << lease_path(hotspot.interface).string() << "\n";
            return conf.str();
        }

        std::string HotspotDriver::digest(const model::HotspotInstance &hotspot) const
        {
            std::ostringstream plan;
            plan << "address " << gateway_cidr(hotspot) << "\n";
            plan << "enabled " << (hotspot.enabled ? 1 : 0) << "\n";
            if (hotspot.enabled)
            {
                plan << render_dnsmasq_config(hotspot);
                plan << "redirect 80 " << config_.hotspot.portal_port << "\n";
                plan << "masquerade " << client_subnet(hotspot) << "\n";
                plan << "shape " << hotspot.bandwidth_limit << "\n";
            }
            return infrastructure::config_digest(plan.str());
        }

        infrastructure::DaemonInstance HotspotDriver::dnsmasq(const std::string &interface)
        {
            return infrastructure::DaemonInstance("dnsmasq@" + interface, pid_path(interface), runner_,
                                                  command_timeout());
        }

        std::vector<std::string> HotspotDriver::dnsmasq_command(const std::string &interface) const
        {
            return {"dnsmasq", "--conf-file=" + config_path(interface).string(),
                    "--pid-file=" + pid_path(interface).string()};
        }

        std::vector<std::string> HotspotDriver::redirect_rule(const std::string &action,
                                                              const std::string &interface) const
        {
            return {"iptables", "-t", "nat", action, "PREROUTING", "-i", interface, "-p", "tcp", "--dport", "80",
                    "-j", "REDIRECT", "--to-ports", std::to_string(config_.hotspot.portal_port)};
        }

        bool HotspotDriver::redirect_present(const std::string &interface)
        {
            return query(redirect_rule("-C", interface)).ok();
        }

        std::string HotspotDriver::client_subnet(const model::HotspotInstance &hotspot)
        {
            auto gateway = model::Ipv4Address::parse(hotspot.ip_address);
            return gateway ? model::Ipv4Subnet(*gateway, HOTSPOT_PREFIX).to_string() : gateway_cidr(hotspot);
        }

        std::vector<std::string> HotspotDriver::masquerade_rule(const std::string &action,
                                                                const model::HotspotInstance &hotspot) const
        {
            // Uplink-agnostic: anything leaving the segment for another link
            return {"iptables", "-t", "nat", action, "POSTROUTING", "-s", client_subnet(hotspot), "!", "-o",
                    hotspot.interface, "-j", "MASQUERADE"};
        }

        bool HotspotDriver::masquerade_present(const model::HotspotInstance &hotspot)
        {
            return query(masquerade_rule("-C", hotspot)).ok();
        }

        std::string HotspotDriver::ip_forward()
        {
            auto result = query({"sysctl", "-n", "net.ipv4.ip_forward"});
            if (!result.ok())
            {
                return "";
            }
            auto value = result.output;
            value.erase(std::remove_if(value.begin(), value.end(), [](char c) { return c == '\n' || c == ' '; }),
                        value.end());
            return value;
        }

        bool HotspotDriver::set_ip_forward(const std::string &value, std::string &cause)
        {
            return run({"sysctl", "-w", "net.ipv4.ip_forward=" + value}, cause);
        }

        bool HotspotDriver::add_root_qdisc(const std::string &interface, std::string &cause)
        {
            return run({"tc", "qdisc", "replace", "dev", interface, "root", "handle", "1:", "htb", "default", "10"},
                       cause);
        }

        bool HotspotDriver::add_rate_class(const model::HotspotInstance &hotspot, std::string &cause)
        {
            auto rate = std::to_string(hotspot.bandwidth_limit) + "mbit";
            return run({"tc", "class", "replace", "dev", hotspot.interface, "parent", "1:", "classid", "1:10", "htb",
                        "rate", rate, "ceil", rate},
                       cause);
        }

        bool HotspotDriver::remove_root_qdisc(const std::string &interface, std::string &cause)
        {
            return run({"tc", "qdisc", "del", "dev", interface, "root"}, cause);
        }

        bool HotspotDriver::shaping_present(const std::string &interface)
        {
            auto result = query({"tc", "qdisc", "show", "dev", interface});
            return result.ok() && result.output.find("htb 1:") != std::string::npos;
        }

        DriverResult HotspotDriver::apply(const model::HotspotInstance &hotspot, const StateListener &listener)
        {
            Activation activation(model::ObjectKind::HOTSPOT, hotspot.interface, listener, activation_timeout(),
                                  logger_);
            const auto &ifname = hotspot.interface;

            activation.enter(DriverState::VALIDATING);
            if (!link_exists(ifname))
            {
                activation.fail("check interface", "interface " + ifname + " is gone");
                return activation.finish(DriverResult::Status::APPLIED);
            }

            activation.enter(DriverState::WRITING_CONFIG, config_path(ifname).string());
            infrastructure::StagedConfigFile conf(config_.paths.staging_dir, config_path(ifname));
            if (hotspot.enabled && !conf.stage(render_dnsmasq_config(hotspot)))
            {
                activation.fail("stage dnsmasq config", "cannot write " + conf.staged_path().string());
                return activation.finish(DriverResult::Status::APPLIED);
            }

            activation.enter(DriverState::ACTIVATING, "assigning " + gateway_cidr(hotspot) + " to " + ifname);
            auto previous_addresses = ipv4_addresses(ifname);
            bool was_up = link_up(ifname);

            activation.step(
                "flush addresses", [&](std::string &cause) { return run({"ip", "addr", "flush", "dev", ifname}, cause); },
                [this, ifname, previous_addresses](std::string &cause) {
                    return add_addresses(ifname, previous_addresses, cause);
                });

            activation.step(
                "assign address",
                [&](std::string &cause) { return run({"ip", "addr", "add", gateway_cidr(hotspot), "dev", ifname}, cause); },
                [this, ifname, cidr = gateway_cidr(hotspot)](std::string &cause) {
                    return run({"ip", "addr", "del", cidr, "dev", ifname}, cause);
                });

            activation.step(
                "link up", [&](std::string &cause) { return set_link(ifname, true, cause); },
                was_up ? RollbackJournal::Inverse()
                       : RollbackJournal::Inverse([this, ifname](std::string &cause) {
                             return set_link(ifname, false, cause);
                         }));

            if (hotspot.enabled)
            {
                auto instance = dnsmasq(ifname);
                if (instance.is_running())
                {
                    activation.step(
                        "stop stale dnsmasq",
                        [&](std::string &cause) {
                            auto result = instance.stop();
                            cause = result.describe();
                            return result.ok();
                        },
                        [this, ifname](std::string &cause) {
                            auto result = dnsmasq(ifname).start(dnsmasq_command(ifname));
                            cause = result.describe();
                            return result.ok();
                        });
                }

                activation.step(
                    "install dnsmasq config",
                    [&](std::string &cause) {
                        std::error_code ec;
                        std::filesystem::create_directories(config_.paths.lease_dir, ec);
                        if (ec)
                        {
                            cause = "cannot create " + config_.paths.lease_dir + ": " + ec.message();
                            return false;
                        }
                        cause = "cannot install " + conf.live_path().string();
                        return conf.install();
                    },
                    [&conf](std::string &cause) {
                        cause = "cannot restore " + conf.live_path().string();
                        return conf.restore();
                    });

                activation.step(
                    "start dnsmasq",
                    [&](std::string &cause) {
                        auto result = instance.start(dnsmasq_command(ifname));
                        cause = result.describe();
                        return result.ok();
                    },
                    [this, ifname](std::string &cause) {
                        auto result = dnsmasq(ifname).stop();
                        cause = result.describe();
                        return result.ok();
                    });

                if (!activation.failed() && !redirect_present(ifname))
                {
                    activation.step(
                        "captive redirect", [&](std::string &cause) { return run(redirect_rule("-A", ifname), cause); },
                        [this, ifname](std::string &cause) { return run(redirect_rule("-D", ifname), cause); });
                }

                std::string forward = activation.failed() ? "1" : ip_forward();
                if (forward != "1")
                {
                    activation.step(
                        "enable forwarding", [&](std::string &cause) { return set_ip_forward("1", cause); },
                        forward.empty() ? RollbackJournal::Inverse()
                                        : RollbackJournal::Inverse([this, forward](std::string &cause) {
                                              return set_ip_forward(forward, cause);
                                          }));
                }

                if (!activation.failed() && !masquerade_present(hotspot))
                {
                    activation.step(
                        "uplink nat", [&](std::string &cause) { return run(masquerade_rule("-A", hotspot), cause); },
                        [this, hotspot](std::string &cause) { return run(masquerade_rule("-D", hotspot), cause); });
                }

                if (hotspot.is_shaped())
                {
                    activation.step(
                        "shape root qdisc", [&](std::string &cause) { return add_root_qdisc(ifname, cause); },
                        [this, ifname](std::string &cause) { return remove_root_qdisc(ifname, cause); });
                    activation.step("shape rate class", [&](std::string &cause) { return add_rate_class(hotspot, cause); });
                }
            }

            auto result = activation.finish(DriverResult::Status::APPLIED);
            conf.discard();
            if (result.ok())
            {
                result.meta.config_digest = digest(hotspot);
                result.meta.link_was_up = was_up;
                logger_->info("Hotspot applied",
                              core::LogContext()
                                  .add("interface", ifname)
                                  .add("gateway", hotspot.ip_address)
                                  .add("dhcp_range", hotspot.dhcp_range.to_string())
                                  .add("bandwidth_limit", hotspot.bandwidth_limit));
            }
            return result;
        }

        DriverResult HotspotDriver::teardown(const model::HotspotInstance &hotspot, const StateListener &listener)
        {
            Activation activation(model::ObjectKind::HOTSPOT, hotspot.interface, listener, activation_timeout(),
                                  logger_);
            const auto &ifname = hotspot.interface;
            bool present = link_exists(ifname);

            activation.enter(DriverState::ACTIVATING, "removing hotspot on " + ifname);

            if (present && shaping_present(ifname))
            {
                activation.step(
                    "remove shaping", [&](std::string &cause) { return remove_root_qdisc(ifname, cause); },
                    [this, hotspot](std::string &cause) {
                        if (!add_root_qdisc(hotspot.interface, cause))
                        {
                            return false;
                        }
                        if (!hotspot.is_shaped())
                        {
                            return true;
                        }
                        return add_rate_class(hotspot, cause);
                    });
            }

            // Forwarding stays on; other segments may still route through it
            if (masquerade_present(hotspot))
            {
                activation.step(
                    "remove uplink nat", [&](std::string &cause) { return run(masquerade_rule("-D", hotspot), cause); },
                    [this, hotspot](std::string &cause) { return run(masquerade_rule("-A", hotspot), cause); });
            }

            if (present && redirect_present(ifname))
            {
                activation.step(
                    "remove captive redirect", [&](std::string &cause) { return run(redirect_rule("-D", ifname), cause); },
                    [this, ifname](std::string &cause) { return run(redirect_rule("-A", ifname), cause); });
            }

            auto instance = dnsmasq(ifname);
            bool running = instance.is_running();
            activation.step(
                "stop dnsmasq",
                [&](std::string &cause) {
                    auto result = instance.stop();
                    cause = result.describe();
                    return result.ok();
                },
                running ? RollbackJournal::Inverse([this, ifname](std::string &cause) {
                    auto result = dnsmasq(ifname).start(dnsmasq_command(ifname));
                    cause = result.describe();
                    return result.ok();
                })
                        : RollbackJournal::Inverse());

            infrastructure::StagedConfigFile conf(config_.paths.staging_dir, config_path(ifname));
            activation.step(
                "remove dnsmasq config",
                [&](std::string &cause) {
                    cause = "cannot remove " + conf.live_path().string();
                    return conf.remove_live();
                },
                [&conf](std::string &cause) {
                    cause = "cannot restore " + conf.live_path().string();
                    return conf.restore();
                });

            if (present)
            {
                auto addresses = ipv4_addresses(ifname);
                auto cidr = gateway_cidr(hotspot);
                if (std::find(addresses.begin(), addresses.end(), cidr) != addresses.end())
                {
                    activation.step(
                        "release address",
                        [&](std::string &cause) { return run({"ip", "addr", "del", cidr, "dev", ifname}, cause); },
                        [this, ifname, cidr](std::string &cause) {
                            return run({"ip", "addr", "add", cidr, "dev", ifname}, cause);
                        });
                }

                if (!hotspot.meta.link_was_up && link_up(ifname))
                {
                    activation.step(
                        "restore link state", [&](std::string &cause) { return set_link(ifname, false, cause); },
                        [this, ifname](std::string &cause) { return set_link(ifname, true, cause); });
                }
            }

            auto result = activation.finish(DriverResult::Status::REMOVED);
            conf.discard();
            if (result.ok())
            {
                logger_->info("Hotspot removed", core::LogContext().add("interface", ifname));
            }
            return result;
        }

        bool HotspotDriver::probe(const model::HotspotInstance &hotspot)
        {
            const auto &ifname = hotspot.interface;
            if (!link_exists(ifname) || hotspot.meta.config_digest != digest(hotspot))
            {
                return false;
            }

            auto addresses = ipv4_addresses(ifname);
            if (std::find(addresses.begin(), addresses.end(), gateway_cidr(hotspot)) == addresses.end())
            {
                return false;
            }
            if (!hotspot.enabled)
            {
                return true;
            }

            auto live = infrastructure::read_text_file(config_path(ifname));
            if (!live || *live != render_dnsmasq_config(hotspot))
            {
                return false;
            }
            if (!dnsmasq(ifname).is_running() || !redirect_present(ifname) || !masquerade_present(hotspot))
            {
                return false;
            }
            return !hotspot.is_shaped() || shaping_present(ifname);
        }

    } // namespace drivers
} // namespace netprov
