/**
 * Wireless Access Point Driver Implementation
 * Renders hostapd configuration and manages the per-radio hostapd instance
 */

#include "drivers/wireless_driver.hpp"
#include "core/logger.hpp"
#include "infrastructure/config_digest.hpp"
#include "infrastructure/staged_file.hpp"

#include <sstream>

namespace netprov
{
    namespace drivers
    {

        WirelessDriver::WirelessDriver(infrastructure::CommandRunner &runner,
                                       const infrastructure::InterfaceSource &interfaces,
                                       const core::EngineConfig &config)
            : SegmentDriver("WirelessDriver", runner, interfaces, config)
        {
        }

        std::filesystem::path WirelessDriver::config_path(const std::string &interface) const
        {
            return std::filesystem::path(config_.paths.hostapd_dir) / ("netprov-" + interface + ".conf");
        }

        std::filesystem::path WirelessDriver::pid_path(const std::string &interface) const
        {
            return std::filesystem::path(config_.paths.run_dir) / ("hostapd-" + interface + ".pid");
        }

        std::string WirelessDriver::render_hostapd_config(const model::WirelessConfig &ap) const
        {
            std::ostringstream conf;
            conf << "# Managed by netprovd, do not edit\n";
            conf << "interface=" << ap.interface << "\n";
            if (!ap.bridge.empty())
            {
                conf << "bridge=" << ap.bridge << "\n";
            }
            conf << "driver=nl80211\n";
            conf << "ssid=" << ap.ssid << "\n";
            conf << "hw_mode=" << ap.hw_mode << "\n";
            conf << "channel=" << ap.channel << "\n";
            conf << "wmm_enabled=0\n";
            conf << "macaddr_acl=0\n";
            conf << "auth_algs=1\n";
            conf << "ignore_broadcast_ssid=0\n";

            if (!ap.is_open())
            {
                conf << "wpa=2\n";
                conf << "wpa_passphrase=" << ap.password << "\n";
                conf << "wpa_key_mgmt=WPA-PSK\n";
                conf << "rsn_pairwise=CCMP\n";
            }
            return conf.str();
        }

        std::string WirelessDriver::digest(const model::WirelessConfig &ap) const
        {
            return infrastructure::config_digest(render_hostapd_config(ap));
        }

        infrastructure::DaemonInstance WirelessDriver::hostapd(const std::string &interface)
        {
            return infrastructure::DaemonInstance("hostapd@" + interface, pid_path(interface), runner_,
                                                  command_timeout());
        }

        std::vector<std::string> WirelessDriver::hostapd_command(const std::string &interface) const
        {
            return {"hostapd", "-B", "-P", pid_path(interface).string(), config_path(interface).string()};
        }

        bool WirelessDriver::start_hostapd(const std::string &interface, std::string &cause)
        {
            auto result = hostapd(interface).start(hostapd_command(interface));
            if (!result.ok())
            {
                cause = "hostapd: " + result.describe();
                return false;
            }
            return true;
        }

        bool WirelessDriver::stop_hostapd(const std::string &interface, std::string &cause)
        {
            auto result = hostapd(interface).stop();
            if (!result.ok())
            {
                cause = "hostapd: " + result.describe();
                return false;
            }
            return true;
        }

        DriverResult WirelessDriver::apply(const model::WirelessConfig &ap, const StateListener &listener)
        {
            Activation activation(model::ObjectKind::WIRELESS, ap.interface, listener, activation_timeout(), logger_);
            const auto &ifname = ap.interface;

            activation.enter(DriverState::VALIDATING);
            if (!link_exists(ifname))
            {
                activation.fail("check interface", "interface " + ifname + " is gone");
                return activation.finish(DriverResult::Status::APPLIED);
            }

            activation.enter(DriverState::WRITING_CONFIG, config_path(ifname).string());
            infrastructure::StagedConfigFile conf(config_.paths.staging_dir, config_path(ifname));
            if (!conf.stage(render_hostapd_config(ap)))
            {
                activation.fail("stage hostapd config", "cannot write " + conf.staged_path().string());
                return activation.finish(DriverResult::Status::APPLIED);
            }

            activation.enter(DriverState::ACTIVATING, "starting hostapd on " + ifname);
            bool was_up = link_up(ifname);

            // An instance left over from an earlier run still holds the radio
            if (hostapd(ifname).is_running())
            {
                activation.step(
                    "stop previous hostapd", [&](std::string &cause) { return stop_hostapd(ifname, cause); },
                    [this, ifname](std::string &cause) { return start_hostapd(ifname, cause); });
            }

            activation.step(
                "install hostapd config",
                [&](std::string &cause) {
                    cause = "cannot install " + conf.live_path().string();
                    return conf.install();
                },
                [&conf](std::string &cause) {
                    cause = "cannot restore " + conf.live_path().string();
                    return conf.restore();
                });

            // hostapd raises the link itself
            if (!was_up)
            {
                activation.guard("link state", [this, ifname](std::string &cause) {
                    return set_link(ifname, false, cause);
                });
            }

            activation.step(
                "start hostapd", [&](std::string &cause) { return start_hostapd(ifname, cause); },
                [this, ifname](std::string &cause) { return stop_hostapd(ifname, cause); });

            auto result = activation.finish(DriverResult::Status::APPLIED);
            conf.discard();
            if (result.ok())
            {
                result.meta.config_digest = digest(ap);
                result.meta.link_was_up = was_up;
                logger_->info("Access point broadcasting",
                              core::LogContext()
                                  .add("interface", ifname)
                                  .add("ssid", ap.ssid)
                                  .add("channel", ap.channel)
                                  .add("secured", !ap.is_open()));
            }
            return result;
        }

        DriverResult WirelessDriver::teardown(const model::WirelessConfig &ap, const StateListener &listener)
        {
            Activation activation(model::ObjectKind::WIRELESS, ap.interface, listener, activation_timeout(), logger_);
            const auto &ifname = ap.interface;

            activation.enter(DriverState::ACTIVATING, "stopping hostapd on " + ifname);

            bool running = hostapd(ifname).is_running();
            activation.step(
                "stop hostapd", [&](std::string &cause) { return stop_hostapd(ifname, cause); },
                running ? RollbackJournal::Inverse([this, ifname](std::string &cause) {
                    return start_hostapd(ifname, cause);
                })
                        : RollbackJournal::Inverse());

            infrastructure::StagedConfigFile conf(config_.paths.staging_dir, config_path(ifname));
            activation.step(
                "remove hostapd config",
                [&](std::string &cause) {
                    cause = "cannot remove " + conf.live_path().string();
                    return conf.remove_live();
                },
                [&conf](std::string &cause) {
                    cause = "cannot restore " + conf.live_path().string();
                    return conf.restore();
                });

            if (!ap.meta.link_was_up && link_up(ifname))
            {
                activation.step(
                    "restore link state", [&](std::string &cause) { return set_link(ifname, false, cause); },
                    [this, ifname](std::string &cause) { return set_link(ifname, true, cause); });
            }

            auto result = activation.finish(DriverResult::Status::REMOVED);
            conf.discard();
            if (result.ok())
            {
                logger_->info("Access point removed", core::LogContext().add("interface", ifname));
            }
            return result;
        }

        bool WirelessDriver::probe(const model::WirelessConfig &ap)
        {
            if (!link_exists(ap.interface) || ap.meta.config_digest != digest(ap))
            {
                return false;
            }
            auto live = infrastructure::read_text_file(config_path(ap.interface));
            if (!live || infrastructure::config_digest(*live) != ap.meta.config_digest)
            {
                return false;
            }
            return hostapd(ap.interface).is_running();
        }

    } // namespace drivers
} // namespace netprov
