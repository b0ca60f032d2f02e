#include "core/engine.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "database/config_store.hpp"
#include "drivers/bridge_driver.hpp"
#include "drivers/hotspot_driver.hpp"
#include "drivers/vlan_driver.hpp"
#include "drivers/wireless_driver.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/interface_discovery.hpp"
#include "services/progress_channel.hpp"
#include "services/reconciler.hpp"
#include "services/status_projector.hpp"

#include <stdexcept>

namespace netprov
{
    namespace core
    {

        ProvisioningEngine::ProvisioningEngine(std::unique_ptr<EngineConfig> config)
            : ProvisioningEngine(std::move(config), std::make_shared<infrastructure::ProcessCommandRunner>(),
                                 std::make_shared<infrastructure::LinuxInterfaceDiscovery>())
        {
        }

        ProvisioningEngine::ProvisioningEngine(std::unique_ptr<EngineConfig> config,
                                               std::shared_ptr<infrastructure::CommandRunner> runner,
                                               std::shared_ptr<infrastructure::InterfaceSource> interfaces)
            : config_(std::move(config)), logger_(get_logger("ProvisioningEngine")), runner_(std::move(runner)),
              interfaces_(std::move(interfaces)), start_time_(std::chrono::steady_clock::now())
        {
            if (!config_)
            {
                throw std::invalid_argument("Engine configuration cannot be null");
            }
            if (!runner_ || !interfaces_)
            {
                throw std::invalid_argument("Command runner and interface source are required");
            }

            logger_->info("Provisioning engine initialized",
                          LogContext()
                              .add("engine_id", config_->engine_id)
                              .add("state_db", config_->paths.state_db)
                              .add("api_enabled", config_->api.enabled));
        }

        ProvisioningEngine::~ProvisioningEngine()
        {
            stop();
        }

        bool ProvisioningEngine::start()
        {
            if (running_.exchange(true))
            {
                return true; // Already running
            }

            try
            {
                logger_->info("Starting provisioning engine...");

                store_ = std::make_unique<db::ConfigStore>(config_->paths.state_db);

                wireless_driver_ = std::make_unique<drivers::WirelessDriver>(*runner_, *interfaces_, *config_);
                hotspot_driver_ = std::make_unique<drivers::HotspotDriver>(*runner_, *interfaces_, *config_);
                vlan_driver_ = std::make_unique<drivers::VlanDriver>(*runner_, *interfaces_, *config_);
                bridge_driver_ = std::make_unique<drivers::BridgeDriver>(*runner_, *interfaces_, *config_);

                progress_ = std::make_shared<services::ProgressChannel>(static_cast<size_t>(config_->events.retained));
                reconciler_ = std::make_shared<services::Reconciler>(*store_, *interfaces_, *wireless_driver_,
                                                                     *hotspot_driver_, *vlan_driver_, *bridge_driver_,
                                                                     *progress_);
                projector_ = std::make_shared<services::StatusProjector>(*store_, *interfaces_, config_->engine_id,
                                                                         progress_.get());

                log_recovery(reconciler_->recover());

                start_time_ = std::chrono::steady_clock::now();
                logger_->info("Provisioning engine started");
                return true;
            }
            catch (const std::exception &e)
            {
                logger_->error("Failed to start provisioning engine", LogContext().add("error", e.what()));
                running_ = false;
                return false;
            }
        }

        void ProvisioningEngine::stop()
        {
            if (!running_.exchange(false))
            {
                return;
            }

            // Provisioned segments stay up across restarts; only the engine stops
            logger_->info("Stopping provisioning engine...");
            if (reconciler_)
            {
                reconciler_->drain();
            }
            logger_->info("Provisioning engine stopped");
        }

        std::chrono::seconds ProvisioningEngine::uptime() const
        {
            return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_time_);
        }

        void ProvisioningEngine::log_recovery(const services::RecoveryReport &report)
        {
            logger_->info("Startup recovery finished",
                          LogContext()
                              .add("live", report.live.size())
                              .add("reapplied", report.reapplied.size())
                              .add("degraded", report.degraded.size())
                              .add("failed", report.failed.size()));

            for (const auto &key : report.degraded)
            {
                logger_->warning("Object is degraded, its interface is missing", LogContext().add("object", key));
            }
            for (const auto &key : report.failed)
            {
                logger_->error("Object could not be re-applied", LogContext().add("object", key));
            }
        }

    } // namespace core
} // namespace netprov
