#ifndef NETPROV_CORE_ENGINE_HPP
#define NETPROV_CORE_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

// Forward declarations
namespace netprov
{
    namespace core
    {
        class EngineConfig;
        class Logger;
    }
    namespace db
    {
        class ConfigStore;
    }
    namespace infrastructure
    {
        class CommandRunner;
        class InterfaceSource;
    }
    namespace drivers
    {
        class WirelessDriver;
        class HotspotDriver;
        class VlanDriver;
        class BridgeDriver;
    }
    namespace services
    {
        class ProgressChannel;
        class Reconciler;
        class StatusProjector;
        struct RecoveryReport;
    }
}

namespace netprov
{
    namespace core
    {

        /**
         * Provisioning engine
         * Owns the command runner, interface discovery, config store, the
         * four drivers and the services built on them.
         */
        class ProvisioningEngine
        {
        public:
            explicit ProvisioningEngine(std::unique_ptr<EngineConfig> config);

            // Injection point for tests and dry runs
            ProvisioningEngine(std::unique_ptr<EngineConfig> config,
                               std::shared_ptr<infrastructure::CommandRunner> runner,
                               std::shared_ptr<infrastructure::InterfaceSource> interfaces);
            ~ProvisioningEngine();

            /**
             * Open the store and run startup recovery. Returns false when the
             * store cannot be opened.
             */
            bool start();

            /**
             * Waits for running operations to finish (an activation is never
             * cut short) and refuses new ones. Segments stay provisioned.
             */
            void stop();
            bool is_running() const { return running_; }

            const EngineConfig &config() const { return *config_; }
            std::chrono::seconds uptime() const;

            std::shared_ptr<services::Reconciler> get_reconciler() const { return reconciler_; }
            std::shared_ptr<services::StatusProjector> get_status_projector() const { return projector_; }
            std::shared_ptr<services::ProgressChannel> get_progress_channel() const { return progress_; }

        private:
            void log_recovery(const services::RecoveryReport &report);

            std::unique_ptr<EngineConfig> config_;
            std::shared_ptr<Logger> logger_;

            std::shared_ptr<infrastructure::CommandRunner> runner_;
            std::shared_ptr<infrastructure::InterfaceSource> interfaces_;
            std::unique_ptr<db::ConfigStore> store_;

            std::unique_ptr<drivers::WirelessDriver> wireless_driver_;
            std::unique_ptr<drivers::HotspotDriver> hotspot_driver_;
            std::unique_ptr<drivers::VlanDriver> vlan_driver_;
            std::unique_ptr<drivers::BridgeDriver> bridge_driver_;

            std::shared_ptr<services::ProgressChannel> progress_;
            std::shared_ptr<services::Reconciler> reconciler_;
            std::shared_ptr<services::StatusProjector> projector_;

            std::atomic<bool> running_{false};
            std::chrono::steady_clock::time_point start_time_;
        };

    } // namespace core
} // namespace netprov

#endif // NETPROV_CORE_ENGINE_HPP
