#ifndef NETPROV_SERVICES_RECONCILER_HPP
#define NETPROV_SERVICES_RECONCILER_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "database/config_store.hpp"
#include "drivers/segment_driver.hpp"
#include "infrastructure/interface_discovery.hpp"
#include "services/conflict_validator.hpp"
#include "services/interface_locks.hpp"
#include "services/progress_channel.hpp"

namespace netprov
{
    namespace core
    {
        class Logger;
    }
}

namespace netprov
{
    namespace services
    {

        /**
         * Outcome of startup recovery, as qualified keys ("vlan:eth0.10")
         */
        struct RecoveryReport
        {
            std::vector<std::string> live;      // probe confirmed, untouched
            std::vector<std::string> reapplied; // driver re-applied stored state
            std::vector<std::string> degraded;  // backing interface missing
            std::vector<std::string> failed;    // re-apply failed, rolled back
        };

        /**
         * Objects in state that reference (kind, key), as qualified keys.
         * VLANs are referenced by hotspots, access points and bridge
         * membership on the VLAN link; bridges by hotspots on the bridge and
         * access points with bridge= set.
         */
        std::vector<std::string> find_dependents(model::ObjectKind kind, const std::string &key,
                                                 const model::DesiredState &state);

        /**
         * Reconciler
         * The only writer of the config store. Runs validator -> driver -> store
         * for create and the reverse for destroy, one interface at a time.
         */
        class Reconciler
        {
        public:
            Reconciler(db::ConfigStore &store, const infrastructure::InterfaceSource &interfaces,
                       drivers::SegmentDriver<model::WirelessConfig> &wireless,
                       drivers::SegmentDriver<model::HotspotInstance> &hotspot,
                       drivers::SegmentDriver<model::VlanConfig> &vlan,
                       drivers::SegmentDriver<model::BridgeConfig> &bridge, ProgressChannel &progress);

            /**
             * Provision a new object and return it as stored (with meta).
             * Re-submitting an object identical to the stored one is a no-op.
             * Throws ValidationConflict, InterfaceNotFound, DriverFailure,
             * RollbackFailure or StoreFailure.
             */
            model::WirelessConfig create(const model::WirelessConfig &request);
            model::HotspotInstance create(const model::HotspotInstance &request);
            model::VlanConfig create(const model::VlanConfig &request); // name derived from parent and id
            model::BridgeConfig create(const model::BridgeConfig &request);

            /**
             * Tear down and forget a stored object. Throws ObjectNotFound,
             * DependencyExists, DriverFailure, RollbackFailure or StoreFailure.
             */
            void destroy(model::ObjectKind kind, const std::string &key);

            /**
             * Drop a degraded object from the store without touching the host.
             * Refused with ValidationConflict while its interfaces exist.
             */
            void forget(model::ObjectKind kind, const std::string &key);

            /**
             * Startup pass over the store in dependency order (VLANs, bridges,
             * access points, hotspots). Never deletes anything.
             */
            RecoveryReport recover();

            /**
             * Refuse further operations with ValidationConflict and block until
             * the ones already running have finished or rolled back.
             */
            void drain();

            // Operations currently between admission and their final event
            size_t in_flight() const;

        private:
            template <typename Config>
            Config create_object(Config request, drivers::SegmentDriver<Config> &driver);

            template <typename Config>
            void destroy_object(const Config &stored, drivers::SegmentDriver<Config> &driver);

            template <typename Config>
            void forget_object(const Config &stored);

            template <typename Config>
            void recover_object(const Config &stored, drivers::SegmentDriver<Config> &driver, RecoveryReport &report);

            [[noreturn]] void raise_driver_failure(const drivers::DriverResult &result, model::ObjectKind kind,
                                                   const std::string &key, const std::string &operation_id);

            drivers::StateListener listener_for(const std::string &operation_id, model::ObjectKind kind,
                                                const std::string &key);

            // Stored objects plus admitted objects whose driver is still running
            model::DesiredState admission_state() const;

            std::vector<std::string> missing_interfaces(const std::vector<std::string> &names) const;

            // Counts one create/destroy/forget for drain(); throws once draining
            class OperationScope
            {
            public:
                OperationScope(Reconciler &owner, model::ObjectKind kind, const std::string &key);
                ~OperationScope();

                OperationScope(const OperationScope &) = delete;
                OperationScope &operator=(const OperationScope &) = delete;

            private:
                Reconciler &owner_;
            };

            db::ConfigStore &store_;
            const infrastructure::InterfaceSource &interfaces_;
            drivers::SegmentDriver<model::WirelessConfig> &wireless_;
            drivers::SegmentDriver<model::HotspotInstance> &hotspot_;
            drivers::SegmentDriver<model::VlanConfig> &vlan_;
            drivers::SegmentDriver<model::BridgeConfig> &bridge_;
            ProgressChannel &progress_;

            ConflictValidator validator_;
            InterfaceLocks locks_;

            mutable std::mutex admission_mutex_;
            model::DesiredState reserved_;

            mutable std::mutex activity_mutex_;
            std::condition_variable idle_;
            size_t in_flight_ = 0;
            bool draining_ = false;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace netprov

#endif // NETPROV_SERVICES_RECONCILER_HPP
