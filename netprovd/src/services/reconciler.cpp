/**
 * Reconciler
 * Validator -> driver -> store sequencing, rollback reporting and startup recovery
 */

#include "services/reconciler.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace netprov
{
    namespace services
    {

        using model::ObjectKind;

        namespace
        {
            ObjectKind kind_of(const model::WirelessConfig &) { return ObjectKind::WIRELESS; }
            ObjectKind kind_of(const model::HotspotInstance &) { return ObjectKind::HOTSPOT; }
            ObjectKind kind_of(const model::VlanConfig &) { return ObjectKind::VLAN; }
            ObjectKind kind_of(const model::BridgeConfig &) { return ObjectKind::BRIDGE; }

            std::vector<std::string> lock_names(const model::WirelessConfig &ap)
            {
                return {ap.interface, ap.bridge};
            }

            std::vector<std::string> lock_names(const model::HotspotInstance &hotspot)
            {
                return {hotspot.interface};
            }

            std::vector<std::string> lock_names(const model::VlanConfig &vlan)
            {
                return {vlan.parent_interface, vlan.name};
            }

            std::vector<std::string> lock_names(const model::BridgeConfig &bridge)
            {
                auto names = bridge.members;
                names.push_back(bridge.name);
                return names;
            }

            const model::WirelessConfig *find_stored(const model::DesiredState &state, const model::WirelessConfig &ap)
            {
                return state.find_wireless(ap.interface);
            }

            const model::HotspotInstance *find_stored(const model::DesiredState &state,
                                                      const model::HotspotInstance &hotspot)
            {
                return state.find_hotspot(hotspot.interface);
            }

            const model::VlanConfig *find_stored(const model::DesiredState &state, const model::VlanConfig &vlan)
            {
                return state.find_vlan(vlan.name);
            }

            const model::BridgeConfig *find_stored(const model::DesiredState &state, const model::BridgeConfig &bridge)
            {
                return state.find_bridge(bridge.name);
            }

            std::vector<model::WirelessConfig> &items(model::DesiredState &state, const model::WirelessConfig &)
            {
                return state.wireless;
            }

            std::vector<model::HotspotInstance> &items(model::DesiredState &state, const model::HotspotInstance &)
            {
                return state.hotspots;
            }

            std::vector<model::VlanConfig> &items(model::DesiredState &state, const model::VlanConfig &)
            {
                return state.vlans;
            }

            std::vector<model::BridgeConfig> &items(model::DesiredState &state, const model::BridgeConfig &)
            {
                return state.bridges;
            }

            template <typename Config>
            void unreserve(model::DesiredState &state, const Config &object)
            {
                auto &list = items(state, object);
                list.erase(std::remove_if(list.begin(), list.end(),
                                          [&](const Config &item) { return item.key() == object.key(); }),
                           list.end());
            }

            template <typename T>
            void append(std::vector<T> &target, const std::vector<T> &source)
            {
                target.insert(target.end(), source.begin(), source.end());
            }

            int64_t unix_now()
            {
                return db::getCurrentTimestamp();
            }

            Severity severity_for(drivers::DriverState state)
            {
                switch (state)
                {
                case drivers::DriverState::ROLLING_BACK:
                    return Severity::WARNING;
                case drivers::DriverState::FAILED:
                    return Severity::ERROR;
                default:
                    return Severity::INFO;
                }
            }
        }

        std::vector<std::string> find_dependents(ObjectKind kind, const std::string &key,
                                                 const model::DesiredState &state)
        {
            std::vector<std::string> dependents;

            if (kind == ObjectKind::VLAN)
            {
                if (state.find_hotspot(key))
                    dependents.push_back(model::qualified_key(ObjectKind::HOTSPOT, key));
                if (state.find_wireless(key))
                    dependents.push_back(model::qualified_key(ObjectKind::WIRELESS, key));
                for (const auto &bridge : state.bridges)
                {
                    if (bridge.has_member(key))
                        dependents.push_back(model::qualified_key(ObjectKind::BRIDGE, bridge.name));
                }
            }
            else if (kind == ObjectKind::BRIDGE)
            {
                if (state.find_hotspot(key))
                    dependents.push_back(model::qualified_key(ObjectKind::HOTSPOT, key));
                for (const auto &ap : state.wireless)
                {
                    if (ap.bridge == key)
                        dependents.push_back(model::qualified_key(ObjectKind::WIRELESS, ap.interface));
                }
            }

            return dependents;
        }

        Reconciler::Reconciler(db::ConfigStore &store, const infrastructure::InterfaceSource &interfaces,
                               drivers::SegmentDriver<model::WirelessConfig> &wireless,
                               drivers::SegmentDriver<model::HotspotInstance> &hotspot,
                               drivers::SegmentDriver<model::VlanConfig> &vlan,
                               drivers::SegmentDriver<model::BridgeConfig> &bridge, ProgressChannel &progress)
            : store_(store), interfaces_(interfaces), wireless_(wireless), hotspot_(hotspot), vlan_(vlan),
              bridge_(bridge), progress_(progress), logger_(core::get_logger("Reconciler"))
        {
        }

        model::DesiredState Reconciler::admission_state() const
        {
            // Caller holds admission_mutex_
            auto state = store_.snapshot();
            append(state.wireless, reserved_.wireless);
            append(state.hotspots, reserved_.hotspots);
            append(state.vlans, reserved_.vlans);
            append(state.bridges, reserved_.bridges);
            return state;
        }

        std::vector<std::string> Reconciler::missing_interfaces(const std::vector<std::string> &names) const
        {
            auto links = interfaces_.list_all();
            std::vector<std::string> missing;
            for (const auto &name : names)
            {
                bool present = std::any_of(links.begin(), links.end(),
                                           [&](const model::Interface &link) { return link.name == name; });
                if (!present)
                {
                    missing.push_back(name);
                }
            }
            return missing;
        }

        Reconciler::OperationScope::OperationScope(Reconciler &owner, ObjectKind kind, const std::string &key)
            : owner_(owner)
        {
            std::lock_guard<std::mutex> lock(owner_.activity_mutex_);
            if (owner_.draining_)
            {
                throw core::ValidationConflict(kind, key, "engine is shutting down");
            }
            ++owner_.in_flight_;
        }

        Reconciler::OperationScope::~OperationScope()
        {
            std::lock_guard<std::mutex> lock(owner_.activity_mutex_);
            if (--owner_.in_flight_ == 0)
            {
                owner_.idle_.notify_all();
            }
        }

        void Reconciler::drain()
        {
            std::unique_lock<std::mutex> lock(activity_mutex_);
            draining_ = true;
            if (in_flight_ > 0)
            {
                logger_->info("Waiting for running operations", core::LogContext().add("in_flight", in_flight_));
            }
            idle_.wait(lock, [this] { return in_flight_ == 0; });
        }

        size_t Reconciler::in_flight() const
        {
            std::lock_guard<std::mutex> lock(activity_mutex_);
            return in_flight_;
        }

        drivers::StateListener Reconciler::listener_for(const std::string &operation_id, ObjectKind kind,
                                                        const std::string &key)
        {
            return [this, operation_id, kind, key](drivers::DriverState state, const std::string &message) {
                progress_.publish(operation_id, kind, key, drivers::to_string(state), message, severity_for(state));
            };
        }

        void Reconciler::raise_driver_failure(const drivers::DriverResult &result, ObjectKind kind,
                                              const std::string &key, const std::string &operation_id)
        {
            if (result.status == drivers::DriverResult::Status::ROLLBACK_FAILED)
            {
                auto cause = result.step + " failed (" + result.cause + "), then " + result.rollback_step +
                             " failed (" + result.rollback_cause + ")";
                logger_->alert("Operation left host in unknown state",
                               core::LogContext()
                                   .add("object", model::qualified_key(kind, key))
                                   .add("operation", operation_id)
                                   .add("cause", cause));
                progress_.publish(operation_id, kind, key, "rollback-failed", cause, Severity::CRITICAL);
                throw core::RollbackFailure(kind, key, result.rollback_step, cause);
            }

            progress_.publish(operation_id, kind, key, "failed", result.step + ": " + result.cause, Severity::ERROR);
            throw core::DriverFailure(kind, key, result.step, result.cause);
        }

        template <typename Config>
        Config Reconciler::create_object(Config request, drivers::SegmentDriver<Config> &driver)
        {
            const auto kind = kind_of(request);
            const auto key = request.key();
            OperationScope activity(*this, kind, key);

            const auto operation_id = progress_.next_operation_id();

            request.meta = model::ProvisionMeta();
            progress_.publish(operation_id, kind, key, "pending", "create requested");
            logger_->info("Create requested",
                          core::LogContext().add("object", model::qualified_key(kind, key)).add("operation", operation_id));

            auto guard = locks_.acquire(lock_names(request));

            {
                std::lock_guard<std::mutex> admission(admission_mutex_);
                progress_.publish(operation_id, kind, key, "validating", "checking conflicts");

                auto state = admission_state();
                if (const auto *existing = find_stored(state, request))
                {
                    if (model::same_desired_state(*existing, request) &&
                        existing->meta.config_digest == driver.digest(request))
                    {
                        logger_->info("Object already applied, nothing to do",
                                      core::LogContext().add("object", model::qualified_key(kind, key)));
                        progress_.publish(operation_id, kind, key, "applied", "unchanged");
                        return *existing;
                    }
                }

                auto verdict = validator_.check(request, state, interfaces_.list_all());
                if (!verdict.is_ok())
                {
                    logger_->warning("Create rejected",
                                     core::LogContext()
                                         .add("object", model::qualified_key(kind, key))
                                         .add("reason", verdict.reason));
                    progress_.publish(operation_id, kind, key, "rejected", verdict.reason, Severity::WARNING);
                    ConflictValidator::raise_if_rejected(verdict, kind, key);
                }

                items(reserved_, request).push_back(request);
            }

            struct Reservation
            {
                Reconciler &owner;
                const Config &object;
                ~Reservation()
                {
                    std::lock_guard<std::mutex> admission(owner.admission_mutex_);
                    unreserve(owner.reserved_, object);
                }
            } reservation{*this, request};

            auto result = driver.apply(request, listener_for(operation_id, kind, key));
            if (!result.ok())
            {
                raise_driver_failure(result, kind, key, operation_id);
            }

            Config stored = request;
            stored.meta = result.meta;
            stored.meta.applied_at = unix_now();

            try
            {
                store_.put(stored);
            }
            catch (const core::StoreFailure &e)
            {
                logger_->error("Store write failed, undoing driver work",
                               core::LogContext().add("object", model::qualified_key(kind, key)).add("error", e.what()));
                progress_.publish(operation_id, kind, key, "store-failed", e.what(), Severity::ERROR);

                auto undo = driver.teardown(stored, listener_for(operation_id, kind, key));
                if (!undo.ok())
                {
                    auto cause = std::string(e.what()) + "; undo failed at " + undo.step + ": " + undo.cause;
                    logger_->alert("Applied object is neither stored nor removed",
                                   core::LogContext().add("object", model::qualified_key(kind, key)).add("cause", cause));
                    progress_.publish(operation_id, kind, key, "rollback-failed", cause, Severity::CRITICAL);
                    throw core::RollbackFailure(kind, key, "undo apply", cause);
                }
                throw;
            }

            progress_.publish(operation_id, kind, key, "stored", "desired state recorded");
            logger_->info("Object provisioned", core::LogContext().add("object", model::qualified_key(kind, key)));
            return stored;
        }

        template <typename Config>
        void Reconciler::destroy_object(const Config &stored, drivers::SegmentDriver<Config> &driver)
        {
            const auto kind = kind_of(stored);
            const auto key = stored.key();

            OperationScope activity(*this, kind, key);

            const auto operation_id = progress_.next_operation_id();

            progress_.publish(operation_id, kind, key, "pending", "delete requested");
            logger_->info("Delete requested",
                          core::LogContext().add("object", model::qualified_key(kind, key)).add("operation", operation_id));

            auto guard = locks_.acquire(lock_names(stored));

            Config current;
            {
                std::lock_guard<std::mutex> admission(admission_mutex_);
                auto state = admission_state();
                const auto *found = find_stored(state, stored);
                if (!found)
                {
                    throw core::ObjectNotFound(kind, key);
                }
                current = *found;

                auto dependents = find_dependents(kind, key, state);
                if (!dependents.empty())
                {
                    logger_->warning("Delete blocked by dependents",
                                     core::LogContext()
                                         .add("object", model::qualified_key(kind, key))
                                         .add("dependents", dependents));
                    progress_.publish(operation_id, kind, key, "rejected", "object has dependents", Severity::WARNING);
                    throw core::DependencyExists(kind, key, dependents);
                }
            }

            auto result = driver.teardown(current, listener_for(operation_id, kind, key));
            if (!result.ok())
            {
                raise_driver_failure(result, kind, key, operation_id);
            }

            try
            {
                store_.remove(kind, key);
            }
            catch (const core::StoreFailure &e)
            {
                logger_->error("Store delete failed, re-applying object",
                               core::LogContext().add("object", model::qualified_key(kind, key)).add("error", e.what()));
                progress_.publish(operation_id, kind, key, "store-failed", e.what(), Severity::ERROR);

                auto redo = driver.apply(current, listener_for(operation_id, kind, key));
                if (!redo.ok())
                {
                    auto cause = std::string(e.what()) + "; re-apply failed at " + redo.step + ": " + redo.cause;
                    logger_->alert("Stored object no longer provisioned",
                                   core::LogContext().add("object", model::qualified_key(kind, key)).add("cause", cause));
                    progress_.publish(operation_id, kind, key, "rollback-failed", cause, Severity::CRITICAL);
                    throw core::RollbackFailure(kind, key, "re-apply", cause);
                }
                throw;
            }

            progress_.publish(operation_id, kind, key, "removed", "desired state deleted");
            logger_->info("Object removed", core::LogContext().add("object", model::qualified_key(kind, key)));
        }

        template <typename Config>
        void Reconciler::forget_object(const Config &stored)
        {
            const auto kind = kind_of(stored);
            const auto key = stored.key();

            OperationScope activity(*this, kind, key);

            const auto operation_id = progress_.next_operation_id();

            auto guard = locks_.acquire(lock_names(stored));

            std::lock_guard<std::mutex> admission(admission_mutex_);
            auto state = admission_state();
            const auto *found = find_stored(state, stored);
            if (!found)
            {
                throw core::ObjectNotFound(kind, key);
            }

            auto missing = missing_interfaces(model::backing_interfaces(*found));
            if (missing.empty())
            {
                throw core::ValidationConflict(kind, key,
                                               model::qualified_key(kind, key) + " is not degraded; delete it instead");
            }

            auto dependents = find_dependents(kind, key, state);
            if (!dependents.empty())
            {
                throw core::DependencyExists(kind, key, dependents);
            }

            store_.remove(kind, key);
            logger_->warning("Degraded object forgotten",
                             core::LogContext().add("object", model::qualified_key(kind, key)).add("missing", missing));
            progress_.publish(operation_id, kind, key, "forgotten", "removed from store without touching the host",
                              Severity::WARNING);
        }

        template <typename Config>
        void Reconciler::recover_object(const Config &stored, drivers::SegmentDriver<Config> &driver,
                                        RecoveryReport &report)
        {
            const auto kind = kind_of(stored);
            const auto key = stored.key();
            const auto qualified = model::qualified_key(kind, key);
            const auto operation_id = progress_.next_operation_id();

            auto guard = locks_.acquire(lock_names(stored));

            auto missing = missing_interfaces(model::backing_interfaces(stored));
            if (!missing.empty())
            {
                logger_->warning("Backing interface missing, object degraded",
                                 core::LogContext().add("object", qualified).add("missing", missing));
                progress_.publish(operation_id, kind, key, "degraded", "missing interface " + missing.front(),
                                  Severity::WARNING);
                report.degraded.push_back(qualified);
                return;
            }

            if (driver.probe(stored))
            {
                logger_->debug("Object live", core::LogContext().add("object", qualified));
                report.live.push_back(qualified);
                return;
            }

            logger_->info("Object not live, re-applying", core::LogContext().add("object", qualified));
            auto result = driver.apply(stored, listener_for(operation_id, kind, key));
            if (!result.ok())
            {
                report.failed.push_back(qualified);
                if (result.status == drivers::DriverResult::Status::ROLLBACK_FAILED)
                {
                    logger_->alert("Startup re-apply could not be rolled back",
                                   core::LogContext()
                                       .add("object", qualified)
                                       .add("step", result.rollback_step)
                                       .add("cause", result.rollback_cause));
                    progress_.publish(operation_id, kind, key, "rollback-failed",
                                      result.rollback_step + ": " + result.rollback_cause, Severity::CRITICAL);
                }
                else
                {
                    logger_->error("Startup re-apply failed",
                                   core::LogContext().add("object", qualified).add("step", result.step).add("cause", result.cause));
                }
                return;
            }

            // Desired fields and the original link state stay as stored
            Config updated = stored;
            updated.meta.config_digest = result.meta.config_digest;
            updated.meta.applied_at = unix_now();
            try
            {
                store_.put(updated);
            }
            catch (const core::StoreFailure &e)
            {
                logger_->error("Cannot refresh provisioning metadata",
                               core::LogContext().add("object", qualified).add("error", e.what()));
            }
            report.reapplied.push_back(qualified);
        }

        model::WirelessConfig Reconciler::create(const model::WirelessConfig &request)
        {
            return create_object(request, wireless_);
        }

        model::HotspotInstance Reconciler::create(const model::HotspotInstance &request)
        {
            return create_object(request, hotspot_);
        }

        model::VlanConfig Reconciler::create(const model::VlanConfig &request)
        {
            auto vlan = request;
            vlan.name = model::VlanConfig::derive_name(vlan.parent_interface, vlan.id);
            return create_object(vlan, vlan_);
        }

        model::BridgeConfig Reconciler::create(const model::BridgeConfig &request)
        {
            auto bridge = request;
            bridge.members = model::normalize_members(bridge.members);
            return create_object(bridge, bridge_);
        }

        void Reconciler::destroy(ObjectKind kind, const std::string &key)
        {
            switch (kind)
            {
            case ObjectKind::WIRELESS:
                if (auto stored = store_.get_wireless(key))
                    return destroy_object(*stored, wireless_);
                break;
            case ObjectKind::HOTSPOT:
                if (auto stored = store_.get_hotspot(key))
                    return destroy_object(*stored, hotspot_);
                break;
            case ObjectKind::VLAN:
                if (auto stored = store_.get_vlan(key))
                    return destroy_object(*stored, vlan_);
                break;
            case ObjectKind::BRIDGE:
                if (auto stored = store_.get_bridge(key))
                    return destroy_object(*stored, bridge_);
                break;
            }
            throw core::ObjectNotFound(kind, key);
        }

        void Reconciler::forget(ObjectKind kind, const std::string &key)
        {
            switch (kind)
            {
            case ObjectKind::WIRELESS:
                if (auto stored = store_.get_wireless(key))
                    return forget_object(*stored);
                break;
            case ObjectKind::HOTSPOT:
                if (auto stored = store_.get_hotspot(key))
                    return forget_object(*stored);
                break;
            case ObjectKind::VLAN:
                if (auto stored = store_.get_vlan(key))
                    return forget_object(*stored);
                break;
            case ObjectKind::BRIDGE:
                if (auto stored = store_.get_bridge(key))
                    return forget_object(*stored);
                break;
            }
            throw core::ObjectNotFound(kind, key);
        }

        RecoveryReport Reconciler::recover()
        {
            RecoveryReport report;
            logger_->info("Startup recovery started");

            for (const auto &vlan : store_.list_vlans())
                recover_object(vlan, vlan_, report);
            for (const auto &bridge : store_.list_bridges())
                recover_object(bridge, bridge_, report);
            for (const auto &ap : store_.list_wireless())
                recover_object(ap, wireless_, report);
            for (const auto &hotspot : store_.list_hotspots())
                recover_object(hotspot, hotspot_, report);

            logger_->info("Startup recovery finished",
                          core::LogContext()
                              .add("live", report.live.size())
                              .add("reapplied", report.reapplied.size())
                              .add("degraded", report.degraded)
                              .add("failed", report.failed));
            return report;
        }

    } // namespace services
} // namespace netprov
