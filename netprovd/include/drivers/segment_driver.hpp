#ifndef NETPROV_DRIVERS_SEGMENT_DRIVER_HPP
#define NETPROV_DRIVERS_SEGMENT_DRIVER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/interface_discovery.hpp"
#include "model/network_objects.hpp"

namespace netprov
{
    namespace core
    {
        class Logger;
    }
}

namespace netprov
{
    namespace drivers
    {

        /**
         * Driver state machine. Only ACTIVATING and ROLLING_BACK touch the host.
         */
        enum class DriverState
        {
            PENDING,
            VALIDATING,
            WRITING_CONFIG,
            ACTIVATING,
            APPLIED,
            ROLLING_BACK,
            FAILED,
            REMOVED
        };

        std::string to_string(DriverState state);

        /**
         * Outcome of apply() or teardown()
         */
        struct DriverResult
        {
            enum class Status
            {
                APPLIED,
                REMOVED,
                FAILED,          // step failed, journal fully replayed
                ROLLBACK_FAILED  // step failed and an inverse failed too
            };

            Status status = Status::FAILED;
            std::string step;  // failing step
            std::string cause;

            // Set for ROLLBACK_FAILED: the inverse that could not be undone
            std::string rollback_step;
            std::string rollback_cause;

            // Filled by apply(): digest of rendered config, pre-apply link state
            model::ProvisionMeta meta;

            bool ok() const { return status == Status::APPLIED || status == Status::REMOVED; }
        };

        // Receives every state transition of one apply/teardown
        using StateListener = std::function<void(DriverState state, const std::string &message)>;

        /**
         * Inverse operations registered by effectful steps, replayed newest first.
         */
        class RollbackJournal
        {
        public:
            using Inverse = std::function<bool(std::string &cause)>;

            void record(const std::string &step, Inverse inverse);

            /**
             * Run every inverse in reverse order. All inverses are attempted;
             * the first failure is reported through failed_step and cause.
             */
            bool replay(std::string &failed_step, std::string &cause);

            void clear() { entries_.clear(); }
            bool empty() const { return entries_.empty(); }
            size_t size() const { return entries_.size(); }

        private:
            struct Entry
            {
                std::string step;
                Inverse inverse;
            };
            std::vector<Entry> entries_;
        };

        /**
         * One run of the state machine for a single object. Steps executed
         * through it are journalled; a failed step (or a passed deadline)
         * replays the journal and yields FAILED or ROLLBACK_FAILED.
         */
        class Activation
        {
        public:
            using Action = std::function<bool(std::string &cause)>;

            Activation(model::ObjectKind kind, const std::string &key, const StateListener &listener,
                       std::chrono::milliseconds deadline, std::shared_ptr<core::Logger> logger);

            void enter(DriverState state, const std::string &message = "");

            /**
             * Execute one step; on success register its inverse (if any).
             * Returns false once any step has failed.
             */
            bool step(const std::string &name, const Action &action, RollbackJournal::Inverse inverse = nullptr);

            // Register an inverse without running anything
            void guard(const std::string &name, RollbackJournal::Inverse inverse);

            // Record a failure detected outside step()
            void fail(const std::string &step, const std::string &cause);

            bool failed() const { return failed_; }

            /**
             * Final transition: APPLIED / REMOVED on success, otherwise
             * ROLLING_BACK then FAILED.
             */
            DriverResult finish(DriverResult::Status success_status);

            DriverState state() const { return state_; }

        private:
            model::ObjectKind kind_;
            std::string key_;
            StateListener listener_;
            std::chrono::steady_clock::time_point deadline_;
            std::shared_ptr<core::Logger> logger_;

            DriverState state_ = DriverState::PENDING;
            RollbackJournal journal_;
            bool failed_ = false;
            std::string failed_step_;
            std::string cause_;
        };

        /**
         * Shared plumbing of the four drivers: command execution with the
         * configured timeout, link and address helpers.
         */
        class DriverBase
        {
        public:
            DriverBase(const std::string &name, infrastructure::CommandRunner &runner,
                       const infrastructure::InterfaceSource &interfaces, const core::EngineConfig &config);
            virtual ~DriverBase() = default;

        protected:
            // Runs argv, fills cause with the command and its failure on error
            bool run(const std::vector<std::string> &argv, std::string &cause);
            infrastructure::CommandResult query(const std::vector<std::string> &argv);

            bool link_exists(const std::string &name) const;
            // Administrative state; an idle radio or unplugged port is still up
            bool link_up(const std::string &name) const;
            bool set_link(const std::string &name, bool up, std::string &cause);

            // "10.0.0.1/24" entries currently on the link
            std::vector<std::string> ipv4_addresses(const std::string &name);
            bool add_addresses(const std::string &name, const std::vector<std::string> &addresses, std::string &cause);

            std::chrono::milliseconds command_timeout() const;
            std::chrono::milliseconds activation_timeout() const;

            infrastructure::CommandRunner &runner_;
            const infrastructure::InterfaceSource &interfaces_;
            const core::EngineConfig &config_;
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * Contract shared by every segment driver.
         */
        template <typename Config>
        class SegmentDriver : public DriverBase
        {
        public:
            using DriverBase::DriverBase;

            /**
             * Make the host match config. Returns APPLIED with fresh meta or
             * FAILED / ROLLBACK_FAILED after rolling back.
             */
            virtual DriverResult apply(const Config &config, const StateListener &listener = nullptr) = 0;

            /**
             * Remove what apply() created, using the stored object (and its
             * meta) to restore pre-apply link state.
             */
            virtual DriverResult teardown(const Config &config, const StateListener &listener = nullptr) = 0;

            /**
             * Read-only: is the object live as stored (daemon running with the
             * recorded config digest, links present and enslaved)?
             */
            virtual bool probe(const Config &config) = 0;

            // Digest of what apply() would render for config
            virtual std::string digest(const Config &config) const = 0;
        };

    } // namespace drivers
} // namespace netprov

#endif // NETPROV_DRIVERS_SEGMENT_DRIVER_HPP
