/**
 * Segment driver plumbing
 * State machine, rollback journal and shared link helpers
 */

#include "drivers/segment_driver.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace netprov
{
    namespace drivers
    {

        std::string to_string(DriverState state)
        {
            switch (state)
            {
            case DriverState::PENDING:
                return "pending";
            case DriverState::VALIDATING:
                return "validating";
            case DriverState::WRITING_CONFIG:
                return "writing-config";
            case DriverState::ACTIVATING:
                return "activating";
            case DriverState::APPLIED:
                return "applied";
            case DriverState::ROLLING_BACK:
                return "rolling-back";
            case DriverState::FAILED:
                return "failed";
            case DriverState::REMOVED:
                return "removed";
            }
            return "unknown";
        }

        void RollbackJournal::record(const std::string &step, Inverse inverse)
        {
            entries_.push_back({step, std::move(inverse)});
        }

        bool RollbackJournal::replay(std::string &failed_step, std::string &cause)
        {
            bool clean = true;
            for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
            {
                std::string inverse_cause;
                bool ok = false;
                try
                {
                    ok = it->inverse(inverse_cause);
                }
                catch (const std::exception &e)
                {
                    inverse_cause = e.what();
                }

                if (!ok && clean)
                {
                    clean = false;
                    failed_step = "undo " + it->step;
                    cause = inverse_cause;
                }
            }
            entries_.clear();
            return clean;
        }

        Activation::Activation(model::ObjectKind kind, const std::string &key, const StateListener &listener,
                               std::chrono::milliseconds deadline, std::shared_ptr<core::Logger> logger)
            : kind_(kind), key_(key), listener_(listener),
              deadline_(std::chrono::steady_clock::now() + deadline), logger_(std::move(logger))
        {
        }

        void Activation::enter(DriverState state, const std::string &message)
        {
            state_ = state;
            logger_->debug("Driver state",
                           core::LogContext()
                               .add("object", model::qualified_key(kind_, key_))
                               .add("state", to_string(state))
                               .add("message", message));
            if (listener_)
            {
                listener_(state, message);
            }
        }

        bool Activation::step(const std::string &name, const Action &action, RollbackJournal::Inverse inverse)
        {
            if (failed_)
            {
                return false;
            }
            if (state_ == DriverState::ACTIVATING && std::chrono::steady_clock::now() > deadline_)
            {
                fail(name, "activation deadline exceeded");
                return false;
            }

            std::string cause;
            bool ok = false;
            try
            {
                ok = action(cause);
            }
            catch (const std::exception &e)
            {
                cause = e.what();
            }

            if (!ok)
            {
                fail(name, cause);
                return false;
            }

            logger_->debug("Step done",
                           core::LogContext().add("object", model::qualified_key(kind_, key_)).add("step", name));
            if (inverse)
            {
                journal_.record(name, std::move(inverse));
            }
            return true;
        }

        void Activation::guard(const std::string &name, RollbackJournal::Inverse inverse)
        {
            if (!failed_)
            {
                journal_.record(name, std::move(inverse));
            }
        }

        void Activation::fail(const std::string &step, const std::string &cause)
        {
            if (failed_)
            {
                return;
            }
            failed_ = true;
            failed_step_ = step;
            cause_ = cause;
            logger_->error("Driver step failed",
                           core::LogContext()
                               .add("object", model::qualified_key(kind_, key_))
                               .add("step", step)
                               .add("cause", cause));
        }

        DriverResult Activation::finish(DriverResult::Status success_status)
        {
            DriverResult result;

            if (!failed_)
            {
                journal_.clear();
                result.status = success_status;
                enter(success_status == DriverResult::Status::REMOVED ? DriverState::REMOVED : DriverState::APPLIED);
                return result;
            }

            result.step = failed_step_;
            result.cause = cause_;

            enter(DriverState::ROLLING_BACK, failed_step_ + ": " + cause_);
            std::string rollback_step;
            std::string rollback_cause;
            if (journal_.replay(rollback_step, rollback_cause))
            {
                result.status = DriverResult::Status::FAILED;
                enter(DriverState::FAILED, failed_step_ + ": " + cause_);
            }
            else
            {
                result.status = DriverResult::Status::ROLLBACK_FAILED;
                result.rollback_step = rollback_step;
                result.rollback_cause = rollback_cause;
                logger_->alert("Rollback incomplete, live state differs from desired state",
                               core::LogContext()
                                   .add("object", model::qualified_key(kind_, key_))
                                   .add("step", rollback_step)
                                   .add("cause", rollback_cause));
                enter(DriverState::FAILED, rollback_step + ": " + rollback_cause);
            }
            return result;
        }

        DriverBase::DriverBase(const std::string &name, infrastructure::CommandRunner &runner,
                               const infrastructure::InterfaceSource &interfaces, const core::EngineConfig &config)
            : runner_(runner), interfaces_(interfaces), config_(config), logger_(core::get_logger(name))
        {
        }

        std::chrono::milliseconds DriverBase::command_timeout() const
        {
            return std::chrono::seconds(config_.timeouts.command_seconds);
        }

        std::chrono::milliseconds DriverBase::activation_timeout() const
        {
            return std::chrono::seconds(config_.timeouts.activation_seconds);
        }

        bool DriverBase::run(const std::vector<std::string> &argv, std::string &cause)
        {
            auto result = runner_.run(argv, command_timeout());
            if (!result.ok())
            {
                cause = infrastructure::format_command(argv) + ": " + result.describe();
                return false;
            }
            return true;
        }

        infrastructure::CommandResult DriverBase::query(const std::vector<std::string> &argv)
        {
            return runner_.run(argv, command_timeout());
        }

        bool DriverBase::link_exists(const std::string &name) const
        {
            return interfaces_.exists(name);
        }

        bool DriverBase::link_up(const std::string &name) const
        {
            auto iface = interfaces_.find(name);
            return iface && iface->admin_up;
        }

        bool DriverBase::set_link(const std::string &name, bool up, std::string &cause)
        {
            return run({"ip", "link", "set", "dev", name, up ? "up" : "down"}, cause);
        }

        std::vector<std::string> DriverBase::ipv4_addresses(const std::string &name)
        {
            // "3: eth0    inet 192.168.1.10/24 brd 192.168.1.255 scope global eth0\ ..."
            std::vector<std::string> addresses;
            auto result = query({"ip", "-o", "-4", "addr", "show", "dev", name});
            if (!result.ok())
            {
                logger_->warning("Cannot read addresses",
                                 core::LogContext().add("interface", name).add("reason", result.describe()));
                return addresses;
            }

            std::istringstream lines(result.output);
            std::string line;
            while (std::getline(lines, line))
            {
                std::istringstream words(line);
                std::string word;
                while (words >> word)
                {
                    if (word == "inet" && (words >> word))
                    {
                        addresses.push_back(word);
                        break;
                    }
                }
            }
            return addresses;
        }

        bool DriverBase::add_addresses(const std::string &name, const std::vector<std::string> &addresses,
                                       std::string &cause)
        {
            for (const auto &address : addresses)
            {
                if (!run({"ip", "addr", "add", address, "dev", name}, cause))
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace drivers
} // namespace netprov
