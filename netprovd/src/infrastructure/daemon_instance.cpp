/**
 * Per-interface daemon lifecycle
 * Start, stop and liveness checks keyed by pid file
 */

#include "infrastructure/daemon_instance.hpp"
#include "infrastructure/staged_file.hpp"
#include "core/logger.hpp"

#include <thread>

namespace netprov
{
    namespace infrastructure
    {

        namespace
        {
            constexpr std::chrono::milliseconds POLL_INTERVAL{100};
        }

        DaemonInstance::DaemonInstance(const std::string &name, const std::filesystem::path &pid_file,
                                       CommandRunner &runner, std::chrono::milliseconds timeout)
            : name_(name), pid_file_(pid_file), runner_(runner), timeout_(timeout),
              logger_(core::get_logger("DaemonInstance"))
        {
        }

        std::optional<int> DaemonInstance::pid() const
        {
            auto content = read_text_file(pid_file_);
            if (!content)
            {
                return std::nullopt;
            }
            try
            {
                int value = std::stoi(*content);
                if (value > 0)
                {
                    return value;
                }
            }
            catch (const std::exception &)
            {
                logger_->warning("Malformed pid file", core::LogContext().add("file", pid_file_.string()));
            }
            return std::nullopt;
        }

        bool DaemonInstance::process_alive(int pid) const
        {
            return runner_.run({"kill", "-0", std::to_string(pid)}, timeout_).ok();
        }

        bool DaemonInstance::is_running() const
        {
            auto current = pid();
            return current && process_alive(*current);
        }

        CommandResult DaemonInstance::start(const std::vector<std::string> &argv)
        {
            std::error_code ec;
            std::filesystem::create_directories(pid_file_.parent_path(), ec);
            std::filesystem::remove(pid_file_, ec);

            logger_->info("Starting daemon instance",
                          core::LogContext().add("instance", name_).add("argv", argv));

            auto result = runner_.run(argv, timeout_);
            if (!result.ok())
            {
                logger_->error("Daemon failed to start",
                               core::LogContext().add("instance", name_).add("reason", result.describe()));
                return result;
            }

            auto deadline = std::chrono::steady_clock::now() + timeout_;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (is_running())
                {
                    logger_->debug("Daemon instance running",
                                   core::LogContext().add("instance", name_).add("pid", pid().value_or(-1)));
                    return result;
                }
                std::this_thread::sleep_for(POLL_INTERVAL);
            }

            result.exit_code = 1;
            result.output = "no live process behind " + pid_file_.string();
            logger_->error("Daemon did not come up", core::LogContext().add("instance", name_));
            return result;
        }

        CommandResult DaemonInstance::stop()
        {
            CommandResult result;
            result.exit_code = 0;

            auto current = pid();
            if (!current || !process_alive(*current))
            {
                std::error_code ec;
                std::filesystem::remove(pid_file_, ec);
                return result;
            }

            logger_->info("Stopping daemon instance",
                          core::LogContext().add("instance", name_).add("pid", *current));

            result = runner_.run({"kill", "-TERM", std::to_string(*current)}, timeout_);
            if (!result.ok())
            {
                logger_->error("Failed to signal daemon",
                               core::LogContext().add("instance", name_).add("reason", result.describe()));
                return result;
            }

            auto deadline = std::chrono::steady_clock::now() + timeout_;
            while (process_alive(*current))
            {
                if (std::chrono::steady_clock::now() >= deadline)
                {
                    result.exit_code = 1;
                    result.output = "pid " + std::to_string(*current) + " ignored SIGTERM";
                    return result;
                }
                std::this_thread::sleep_for(POLL_INTERVAL);
            }

            std::error_code ec;
            std::filesystem::remove(pid_file_, ec);
            return result;
        }

    } // namespace infrastructure
} // namespace netprov
