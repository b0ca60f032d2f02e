#ifndef NETPROV_INFRASTRUCTURE_DAEMON_INSTANCE_HPP
#define NETPROV_INFRASTRUCTURE_DAEMON_INSTANCE_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/command_runner.hpp"

namespace netprov
{
    namespace core
    {
        class Logger;
    }
}

namespace netprov
{
    namespace infrastructure
    {

        /**
         * One daemon process scoped to one interface (hostapd for wlan0,
         * dnsmasq for eth0.10, ...), tracked through its own pid file so that
         * stopping it never disturbs instances serving other interfaces.
         */
        class DaemonInstance
        {
        public:
            DaemonInstance(const std::string &name, const std::filesystem::path &pid_file,
                           CommandRunner &runner, std::chrono::milliseconds timeout);

            /**
             * Run a self-daemonising command line and wait for the pid file.
             */
            CommandResult start(const std::vector<std::string> &argv);

            /**
             * SIGTERM the recorded pid and wait for it to go away. Stopping an
             * instance that is not running succeeds.
             */
            CommandResult stop();

            bool is_running() const;
            std::optional<int> pid() const;

            const std::string &name() const { return name_; }
            const std::filesystem::path &pid_file() const { return pid_file_; }

        private:
            bool process_alive(int pid) const;

            std::string name_;
            std::filesystem::path pid_file_;
            CommandRunner &runner_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace netprov

#endif // NETPROV_INFRASTRUCTURE_DAEMON_INSTANCE_HPP
