#ifndef NETPROV_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define NETPROV_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

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
         * Outcome of one external command
         */
        struct CommandResult
        {
            int exit_code = -1;
            std::string output; // stdout and stderr, interleaved
            bool launched = true;
            bool timed_out = false;

            bool ok() const { return launched && !timed_out && exit_code == 0; }

            // Short human readable reason for a failed command
            std::string describe() const;
        };

        /**
         * Abstract executor for iproute2, iptables, tc, hostapd, dnsmasq...
         * Every call is blocking and bounded by the given timeout.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            virtual CommandResult run(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout) = 0;
        };

        /**
         * fork/exec based runner. No shell is involved, so arguments are never
         * re-parsed. A child that outlives its timeout is killed.
         */
        class ProcessCommandRunner : public CommandRunner
        {
        public:
            ProcessCommandRunner();

            CommandResult run(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

        std::string format_command(const std::vector<std::string> &argv);

    } // namespace infrastructure
} // namespace netprov

#endif // NETPROV_INFRASTRUCTURE_COMMAND_RUNNER_HPP
