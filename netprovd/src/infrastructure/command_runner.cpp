/**
 * External command execution
 * fork/execvp with a captured pipe and a hard deadline
 */

#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace netprov
{
    namespace infrastructure
    {

        std::string CommandResult::describe() const
        {
            if (!launched)
            {
                return "could not launch: " + output;
            }
            if (timed_out)
            {
                return "timed out";
            }

            std::string reason = "exit code " + std::to_string(exit_code);
            auto first_line = output.substr(0, output.find('\n'));
            if (!first_line.empty())
            {
                reason += ": " + first_line;
            }
            return reason;
        }

        std::string format_command(const std::vector<std::string> &argv)
        {
            std::string out;
            for (const auto &arg : argv)
            {
                if (!out.empty())
                {
                    out += ' ';
                }
                out += arg;
            }
            return out;
        }

        ProcessCommandRunner::ProcessCommandRunner()
            : logger_(core::get_logger("CommandRunner"))
        {
        }

        CommandResult ProcessCommandRunner::run(const std::vector<std::string> &argv,
                                                std::chrono::milliseconds timeout)
        {
            CommandResult result;

            if (argv.empty())
            {
                result.launched = false;
                result.output = "empty command";
                return result;
            }

            int fds[2];
            if (pipe2(fds, O_CLOEXEC) != 0)
            {
                result.launched = false;
                result.output = std::strerror(errno);
                return result;
            }

            logger_->debug("Running command", core::LogContext().add("argv", argv));

            // Built before fork: the child of a threaded process must not allocate
            std::vector<char *> args;
            for (const auto &arg : argv)
            {
                args.push_back(const_cast<char *>(arg.c_str()));
            }
            args.push_back(nullptr);

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                dup2(fds[1], STDOUT_FILENO);
                dup2(fds[1], STDERR_FILENO);
                execvp(args[0], args.data());
                _exit(127);
            }

            close(fds[1]);

            if (pid < 0)
            {
                close(fds[0]);
                result.launched = false;
                result.output = std::strerror(errno);
                return result;
            }

            fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL, 0) | O_NONBLOCK);

            auto deadline = std::chrono::steady_clock::now() + timeout;
            int status = 0;
            bool exited = false;
            char buffer[512];

            while (!exited)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                {
                    kill(pid, SIGKILL);
                    waitpid(pid, &status, 0);
                    result.timed_out = true;
                    logger_->warning("Command timed out",
                                     core::LogContext().add("argv", argv).add("timeout_ms", timeout.count()));
                    break;
                }

                struct pollfd pfd = {fds[0], POLLIN, 0};
                int slice = static_cast<int>(std::min<long long>(remaining.count(), 50));
                if (poll(&pfd, 1, slice) > 0)
                {
                    ssize_t n;
                    while ((n = read(fds[0], buffer, sizeof(buffer))) > 0)
                    {
                        result.output.append(buffer, static_cast<size_t>(n));
                    }
                }

                // Daemonising children (hostapd -B) may leave grandchildren
                // holding the pipe, so exit status rather than EOF ends the wait.
                pid_t waited = waitpid(pid, &status, WNOHANG);
                if (waited == pid)
                {
                    exited = true;
                    ssize_t n;
                    while ((n = read(fds[0], buffer, sizeof(buffer))) > 0)
                    {
                        result.output.append(buffer, static_cast<size_t>(n));
                    }
                }
            }

            close(fds[0]);

            if (!result.timed_out)
            {
                if (WIFEXITED(status))
                {
                    result.exit_code = WEXITSTATUS(status);
                    if (result.exit_code == 127)
                    {
                        result.launched = false;
                        result.output = "command not found: " + argv[0];
                    }
                }
                else if (WIFSIGNALED(status))
                {
                    result.exit_code = 128 + WTERMSIG(status);
                }
            }

            if (!result.ok())
            {
                logger_->debug("Command failed",
                               core::LogContext().add("argv", argv).add("reason", result.describe()));
            }

            return result;
        }

    } // namespace infrastructure
} // namespace netprov
