#ifndef HOTSPOTD_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define HOTSPOTD_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hotspotd
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {

        struct CommandResult
        {
            int exit_code = -1;
            std::string output;
            std::string error;
            bool launched = false;
            bool timed_out = false;

            bool ok() const { return launched && !timed_out && exit_code == 0; }
        };

        /**
         * Boundary to the external tools (nmcli, iw, ip, iptables, ...).
         * Every call is bounded by a timeout; a timed-out call is a failed call.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            virtual CommandResult run(const std::vector<std::string> &args,
                                      std::chrono::milliseconds timeout) = 0;

            virtual bool tool_available(const std::string &tool) = 0;
        };

        std::string join_command(const std::vector<std::string> &args);

        /**
         * Runs commands as child processes via fork/execvp. No shell is involved,
         * so SSIDs and passwords are passed through verbatim.
         */
        class SystemCommandRunner : public CommandRunner
        {
        public:
            SystemCommandRunner();

            CommandResult run(const std::vector<std::string> &args,
                              std::chrono::milliseconds timeout) override;

            bool tool_available(const std::string &tool) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace hotspotd

#endif // HOTSPOTD_INFRASTRUCTURE_COMMAND_RUNNER_HPP
