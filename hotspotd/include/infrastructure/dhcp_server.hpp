#ifndef HOTSPOTD_INFRASTRUCTURE_DHCP_SERVER_HPP
#define HOTSPOTD_INFRASTRUCTURE_DHCP_SERVER_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/config.hpp"

namespace hotspotd
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {
        class CommandRunner;

        /**
         * DHCP Server Manager
         * Runs dnsmasq on the virtual AP interface in concurrent mode
         */
        class DHCPServerManager
        {
        public:
            DHCPServerManager(CommandRunner &runner,
                              const core::ConcurrentConfig &config,
                              const std::string &runtime_dir,
                              const std::optional<std::string> &dns,
                              std::chrono::milliseconds timeout);

            bool setup_dhcp_server(const std::string &interface);

            // Stops dnsmasq through its PID file and removes generated files
            bool teardown_dhcp_server();

            bool is_running() const;

            // Entries in the lease file; 0 when it does not exist
            int count_leases() const;

            const std::filesystem::path &config_file() const { return config_file_; }
            const std::filesystem::path &lease_file() const { return lease_file_; }
            const std::filesystem::path &pid_file() const { return pid_file_; }

            static std::string render_config(const std::string &interface,
                                             const core::ConcurrentConfig &config,
                                             const std::optional<std::string> &dns,
                                             const std::string &lease_file,
                                             const std::string &pid_file);

        private:
            bool create_config_file(const std::string &interface);
            void remove_generated_files();

            CommandRunner &runner_;
            core::ConcurrentConfig config_;
            std::optional<std::string> dns_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;

            std::filesystem::path config_dir_;
            std::filesystem::path config_file_;
            std::filesystem::path lease_file_;
            std::filesystem::path pid_file_;
        };

    } // namespace infrastructure
} // namespace hotspotd

#endif // HOTSPOTD_INFRASTRUCTURE_DHCP_SERVER_HPP
