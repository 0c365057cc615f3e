/**
 * DHCP Server Manager Implementation
 * dnsmasq configuration and lifecycle for the virtual AP interface
 */

#include "infrastructure/dhcp_server.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/process_control.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <initializer_list>
#include <sstream>

namespace hotspotd
{
    namespace infrastructure
    {

        DHCPServerManager::DHCPServerManager(CommandRunner &runner,
                                             const core::ConcurrentConfig &config,
                                             const std::string &runtime_dir,
                                             const std::optional<std::string> &dns,
                                             std::chrono::milliseconds timeout)
            : runner_(runner), config_(config), dns_(dns), timeout_(timeout),
              logger_(core::get_logger("DHCPServerManager"))
        {
            config_dir_ = runtime_dir;
            config_file_ = config_dir_ / ("dnsmasq-" + config.virtual_interface + ".conf");
            lease_file_ = config_dir_ / ("dnsmasq-" + config.virtual_interface + ".leases");
            pid_file_ = config_dir_ / ("dnsmasq-" + config.virtual_interface + ".pid");
        }

        bool DHCPServerManager::setup_dhcp_server(const std::string &interface)
        {
            logger_->info("Setting up DHCP server...",
                          core::LogContext()
                              .add("interface", interface)
                              .add("dhcp_range", config_.dhcp_start + "-" + config_.dhcp_end));

            // A dnsmasq left behind by a crashed session would hold the port
            if (auto stale = read_pid_file(pid_file_.string()))
            {
                if (!terminate_process(*stale, std::chrono::seconds(2)))
                {
                    logger_->warning("Stale dnsmasq did not exit", core::LogContext().add("pid", *stale));
                }
            }

            if (!create_config_file(interface))
            {
                logger_->error("Failed to create DHCP configuration file");
                return false;
            }

            auto result = runner_.run({"dnsmasq", "--conf-file=" + config_file_.string()}, timeout_);
            if (!result.ok())
            {
                logger_->error("Failed to start dnsmasq process",
                               core::LogContext()
                                   .add("exit_code", result.exit_code)
                                   .add("error", result.error));
                remove_generated_files();
                return false;
            }

            logger_->info("DHCP server setup successful", core::LogContext().add("interface", interface));
            return true;
        }

        bool DHCPServerManager::teardown_dhcp_server()
        {
            bool stopped = true;
            if (auto pid = read_pid_file(pid_file_.string()))
            {
                logger_->debug("Stopping dnsmasq process", core::LogContext().add("pid", *pid));
                stopped = terminate_process(*pid, std::chrono::seconds(2));
                if (!stopped)
                {
                    logger_->warning("dnsmasq did not exit", core::LogContext().add("pid", *pid));
                }
            }

            remove_generated_files();
            return stopped;
        }

        bool DHCPServerManager::is_running() const
        {
            auto pid = read_pid_file(pid_file_.string());
            return pid && process_alive(*pid);
        }

        int DHCPServerManager::count_leases() const
        {
            std::ifstream stream(lease_file_);
            if (!stream)
            {
                return 0;
            }

            int count = 0;
            std::string line;
            while (std::getline(stream, line))
            {
                if (line.find_first_not_of(" \t\r") != std::string::npos)
                {
                    ++count;
                }
            }
            return count;
        }

        std::string DHCPServerManager::render_config(const std::string &interface,
                                                     const core::ConcurrentConfig &config,
                                                     const std::optional<std::string> &dns,
                                                     const std::string &lease_file,
                                                     const std::string &pid_file)
        {
            std::ostringstream config_stream;
            config_stream << "# hotspotd DHCP configuration for " << interface << "\n";
            config_stream << "# Auto-generated - do not edit manually\n\n";

            config_stream << "interface=" << interface << "\n";
            config_stream << "bind-interfaces\n";
            config_stream << "except-interface=lo\n";
            config_stream << "dhcp-range=" << config.dhcp_start << "," << config.dhcp_end
                          << ",255.255.255.0," << config.lease_time << "\n";
            config_stream << "dhcp-option=option:router," << config.gateway << "\n";
            if (dns && !dns->empty())
            {
                config_stream << "dhcp-option=option:dns-server," << *dns << "\n";
                config_stream << "server=" << *dns << "\n";
            }
            else
            {
                config_stream << "dhcp-option=option:dns-server," << config.gateway << "\n";
            }

            config_stream << "dhcp-authoritative\n";
            config_stream << "dhcp-leasefile=" << lease_file << "\n";
            config_stream << "pid-file=" << pid_file << "\n";
            return config_stream.str();
        }

        bool DHCPServerManager::create_config_file(const std::string &interface)
        {
            try
            {
                std::filesystem::create_directories(config_dir_);

                std::ofstream config_stream(config_file_, std::ios::trunc);
                if (!config_stream)
                {
                    logger_->error("Cannot create DHCP config file", core::LogContext().add("file", config_file_.string()));
                    return false;
                }

                config_stream << render_config(interface, config_, dns_, lease_file_.string(), pid_file_.string());
                config_stream.close();

                logger_->debug("DHCP configuration file created", core::LogContext().add("file", config_file_.string()));
                return true;
            }
            catch (const std::exception &e)
            {
                logger_->error("Error creating DHCP config file", core::LogContext().add("error", e.what()));
                return false;
            }
        }

        void DHCPServerManager::remove_generated_files()
        {
            for (const auto &path : {config_file_, lease_file_, pid_file_})
            {
                std::error_code ec;
                std::filesystem::remove(path, ec);
                if (ec)
                {
                    logger_->warning("Error removing DHCP file",
                                     core::LogContext().add("file", path.string()).add("error", ec.message()));
                }
            }
        }

    } // namespace infrastructure
} // namespace hotspotd
