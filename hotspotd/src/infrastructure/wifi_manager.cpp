/**
 * WiFi Access Point Manager Implementation
 * Drives NetworkManager profiles for the standard access-point workflow
 */

#include "infrastructure/wifi_manager.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <sstream>
#include <thread>

namespace hotspotd
{
    namespace infrastructure
    {

        WiFiAccessPointManager::WiFiAccessPointManager(CommandRunner &runner,
                                                       const core::AccessPointConfig &config,
                                                       std::chrono::milliseconds timeout)
            : runner_(runner), config_(config), timeout_(timeout),
              sleeper_([](std::chrono::milliseconds delay)
                       { std::this_thread::sleep_for(delay); }),
              logger_(core::get_logger("WiFiAccessPointManager"))
        {
        }

        bool WiFiAccessPointManager::setup_hotspot(const std::string &interface)
        {
            logger_->info("Setting up WiFi Access Point...",
                          core::LogContext().add("interface", interface).add("ssid", config_.ssid));

            if (!ensure_radio_ready(interface))
            {
                logger_->warning("Radio did not report ready, continuing", core::LogContext().add("interface", interface));
            }

            if (!disconnect_device(interface))
            {
                logger_->debug("Device was not associated", core::LogContext().add("interface", interface));
            }
            remove_existing_connection();

            if (!create_hotspot_connection(interface))
            {
                logger_->error("Failed to create hotspot connection");
                return false;
            }

            if (!activate_connection(interface))
            {
                logger_->error("Failed to activate connection");
                remove_existing_connection();
                return false;
            }

            logger_->info("WiFi Access Point setup successful",
                          core::LogContext()
                              .add("ssid", config_.ssid)
                              .add("interface", interface)
                              .add("band", config_.band)
                              .add("hidden", config_.hidden));
            return true;
        }

        bool WiFiAccessPointManager::teardown_hotspot()
        {
            logger_->info("Tearing down WiFi Access Point...", core::LogContext().add("connection", config_.connection_name));
            return remove_existing_connection();
        }

        bool WiFiAccessPointManager::ensure_radio_ready(const std::string &interface, int attempts)
        {
            if (!run_nmcli_command({"radio", "wifi", "on"}))
            {
                logger_->warning("Failed to switch the Wi-Fi radio on");
            }

            for (int attempt = 0; attempt < attempts; ++attempt)
            {
                std::string output;
                if (run_nmcli_command({"-t", "-f", "DEVICE,STATE", "device"}, &output))
                {
                    auto state = parse_device_state(output, interface);
                    if (state == "connected" || state == "disconnected")
                    {
                        logger_->debug("Radio ready", core::LogContext().add("interface", interface).add("state", state));
                        return true;
                    }
                }
                sleeper_(std::chrono::seconds(1));
            }
            return false;
        }

        bool WiFiAccessPointManager::disconnect_device(const std::string &interface)
        {
            // Fails harmlessly when the device is not associated
            return run_nmcli_command({"device", "disconnect", interface});
        }

        bool WiFiAccessPointManager::set_device_managed(const std::string &interface, bool managed)
        {
            if (!run_nmcli_command({"device", "set", interface, "managed", managed ? "yes" : "no"}))
            {
                logger_->warning("Failed to change NetworkManager control",
                                 core::LogContext().add("interface", interface).add("managed", managed));
                return false;
            }
            return true;
        }

        std::vector<std::string> WiFiAccessPointManager::build_profile_command(const core::AccessPointConfig &config,
                                                                               const std::string &interface)
        {
            std::vector<std::string> command = {
                "nmcli", "connection", "add",
                "type", "wifi",
                "ifname", interface,
                "con-name", config.connection_name,
                "autoconnect", "no",
                "ssid", config.ssid,
                "wifi.mode", "ap",
                "wifi.band", config.band,
                "wifi-sec.key-mgmt", "wpa-psk",
                "wifi-sec.psk", config.password,
                "wifi-sec.proto", "rsn",
                "wifi-sec.pairwise", "ccmp",
                "wifi-sec.group", "ccmp",
                "ipv4.method", "shared"};

            if (config.hidden)
            {
                command.insert(command.end(), {"wifi.hidden", "yes"});
            }

            if (config.dns && !config.dns->empty())
            {
                command.insert(command.end(), {"ipv4.dns", *config.dns, "ipv4.ignore-auto-dns", "yes"});
            }

            return command;
        }

        std::string WiFiAccessPointManager::parse_device_state(const std::string &output, const std::string &interface)
        {
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                auto colon = line.find(':');
                if (colon != std::string::npos && line.substr(0, colon) == interface)
                {
                    return line.substr(colon + 1);
                }
            }
            return "";
        }

        bool WiFiAccessPointManager::remove_existing_connection()
        {
            logger_->debug("Removing existing connection", core::LogContext().add("connection", config_.connection_name));

            // Absent profile is the desired end state
            if (!run_nmcli_command({"connection", "delete", config_.connection_name}))
            {
                logger_->debug("No profile to remove", core::LogContext().add("connection", config_.connection_name));
            }
            return true;
        }

        bool WiFiAccessPointManager::create_hotspot_connection(const std::string &interface)
        {
            logger_->info("Creating hotspot connection", core::LogContext().add("connection", config_.connection_name));

            auto command = build_profile_command(config_, interface);

            auto masked = command;
            for (size_t i = 0; i + 1 < masked.size(); ++i)
            {
                if (masked[i] == "wifi-sec.psk")
                {
                    masked[i + 1] = "********";
                }
            }
            logger_->debug("Creating hotspot connection", core::LogContext().add("command", join_command(masked)));

            std::vector<std::string> args(command.begin() + 1, command.end());
            std::string output;
            if (!run_nmcli_command(args, &output))
            {
                logger_->error("Failed to create hotspot connection", core::LogContext().add("output", output));
                return false;
            }

            logger_->debug("Hotspot connection created successfully");
            return true;
        }

        bool WiFiAccessPointManager::activate_connection(const std::string &interface)
        {
            logger_->info("Activating hotspot connection", core::LogContext().add("connection", config_.connection_name));

            std::string output;
            if (!run_nmcli_command({"connection", "up", config_.connection_name, "ifname", interface}, &output))
            {
                logger_->error("Failed to activate hotspot connection", core::LogContext().add("output", output));
                return false;
            }

            logger_->debug("Hotspot connection activated successfully");
            return true;
        }

        bool WiFiAccessPointManager::run_nmcli_command(const std::vector<std::string> &args, std::string *output)
        {
            std::vector<std::string> command = {"nmcli"};
            command.insert(command.end(), args.begin(), args.end());

            auto result = runner_.run(command, timeout_);
            if (output)
            {
                *output = result.ok() ? result.output : result.error;
            }
            return result.ok();
        }

    } // namespace infrastructure
} // namespace hotspotd
