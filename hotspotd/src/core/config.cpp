#include "core/config.hpp"
#include "core/logger.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace hotspotd
{
    namespace core
    {

        namespace
        {
            void read_optional(const nlohmann::json &j, const char *key, std::optional<std::string> &target)
            {
                if (!j.contains(key))
                    return;
                if (j[key].is_null() || j[key].get<std::string>().empty())
                    target.reset();
                else
                    target = j[key].get<std::string>();
            }

            void write_optional(nlohmann::json &j, const char *key, const std::optional<std::string> &value)
            {
                if (value)
                    j[key] = *value;
                else
                    j[key] = nullptr;
            }
        }

        // AccessPointConfig implementation
        void AccessPointConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("ssid"))
                ssid = j["ssid"];
            if (j.contains("password"))
                password = j["password"];
            if (j.contains("band"))
                band = j["band"];
            if (j.contains("hidden"))
                hidden = j["hidden"];
            read_optional(j, "dns", dns);
            read_optional(j, "interface", interface);
            read_optional(j, "internet_interface", internet_interface);
            if (j.contains("connection_name"))
                connection_name = j["connection_name"];
            if (j.contains("country_code"))
                country_code = j["country_code"];
        }

        nlohmann::json AccessPointConfig::to_json() const
        {
            nlohmann::json j{
                {"ssid", ssid},
                {"password", password},
                {"band", band},
                {"hidden", hidden},
                {"connection_name", connection_name},
                {"country_code", country_code}};
            write_optional(j, "dns", dns);
            write_optional(j, "interface", interface);
            write_optional(j, "internet_interface", internet_interface);
            return j;
        }

        // PolicyConfig implementation
        void PolicyConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("mac_mode"))
                mac_mode = j["mac_mode"];
            if (j.contains("mac_list"))
                mac_list = j["mac_list"].get<std::vector<std::string>>();
            if (j.contains("auto_off_minutes"))
                auto_off_minutes = j["auto_off_minutes"];
            if (j.contains("exclude_vpn"))
                exclude_vpn = j["exclude_vpn"];
            if (j.contains("force_single_interface"))
                force_single_interface = j["force_single_interface"];
        }

        nlohmann::json PolicyConfig::to_json() const
        {
            return nlohmann::json{
                {"mac_mode", mac_mode},
                {"mac_list", mac_list},
                {"auto_off_minutes", auto_off_minutes},
                {"exclude_vpn", exclude_vpn},
                {"force_single_interface", force_single_interface}};
        }

        // ConcurrentConfig implementation
        void ConcurrentConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("virtual_interface"))
                virtual_interface = j["virtual_interface"];
            if (j.contains("gateway"))
                gateway = j["gateway"];
            if (j.contains("dhcp_start"))
                dhcp_start = j["dhcp_start"];
            if (j.contains("dhcp_end"))
                dhcp_end = j["dhcp_end"];
            if (j.contains("lease_time"))
                lease_time = j["lease_time"];
        }

        nlohmann::json ConcurrentConfig::to_json() const
        {
            return nlohmann::json{
                {"virtual_interface", virtual_interface},
                {"gateway", gateway},
                {"dhcp_start", dhcp_start},
                {"dhcp_end", dhcp_end},
                {"lease_time", lease_time}};
        }

        // PathsConfig implementation
        void PathsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("runtime_dir"))
                runtime_dir = j["runtime_dir"];
            if (j.contains("status_file"))
                status_file = j["status_file"];
            if (j.contains("pid_file"))
                pid_file = j["pid_file"];
        }

        nlohmann::json PathsConfig::to_json() const
        {
            return nlohmann::json{
                {"runtime_dir", runtime_dir},
                {"status_file", status_file},
                {"pid_file", pid_file}};
        }

        // TimingConfig implementation
        void TimingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("command_timeout_ms"))
                command_timeout_ms = j["command_timeout_ms"];
            if (j.contains("probe_timeout_ms"))
                probe_timeout_ms = j["probe_timeout_ms"];
            if (j.contains("poll_interval_ms"))
                poll_interval_ms = j["poll_interval_ms"];
            if (j.contains("client_sample_every"))
                client_sample_every = j["client_sample_every"];
            if (j.contains("link_up_retries"))
                link_up_retries = j["link_up_retries"];
        }

        nlohmann::json TimingConfig::to_json() const
        {
            return nlohmann::json{
                {"command_timeout_ms", command_timeout_ms},
                {"probe_timeout_ms", probe_timeout_ms},
                {"poll_interval_ms", poll_interval_ms},
                {"client_sample_every", client_sample_every},
                {"link_up_retries", link_up_retries}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"];
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // HotspotConfig implementation
        std::unique_ptr<HotspotConfig> HotspotConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<HotspotConfig> HotspotConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("configuration root must be a JSON object");
            }

            auto config = std::make_unique<HotspotConfig>();

            try
            {
                if (j.contains("access_point"))
                    config->ap.from_json(j["access_point"]);
                if (j.contains("policy"))
                    config->policy.from_json(j["policy"]);
                if (j.contains("concurrent"))
                    config->concurrent.from_json(j["concurrent"]);
                if (j.contains("paths"))
                    config->paths.from_json(j["paths"]);
                if (j.contains("timing"))
                    config->timing.from_json(j["timing"]);
                if (j.contains("logging"))
                    config->logging.from_json(j["logging"]);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::invalid_argument("Invalid configuration value: " + std::string(e.what()));
            }

            return config;
        }

        std::unique_ptr<HotspotConfig> HotspotConfig::create_default()
        {
            return std::make_unique<HotspotConfig>();
        }

        nlohmann::json HotspotConfig::to_json() const
        {
            return nlohmann::json{
                {"access_point", ap.to_json()},
                {"policy", policy.to_json()},
                {"concurrent", concurrent.to_json()},
                {"paths", paths.to_json()},
                {"timing", timing.to_json()},
                {"logging", logging.to_json()}};
        }

        void HotspotConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        bool HotspotConfig::validate() const
        {
            auto logger = get_logger("HotspotConfig");

            if (ap.band != "bg" && ap.band != "a")
            {
                logger->error("Configuration validation error: band must be 'bg' or 'a'",
                              LogContext().add("band", ap.band));
                return false;
            }

            if (ap.connection_name.empty())
            {
                logger->error("Configuration validation error: connection_name cannot be empty");
                return false;
            }

            if (policy.mac_mode != "block" && policy.mac_mode != "allow")
            {
                logger->error("Configuration validation error: mac_mode must be 'block' or 'allow'",
                              LogContext().add("mac_mode", policy.mac_mode));
                return false;
            }

            for (const auto &mac : policy.mac_list)
            {
                if (!is_valid_mac(mac))
                {
                    logger->error("Configuration validation error: malformed MAC address",
                                  LogContext().add("mac", mac));
                    return false;
                }
            }

            if (policy.auto_off_minutes < 0)
            {
                logger->error("Configuration validation error: auto_off_minutes must not be negative");
                return false;
            }

            if (paths.runtime_dir.empty() || paths.status_file.empty() || paths.pid_file.empty())
            {
                logger->error("Configuration validation error: runtime paths cannot be empty");
                return false;
            }

            if (concurrent.virtual_interface.empty() || concurrent.virtual_interface.size() > 15)
            {
                logger->error("Configuration validation error: virtual_interface must be 1-15 characters",
                              LogContext().add("virtual_interface", concurrent.virtual_interface));
                return false;
            }

            if (timing.command_timeout_ms <= 0 || timing.probe_timeout_ms <= 0 ||
                timing.poll_interval_ms <= 0 || timing.client_sample_every <= 0 ||
                timing.link_up_retries < 0)
            {
                logger->error("Configuration validation error: timing values must be positive");
                return false;
            }

            return true;
        }

        bool HotspotConfig::is_valid_mac(const std::string &mac)
        {
            if (mac.size() != 17)
            {
                return false;
            }
            for (size_t i = 0; i < mac.size(); ++i)
            {
                if (i % 3 == 2)
                {
                    if (mac[i] != ':')
                        return false;
                }
                else if (!std::isxdigit(static_cast<unsigned char>(mac[i])))
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace core
} // namespace hotspotd
