#ifndef HOTSPOTD_CORE_CONFIG_HPP
#define HOTSPOTD_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace hotspotd
{
    namespace core
    {

        /**
         * Access point identity and placement
         */
        struct AccessPointConfig
        {
            std::string ssid = "MintHotspot";
            std::string password = "password123";
            std::string band = "bg"; // "bg" (2.4 GHz) or "a" (5 GHz)
            bool hidden = false;
            std::optional<std::string> dns;
            std::optional<std::string> interface;          // manual hotspot interface
            std::optional<std::string> internet_interface; // manual upstream override
            std::string connection_name = "temp_hotspot_con";
            std::string country_code = "US";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Client admission and session policy
         */
        struct PolicyConfig
        {
            std::string mac_mode = "block"; // "block" or "allow"
            std::vector<std::string> mac_list;
            int auto_off_minutes = 0;
            bool exclude_vpn = false;
            bool force_single_interface = false;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Settings for the virtual AP interface used in STA+AP concurrent mode
         */
        struct ConcurrentConfig
        {
            std::string virtual_interface = "ap0";
            std::string gateway = "192.168.12.1";
            std::string dhcp_start = "192.168.12.10";
            std::string dhcp_end = "192.168.12.100";
            std::string lease_time = "12h";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct PathsConfig
        {
            std::string runtime_dir = "/run/hotspotd";
            std::string status_file = "/tmp/hotspot_status.json";
            std::string pid_file = "/tmp/hotspot_backend.pid";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Timeouts and cadences. External tools are always bounded by these.
         */
        struct TimingConfig
        {
            int command_timeout_ms = 5000;
            int probe_timeout_ms = 2000;
            int poll_interval_ms = 1000;
            int client_sample_every = 5;
            int link_up_retries = 3;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete hotspot configuration
         */
        class HotspotConfig
        {
        public:
            AccessPointConfig ap;
            PolicyConfig policy;
            ConcurrentConfig concurrent;
            PathsConfig paths;
            TimingConfig timing;
            LoggingConfig logging;

        public:
            HotspotConfig() = default;

            static std::unique_ptr<HotspotConfig> from_file(const std::string &config_path);
            static std::unique_ptr<HotspotConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<HotspotConfig> create_default();

            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            bool validate() const;

            static bool is_valid_mac(const std::string &mac);
        };

    } // namespace core
} // namespace hotspotd

#endif // HOTSPOTD_CORE_CONFIG_HPP
