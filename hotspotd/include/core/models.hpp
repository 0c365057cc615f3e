#ifndef HOTSPOTD_CORE_MODELS_HPP
#define HOTSPOTD_CORE_MODELS_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hotspotd
{
    namespace core
    {

        enum class InterfaceType
        {
            WIFI,
            ETHERNET,
            VPN,
            MOBILE,
            TETHERED,
            BRIDGE,
            OTHER
        };

        const char *interface_type_to_string(InterfaceType type);

        /**
         * Snapshot of one host network interface.
         *
         * Produced by the inventory and never modified afterwards; callers that
         * need fresh data query the inventory again. is_usb and is_internal are
         * both false when the hardware path could not be resolved.
         */
        struct Interface
        {
            std::string name;
            InterfaceType type = InterfaceType::OTHER;

            bool is_usb = false;
            bool is_internal = false;
            std::optional<std::string> driver;

            std::string state;
            bool connected = false;
            std::optional<std::string> connection_name;
            bool has_ip = false;
            std::string ip_address;

            // Wi-Fi only
            std::optional<std::string> phy; // wiphy the interface lives on, e.g. "phy0"
            bool ap_support = false;
            bool supports_5ghz = false;
            bool supports_concurrency = false;
            int concurrency_channels = 1;
            bool in_monitor_mode = false;

            bool is_internet_source = false;
            std::vector<std::string> issues;
            std::string label;

            bool is_wifi() const { return type == InterfaceType::WIFI; }

            // Usable as an access point: AP-capable Wi-Fi radio not held in monitor mode
            bool can_host_ap() const { return is_wifi() && ap_support && !in_monitor_mode; }

            // Both are interfaces of one physical radio (a virtual AP shares its parent's phy)
            bool shares_radio_with(const Interface &other) const
            {
                return phy && other.phy && *phy == *other.phy;
            }

            // Ethernet, mobile broadband or tethering with an address
            bool is_wired_class_source() const
            {
                return connected && has_ip &&
                       (type == InterfaceType::ETHERNET || type == InterfaceType::MOBILE ||
                        type == InterfaceType::TETHERED);
            }
        };

        void to_json(nlohmann::json &j, const Interface &iface);

        /**
         * Outcome of interface selection, produced fresh on every call
         */
        struct SelectionResult
        {
            std::optional<std::string> internet_interface;
            std::optional<std::string> hotspot_interface;
            std::string rationale;
            std::vector<std::string> warnings;
            bool high_risk = false;

            bool operator==(const SelectionResult &other) const
            {
                return internet_interface == other.internet_interface &&
                       hotspot_interface == other.hotspot_interface &&
                       rationale == other.rationale &&
                       warnings == other.warnings &&
                       high_risk == other.high_risk;
            }
        };

        void to_json(nlohmann::json &j, const SelectionResult &selection);

        /**
         * Preflight findings. ok() holds exactly when there are no errors.
         */
        struct PreflightReport
        {
            std::vector<std::string> errors;
            std::vector<std::string> warnings;
            std::optional<std::string> target_interface;

            bool ok() const { return errors.empty(); }
            std::string error_text() const;
        };

        enum class OperatingMode
        {
            MANAGED,
            CONCURRENT,
            DUAL_ADAPTER
        };

        const char *operating_mode_to_string(OperatingMode mode);

        enum class MacMode
        {
            BLOCK,
            ALLOW
        };

        struct MacPolicy
        {
            MacMode mode = MacMode::BLOCK;
            std::set<std::string> addresses; // lower-case aa:bb:cc:dd:ee:ff

            static MacPolicy from_strings(const std::string &mode, const std::vector<std::string> &addresses);
        };

        /**
         * Mutable state of the running hotspot. Owned by the monitor loop;
         * the orchestrator and firewall receive it by reference.
         */
        struct RuntimeSession
        {
            std::string hotspot_interface;
            std::optional<std::string> virtual_interface;
            OperatingMode mode = OperatingMode::MANAGED;
            std::optional<std::string> current_upstream;
            MacPolicy mac_policy;
            int idle_seconds = 0;
            int auto_off_minutes = 0;

            // Side effects still engaged; teardown clears them one by one
            bool profile_created = false;
            bool rules_installed = false;
            bool hostapd_started = false;
            bool dnsmasq_started = false;

            // Interface the AP actually serves clients on
            const std::string &ap_interface() const
            {
                return virtual_interface ? *virtual_interface : hotspot_interface;
            }
        };

    } // namespace core
} // namespace hotspotd

#endif // HOTSPOTD_CORE_MODELS_HPP
