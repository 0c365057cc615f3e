#include "core/models.hpp"
#include <algorithm>
#include <cctype>

namespace hotspotd
{
    namespace core
    {

        const char *interface_type_to_string(InterfaceType type)
        {
            switch (type)
            {
            case InterfaceType::WIFI:
                return "wifi";
            case InterfaceType::ETHERNET:
                return "ethernet";
            case InterfaceType::VPN:
                return "vpn";
            case InterfaceType::MOBILE:
                return "mobile";
            case InterfaceType::TETHERED:
                return "tethered";
            case InterfaceType::BRIDGE:
                return "bridge";
            case InterfaceType::OTHER:
                return "other";
            }
            return "other";
        }

        const char *operating_mode_to_string(OperatingMode mode)
        {
            switch (mode)
            {
            case OperatingMode::MANAGED:
                return "managed";
            case OperatingMode::CONCURRENT:
                return "concurrent";
            case OperatingMode::DUAL_ADAPTER:
                return "dual-adapter";
            }
            return "managed";
        }

        void to_json(nlohmann::json &j, const Interface &iface)
        {
            j = nlohmann::json{
                {"name", iface.name},
                {"type", interface_type_to_string(iface.type)},
                {"state", iface.state},
                {"connected", iface.connected},
                {"connection_name", iface.connection_name ? nlohmann::json(*iface.connection_name) : nlohmann::json(nullptr)},
                {"is_usb", iface.is_usb},
                {"is_internal", iface.is_internal},
                {"driver", iface.driver ? nlohmann::json(*iface.driver) : nlohmann::json(nullptr)},
                {"has_ip", iface.has_ip},
                {"phy", iface.phy ? nlohmann::json(*iface.phy) : nlohmann::json(nullptr)},
                {"ip_address", iface.ip_address},
                {"ap_support", iface.ap_support},
                {"supports_5ghz", iface.supports_5ghz},
                {"supports_concurrency", iface.supports_concurrency},
                {"concurrency_channels", iface.concurrency_channels},
                {"in_monitor_mode", iface.in_monitor_mode},
                {"is_internet_source", iface.is_internet_source},
                {"issues", iface.issues},
                {"label", iface.label}};
        }

        void to_json(nlohmann::json &j, const SelectionResult &selection)
        {
            j = nlohmann::json{
                {"internet_interface", selection.internet_interface ? nlohmann::json(*selection.internet_interface) : nlohmann::json(nullptr)},
                {"hotspot_interface", selection.hotspot_interface ? nlohmann::json(*selection.hotspot_interface) : nlohmann::json(nullptr)},
                {"rationale", selection.rationale},
                {"warnings", selection.warnings},
                {"high_risk", selection.high_risk}};
        }

        std::string PreflightReport::error_text() const
        {
            std::string text;
            for (const auto &error : errors)
            {
                if (!text.empty())
                {
                    text += "\n";
                }
                text += error;
            }
            return text;
        }

        MacPolicy MacPolicy::from_strings(const std::string &mode, const std::vector<std::string> &addresses)
        {
            MacPolicy policy;
            policy.mode = (mode == "allow") ? MacMode::ALLOW : MacMode::BLOCK;
            for (auto mac : addresses)
            {
                std::transform(mac.begin(), mac.end(), mac.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                policy.addresses.insert(mac);
            }
            return policy;
        }

    } // namespace core
} // namespace hotspotd
