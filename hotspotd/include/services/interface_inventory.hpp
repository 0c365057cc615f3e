#ifndef HOTSPOTD_SERVICES_INTERFACE_INVENTORY_HPP
#define HOTSPOTD_SERVICES_INTERFACE_INVENTORY_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/models.hpp"

namespace hotspotd
{
    namespace core
    {
        class Logger;
    }
    namespace infrastructure
    {
        class CommandRunner;
    }

    namespace services
    {
        class CapabilityProbe;
        class UpstreamResolver;

        /**
         * One row of `nmcli -t -f DEVICE,TYPE,STATE,CONNECTION device`
         */
        struct DeviceRow
        {
            std::string device;
            std::string type;
            std::string state;
            std::string connection;
        };

        /**
         * Enumerates host interfaces and annotates them with bus, driver,
         * connectivity and radio capabilities. Nothing is cached: every call
         * re-queries the system.
         */
        class InterfaceInventory
        {
        public:
            InterfaceInventory(infrastructure::CommandRunner &runner,
                               CapabilityProbe &probe,
                               UpstreamResolver &resolver,
                               std::chrono::milliseconds timeout);
            virtual ~InterfaceInventory() = default;

            virtual std::vector<core::Interface> list_interfaces(bool exclude_vpn = false);

            // Convenience filter over a fresh listing
            std::vector<core::Interface> wifi_interfaces(bool exclude_vpn = false);

            // nmcli terse output, honouring "\:" escapes
            static std::vector<DeviceRow> parse_device_table(const std::string &output);

            static bool is_excluded(const DeviceRow &row);
            static core::InterfaceType classify(const std::string &name, const std::string &nmcli_type);
            static bool is_connected_state(const std::string &state);

            // "3: wlan0    inet 192.168.1.5/24 brd ..." -> "192.168.1.5"
            static std::optional<std::string> parse_ipv4(const std::string &output);

            static std::string render_label(const core::Interface &iface);

        private:
            void resolve_hardware(core::Interface &iface);
            void resolve_address(core::Interface &iface);
            void apply_radio(core::Interface &iface);
            static void collect_issues(core::Interface &iface, bool name_classified);

            infrastructure::CommandRunner &runner_;
            CapabilityProbe &probe_;
            UpstreamResolver &resolver_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_INTERFACE_INVENTORY_HPP
