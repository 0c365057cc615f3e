#ifndef HOTSPOTD_SERVICES_INTERFACE_SELECTOR_HPP
#define HOTSPOTD_SERVICES_INTERFACE_SELECTOR_HPP

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

    namespace services
    {
        class InterfaceInventory;

        /**
         * Picks the internet uplink and the hotspot radio with a fixed priority
         * policy and explains the choice.
         *
         * Internet: manual override > Ethernet with IP > mobile with IP >
         * tethering with IP > connected Wi-Fi.
         * Hotspot: USB AP radio > STA+AP capable radio (the uplink one first) >
         * unclaimed internal AP radio > any AP radio. Monitor-mode radios never
         * qualify.
         */
        class InterfaceSelector
        {
        public:
            explicit InterfaceSelector(InterfaceInventory &inventory);

            core::SelectionResult select(const std::optional<std::string> &manual_internet_override,
                                         bool exclude_vpn = false);

            // Pure policy over a snapshot; identical input gives identical output
            static core::SelectionResult select_from(const std::vector<core::Interface> &interfaces,
                                                     const std::optional<std::string> &manual_internet_override);

        private:
            InterfaceInventory &inventory_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_INTERFACE_SELECTOR_HPP
