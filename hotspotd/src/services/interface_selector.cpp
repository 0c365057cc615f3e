#include "services/interface_selector.hpp"
#include "services/interface_inventory.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <functional>

namespace hotspotd
{
    namespace services
    {

        namespace
        {
            using core::Interface;
            using core::InterfaceType;

            /**
             * First interface matching `predicate`, preferring the one that
             * currently carries the default route. Ties keep inventory order.
             */
            const Interface *pick(const std::vector<Interface> &interfaces,
                                  const std::function<bool(const Interface &)> &predicate)
            {
                const Interface *first = nullptr;
                for (const auto &iface : interfaces)
                {
                    if (!predicate(iface))
                        continue;
                    if (iface.is_internet_source)
                        return &iface;
                    if (!first)
                        first = &iface;
                }
                return first;
            }

            const Interface *find_by_name(const std::vector<Interface> &interfaces, const std::string &name)
            {
                for (const auto &iface : interfaces)
                {
                    if (iface.name == name)
                        return &iface;
                }
                return nullptr;
            }

            std::string describe(const Interface &iface)
            {
                std::string text = iface.name;
                if (iface.has_ip)
                {
                    text += " (" + iface.ip_address + ")";
                }
                return text;
            }
        }

        InterfaceSelector::InterfaceSelector(InterfaceInventory &inventory)
            : inventory_(inventory), logger_(core::get_logger("InterfaceSelector"))
        {
        }

        core::SelectionResult InterfaceSelector::select(const std::optional<std::string> &manual_internet_override,
                                                        bool exclude_vpn)
        {
            auto result = select_from(inventory_.list_interfaces(exclude_vpn), manual_internet_override);

            logger_->info("Interface selection",
                          core::LogContext()
                              .add("internet", result.internet_interface.value_or("none"))
                              .add("hotspot", result.hotspot_interface.value_or("none"))
                              .add("high_risk", result.high_risk));
            for (const auto &warning : result.warnings)
            {
                logger_->warning(warning);
            }
            return result;
        }

        core::SelectionResult InterfaceSelector::select_from(const std::vector<core::Interface> &interfaces,
                                                             const std::optional<std::string> &manual_internet_override)
        {
            core::SelectionResult result;
            std::vector<std::string> trail;

            // Internet side
            const Interface *internet = nullptr;
            if (manual_internet_override && !manual_internet_override->empty())
            {
                result.internet_interface = *manual_internet_override;
                internet = find_by_name(interfaces, *manual_internet_override);
                trail.push_back("internet: manual override " + *manual_internet_override);
                if (!internet)
                {
                    result.warnings.push_back("Manual internet interface '" + *manual_internet_override +
                                              "' was not found among discovered interfaces.");
                }
            }
            else
            {
                struct Rule
                {
                    const char *description;
                    std::function<bool(const Interface &)> predicate;
                };
                const Rule rules[] = {
                    {"connected Ethernet", [](const Interface &i)
                     { return i.type == InterfaceType::ETHERNET && i.connected && i.has_ip; }},
                    {"mobile broadband", [](const Interface &i)
                     { return i.type == InterfaceType::MOBILE && i.connected && i.has_ip; }},
                    {"USB/phone tethering", [](const Interface &i)
                     { return i.type == InterfaceType::TETHERED && i.connected && i.has_ip; }},
                    {"connected Wi-Fi", [](const Interface &i)
                     { return i.type == InterfaceType::WIFI && i.connected; }},
                };

                for (const auto &rule : rules)
                {
                    internet = pick(interfaces, rule.predicate);
                    if (internet)
                    {
                        result.internet_interface = internet->name;
                        trail.push_back(std::string("internet: ") + rule.description + " " + describe(*internet));
                        break;
                    }
                }

                if (!internet)
                {
                    trail.push_back("internet: none");
                    result.warnings.push_back("No internet source detected. Hotspot clients will not have internet "
                                              "access until a connection is established.");
                }
            }

            // Hotspot side
            for (const auto &iface : interfaces)
            {
                if (iface.is_wifi() && iface.in_monitor_mode)
                {
                    result.warnings.push_back("Wi-Fi interface " + iface.name +
                                              " is in monitor mode and was excluded from hotspot candidates.");
                }
            }

            const std::string claimed = result.internet_interface.value_or("");
            const Interface *uplink = find_by_name(interfaces, claimed);
            const Interface *hotspot = nullptr;
            std::string reason;

            // Separate hardware from the uplink; a virtual interface on the uplink's radio is not
            auto unclaimed = [&](const Interface &i)
            {
                return i.name != claimed && !(uplink && i.shares_radio_with(*uplink));
            };

            hotspot = pick(interfaces, [&](const Interface &i)
                           { return i.can_host_ap() && i.is_usb && unclaimed(i); });
            if (hotspot)
            {
                reason = "hotspot: dedicated USB Wi-Fi adapter " + hotspot->name;
            }

            if (!hotspot)
            {
                if (uplink && uplink->can_host_ap() && uplink->supports_concurrency)
                {
                    hotspot = uplink;
                    reason = "hotspot: STA+AP concurrent radio " + hotspot->name + " shared with the uplink";
                }
                else
                {
                    hotspot = pick(interfaces, [](const Interface &i)
                                   { return i.can_host_ap() && i.supports_concurrency; });
                    if (hotspot)
                    {
                        reason = "hotspot: STA+AP capable radio " + hotspot->name;
                    }
                }
            }

            if (!hotspot)
            {
                hotspot = pick(interfaces, [&](const Interface &i)
                               { return i.can_host_ap() && i.is_internal && unclaimed(i); });
                if (hotspot)
                {
                    reason = "hotspot: unclaimed built-in radio " + hotspot->name;
                }
            }

            if (!hotspot)
            {
                hotspot = pick(interfaces, [&](const Interface &i)
                               { return i.can_host_ap() && unclaimed(i); });
                if (!hotspot)
                {
                    hotspot = pick(interfaces, [](const Interface &i)
                                   { return i.can_host_ap(); });
                }
                if (hotspot)
                {
                    reason = "hotspot: remaining AP-capable radio " + hotspot->name;
                }
            }

            if (hotspot)
            {
                result.hotspot_interface = hotspot->name;
                trail.push_back(reason);

                bool shares_uplink = hotspot->name == claimed || (uplink && hotspot->shares_radio_with(*uplink));
                bool alternate_uplink = std::any_of(interfaces.begin(), interfaces.end(),
                                                    [&](const Interface &i)
                                                    { return i.name != hotspot->name && i.is_wired_class_source(); });
                if (shares_uplink && !hotspot->supports_concurrency && !alternate_uplink)
                {
                    result.high_risk = true;
                    result.warnings.push_back("High risk: " + hotspot->name +
                                              " is the only AP-capable radio and also the only internet source; "
                                              "starting the hotspot will disconnect it.");
                }
            }
            else
            {
                trail.push_back("hotspot: none");
                result.warnings.push_back("No Wi-Fi adapter with AP support found.");
            }

            for (const auto &step : trail)
            {
                result.rationale += result.rationale.empty() ? step : "; " + step;
            }
            return result;
        }

    } // namespace services
} // namespace hotspotd
