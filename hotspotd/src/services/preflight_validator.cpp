/**
 * Preflight checklist: decides whether starting the access point is safe
 */

#include "services/preflight_validator.hpp"
#include "services/interface_inventory.hpp"
#include "services/interface_selector.hpp"
#include "services/upstream_resolver.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/instance_lock.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <thread>

namespace hotspotd
{
    namespace services
    {

        namespace
        {
            std::string to_lower(std::string text)
            {
                std::transform(text.begin(), text.end(), text.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return text;
            }

            bool is_physical(const core::Interface &iface)
            {
                return iface.type == core::InterfaceType::WIFI || iface.type == core::InterfaceType::ETHERNET ||
                       iface.type == core::InterfaceType::MOBILE || iface.type == core::InterfaceType::TETHERED;
            }

            std::string network_of(const core::Interface &iface)
            {
                return iface.connection_name.value_or("its current network");
            }
        }

        PreflightValidator::PreflightValidator(infrastructure::CommandRunner &runner,
                                               InterfaceInventory &inventory,
                                               UpstreamResolver &resolver,
                                               const infrastructure::InstanceLock *instance_lock,
                                               std::chrono::milliseconds timeout,
                                               int link_up_retries)
            : runner_(runner), inventory_(inventory), resolver_(resolver), instance_lock_(instance_lock),
              timeout_(timeout), link_up_retries_(link_up_retries),
              sleeper_([](std::chrono::milliseconds delay)
                       { std::this_thread::sleep_for(delay); }),
              logger_(core::get_logger("PreflightValidator"))
        {
        }

        core::PreflightReport PreflightValidator::validate(const PreflightRequest &request)
        {
            core::PreflightReport report;
            logger_->info("Running preflight checks");

            check_network_manager(report);

            if (!check_rfkill(report))
            {
                return report;
            }

            auto interfaces = inventory_.list_interfaces(request.exclude_vpn);
            std::vector<const core::Interface *> wifi;
            for (const auto &iface : interfaces)
            {
                if (iface.is_wifi())
                {
                    wifi.push_back(&iface);
                }
            }

            if (wifi.empty())
            {
                report.errors.push_back("No Wi-Fi interfaces found. Ensure your Wi-Fi adapter is connected and recognized.");
                return report;
            }

            for (const auto *iface : wifi)
            {
                if (iface->in_monitor_mode && (!request.interface || *request.interface != iface->name))
                {
                    report.warnings.push_back("Wi-Fi interface " + iface->name +
                                              " is in monitor mode (used by another tool) and cannot host the hotspot.");
                }
            }

            // Effective target
            std::string target_name;
            if (request.interface && !request.interface->empty())
            {
                target_name = *request.interface;
            }
            else
            {
                auto selection = InterfaceSelector::select_from(interfaces, request.internet_interface);
                if (selection.hotspot_interface)
                {
                    target_name = *selection.hotspot_interface;
                }
                else
                {
                    auto usable = std::find_if(wifi.begin(), wifi.end(), [](const core::Interface *i)
                                               { return !i->in_monitor_mode; });
                    target_name = (usable != wifi.end() ? *usable : wifi.front())->name;
                }
            }
            report.target_interface = target_name;

            auto target_it = std::find_if(wifi.begin(), wifi.end(), [&](const core::Interface *i)
                                          { return i->name == target_name; });
            const core::Interface *target = target_it != wifi.end() ? *target_it : nullptr;

            std::optional<std::string> upstream = request.internet_interface;
            if (!upstream || upstream->empty())
            {
                upstream = resolver_.resolve_upstream(request.exclude_vpn);
            }

            if (!target)
            {
                std::string available;
                for (const auto *iface : wifi)
                {
                    available += available.empty() ? iface->name : ", " + iface->name;
                }
                report.errors.push_back("Interface '" + target_name + "' not found. Available: " + available);
            }
            else if (target->in_monitor_mode)
            {
                report.errors.push_back("Interface " + target->name +
                                        " is in monitor mode. Switch it back first: sudo iw dev " + target->name +
                                        " set type managed");
            }
            else
            {
                check_link_state(target->name, report);

                if (!target->ap_support)
                {
                    std::string message = "Interface " + target->name + " does not support AP (Access Point) mode.";
                    if (const auto *other = alternate_ap_radio(*target, interfaces))
                    {
                        message += " Use " + other->name + " instead (--interface " + other->name + ").";
                    }
                    else
                    {
                        message += " Use a Wi-Fi adapter that supports AP mode.";
                    }
                    report.errors.push_back(message);
                }

                check_busy(*target, interfaces, upstream, request, wifi.size(), report);
            }

            if (!upstream)
            {
                report.warnings.push_back("No active internet connection detected. Hotspot clients will not have "
                                          "internet access unless you connect later.");
            }

            if (request.band == "a" && target && !target->supports_5ghz)
            {
                report.errors.push_back("Your Wi-Fi adapter (" + target->name +
                                        ") does not support the 5GHz band. Use 2.4GHz instead.");
            }

            if (request.ssid.empty() || request.ssid.size() > 32)
            {
                report.errors.push_back("SSID must be between 1 and 32 characters.");
            }
            if (!is_ascii(request.ssid))
            {
                report.warnings.push_back("SSID contains non-ASCII characters. Some devices may not display it correctly.");
            }

            if (request.password.size() < 8)
            {
                report.errors.push_back("Password must be at least 8 characters for WPA2 security.");
            }
            else if (request.password.size() > 63)
            {
                report.errors.push_back("Password must not exceed 63 characters.");
            }

            if (instance_lock_)
            {
                if (auto pid = instance_lock_->find_conflicting())
                {
                    report.warnings.push_back("Another hotspot backend is running (PID " + std::to_string(*pid) +
                                              "). It will be terminated.");
                }
            }

            logger_->info("Preflight finished",
                          core::LogContext()
                              .add("target", target_name)
                              .add("errors", report.errors.size())
                              .add("warnings", report.warnings.size()));
            return report;
        }

        bool PreflightValidator::is_busy(const core::Interface &target, const std::string &own_profile)
        {
            return target.connected && target.connection_name && *target.connection_name != own_profile;
        }

        bool PreflightValidator::carries_upstream(const core::Interface &target,
                                                  const std::vector<core::Interface> &interfaces,
                                                  const std::optional<std::string> &upstream)
        {
            if (!upstream)
            {
                return false;
            }
            if (*upstream == target.name)
            {
                return true;
            }
            if (!UpstreamResolver::is_vpn_name(*upstream))
            {
                return false;
            }

            // A tunnel rides on whichever physical link is up; if that is only the target, it is the target
            for (const auto &iface : interfaces)
            {
                if (iface.name != target.name && is_physical(iface) && iface.connected)
                {
                    return false;
                }
            }
            return target.connected;
        }

        const core::Interface *PreflightValidator::alternate_source(const core::Interface &target,
                                                                    const std::vector<core::Interface> &interfaces)
        {
            for (const auto &iface : interfaces)
            {
                if (iface.name != target.name && iface.is_wired_class_source())
                {
                    return &iface;
                }
            }
            return nullptr;
        }

        const core::Interface *PreflightValidator::alternate_ap_radio(const core::Interface &target,
                                                                      const std::vector<core::Interface> &interfaces)
        {
            for (const auto &iface : interfaces)
            {
                if (iface.name != target.name && iface.can_host_ap() && !iface.shares_radio_with(target))
                {
                    return &iface;
                }
            }
            return nullptr;
        }

        bool PreflightValidator::is_ascii(const std::string &text)
        {
            return std::all_of(text.begin(), text.end(), [](char c)
                               { return static_cast<unsigned char>(c) < 128; });
        }

        std::optional<bool> PreflightValidator::parse_admin_up(const std::string &ip_link_output)
        {
            static const std::regex flags_regex(R"(<([^>]*)>)");
            std::smatch match;
            if (!std::regex_search(ip_link_output, match, flags_regex))
            {
                return std::nullopt;
            }

            std::istringstream flags(match[1].str());
            std::string flag;
            while (std::getline(flags, flag, ','))
            {
                if (flag == "UP")
                {
                    return true;
                }
            }
            return false;
        }

        void PreflightValidator::check_network_manager(core::PreflightReport &report)
        {
            auto result = runner_.run({"systemctl", "is-active", "NetworkManager"}, timeout_);
            if (!result.launched || result.timed_out)
            {
                report.warnings.push_back("Could not verify NetworkManager status.");
            }
            else if (result.exit_code != 0)
            {
                report.errors.push_back("NetworkManager is not running. Start it with: sudo systemctl start NetworkManager");
            }
        }

        bool PreflightValidator::check_rfkill(core::PreflightReport &report)
        {
            auto result = runner_.run({"rfkill", "list", "wifi"}, timeout_);
            if (!result.ok())
            {
                // Nothing to go on; assume the radio is free
                return true;
            }

            auto output = to_lower(result.output);
            if (output.find("hard blocked: yes") != std::string::npos)
            {
                report.errors.push_back("Wi-Fi is HARDWARE BLOCKED. Check the physical Wi-Fi switch or key on your laptop.");
                return false;
            }
            if (output.find("soft blocked: yes") != std::string::npos)
            {
                report.errors.push_back("Wi-Fi is SOFTWARE BLOCKED. Run: sudo rfkill unblock wifi");
                return false;
            }
            return true;
        }

        void PreflightValidator::check_link_state(const std::string &interface, core::PreflightReport &report)
        {
            auto show = runner_.run({"ip", "link", "show", interface}, timeout_);
            if (!show.ok())
            {
                report.warnings.push_back("Could not read the link state of " + interface + ".");
                return;
            }

            auto up = parse_admin_up(show.output);
            if (!up || *up)
            {
                return;
            }

            logger_->warning("Interface administratively down, bringing it up",
                             core::LogContext().add("interface", interface));
            for (int attempt = 1; attempt <= link_up_retries_; ++attempt)
            {
                auto set_up = runner_.run({"ip", "link", "set", interface, "up"}, timeout_);
                if (!set_up.ok())
                {
                    logger_->debug("ip link set up failed",
                                   core::LogContext().add("interface", interface).add("attempt", attempt));
                }
                sleeper_(std::chrono::seconds(1));

                auto recheck = runner_.run({"ip", "link", "show", interface}, timeout_);
                if (recheck.ok() && parse_admin_up(recheck.output).value_or(false))
                {
                    logger_->info("Interface is up", core::LogContext().add("interface", interface));
                    return;
                }
            }

            report.warnings.push_back("Interface " + interface +
                                      " is DOWN and could not be brought up. It may be disabled or have driver issues.");
        }

        void PreflightValidator::check_busy(const core::Interface &target,
                                            const std::vector<core::Interface> &interfaces,
                                            const std::optional<std::string> &upstream,
                                            const PreflightRequest &request,
                                            size_t wifi_count,
                                            core::PreflightReport &report)
        {
            if (!is_busy(target, request.connection_name))
            {
                return;
            }

            const std::string network = network_of(target);

            if (!carries_upstream(target, interfaces, upstream))
            {
                report.warnings.push_back("Interface " + target.name + " is connected to '" + network +
                                          "'. It will be disconnected to start the hotspot.");
                return;
            }

            if (target.supports_concurrency && helpers_available())
            {
                report.warnings.push_back("Interface " + target.name + " supports STA+AP concurrency. The connection to '" +
                                          network + "' will be preserved, no disconnect risk.");
                return;
            }

            const auto *alternate = alternate_source(target, interfaces);
            const auto *other_radio = alternate_ap_radio(target, interfaces);

            if (!alternate && wifi_count == 1)
            {
                if (request.force_single_interface)
                {
                    report.warnings.push_back("FORCED: Your only Wi-Fi interface (" + target.name +
                                              ") will disconnect from '" + network +
                                              "'. You will lose internet connectivity. Proceed with caution.");
                }
                else
                {
                    report.errors.push_back(
                        "BLOCKED: Your only Wi-Fi interface (" + target.name +
                        ") is currently providing your internet connection via '" + network +
                        "'. Starting a hotspot will disconnect you completely with no way to recover remotely.\n"
                        "Solutions:\n"
                        "  1. Connect to the internet via Ethernet cable first\n"
                        "  2. Add a second USB Wi-Fi adapter for the hotspot\n"
                        "  3. Tether a phone over USB for internet\n"
                        "  4. Use --force-single-interface if you understand the risk");
                }
                return;
            }

            if (alternate)
            {
                report.warnings.push_back("Your Wi-Fi (" + target.name + ") will disconnect from '" + network +
                                          "'. Internet will continue via " + alternate->name + ".");
                return;
            }

            if (other_radio)
            {
                report.warnings.push_back("Interface " + target.name + " carries your internet connection. " +
                                          other_radio->name + " can host the hotspot instead (--interface " +
                                          other_radio->name + ") without disconnecting you.");
                return;
            }

            report.warnings.push_back("Interface " + target.name + " is connected to '" + network +
                                      "'. It will be disconnected to start the hotspot.");
        }

        bool PreflightValidator::helpers_available()
        {
            return std::all_of(concurrency_tools_.begin(), concurrency_tools_.end(), [this](const std::string &tool)
                               { return runner_.tool_available(tool); });
        }

    } // namespace services
} // namespace hotspotd
