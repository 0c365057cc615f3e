/**
 * Mode selection and access point bring-up/teardown
 */

#include "services/mode_orchestrator.hpp"
#include "services/capability_probe.hpp"
#include "services/firewall_manager.hpp"
#include "services/preflight_validator.hpp"
#include "services/upstream_resolver.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/dhcp_server.hpp"
#include "infrastructure/hostapd_manager.hpp"
#include "infrastructure/wifi_manager.hpp"
#include "core/logger.hpp"

#include <initializer_list>
#include <sstream>

namespace hotspotd
{
    namespace services
    {

        namespace
        {
            constexpr int DEFAULT_5GHZ_CHANNEL = 36;

            std::string trim_trailing(const std::string &text)
            {
                auto end = text.find_last_not_of(" \t\r\n");
                return end == std::string::npos ? "" : text.substr(0, end + 1);
            }

            // Hardware that can keep the host online on its own
            bool is_physical_uplink(const core::Interface &iface)
            {
                return iface.type == core::InterfaceType::WIFI || iface.type == core::InterfaceType::ETHERNET ||
                       iface.type == core::InterfaceType::MOBILE || iface.type == core::InterfaceType::TETHERED;
            }
        }

        ModeOrchestrator::ModeOrchestrator(infrastructure::CommandRunner &runner,
                                           const core::HotspotConfig &config,
                                           CapabilityProbe &probe,
                                           FirewallManager &firewall)
            : runner_(runner), config_(config), probe_(probe), firewall_(firewall),
              timeout_(std::chrono::milliseconds(config.timing.command_timeout_ms)),
              wifi_manager_(std::make_unique<infrastructure::WiFiAccessPointManager>(runner, config.ap, timeout_)),
              logger_(core::get_logger("ModeOrchestrator"))
        {
        }

        ModeOrchestrator::~ModeOrchestrator() = default;

        ModeDecision ModeOrchestrator::choose_mode(const core::Interface &target,
                                                   const std::vector<core::Interface> &interfaces,
                                                   const std::optional<std::string> &upstream,
                                                   bool helpers_available,
                                                   bool force_single_interface,
                                                   const std::string &own_profile)
        {
            ModeDecision decision;
            decision.ok = true;

            if (target.supports_concurrency && target.connected && helpers_available)
            {
                decision.mode = core::OperatingMode::CONCURRENT;
                decision.reason = target.name + " supports STA+AP concurrency; its connection is preserved";
                return decision;
            }

            if (upstream && *upstream != target.name && !UpstreamResolver::is_vpn_name(*upstream))
            {
                for (const auto &iface : interfaces)
                {
                    if (iface.name == *upstream && is_physical_uplink(iface) && !iface.shares_radio_with(target))
                    {
                        decision.mode = core::OperatingMode::DUAL_ADAPTER;
                        decision.reason = "internet via " + iface.name + ", hotspot on separate radio " + target.name;
                        return decision;
                    }
                }
            }

            decision.mode = core::OperatingMode::MANAGED;

            // Taking over a sibling of the uplink radio disrupts the uplink itself
            bool uplink_sibling = false;
            if (upstream && *upstream != target.name)
            {
                for (const auto &iface : interfaces)
                {
                    if (iface.name == *upstream && iface.connected && iface.shares_radio_with(target))
                    {
                        uplink_sibling = true;
                    }
                }
            }

            if (!uplink_sibling && !PreflightValidator::is_busy(target, own_profile))
            {
                decision.reason = target.name + " is not connected; nothing to preserve";
                return decision;
            }

            if (!uplink_sibling && !PreflightValidator::carries_upstream(target, interfaces, upstream))
            {
                decision.reason = target.name + " is connected but does not carry the internet connection";
                return decision;
            }

            if (const auto *alternate = PreflightValidator::alternate_source(target, interfaces))
            {
                decision.reason = "internet continues via " + alternate->name + " after " + target.name + " disconnects";
                return decision;
            }

            if (const auto *other = PreflightValidator::alternate_ap_radio(target, interfaces))
            {
                decision.reason = target.name + " chosen although " + other->name + " could host the hotspot";
                return decision;
            }

            if (force_single_interface)
            {
                decision.reason = "forced onto the only radio " + target.name + "; internet will be lost";
                return decision;
            }

            decision.ok = false;
            decision.reason = "Refusing to start: " +
                              (uplink_sibling ? target.name + " (same radio as " + *upstream + ")" : target.name) +
                              " carries your only internet connection, has no STA+AP concurrency and no second "
                              "adapter is available. Connect Ethernet, add a USB Wi-Fi adapter, tether a phone, "
                              "or pass --force-single-interface to accept the disconnect.";
            return decision;
        }

        int ModeOrchestrator::choose_channel(int station_channel,
                                             int concurrency_channels,
                                             const std::string &band,
                                             bool supports_5ghz)
        {
            if (concurrency_channels <= 1)
            {
                return station_channel;
            }
            if (band == "a" && supports_5ghz)
            {
                return DEFAULT_5GHZ_CHANNEL;
            }
            return CapabilityProbe::DEFAULT_CHANNEL;
        }

        bool ModeOrchestrator::helpers_available()
        {
            for (const char *tool : {"hostapd", "dnsmasq", "iw"})
            {
                if (!runner_.tool_available(tool))
                {
                    logger_->debug("Helper not available", core::LogContext().add("tool", tool));
                    return false;
                }
            }
            return true;
        }

        bool ModeOrchestrator::start(core::RuntimeSession &session,
                                     const core::Interface &target,
                                     const std::vector<core::Interface> &interfaces,
                                     const std::optional<std::string> &upstream,
                                     std::string &failure)
        {
            auto decision = choose_mode(target, interfaces, upstream, helpers_available(),
                                        config_.policy.force_single_interface, config_.ap.connection_name);
            if (!decision.ok)
            {
                logger_->error("Mode selection refused", core::LogContext().add("interface", target.name));
                failure = decision.reason;
                return false;
            }

            session.hotspot_interface = target.name;
            session.mode = decision.mode;
            session.mac_policy = core::MacPolicy::from_strings(config_.policy.mac_mode, config_.policy.mac_list);
            session.auto_off_minutes = config_.policy.auto_off_minutes;
            session.idle_seconds = 0;

            logger_->info("Operating mode selected",
                          core::LogContext()
                              .add("mode", core::operating_mode_to_string(decision.mode))
                              .add("interface", target.name)
                              .add("reason", decision.reason));

            bool started = decision.mode == core::OperatingMode::CONCURRENT
                               ? start_concurrent(session, target, upstream, failure)
                               : start_standard(session, target, failure);
            if (!started)
            {
                logger_->error("Hotspot startup failed, reverting", core::LogContext().add("reason", failure));
                teardown(session);
            }
            return started;
        }

        bool ModeOrchestrator::start_concurrent(core::RuntimeSession &session,
                                                const core::Interface &target,
                                                const std::optional<std::string> &upstream,
                                                std::string &failure)
        {
            const std::string &vif = config_.concurrent.virtual_interface;

            // Leftover from an earlier crash
            delete_virtual_interface(vif);

            session.virtual_interface = vif;
            if (!run_checked({"iw", "dev", target.name, "interface", "add", vif, "type", "__ap"}, failure,
                             "create virtual AP interface " + vif))
            {
                session.virtual_interface.reset();
                return false;
            }

            if (!wifi_manager_->set_device_managed(vif, false))
            {
                logger_->warning("NetworkManager may interfere with the virtual interface",
                                 core::LogContext().add("interface", vif));
            }

            int station_channel = probe_.current_channel(target.name);
            int channel = choose_channel(station_channel, target.concurrency_channels,
                                         config_.ap.band, target.supports_5ghz);
            if (target.concurrency_channels > 1 && channel != station_channel)
            {
                logger_->warning("AP channel chosen from the requested band; separation from the station "
                                 "channel is not verified",
                                 core::LogContext().add("station_channel", station_channel).add("ap_channel", channel));
            }
            else if (config_.ap.band == "a" && channel <= 14)
            {
                logger_->info("AP follows the station's 2.4GHz channel", core::LogContext().add("channel", channel));
            }

            if (probe_.channel_no_ir(target.name, channel))
            {
                logger_->warning("Channel is restricted (no-IR), adjusting regulatory domain",
                                 core::LogContext().add("channel", channel).add("country", config_.ap.country_code));
                auto reg = runner_.run({"iw", "reg", "set", config_.ap.country_code}, timeout_);
                if (!reg.ok())
                {
                    logger_->warning("Regulatory domain change failed", core::LogContext().add("error", reg.error));
                }
            }

            if (!run_checked({"ip", "addr", "flush", "dev", vif}, failure, "flush addresses on " + vif) ||
                !run_checked({"ip", "addr", "add", config_.concurrent.gateway + "/24", "dev", vif}, failure,
                             "assign " + config_.concurrent.gateway + " to " + vif) ||
                !run_checked({"ip", "link", "set", vif, "up"}, failure, "bring " + vif + " up"))
            {
                return false;
            }

            session.rules_installed = true;
            if (!firewall_.apply(vif, upstream, session.mac_policy))
            {
                failure = "Could not install NAT/forwarding rules for " + vif + ". Check that iptables is available.";
                return false;
            }
            session.current_upstream = upstream;

            hostapd_ = std::make_unique<infrastructure::HostapdManager>(runner_, config_.ap, config_.paths.runtime_dir,
                                                                        vif, timeout_);
            session.hostapd_started = true;
            if (!hostapd_->start(channel))
            {
                failure = "hostapd could not start the access point on " + vif + " (channel " +
                          std::to_string(channel) + "). Your connection on " + target.name +
                          " was left untouched. Check `journalctl -t hostapd` or try --band bg.";
                return false;
            }

            dhcp_server_ = std::make_unique<infrastructure::DHCPServerManager>(
                runner_, config_.concurrent, config_.paths.runtime_dir, config_.ap.dns, timeout_);
            session.dnsmasq_started = true;
            if (!dhcp_server_->setup_dhcp_server(vif))
            {
                failure = "dnsmasq could not serve DHCP on " + vif +
                          ". Make sure no other DHCP server is bound to it.";
                return false;
            }

            logger_->info("Concurrent access point active",
                          core::LogContext()
                              .add("physical", target.name)
                              .add("virtual", vif)
                              .add("channel", channel)
                              .add("upstream", upstream.value_or("none")));
            return true;
        }

        bool ModeOrchestrator::start_standard(core::RuntimeSession &session,
                                              const core::Interface &target,
                                              std::string &failure)
        {
            session.profile_created = true;
            if (!wifi_manager_->setup_hotspot(target.name))
            {
                failure = "NetworkManager could not activate the access point on " + target.name +
                          ". Check `nmcli device status` and that the adapter supports AP mode.";
                return false;
            }

            session.rules_installed = true;
            if (!firewall_.apply_mss_clamp())
            {
                logger_->warning("MSS clamping not installed; large transfers over tunnels may stall");
            }
            return true;
        }

        void ModeOrchestrator::teardown(core::RuntimeSession &session)
        {
            logger_->info("Tearing down hotspot", core::LogContext().add("interface", session.hotspot_interface));

            if (session.dnsmasq_started)
            {
                if (dhcp_server_ && !dhcp_server_->teardown_dhcp_server())
                {
                    logger_->warning("DHCP server teardown incomplete");
                }
                session.dnsmasq_started = false;
            }

            if (session.hostapd_started)
            {
                if (hostapd_ && !hostapd_->stop())
                {
                    logger_->warning("hostapd teardown incomplete");
                }
                session.hostapd_started = false;
            }

            if (session.virtual_interface)
            {
                delete_virtual_interface(*session.virtual_interface);
                session.virtual_interface.reset();
            }

            if (session.rules_installed)
            {
                firewall_.remove();
                session.rules_installed = false;
            }

            if (session.profile_created)
            {
                if (!wifi_manager_->teardown_hotspot())
                {
                    logger_->warning("Access point profile removal failed");
                }
                session.profile_created = false;
            }

            session.current_upstream.reset();
            dhcp_server_.reset();
            hostapd_.reset();
        }

        void ModeOrchestrator::cleanup_leftovers()
        {
            const std::string &vif = config_.concurrent.virtual_interface;

            infrastructure::DHCPServerManager dhcp(runner_, config_.concurrent, config_.paths.runtime_dir,
                                                   config_.ap.dns, timeout_);
            if (!dhcp.teardown_dhcp_server())
            {
                logger_->warning("dnsmasq from a previous session is still running");
            }

            infrastructure::HostapdManager hostapd(runner_, config_.ap, config_.paths.runtime_dir, vif, timeout_);
            if (!hostapd.stop())
            {
                logger_->warning("hostapd from a previous session is still running");
            }

            delete_virtual_interface(vif);
            firewall_.remove();
            if (!wifi_manager_->teardown_hotspot())
            {
                logger_->warning("Access point profile removal failed");
            }
        }

        int ModeOrchestrator::count_clients(const core::RuntimeSession &session)
        {
            if (session.mode == core::OperatingMode::CONCURRENT)
            {
                return dhcp_server_ ? dhcp_server_->count_leases() : 0;
            }

            auto result = runner_.run({"iw", "dev", session.ap_interface(), "station", "dump"}, timeout_);
            if (!result.ok())
            {
                return 0;
            }
            return parse_station_count(result.output);
        }

        int ModeOrchestrator::parse_station_count(const std::string &station_dump)
        {
            int count = 0;
            std::istringstream stream(station_dump);
            std::string line;
            while (std::getline(stream, line))
            {
                if (line.rfind("Station ", 0) == 0)
                {
                    ++count;
                }
            }
            return count;
        }

        bool ModeOrchestrator::run_checked(const std::vector<std::string> &args,
                                           std::string &failure,
                                           const std::string &what)
        {
            auto result = runner_.run(args, timeout_);
            if (result.ok())
            {
                return true;
            }

            logger_->error("Command failed",
                           core::LogContext()
                               .add("command", infrastructure::join_command(args))
                               .add("exit_code", result.exit_code)
                               .add("error", result.error));
            auto detail = trim_trailing(result.error);
            failure = "Failed to " + what + (detail.empty() ? "." : ": " + detail);
            return false;
        }

        void ModeOrchestrator::delete_virtual_interface(const std::string &name)
        {
            auto info = runner_.run({"iw", "dev", name, "info"}, timeout_);
            if (!info.ok())
            {
                return;
            }

            auto result = runner_.run({"iw", "dev", name, "del"}, timeout_);
            if (!result.ok())
            {
                logger_->warning("Failed to delete virtual interface",
                                 core::LogContext().add("interface", name).add("error", result.error));
            }
        }

    } // namespace services
} // namespace hotspotd
