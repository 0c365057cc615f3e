#ifndef HOTSPOTD_SERVICES_MODE_ORCHESTRATOR_HPP
#define HOTSPOTD_SERVICES_MODE_ORCHESTRATOR_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
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
        class WiFiAccessPointManager;
        class HostapdManager;
        class DHCPServerManager;
    }

    namespace services
    {
        class CapabilityProbe;
        class FirewallManager;

        struct ModeDecision
        {
            bool ok = false;
            core::OperatingMode mode = core::OperatingMode::MANAGED;
            std::string reason;
        };

        /**
         * Chooses the operating mode once per session, brings the access point
         * up in that mode and takes every side effect down again.
         *
         * Concurrent mode never falls back to disconnecting the physical radio:
         * if the virtual AP cannot be brought up, the session fails.
         */
        class ModeOrchestrator
        {
        public:
            ModeOrchestrator(infrastructure::CommandRunner &runner,
                             const core::HotspotConfig &config,
                             CapabilityProbe &probe,
                             FirewallManager &firewall);
            ~ModeOrchestrator();

            static ModeDecision choose_mode(const core::Interface &target,
                                            const std::vector<core::Interface> &interfaces,
                                            const std::optional<std::string> &upstream,
                                            bool helpers_available,
                                            bool force_single_interface,
                                            const std::string &own_profile);

            /**
             * Channel for the virtual AP. Single-channel concurrency pins it to
             * the station's channel; with more channels the requested band's
             * default is used without checking separation from the station.
             */
            static int choose_channel(int station_channel,
                                      int concurrency_channels,
                                      const std::string &band,
                                      bool supports_5ghz);

            // hostapd, dnsmasq and iw on PATH
            bool helpers_available();

            /**
             * Fills `session` and brings the access point up. On failure every
             * side effect already made is reversed and `failure` explains why.
             */
            bool start(core::RuntimeSession &session,
                       const core::Interface &target,
                       const std::vector<core::Interface> &interfaces,
                       const std::optional<std::string> &upstream,
                       std::string &failure);

            // Idempotent; safe after a partial start
            void teardown(core::RuntimeSession &session);

            // Session-independent cleanup for --stop
            void cleanup_leftovers();

            // Connected clients: station dump or DHCP leases, by mode
            int count_clients(const core::RuntimeSession &session);

            // "Station aa:bb:..." entries in `iw dev X station dump`
            static int parse_station_count(const std::string &station_dump);

            infrastructure::WiFiAccessPointManager &wifi_manager() { return *wifi_manager_; }

        private:
            bool start_concurrent(core::RuntimeSession &session,
                                  const core::Interface &target,
                                  const std::optional<std::string> &upstream,
                                  std::string &failure);
            bool start_standard(core::RuntimeSession &session,
                                const core::Interface &target,
                                std::string &failure);
            bool run_checked(const std::vector<std::string> &args, std::string &failure, const std::string &what);
            void delete_virtual_interface(const std::string &name);

            infrastructure::CommandRunner &runner_;
            core::HotspotConfig config_;
            CapabilityProbe &probe_;
            FirewallManager &firewall_;
            std::chrono::milliseconds timeout_;
            std::unique_ptr<infrastructure::WiFiAccessPointManager> wifi_manager_;
            std::unique_ptr<infrastructure::HostapdManager> hostapd_;
            std::unique_ptr<infrastructure::DHCPServerManager> dhcp_server_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_MODE_ORCHESTRATOR_HPP
