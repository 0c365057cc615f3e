#ifndef HOTSPOTD_SERVICES_PREFLIGHT_VALIDATOR_HPP
#define HOTSPOTD_SERVICES_PREFLIGHT_VALIDATOR_HPP

#include <chrono>
#include <functional>
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
        class InstanceLock;
    }

    namespace services
    {
        class InterfaceInventory;
        class UpstreamResolver;

        struct PreflightRequest
        {
            std::optional<std::string> interface;          // manual hotspot interface
            std::optional<std::string> internet_interface; // manual upstream override
            std::string ssid;
            std::string password;
            std::string band = "bg";
            bool exclude_vpn = false;
            bool force_single_interface = false;
            std::string connection_name = "temp_hotspot_con"; // our own profile never counts as busy
        };

        /**
         * Checklist run before any system state is touched.
         *
         * Every check appends to errors (fatal) or warnings (advisory). Only a
         * blocked radio or the absence of Wi-Fi hardware stop the checklist early.
         */
        class PreflightValidator
        {
        public:
            using Sleeper = std::function<void(std::chrono::milliseconds)>;

            PreflightValidator(infrastructure::CommandRunner &runner,
                               InterfaceInventory &inventory,
                               UpstreamResolver &resolver,
                               const infrastructure::InstanceLock *instance_lock,
                               std::chrono::milliseconds timeout,
                               int link_up_retries = 3);

            core::PreflightReport validate(const PreflightRequest &request);

            void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

            // Connected to some network other than our own access-point profile
            static bool is_busy(const core::Interface &target, const std::string &own_profile);

            // The target radio is the path to the internet right now
            static bool carries_upstream(const core::Interface &target,
                                         const std::vector<core::Interface> &interfaces,
                                         const std::optional<std::string> &upstream);

            // Another interface that keeps the host online once the target is repurposed
            static const core::Interface *alternate_source(const core::Interface &target,
                                                           const std::vector<core::Interface> &interfaces);

            static const core::Interface *alternate_ap_radio(const core::Interface &target,
                                                             const std::vector<core::Interface> &interfaces);

            static bool is_ascii(const std::string &text);

            // Administrative UP flag from `ip link show`; nullopt if no flag list is present
            static std::optional<bool> parse_admin_up(const std::string &ip_link_output);

        private:
            void check_network_manager(core::PreflightReport &report);
            bool check_rfkill(core::PreflightReport &report);
            void check_link_state(const std::string &interface, core::PreflightReport &report);
            void check_busy(const core::Interface &target,
                            const std::vector<core::Interface> &interfaces,
                            const std::optional<std::string> &upstream,
                            const PreflightRequest &request,
                            size_t wifi_count,
                            core::PreflightReport &report);
            bool helpers_available();

            infrastructure::CommandRunner &runner_;
            InterfaceInventory &inventory_;
            UpstreamResolver &resolver_;
            const infrastructure::InstanceLock *instance_lock_;
            std::chrono::milliseconds timeout_;
            int link_up_retries_;
            Sleeper sleeper_;
            std::vector<std::string> concurrency_tools_{"hostapd", "dnsmasq"};
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_PREFLIGHT_VALIDATOR_HPP
