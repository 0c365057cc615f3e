#ifndef HOTSPOTD_INFRASTRUCTURE_WIFI_MANAGER_HPP
#define HOTSPOTD_INFRASTRUCTURE_WIFI_MANAGER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/config.hpp"

namespace hotspotd
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {
        class CommandRunner;

        /**
         * WiFi Access Point Manager
         * Creates, activates and removes the access-point profile through
         * NetworkManager (Managed and Dual-Adapter modes)
         */
        class WiFiAccessPointManager
        {
        public:
            using Sleeper = std::function<void(std::chrono::milliseconds)>;

            WiFiAccessPointManager(CommandRunner &runner,
                                   const core::AccessPointConfig &config,
                                   std::chrono::milliseconds timeout);

            // Radio on, drop the current association, fresh profile, activate
            bool setup_hotspot(const std::string &interface);

            // Deletes the profile; succeeds when it was never there
            bool teardown_hotspot();

            // `nmcli radio wifi on`, then wait until the device is usable
            bool ensure_radio_ready(const std::string &interface, int attempts = 5);

            bool disconnect_device(const std::string &interface);
            bool set_device_managed(const std::string &interface, bool managed);

            const std::string &connection_name() const { return config_.connection_name; }

            void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

            // `nmcli connection add ...` for this configuration
            static std::vector<std::string> build_profile_command(const core::AccessPointConfig &config,
                                                                  const std::string &interface);

            // DEVICE:STATE terse table -> state of `interface`, empty if absent
            static std::string parse_device_state(const std::string &output, const std::string &interface);

        private:
            bool remove_existing_connection();
            bool create_hotspot_connection(const std::string &interface);
            bool activate_connection(const std::string &interface);
            bool run_nmcli_command(const std::vector<std::string> &args, std::string *output = nullptr);

            CommandRunner &runner_;
            core::AccessPointConfig config_;
            std::chrono::milliseconds timeout_;
            Sleeper sleeper_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace hotspotd

#endif // HOTSPOTD_INFRASTRUCTURE_WIFI_MANAGER_HPP
