#ifndef HOTSPOTD_INFRASTRUCTURE_HOSTAPD_MANAGER_HPP
#define HOTSPOTD_INFRASTRUCTURE_HOSTAPD_MANAGER_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
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
         * Runs hostapd on the virtual AP interface in concurrent mode.
         * hostapd daemonizes itself (-B) and records its PID (-P).
         */
        class HostapdManager
        {
        public:
            HostapdManager(CommandRunner &runner,
                           const core::AccessPointConfig &config,
                           const std::string &runtime_dir,
                           const std::string &interface,
                           std::chrono::milliseconds timeout);

            bool start(int channel);
            bool stop();
            bool is_running() const;

            const std::filesystem::path &config_file() const { return config_file_; }
            const std::filesystem::path &pid_file() const { return pid_file_; }

            // Channels above 14 are 5 GHz
            static const char *hw_mode_for_channel(int channel);

            /**
             * hostapd.conf text. Fails (empty result) when the passphrase
             * contains characters hostapd cannot take on a config line.
             */
            static std::string render_config(const core::AccessPointConfig &config,
                                             const std::string &interface,
                                             int channel);

        private:
            void remove_generated_files();

            CommandRunner &runner_;
            core::AccessPointConfig config_;
            std::string interface_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;

            std::filesystem::path config_dir_;
            std::filesystem::path config_file_;
            std::filesystem::path pid_file_;
        };

    } // namespace infrastructure
} // namespace hotspotd

#endif // HOTSPOTD_INFRASTRUCTURE_HOSTAPD_MANAGER_HPP
