#ifndef HOTSPOTD_CORE_HOTSPOT_SERVICE_HPP
#define HOTSPOTD_CORE_HOTSPOT_SERVICE_HPP

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Forward declarations
namespace hotspotd
{
    namespace core
    {
        class HotspotConfig;
        class Logger;
        struct Interface;
    }
    namespace infrastructure
    {
        class CommandRunner;
        class CancellationToken;
        class InstanceLock;
        class StatusReporter;
    }
    namespace services
    {
        class CapabilityProbe;
        class UpstreamResolver;
        class InterfaceInventory;
        class FirewallManager;
        class ModeOrchestrator;
    }
}

namespace hotspotd
{
    namespace core
    {

        /**
         * hotspotd application
         * Wires the services together and runs one command: a full hotspot
         * session, --stop, or one of the read-only discovery queries.
         * Every command returns the process exit code.
         */
        class HotspotService
        {
        public:
            HotspotService(std::unique_ptr<HotspotConfig> config,
                           infrastructure::CommandRunner &runner,
                           std::ostream &out = std::cout,
                           std::ostream &err = std::cerr);
            ~HotspotService();

            // Preflight, start, monitor until cancelled or idle, tear down
            int run(infrastructure::CancellationToken &token);

            // Stop a running instance and clean up whatever it left behind
            int stop();

            nlohmann::json list_interfaces();
            nlohmann::json recommend();

            const HotspotConfig &config() const { return *config_; }

        private:
            int fail(const std::string &message);
            const Interface *find_interface(const std::vector<Interface> &interfaces, const std::string &name) const;

            std::unique_ptr<HotspotConfig> config_;
            infrastructure::CommandRunner &runner_;
            std::ostream &out_;
            std::ostream &err_;

            std::unique_ptr<services::CapabilityProbe> probe_;
            std::unique_ptr<services::UpstreamResolver> resolver_;
            std::unique_ptr<services::InterfaceInventory> inventory_;
            std::unique_ptr<services::FirewallManager> firewall_;
            std::unique_ptr<services::ModeOrchestrator> orchestrator_;
            std::unique_ptr<infrastructure::InstanceLock> instance_lock_;
            std::unique_ptr<infrastructure::StatusReporter> status_;
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace hotspotd

#endif // HOTSPOTD_CORE_HOTSPOT_SERVICE_HPP
