#ifndef HOTSPOTD_SERVICES_MONITOR_LOOP_HPP
#define HOTSPOTD_SERVICES_MONITOR_LOOP_HPP

#include <chrono>
#include <functional>
#include <memory>
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
        class CancellationToken;
    }

    namespace services
    {
        class UpstreamResolver;
        class FirewallManager;

        enum class MonitorExit
        {
            CANCELLED,
            AUTO_OFF
        };

        /**
         * Runs for the lifetime of a session: follows the upstream and
         * reprograms the rules when it moves, and counts idle time for
         * auto-off. Sole writer of the session while it runs.
         */
        class MonitorLoop
        {
        public:
            using ClientCounter = std::function<int(const core::RuntimeSession &)>;

            MonitorLoop(UpstreamResolver &resolver,
                        FirewallManager &firewall,
                        ClientCounter client_counter,
                        const core::TimingConfig &timing,
                        bool exclude_vpn);

            // One iteration; true when auto-off fired
            bool tick(core::RuntimeSession &session);

            MonitorExit run(core::RuntimeSession &session, infrastructure::CancellationToken &token);

            // Idle seconds added per empty client sample
            int idle_step_seconds() const { return idle_step_seconds_; }

        private:
            void follow_upstream(core::RuntimeSession &session);
            bool sample_clients(core::RuntimeSession &session);

            UpstreamResolver &resolver_;
            FirewallManager &firewall_;
            ClientCounter client_counter_;
            std::chrono::milliseconds poll_interval_;
            int sample_every_;
            int idle_step_seconds_;
            bool exclude_vpn_;
            int iteration_ = 0;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_MONITOR_LOOP_HPP
