#include "services/monitor_loop.hpp"
#include "services/firewall_manager.hpp"
#include "services/upstream_resolver.hpp"
#include "infrastructure/cancellation.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace hotspotd
{
    namespace services
    {

        MonitorLoop::MonitorLoop(UpstreamResolver &resolver,
                                 FirewallManager &firewall,
                                 ClientCounter client_counter,
                                 const core::TimingConfig &timing,
                                 bool exclude_vpn)
            : resolver_(resolver), firewall_(firewall), client_counter_(std::move(client_counter)),
              poll_interval_(timing.poll_interval_ms),
              sample_every_(std::max(1, timing.client_sample_every)),
              idle_step_seconds_(std::max(1, timing.client_sample_every * timing.poll_interval_ms / 1000)),
              exclude_vpn_(exclude_vpn),
              logger_(core::get_logger("MonitorLoop"))
        {
        }

        bool MonitorLoop::tick(core::RuntimeSession &session)
        {
            follow_upstream(session);
            return sample_clients(session);
        }

        MonitorExit MonitorLoop::run(core::RuntimeSession &session, infrastructure::CancellationToken &token)
        {
            logger_->info("Monitoring internet source",
                          core::LogContext()
                              .add("hotspot", session.ap_interface())
                              .add("auto_off_minutes", session.auto_off_minutes));

            while (!token.cancelled())
            {
                if (tick(session))
                {
                    logger_->info("Auto-off trigger",
                                  core::LogContext().add("idle_seconds", session.idle_seconds));
                    return MonitorExit::AUTO_OFF;
                }

                if (token.wait_for(poll_interval_))
                {
                    break;
                }
            }

            logger_->info("Stop requested");
            return MonitorExit::CANCELLED;
        }

        void MonitorLoop::follow_upstream(core::RuntimeSession &session)
        {
            auto upstream = resolver_.resolve_upstream(exclude_vpn_);
            if (!upstream || upstream == session.current_upstream || *upstream == session.ap_interface())
            {
                return;
            }

            logger_->info("Routing update",
                          core::LogContext()
                              .add("upstream", *upstream)
                              .add("previous", session.current_upstream.value_or("none"))
                              .add("hotspot", session.ap_interface()));

            session.rules_installed = true;
            if (!firewall_.apply(session.ap_interface(), upstream, session.mac_policy))
            {
                // current_upstream stays stale so the next tick retries
                logger_->warning("Rule update incomplete, retrying next cycle");
                return;
            }
            session.current_upstream = upstream;
        }

        bool MonitorLoop::sample_clients(core::RuntimeSession &session)
        {
            if (session.auto_off_minutes <= 0)
            {
                return false;
            }

            if (++iteration_ < sample_every_)
            {
                return false;
            }
            iteration_ = 0;

            int clients = client_counter_(session);
            if (clients == 0)
            {
                session.idle_seconds += idle_step_seconds_;
            }
            else
            {
                session.idle_seconds = 0;
            }

            logger_->debug("Client sample",
                           core::LogContext().add("clients", clients).add("idle_seconds", session.idle_seconds));

            return session.idle_seconds >= session.auto_off_minutes * 60;
        }

    } // namespace services
} // namespace hotspotd
