#include "core/hotspot_service.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/models.hpp"
#include "services/capability_probe.hpp"
#include "services/upstream_resolver.hpp"
#include "services/interface_inventory.hpp"
#include "services/interface_selector.hpp"
#include "services/preflight_validator.hpp"
#include "services/firewall_manager.hpp"
#include "services/mode_orchestrator.hpp"
#include "services/monitor_loop.hpp"
#include "services/session_guard.hpp"
#include "infrastructure/cancellation.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/instance_lock.hpp"
#include "infrastructure/status_reporter.hpp"

#include <stdexcept>

namespace hotspotd
{
    namespace core
    {

        HotspotService::HotspotService(std::unique_ptr<HotspotConfig> config,
                                       infrastructure::CommandRunner &runner,
                                       std::ostream &out,
                                       std::ostream &err)
            : config_(std::move(config)), runner_(runner), out_(out), err_(err),
              logger_(get_logger("HotspotService"))
        {
            if (!config_)
            {
                throw std::invalid_argument("Hotspot configuration cannot be null");
            }

            auto command_timeout = std::chrono::milliseconds(config_->timing.command_timeout_ms);
            auto probe_timeout = std::chrono::milliseconds(config_->timing.probe_timeout_ms);

            probe_ = std::make_unique<services::CapabilityProbe>(runner_, probe_timeout);
            resolver_ = std::make_unique<services::UpstreamResolver>(runner_, probe_timeout);
            inventory_ = std::make_unique<services::InterfaceInventory>(runner_, *probe_, *resolver_, probe_timeout);
            firewall_ = std::make_unique<services::FirewallManager>(runner_, command_timeout);
            orchestrator_ = std::make_unique<services::ModeOrchestrator>(runner_, *config_, *probe_, *firewall_);
            instance_lock_ = std::make_unique<infrastructure::InstanceLock>(config_->paths.pid_file);
            status_ = std::make_unique<infrastructure::StatusReporter>(config_->paths.status_file);

            logger_->debug("hotspotd initialized",
                           LogContext()
                               .add("ssid", config_->ap.ssid)
                               .add("band", config_->ap.band)
                               .add("status_file", config_->paths.status_file));
        }

        HotspotService::~HotspotService() = default;

        int HotspotService::run(infrastructure::CancellationToken &token)
        {
            services::PreflightValidator validator(runner_, *inventory_, *resolver_, instance_lock_.get(),
                                                   std::chrono::milliseconds(config_->timing.command_timeout_ms),
                                                   config_->timing.link_up_retries);

            services::PreflightRequest request;
            request.interface = config_->ap.interface;
            request.internet_interface = config_->ap.internet_interface;
            request.ssid = config_->ap.ssid;
            request.password = config_->ap.password;
            request.band = config_->ap.band;
            request.exclude_vpn = config_->policy.exclude_vpn;
            request.force_single_interface = config_->policy.force_single_interface;
            request.connection_name = config_->ap.connection_name;

            auto report = validator.validate(request);
            for (const auto &warning : report.warnings)
            {
                out_ << "WARNING: " << warning << std::endl;
            }
            if (!report.ok())
            {
                return fail(report.error_text());
            }

            if (!instance_lock_->acquire())
            {
                return fail("Could not claim " + instance_lock_->path() +
                            ". Stop the other hotspot instance with: sudo hotspotd --stop");
            }

            RuntimeSession session;
            services::SessionGuard guard(*orchestrator_, *instance_lock_, session);

            // Fresh snapshot: preflight may have brought the link up
            auto interfaces = inventory_->list_interfaces(config_->policy.exclude_vpn);
            const Interface *target = find_interface(interfaces, report.target_interface.value_or(""));
            if (!target)
            {
                return fail("Interface '" + report.target_interface.value_or("") +
                            "' disappeared during startup. Re-plug the adapter and try again.");
            }

            auto upstream = config_->ap.internet_interface ? config_->ap.internet_interface
                                                           : resolver_->resolve_upstream(config_->policy.exclude_vpn);

            std::string failure;
            if (!orchestrator_->start(session, *target, interfaces, upstream, failure))
            {
                return fail(failure);
            }

            std::string active = "Hotspot ACTIVE on " + session.ap_interface() + " (" +
                                 operating_mode_to_string(session.mode) + ", SSID " + config_->ap.ssid + ")";
            out_ << active << std::endl;
            if (!status_->active(active))
            {
                logger_->warning("Status file not updated", LogContext().add("file", status_->path()));
            }

            services::MonitorLoop monitor(
                *resolver_, *firewall_,
                [this](const RuntimeSession &s)
                { return orchestrator_->count_clients(s); },
                config_->timing, config_->policy.exclude_vpn);

            auto reason = monitor.run(session, token);
            if (reason == services::MonitorExit::AUTO_OFF)
            {
                out_ << "No clients for " << session.auto_off_minutes << " minutes, shutting down" << std::endl;
            }

            guard.close();
            out_ << "Hotspot stopped" << std::endl;
            if (!status_->stopped(reason == services::MonitorExit::AUTO_OFF ? "Stopped after idle timeout"
                                                                            : "Stopped"))
            {
                logger_->warning("Status file not updated", LogContext().add("file", status_->path()));
            }
            return 0;
        }

        int HotspotService::stop()
        {
            if (!instance_lock_->stop_running_instance())
            {
                return fail("The running hotspot did not exit. Check it with: ps -p $(cat " +
                            instance_lock_->path() + ")");
            }

            orchestrator_->cleanup_leftovers();

            out_ << "Hotspot stopped" << std::endl;
            if (!status_->stopped("Stopped"))
            {
                logger_->warning("Status file not updated", LogContext().add("file", status_->path()));
            }
            return 0;
        }

        nlohmann::json HotspotService::list_interfaces()
        {
            nlohmann::json list = nlohmann::json::array();
            for (const auto &iface : inventory_->list_interfaces(config_->policy.exclude_vpn))
            {
                list.push_back(nlohmann::json(iface));
            }
            return list;
        }

        nlohmann::json HotspotService::recommend()
        {
            services::InterfaceSelector selector(*inventory_);
            return nlohmann::json(selector.select(config_->ap.internet_interface, config_->policy.exclude_vpn));
        }

        int HotspotService::fail(const std::string &message)
        {
            err_ << "ERROR: " << message << std::endl;
            logger_->error("Hotspot failed", LogContext().add("reason", message));
            if (!status_->error(message))
            {
                logger_->warning("Status file not updated", LogContext().add("file", status_->path()));
            }
            return 1;
        }

        const Interface *HotspotService::find_interface(const std::vector<Interface> &interfaces,
                                                        const std::string &name) const
        {
            for (const auto &iface : interfaces)
            {
                if (iface.name == name)
                {
                    return &iface;
                }
            }
            return nullptr;
        }

    } // namespace core
} // namespace hotspotd
