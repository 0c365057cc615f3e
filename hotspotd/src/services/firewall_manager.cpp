/**
 * Rule engine for the hotspot chains
 */

#include "services/firewall_manager.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

namespace hotspotd
{
    namespace services
    {

        std::vector<std::string> FirewallRule::to_command() const
        {
            std::vector<std::string> command = {"iptables", "-t", table, "-A", chain};
            command.insert(command.end(), spec.begin(), spec.end());
            return command;
        }

        FirewallManager::FirewallManager(infrastructure::CommandRunner &runner, std::chrono::milliseconds timeout)
            : runner_(runner), timeout_(timeout), logger_(core::get_logger("FirewallManager"))
        {
        }

        const std::vector<FirewallManager::ChainHook> &FirewallManager::hooks()
        {
            static const std::vector<ChainHook> chain_hooks = {
                {"nat", "POSTROUTING", NAT_CHAIN},
                {"filter", "FORWARD", FILTER_CHAIN},
                {"mangle", "FORWARD", MANGLE_CHAIN},
            };
            return chain_hooks;
        }

        std::vector<FirewallRule> FirewallManager::build_rules(const std::string &hotspot_interface,
                                                               const std::optional<std::string> &upstream,
                                                               const core::MacPolicy &policy)
        {
            std::vector<FirewallRule> rules;

            auto egress = [&](std::vector<std::string> spec)
            {
                if (upstream)
                {
                    spec.insert(spec.begin() + 2, {"-o", *upstream});
                }
                return spec;
            };

            if (upstream)
            {
                rules.push_back({"nat", NAT_CHAIN, {"-o", *upstream, "-j", "MASQUERADE"}});
            }

            // Explicit per-address decisions come first
            for (const auto &mac : policy.addresses)
            {
                const char *verdict = policy.mode == core::MacMode::BLOCK ? "DROP" : "ACCEPT";
                rules.push_back({"filter", FILTER_CHAIN,
                                 egress({"-i", hotspot_interface, "-m", "mac", "--mac-source", mac, "-j", verdict})});
            }

            if (policy.mode == core::MacMode::ALLOW)
            {
                rules.push_back({"filter", FILTER_CHAIN, {"-i", hotspot_interface, "-j", "DROP"}});
            }

            rules.push_back({"filter", FILTER_CHAIN,
                             {"-m", "conntrack", "--ctstate", "RELATED,ESTABLISHED", "-j", "ACCEPT"}});

            if (upstream)
            {
                rules.push_back({"filter", FILTER_CHAIN,
                                 {"-i", *upstream, "-o", hotspot_interface, "-j", "ACCEPT"}});
            }

            if (policy.mode == core::MacMode::BLOCK)
            {
                rules.push_back({"filter", FILTER_CHAIN, egress({"-i", hotspot_interface, "-j", "ACCEPT"})});
            }

            rules.push_back({"mangle", MANGLE_CHAIN,
                             {"-p", "tcp", "--tcp-flags", "SYN,RST", "SYN", "-j", "TCPMSS", "--clamp-mss-to-pmtu"}});

            return rules;
        }

        bool FirewallManager::apply(const std::string &hotspot_interface,
                                    const std::optional<std::string> &upstream,
                                    const core::MacPolicy &policy)
        {
            logger_->info("Programming hotspot rules",
                          core::LogContext()
                              .add("hotspot", hotspot_interface)
                              .add("upstream", upstream.value_or("none"))
                              .add("mac_mode", policy.mode == core::MacMode::BLOCK ? "block" : "allow")
                              .add("mac_count", policy.addresses.size()));

            bool success = enable_forwarding();

            for (const auto &hook : hooks())
            {
                if (!ensure_chain(hook) || !flush_chain(hook))
                {
                    logger_->error("Cannot prepare chain",
                                   core::LogContext().add("table", hook.table).add("chain", hook.chain));
                    return false;
                }
            }

            for (const auto &rule : build_rules(hotspot_interface, upstream, policy))
            {
                if (!iptables(rule.to_command()))
                {
                    success = false;
                }
            }

            return success;
        }

        bool FirewallManager::apply_mss_clamp()
        {
            const auto &hook = hooks()[2];
            if (!ensure_chain(hook) || !flush_chain(hook))
            {
                return false;
            }

            FirewallRule clamp{"mangle", MANGLE_CHAIN,
                               {"-p", "tcp", "--tcp-flags", "SYN,RST", "SYN", "-j", "TCPMSS", "--clamp-mss-to-pmtu"}};
            return iptables(clamp.to_command());
        }

        bool FirewallManager::enable_forwarding()
        {
            auto result = runner_.run({"sysctl", "-w", "net.ipv4.ip_forward=1"}, timeout_);
            if (!result.ok())
            {
                logger_->warning("Failed to enable IPv4 forwarding", core::LogContext().add("error", result.error));
                return false;
            }
            return true;
        }

        void FirewallManager::remove()
        {
            for (const auto &hook : hooks())
            {
                // A jump may have been inserted more than once by an older instance
                for (int i = 0; i < 8; ++i)
                {
                    auto result = runner_.run({"iptables", "-t", hook.table, "-D", hook.parent, "-j", hook.chain}, timeout_);
                    if (!result.ok())
                    {
                        break;
                    }
                }
                auto flush = runner_.run({"iptables", "-t", hook.table, "-F", hook.chain}, timeout_);
                auto drop = runner_.run({"iptables", "-t", hook.table, "-X", hook.chain}, timeout_);
                if (!flush.ok() || !drop.ok())
                {
                    // Expected when the chain was never created
                    logger_->debug("Chain not removed",
                                   core::LogContext().add("table", hook.table).add("chain", hook.chain));
                }
            }
            logger_->debug("Hotspot chains removed");
        }

        bool FirewallManager::ensure_chain(const ChainHook &hook)
        {
            // -N fails when the chain exists; the check below is authoritative
            auto create = runner_.run({"iptables", "-t", hook.table, "-N", hook.chain}, timeout_);
            if (!create.ok())
            {
                logger_->debug("Chain already present", core::LogContext().add("chain", hook.chain));
            }

            auto check = runner_.run({"iptables", "-t", hook.table, "-C", hook.parent, "-j", hook.chain}, timeout_);
            if (check.ok())
            {
                return true;
            }
            return iptables({"iptables", "-t", hook.table, "-I", hook.parent, "1", "-j", hook.chain});
        }

        bool FirewallManager::flush_chain(const ChainHook &hook)
        {
            return iptables({"iptables", "-t", hook.table, "-F", hook.chain});
        }

        bool FirewallManager::iptables(const std::vector<std::string> &args)
        {
            auto result = runner_.run(args, timeout_);
            if (!result.ok())
            {
                logger_->warning("iptables command failed",
                                 core::LogContext()
                                     .add("command", infrastructure::join_command(args))
                                     .add("error", result.error));
                return false;
            }
            return true;
        }

    } // namespace services
} // namespace hotspotd
