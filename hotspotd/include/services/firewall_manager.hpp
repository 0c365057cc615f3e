#ifndef HOTSPOTD_SERVICES_FIREWALL_MANAGER_HPP
#define HOTSPOTD_SERVICES_FIREWALL_MANAGER_HPP

#include <chrono>
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
    }

    namespace services
    {

        /**
         * One rule appended to a hotspotd chain
         */
        struct FirewallRule
        {
            std::string table;
            std::string chain;
            std::vector<std::string> spec;

            std::vector<std::string> to_command() const;

            bool operator==(const FirewallRule &other) const
            {
                return table == other.table && chain == other.chain && spec == other.spec;
            }
        };

        /**
         * NAT, forwarding, MSS clamping and MAC filtering for the hotspot.
         *
         * Everything lives in three dedicated chains reached by one jump each,
         * so applying means flush-then-append inside those chains and never
         * touches foreign rules.
         */
        class FirewallManager
        {
        public:
            static constexpr const char *NAT_CHAIN = "HOTSPOTD_POST";
            static constexpr const char *FILTER_CHAIN = "HOTSPOTD_FWD";
            static constexpr const char *MANGLE_CHAIN = "HOTSPOTD_MSS";

            FirewallManager(infrastructure::CommandRunner &runner, std::chrono::milliseconds timeout);

            /**
             * Rules for the given interfaces in evaluation order. Without an
             * upstream no NAT is installed and forwarding is not bound to an
             * egress interface.
             */
            static std::vector<FirewallRule> build_rules(const std::string &hotspot_interface,
                                                         const std::optional<std::string> &upstream,
                                                         const core::MacPolicy &policy);

            bool apply(const std::string &hotspot_interface,
                       const std::optional<std::string> &upstream,
                       const core::MacPolicy &policy);

            // MSS clamp only; the connection manager does NAT for shared profiles
            bool apply_mss_clamp();

            bool enable_forwarding();

            // Drops jumps, flushes and deletes our chains. Safe when nothing is installed.
            void remove();

        private:
            struct ChainHook
            {
                const char *table;
                const char *parent;
                const char *chain;
            };

            static const std::vector<ChainHook> &hooks();

            bool ensure_chain(const ChainHook &hook);
            bool flush_chain(const ChainHook &hook);
            bool iptables(const std::vector<std::string> &args);

            infrastructure::CommandRunner &runner_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_FIREWALL_MANAGER_HPP
