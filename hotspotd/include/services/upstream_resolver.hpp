#ifndef HOTSPOTD_SERVICES_UPSTREAM_RESOLVER_HPP
#define HOTSPOTD_SERVICES_UPSTREAM_RESOLVER_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

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
         * Finds the interface carrying the default internet route.
         * Stateless apart from the runner; cheap enough to call every second.
         */
        class UpstreamResolver
        {
        public:
            UpstreamResolver(infrastructure::CommandRunner &runner, std::chrono::milliseconds timeout);
            virtual ~UpstreamResolver() = default;

            virtual std::optional<std::string> resolve_upstream(bool exclude_vpn);

            static bool is_vpn_name(const std::string &name);

            // "1.1.1.1 via 192.168.1.1 dev enp3s0 src ..." -> "enp3s0"
            static std::optional<std::string> parse_route_get(const std::string &output);

            // Device of every "default ... dev X" line, in table order
            static std::vector<std::string> parse_default_routes(const std::string &output);

            static const std::vector<std::string> &probe_addresses();

        private:
            std::vector<std::string> default_route_devices();

            infrastructure::CommandRunner &runner_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_UPSTREAM_RESOLVER_HPP
