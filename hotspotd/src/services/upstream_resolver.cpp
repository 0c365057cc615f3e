#include "services/upstream_resolver.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <regex>
#include <sstream>

namespace hotspotd
{
    namespace services
    {

        UpstreamResolver::UpstreamResolver(infrastructure::CommandRunner &runner, std::chrono::milliseconds timeout)
            : runner_(runner), timeout_(timeout), logger_(core::get_logger("UpstreamResolver"))
        {
        }

        std::optional<std::string> UpstreamResolver::resolve_upstream(bool exclude_vpn)
        {
            if (!exclude_vpn)
            {
                // Trust the kernel's routing decision, VPN included
                for (const auto &address : probe_addresses())
                {
                    auto result = runner_.run({"ip", "route", "get", address}, timeout_);
                    if (!result.ok())
                    {
                        continue;
                    }
                    if (auto device = parse_route_get(result.output))
                    {
                        return device;
                    }
                }

                auto defaults = default_route_devices();
                if (!defaults.empty())
                {
                    return defaults.front();
                }
                return std::nullopt;
            }

            auto candidates = default_route_devices();
            if (candidates.empty())
            {
                return std::nullopt;
            }

            for (const auto &device : candidates)
            {
                if (!is_vpn_name(device))
                {
                    return device;
                }
            }

            logger_->debug("Only VPN default routes present, using first candidate",
                           core::LogContext().add("device", candidates.front()));
            return candidates.front();
        }

        bool UpstreamResolver::is_vpn_name(const std::string &name)
        {
            static const char *const prefixes[] = {"tun", "tap", "wg", "ppp"};
            for (const char *prefix : prefixes)
            {
                if (name.rfind(prefix, 0) == 0)
                {
                    return true;
                }
            }
            return false;
        }

        std::optional<std::string> UpstreamResolver::parse_route_get(const std::string &output)
        {
            static const std::regex dev_regex(R"(\bdev\s+(\S+))");
            std::smatch match;
            if (std::regex_search(output, match, dev_regex))
            {
                return match[1].str();
            }
            return std::nullopt;
        }

        std::vector<std::string> UpstreamResolver::parse_default_routes(const std::string &output)
        {
            static const std::regex dev_regex(R"(\bdev\s+(\S+))");
            std::vector<std::string> devices;
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                if (line.rfind("default", 0) != 0)
                {
                    continue;
                }
                std::smatch match;
                if (std::regex_search(line, match, dev_regex))
                {
                    devices.push_back(match[1].str());
                }
            }
            return devices;
        }

        const std::vector<std::string> &UpstreamResolver::probe_addresses()
        {
            static const std::vector<std::string> addresses = {"1.1.1.1", "8.8.8.8"};
            return addresses;
        }

        std::vector<std::string> UpstreamResolver::default_route_devices()
        {
            auto result = runner_.run({"ip", "-4", "route", "show", "default"}, timeout_);
            if (!result.ok())
            {
                return {};
            }
            return parse_default_routes(result.output);
        }

    } // namespace services
} // namespace hotspotd
