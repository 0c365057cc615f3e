/**
 * Radio capability probing through `iw`
 */

#include "services/capability_probe.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>
#include <sstream>
#include <vector>

namespace hotspotd
{
    namespace services
    {

        namespace
        {
            std::string trim(const std::string &s)
            {
                auto begin = s.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                {
                    return "";
                }
                auto end = s.find_last_not_of(" \t\r\n");
                return s.substr(begin, end - begin + 1);
            }

            size_t indentation(const std::string &line)
            {
                size_t width = 0;
                for (char c : line)
                {
                    if (c == '\t')
                        width += 8;
                    else if (c == ' ')
                        width += 1;
                    else
                        break;
                }
                return width;
            }

            // Digits captured from iw output; nullopt when the value does not fit an int
            std::optional<int> parse_count(const std::string &digits)
            {
                errno = 0;
                char *end = nullptr;
                long value = std::strtol(digits.c_str(), &end, 10);
                if (errno == ERANGE || end == digits.c_str() || *end != '\0' ||
                    value < 0 || value > std::numeric_limits<int>::max())
                {
                    return std::nullopt;
                }
                return static_cast<int>(value);
            }

            std::vector<std::string> split_lines(const std::string &text)
            {
                std::vector<std::string> lines;
                std::istringstream stream(text);
                std::string line;
                while (std::getline(stream, line))
                {
                    lines.push_back(line);
                }
                return lines;
            }

            /**
             * Collects the bullet entries of an indented block headed by `header`.
             * Continuation lines (deeper indentation, no bullet) are joined onto
             * the preceding entry.
             */
            std::optional<std::vector<std::string>> collect_block(const std::string &text, const std::string &header)
            {
                auto lines = split_lines(text);
                for (size_t i = 0; i < lines.size(); ++i)
                {
                    if (lines[i].find(header) == std::string::npos)
                    {
                        continue;
                    }

                    size_t header_indent = indentation(lines[i]);
                    std::vector<std::string> entries;
                    for (size_t k = i + 1; k < lines.size(); ++k)
                    {
                        const std::string &line = lines[k];
                        std::string body = trim(line);
                        if (body.empty() || indentation(line) <= header_indent)
                        {
                            break;
                        }
                        if (body[0] == '*')
                        {
                            entries.push_back(trim(body.substr(1)));
                        }
                        else if (!entries.empty())
                        {
                            entries.back() += " " + body;
                        }
                        else
                        {
                            break;
                        }
                    }
                    return entries;
                }
                return std::nullopt;
            }

            struct RoleGroup
            {
                std::vector<std::string> roles;
                int limit = 0;
            };

            bool group_has(const RoleGroup &group, const std::string &role)
            {
                return std::find(group.roles.begin(), group.roles.end(), role) != group.roles.end();
            }

            /**
             * One combination line, e.g.
             * "#{ managed } <= 1, #{ AP, P2P-client } <= 1, total <= 3, #channels <= 2"
             */
            std::optional<ConcurrencyInfo> evaluate_combination(const std::string &combination)
            {
                static const std::regex group_regex(R"(#\{\s*([^}]*)\}\s*<=\s*(\d+))");
                static const std::regex total_regex(R"(total\s*<=\s*(\d+))");
                static const std::regex channels_regex(R"(#channels\s*<=\s*(\d+))");

                std::vector<RoleGroup> groups;
                for (auto it = std::sregex_iterator(combination.begin(), combination.end(), group_regex);
                     it != std::sregex_iterator(); ++it)
                {
                    auto limit = parse_count((*it)[2].str());
                    if (!limit)
                    {
                        return std::nullopt;
                    }
                    RoleGroup group;
                    group.limit = *limit;
                    std::istringstream roles((*it)[1].str());
                    std::string role;
                    while (std::getline(roles, role, ','))
                    {
                        role = trim(role);
                        if (!role.empty())
                        {
                            group.roles.push_back(role);
                        }
                    }
                    groups.push_back(group);
                }

                std::smatch match;
                if (groups.empty() || !std::regex_search(combination, match, total_regex))
                {
                    return std::nullopt;
                }
                auto total = parse_count(match[1].str());
                if (!total)
                {
                    return std::nullopt;
                }

                int channels = 1;
                if (std::regex_search(combination, match, channels_regex))
                {
                    auto limit = parse_count(match[1].str());
                    if (!limit)
                    {
                        return std::nullopt;
                    }
                    channels = std::max(1, *limit);
                }

                const RoleGroup *managed_group = nullptr;
                const RoleGroup *ap_group = nullptr;
                for (const auto &group : groups)
                {
                    if (!managed_group && group_has(group, "managed") && group.limit >= 1)
                        managed_group = &group;
                    if (!ap_group && group_has(group, "AP") && group.limit >= 1)
                        ap_group = &group;
                }

                ConcurrencyInfo info;
                info.channels = channels;
                if (!managed_group || !ap_group || *total < 2)
                {
                    return info;
                }

                // Sharing one group means both roles compete for the same slots
                if (managed_group == ap_group && managed_group->limit < 2)
                {
                    return info;
                }

                info.supported = true;
                return info;
            }
        }

        namespace iw_parsers
        {
            std::optional<std::string> parse_phy_name(const std::string &dev_info)
            {
                static const std::regex wiphy_regex(R"(wiphy\s+(\d+))");
                std::smatch match;
                if (std::regex_search(dev_info, match, wiphy_regex))
                {
                    return "phy" + match[1].str();
                }
                return std::nullopt;
            }

            std::optional<bool> parse_ap_mode_support(const std::string &phy_info)
            {
                auto modes = collect_block(phy_info, "Supported interface modes:");
                if (!modes)
                {
                    return std::nullopt;
                }
                for (const auto &mode : *modes)
                {
                    if (mode == "AP")
                    {
                        return true;
                    }
                }
                return false;
            }

            bool parse_5ghz_support(const std::string &phy_info)
            {
                return phy_info.find("5180") != std::string::npos ||
                       phy_info.find("5240") != std::string::npos ||
                       phy_info.find("5745") != std::string::npos;
            }

            ConcurrencyInfo parse_concurrency(const std::string &phy_info)
            {
                ConcurrencyInfo result;
                auto combinations = collect_block(phy_info, "valid interface combinations:");
                if (!combinations)
                {
                    return result;
                }

                for (const auto &combination : *combinations)
                {
                    auto info = evaluate_combination(combination);
                    if (!info || !info->supported)
                    {
                        continue;
                    }
                    if (!result.supported || info->channels > result.channels)
                    {
                        result = *info;
                    }
                }
                return result;
            }

            std::optional<int> parse_channel(const std::string &dev_info)
            {
                static const std::regex channel_regex(R"(^\s*channel\s+(\d+))");
                for (const auto &line : split_lines(dev_info))
                {
                    std::smatch match;
                    if (std::regex_search(line, match, channel_regex))
                    {
                        return parse_count(match[1].str());
                    }
                }
                return std::nullopt;
            }

            bool parse_monitor_mode(const std::string &dev_info)
            {
                static const std::regex type_regex(R"(^\s*type\s+monitor\b)");
                for (const auto &line : split_lines(dev_info))
                {
                    if (std::regex_search(line, type_regex))
                    {
                        return true;
                    }
                }
                return false;
            }

            bool parse_channel_no_ir(const std::string &phy_info, int channel)
            {
                const std::string marker = "[" + std::to_string(channel) + "]";
                for (const auto &line : split_lines(phy_info))
                {
                    if (line.find("MHz") == std::string::npos || line.find(marker) == std::string::npos)
                    {
                        continue;
                    }
                    return line.find("no IR") != std::string::npos ||
                           line.find("no-IR") != std::string::npos ||
                           line.find("passive scan") != std::string::npos;
                }
                return false;
            }
        }

        CapabilityProbe::CapabilityProbe(infrastructure::CommandRunner &runner, std::chrono::milliseconds timeout)
            : runner_(runner), timeout_(timeout), logger_(core::get_logger("CapabilityProbe"))
        {
        }

        RadioCapabilities CapabilityProbe::probe(const std::string &interface)
        {
            RadioCapabilities caps;

            auto dev = dev_info(interface);
            if (!dev)
            {
                logger_->debug("Radio info unavailable, using defaults", core::LogContext().add("interface", interface));
                return caps;
            }

            caps.in_monitor_mode = iw_parsers::parse_monitor_mode(*dev);
            if (auto channel = iw_parsers::parse_channel(*dev))
            {
                caps.current_channel = *channel;
                caps.channel_known = true;
            }

            caps.phy = iw_parsers::parse_phy_name(*dev);
            if (!caps.phy)
            {
                return caps;
            }

            auto phy = phy_info_for(*caps.phy);
            if (!phy)
            {
                return caps;
            }

            caps.ap_support = iw_parsers::parse_ap_mode_support(*phy).value_or(true);
            caps.supports_5ghz = iw_parsers::parse_5ghz_support(*phy);
            caps.concurrency = iw_parsers::parse_concurrency(*phy);
            return caps;
        }

        bool CapabilityProbe::ap_mode_supported(const std::string &interface)
        {
            auto phy = phy_info(interface);
            if (!phy)
            {
                return true;
            }
            return iw_parsers::parse_ap_mode_support(*phy).value_or(true);
        }

        bool CapabilityProbe::supports_5ghz(const std::string &interface)
        {
            auto phy = phy_info(interface);
            return phy && iw_parsers::parse_5ghz_support(*phy);
        }

        ConcurrencyInfo CapabilityProbe::concurrency(const std::string &interface)
        {
            auto phy = phy_info(interface);
            if (!phy)
            {
                return ConcurrencyInfo{};
            }
            return iw_parsers::parse_concurrency(*phy);
        }

        int CapabilityProbe::current_channel(const std::string &interface)
        {
            auto dev = dev_info(interface);
            if (!dev)
            {
                return DEFAULT_CHANNEL;
            }
            return iw_parsers::parse_channel(*dev).value_or(DEFAULT_CHANNEL);
        }

        bool CapabilityProbe::in_monitor_mode(const std::string &interface)
        {
            auto dev = dev_info(interface);
            return dev && iw_parsers::parse_monitor_mode(*dev);
        }

        bool CapabilityProbe::channel_no_ir(const std::string &interface, int channel)
        {
            auto phy = phy_info(interface);
            return phy && iw_parsers::parse_channel_no_ir(*phy, channel);
        }

        std::optional<std::string> CapabilityProbe::dev_info(const std::string &interface)
        {
            auto result = runner_.run({"iw", "dev", interface, "info"}, timeout_);
            if (!result.ok())
            {
                return std::nullopt;
            }
            return result.output;
        }

        std::optional<std::string> CapabilityProbe::phy_info(const std::string &interface)
        {
            auto dev = dev_info(interface);
            if (!dev)
            {
                return std::nullopt;
            }
            auto phy = iw_parsers::parse_phy_name(*dev);
            if (!phy)
            {
                return std::nullopt;
            }
            return phy_info_for(*phy);
        }

        std::optional<std::string> CapabilityProbe::phy_info_for(const std::string &phy)
        {
            auto result = runner_.run({"iw", phy, "info"}, timeout_);
            if (!result.ok())
            {
                logger_->debug("Phy query failed", core::LogContext().add("phy", phy));
                return std::nullopt;
            }
            return result.output;
        }

    } // namespace services
} // namespace hotspotd
