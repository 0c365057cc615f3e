/**
 * Interface discovery through nmcli, sysfs and iw
 */

#include "services/interface_inventory.hpp"
#include "services/capability_probe.hpp"
#include "services/upstream_resolver.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <regex>
#include <sstream>

namespace hotspotd
{
    namespace services
    {

        namespace
        {
            bool has_prefix(const std::string &name, std::initializer_list<const char *> prefixes)
            {
                for (const char *prefix : prefixes)
                {
                    if (name.rfind(prefix, 0) == 0)
                    {
                        return true;
                    }
                }
                return false;
            }

            // Name-prefix heuristics; best effort only
            std::optional<core::InterfaceType> classify_by_name(const std::string &name)
            {
                if (has_prefix(name, {"tun", "tap", "wg", "ppp"}))
                    return core::InterfaceType::VPN;
                if (has_prefix(name, {"wwan", "wwp", "cdc", "mbim"}))
                    return core::InterfaceType::MOBILE;
                if (has_prefix(name, {"usb", "rndis"}))
                    return core::InterfaceType::TETHERED;
                return std::nullopt;
            }

            void add_issue(core::Interface &iface, const std::string &issue)
            {
                if (std::find(iface.issues.begin(), iface.issues.end(), issue) == iface.issues.end())
                {
                    iface.issues.push_back(issue);
                }
            }

            std::string basename_of(const std::string &path)
            {
                auto slash = path.find_last_of('/');
                return slash == std::string::npos ? path : path.substr(slash + 1);
            }

            std::string first_line(const std::string &text)
            {
                auto end = text.find('\n');
                return end == std::string::npos ? text : text.substr(0, end);
            }
        }

        InterfaceInventory::InterfaceInventory(infrastructure::CommandRunner &runner,
                                               CapabilityProbe &probe,
                                               UpstreamResolver &resolver,
                                               std::chrono::milliseconds timeout)
            : runner_(runner), probe_(probe), resolver_(resolver), timeout_(timeout),
              logger_(core::get_logger("InterfaceInventory"))
        {
        }

        std::vector<core::Interface> InterfaceInventory::list_interfaces(bool exclude_vpn)
        {
            std::vector<core::Interface> interfaces;

            auto table = runner_.run({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"}, timeout_);
            if (!table.ok())
            {
                logger_->warning("Failed to query device table from NetworkManager",
                                 core::LogContext().add("timed_out", table.timed_out));
                return interfaces;
            }

            auto upstream = resolver_.resolve_upstream(exclude_vpn);

            for (const auto &row : parse_device_table(table.output))
            {
                if (is_excluded(row))
                {
                    continue;
                }

                core::Interface iface;
                iface.name = row.device;
                iface.type = classify(row.device, row.type);
                iface.state = row.state;
                iface.connected = is_connected_state(row.state);
                if (!row.connection.empty() && row.connection != "--")
                {
                    iface.connection_name = row.connection;
                }

                resolve_hardware(iface);
                resolve_address(iface);
                if (iface.is_wifi())
                {
                    apply_radio(iface);
                }

                iface.is_internet_source = iface.connected && upstream && *upstream == iface.name;

                collect_issues(iface, classify_by_name(iface.name).has_value());
                iface.label = render_label(iface);

                logger_->debug("Discovered interface",
                               core::LogContext()
                                   .add("name", iface.name)
                                   .add("type", core::interface_type_to_string(iface.type))
                                   .add("state", iface.state)
                                   .add("usb", iface.is_usb)
                                   .add("ap", iface.ap_support)
                                   .add("concurrency", iface.supports_concurrency));

                interfaces.push_back(std::move(iface));
            }

            return interfaces;
        }

        std::vector<core::Interface> InterfaceInventory::wifi_interfaces(bool exclude_vpn)
        {
            auto all = list_interfaces(exclude_vpn);
            std::vector<core::Interface> wifi;
            std::copy_if(all.begin(), all.end(), std::back_inserter(wifi),
                         [](const core::Interface &iface)
                         { return iface.is_wifi(); });
            return wifi;
        }

        std::vector<DeviceRow> InterfaceInventory::parse_device_table(const std::string &output)
        {
            std::vector<DeviceRow> rows;
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }

                std::vector<std::string> fields(1);
                for (size_t i = 0; i < line.size(); ++i)
                {
                    char c = line[i];
                    if (c == '\\' && i + 1 < line.size())
                    {
                        fields.back() += line[++i];
                    }
                    else if (c == ':')
                    {
                        fields.emplace_back();
                    }
                    else
                    {
                        fields.back() += c;
                    }
                }

                if (fields.size() < 3 || fields[0].empty())
                {
                    continue;
                }

                DeviceRow row;
                row.device = fields[0];
                row.type = fields[1];
                row.state = fields[2];
                if (fields.size() > 3)
                {
                    row.connection = fields[3];
                }
                rows.push_back(row);
            }
            return rows;
        }

        bool InterfaceInventory::is_excluded(const DeviceRow &row)
        {
            if (has_prefix(row.device, {"lo", "docker", "br-", "veth", "virbr", "p2p-"}))
            {
                return true;
            }
            return row.type == "wifi-p2p" || row.type == "loopback";
        }

        core::InterfaceType InterfaceInventory::classify(const std::string &name, const std::string &nmcli_type)
        {
            if (nmcli_type == "wifi")
            {
                return core::InterfaceType::WIFI;
            }
            if (auto by_name = classify_by_name(name))
            {
                return *by_name;
            }
            if (nmcli_type == "ethernet")
                return core::InterfaceType::ETHERNET;
            if (nmcli_type == "bridge")
                return core::InterfaceType::BRIDGE;
            if (nmcli_type == "tun" || nmcli_type == "wireguard" || nmcli_type == "vpn" || nmcli_type == "ppp")
                return core::InterfaceType::VPN;
            if (nmcli_type == "gsm" || nmcli_type == "cdma" || nmcli_type == "modem")
                return core::InterfaceType::MOBILE;
            return core::InterfaceType::OTHER;
        }

        bool InterfaceInventory::is_connected_state(const std::string &state)
        {
            return state == "connected" || state.rfind("connected (", 0) == 0;
        }

        std::optional<std::string> InterfaceInventory::parse_ipv4(const std::string &output)
        {
            static const std::regex inet_regex(R"(\binet\s+(\d+\.\d+\.\d+\.\d+)/\d+)");
            std::smatch match;
            if (std::regex_search(output, match, inet_regex))
            {
                return match[1].str();
            }
            return std::nullopt;
        }

        std::string InterfaceInventory::render_label(const core::Interface &iface)
        {
            std::vector<std::string> parts;

            switch (iface.type)
            {
            case core::InterfaceType::WIFI:
                parts.push_back(iface.is_usb ? "USB Wi-Fi Adapter" : iface.is_internal ? "Built-in Wi-Fi"
                                                                                       : "Wi-Fi");
                break;
            case core::InterfaceType::ETHERNET:
                parts.push_back(iface.is_usb ? "USB Ethernet" : "Ethernet");
                break;
            case core::InterfaceType::VPN:
                parts.push_back("VPN");
                break;
            case core::InterfaceType::MOBILE:
                parts.push_back("Mobile Broadband");
                break;
            case core::InterfaceType::TETHERED:
                parts.push_back("USB Tethering");
                break;
            case core::InterfaceType::BRIDGE:
                parts.push_back("Bridge");
                break;
            case core::InterfaceType::OTHER:
                parts.push_back("Other");
                break;
            }

            if (iface.is_wifi())
            {
                std::vector<std::string> caps;
                if (iface.ap_support)
                    caps.push_back("AP");
                if (iface.supports_5ghz)
                    caps.push_back("5GHz");
                if (iface.supports_concurrency)
                    caps.push_back("STA+AP");
                if (!caps.empty())
                {
                    std::string joined;
                    for (const auto &cap : caps)
                    {
                        joined += joined.empty() ? cap : ", " + cap;
                    }
                    parts.push_back("[" + joined + "]");
                }
            }

            if (iface.connected && iface.connection_name)
            {
                parts.push_back("-> " + *iface.connection_name);
            }

            parts.push_back("(" + iface.name + ")");

            std::string label;
            for (const auto &part : parts)
            {
                label += label.empty() ? part : " " + part;
            }
            return label;
        }

        void InterfaceInventory::resolve_hardware(core::Interface &iface)
        {
            const std::string sys_path = "/sys/class/net/" + iface.name + "/device";

            auto device = runner_.run({"readlink", "-f", sys_path}, timeout_);
            if (!device.ok())
            {
                return;
            }

            std::string device_path = first_line(device.output);
            iface.is_usb = device_path.find("/usb") != std::string::npos;
            iface.is_internal = !iface.is_usb && device_path.find("/pci") != std::string::npos;

            if (!iface.is_usb && !iface.is_internal)
            {
                return;
            }

            auto driver = runner_.run({"readlink", "-f", sys_path + "/driver"}, timeout_);
            if (driver.ok())
            {
                std::string name = basename_of(first_line(driver.output));
                if (!name.empty() && name != "driver")
                {
                    iface.driver = name;
                }
            }
        }

        void InterfaceInventory::resolve_address(core::Interface &iface)
        {
            auto result = runner_.run({"ip", "-4", "-o", "addr", "show", "dev", iface.name}, timeout_);
            if (!result.ok())
            {
                return;
            }
            if (auto address = parse_ipv4(result.output))
            {
                iface.has_ip = true;
                iface.ip_address = *address;
            }
        }

        void InterfaceInventory::apply_radio(core::Interface &iface)
        {
            auto caps = probe_.probe(iface.name);
            iface.phy = caps.phy;
            iface.ap_support = caps.ap_support;
            iface.supports_5ghz = caps.supports_5ghz;
            iface.supports_concurrency = caps.concurrency.supported;
            iface.concurrency_channels = std::max(1, caps.concurrency.channels);
            iface.in_monitor_mode = caps.in_monitor_mode;
        }

        void InterfaceInventory::collect_issues(core::Interface &iface, bool name_classified)
        {
            if (iface.is_wifi())
            {
                if (!iface.ap_support)
                    add_issue(iface, "no AP mode support");
                if (iface.in_monitor_mode)
                    add_issue(iface, "in monitor mode");
                if (iface.supports_concurrency && iface.concurrency_channels == 1)
                    add_issue(iface, "STA+AP concurrency limited to one channel");
            }
            if (name_classified)
            {
                add_issue(iface, "name-based classification");
            }
            if (!iface.is_usb && !iface.is_internal &&
                (iface.type == core::InterfaceType::WIFI || iface.type == core::InterfaceType::ETHERNET))
            {
                add_issue(iface, "bus attachment unknown");
            }
            if (iface.connected && !iface.has_ip)
            {
                add_issue(iface, "connected without an IPv4 address");
            }
        }

    } // namespace services
} // namespace hotspotd
