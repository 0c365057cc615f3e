/**
 * hotspotd
 * Main entry point for the Wi-Fi hotspot daemon
 */

#include <cstdlib>
#include <iostream>
#include <unistd.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/hotspot_service.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "infrastructure/cancellation.hpp"
#include "infrastructure/command_runner.hpp"

// Command line argument parsing
#include <getopt.h>

namespace hotspotd {

constexpr const char* VERSION = "0.3.0";

/**
 * Check if running with required privileges
 */
bool check_root_privileges() {
    if (geteuid() != 0) {
        std::cerr << "ERROR: hotspotd must be run as root to configure the access point." << std::endl;
        std::cerr << "Please run with: sudo hotspotd" << std::endl;
        return false;
    }
    return true;
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "hotspotd - Wi-Fi hotspot that keeps your internet connection\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Access point:\n";
    std::cout << "  --ssid NAME                  Network name (1-32 characters)\n";
    std::cout << "  --password PASS              WPA2 passphrase (8-63 characters)\n";
    std::cout << "  --band bg|a                  2.4 GHz (bg) or 5 GHz (a)\n";
    std::cout << "  --hidden                     Do not broadcast the SSID\n";
    std::cout << "  --dns ADDR                   DNS server handed to clients\n";
    std::cout << "  --interface IFACE            Wi-Fi interface that hosts the hotspot\n";
    std::cout << "  --internet-interface IFACE   Interface that provides internet\n";
    std::cout << "  --exclude-vpn                Never route clients through a VPN interface\n";
    std::cout << "  --force-single-interface     Allow dropping the only internet connection\n\n";
    std::cout << "Clients:\n";
    std::cout << "  --mac-mode block|allow       MAC filter mode\n";
    std::cout << "  --block MAC                  Block a client (repeatable)\n";
    std::cout << "  --allow MAC                  Allow a client (repeatable, implies --mac-mode allow)\n";
    std::cout << "  --auto-off MIN               Stop after MIN minutes without clients (0 = never)\n\n";
    std::cout << "Commands:\n";
    std::cout << "  --stop                       Stop a running hotspot and clean up\n";
    std::cout << "  --list-interfaces            Print detected interfaces as JSON\n";
    std::cout << "  --recommend                  Print the recommended interface pair as JSON\n\n";
    std::cout << "General:\n";
    std::cout << "  -c, --config FILE            Configuration file (JSON)\n";
    std::cout << "  -v, --verbose                Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE          Log to file instead of console\n";
    std::cout << "  -h, --help                   Show this help message\n";
    std::cout << "  --version                    Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  sudo " << program_name << " --ssid Cafe --password 'correct horse'\n";
    std::cout << "  sudo " << program_name << " --interface wlx00c0ca --auto-off 30\n";
    std::cout << "  sudo " << program_name << " --stop\n";
    std::cout << "  " << program_name << " --recommend\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "hotspotd v" << VERSION << std::endl;
    std::cout << "Built for Linux with NetworkManager" << std::endl;
    std::cout << "Modes: Managed, Concurrent (STA+AP), Dual-Adapter" << std::endl;
}

enum class Command {
    START,
    STOP,
    LIST_INTERFACES,
    RECOMMEND
};

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file;
    int verbosity = 0;
    std::string log_file;
    Command command = Command::START;
    bool help = false;
    bool version = false;

    std::optional<std::string> ssid;
    std::optional<std::string> password;
    std::optional<std::string> band;
    bool hidden = false;
    std::optional<std::string> dns;
    std::optional<std::string> interface;
    std::optional<std::string> internet_interface;
    std::optional<std::string> mac_mode;
    std::vector<std::string> block_list;
    std::vector<std::string> allow_list;
    int auto_off_minutes = -1;
    bool exclude_vpn = false;
    bool force_single_interface = false;
};

enum LongOption {
    OPT_INTERFACE = 1000,
    OPT_INTERNET_INTERFACE,
    OPT_SSID,
    OPT_PASSWORD,
    OPT_BAND,
    OPT_HIDDEN,
    OPT_DNS,
    OPT_MAC_MODE,
    OPT_BLOCK,
    OPT_ALLOW,
    OPT_AUTO_OFF,
    OPT_EXCLUDE_VPN,
    OPT_FORCE_SINGLE,
    OPT_STOP,
    OPT_LIST_INTERFACES,
    OPT_RECOMMEND,
    OPT_VERSION
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"interface",              required_argument, 0, OPT_INTERFACE},
        {"internet-interface",     required_argument, 0, OPT_INTERNET_INTERFACE},
        {"ssid",                   required_argument, 0, OPT_SSID},
        {"password",               required_argument, 0, OPT_PASSWORD},
        {"band",                   required_argument, 0, OPT_BAND},
        {"hidden",                 no_argument,       0, OPT_HIDDEN},
        {"dns",                    required_argument, 0, OPT_DNS},
        {"mac-mode",               required_argument, 0, OPT_MAC_MODE},
        {"block",                  required_argument, 0, OPT_BLOCK},
        {"allow",                  required_argument, 0, OPT_ALLOW},
        {"auto-off",               required_argument, 0, OPT_AUTO_OFF},
        {"exclude-vpn",            no_argument,       0, OPT_EXCLUDE_VPN},
        {"force-single-interface", no_argument,       0, OPT_FORCE_SINGLE},
        {"stop",                   no_argument,       0, OPT_STOP},
        {"list-interfaces",        no_argument,       0, OPT_LIST_INTERFACES},
        {"recommend",              no_argument,       0, OPT_RECOMMEND},
        {"config",                 required_argument, 0, 'c'},
        {"verbose",                no_argument,       0, 'v'},
        {"log-file",               required_argument, 0, 'l'},
        {"help",                   no_argument,       0, 'h'},
        {"version",                no_argument,       0, OPT_VERSION},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'h':
                args.help = true;
                break;
            case OPT_INTERFACE:
                args.interface = optarg;
                break;
            case OPT_INTERNET_INTERFACE:
                args.internet_interface = optarg;
                break;
            case OPT_SSID:
                args.ssid = optarg;
                break;
            case OPT_PASSWORD:
                args.password = optarg;
                break;
            case OPT_BAND:
                args.band = optarg;
                break;
            case OPT_HIDDEN:
                args.hidden = true;
                break;
            case OPT_DNS:
                args.dns = optarg;
                break;
            case OPT_MAC_MODE:
                args.mac_mode = optarg;
                break;
            case OPT_BLOCK:
                args.block_list.push_back(optarg);
                break;
            case OPT_ALLOW:
                args.allow_list.push_back(optarg);
                break;
            case OPT_AUTO_OFF:
                args.auto_off_minutes = std::stoi(optarg);
                break;
            case OPT_EXCLUDE_VPN:
                args.exclude_vpn = true;
                break;
            case OPT_FORCE_SINGLE:
                args.force_single_interface = true;
                break;
            case OPT_STOP:
                args.command = Command::STOP;
                break;
            case OPT_LIST_INTERFACES:
                args.command = Command::LIST_INTERFACES;
                break;
            case OPT_RECOMMEND:
                args.command = Command::RECOMMEND;
                break;
            case OPT_VERSION:
                args.version = true;
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << std::endl;
        exit(1);
    }

    return args;
}

/**
 * Command-line values override the configuration file
 */
void apply_overrides(const Arguments& args, core::HotspotConfig& config) {
    if (args.ssid) config.ap.ssid = *args.ssid;
    if (args.password) config.ap.password = *args.password;
    if (args.band) config.ap.band = *args.band;
    if (args.hidden) config.ap.hidden = true;
    if (args.dns) config.ap.dns = args.dns;
    if (args.interface) config.ap.interface = args.interface;
    if (args.internet_interface) config.ap.internet_interface = args.internet_interface;
    if (args.exclude_vpn) config.policy.exclude_vpn = true;
    if (args.force_single_interface) config.policy.force_single_interface = true;
    if (args.auto_off_minutes >= 0) config.policy.auto_off_minutes = args.auto_off_minutes;
    if (!args.log_file.empty()) config.logging.log_file = args.log_file;

    if (args.mac_mode) {
        config.policy.mac_mode = *args.mac_mode;
    } else if (!args.allow_list.empty()) {
        config.policy.mac_mode = "allow";
    } else if (!args.block_list.empty()) {
        config.policy.mac_mode = "block";
    }

    const auto& listed = config.policy.mac_mode == "allow" ? args.allow_list : args.block_list;
    if (!listed.empty()) {
        config.policy.mac_list = listed;
    }
}

} // namespace hotspotd

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace hotspotd;

    try {
        // Parse command line arguments
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        bool discovery = args.command == Command::LIST_INTERFACES || args.command == Command::RECOMMEND;

        // Logging goes to stdout; keep discovery output parseable unless asked for more
        core::LogLevel log_level = discovery ? core::LogLevel::WARNING : core::LogLevel::INFO;
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }

        core::setup_logging(log_level, args.log_file, args.log_file.empty());
        auto logger = core::get_logger("main");

        // Check privileges for the commands that change the system
        if (!discovery && !check_root_privileges()) {
            return 1;
        }

        // Load configuration
        std::unique_ptr<core::HotspotConfig> config;
        if (args.config_file.empty()) {
            config = core::HotspotConfig::create_default();
        } else {
            try {
                config = core::HotspotConfig::from_file(args.config_file);
            } catch (const std::exception& e) {
                logger->error("Failed to load configuration",
                             core::LogContext().add("config_file", args.config_file)
                                              .add("error", e.what()));
                return 1;
            }
        }

        apply_overrides(args, *config);

        // The file's logging section applies when the command line is silent
        if (args.verbosity == 0 && !discovery) {
            log_level = core::LoggerManager::string_to_level(config->logging.log_level);
        }
        core::setup_logging(log_level, config->logging.log_file, config->logging.log_file.empty());

        // Validate configuration
        if (!config->validate()) {
            logger->error("Configuration validation failed");
            return 1;
        }

        infrastructure::SystemCommandRunner runner;

        if (args.command == Command::LIST_INTERFACES || args.command == Command::RECOMMEND) {
            core::HotspotService service(std::move(config), runner);
            auto document = args.command == Command::LIST_INTERFACES ? service.list_interfaces()
                                                                     : service.recommend();
            std::cout << document.dump(2) << std::endl;
            return 0;
        }

        if (args.command == Command::STOP) {
            core::HotspotService service(std::move(config), runner);
            return service.stop();
        }

        // Termination signals are consumed by the monitor loop from here on
        infrastructure::SignalCancellationToken cancellation;

        logger->info("Starting hotspotd...",
                     core::LogContext().add("ssid", config->ap.ssid).add("band", config->ap.band));

        core::HotspotService service(std::move(config), runner);
        int exit_code = service.run(cancellation);

        logger->info("hotspotd stopped", core::LogContext().add("exit_code", exit_code));
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "Unknown fatal error occurred" << std::endl;
        return 1;
    }
}
