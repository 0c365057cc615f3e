#include "infrastructure/hostapd_manager.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/process_control.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <sstream>

namespace hotspotd
{
    namespace infrastructure
    {

        namespace
        {
            bool is_printable_ascii(const std::string &text)
            {
                for (char c : text)
                {
                    auto byte = static_cast<unsigned char>(c);
                    if (byte < 0x20 || byte > 0x7e)
                    {
                        return false;
                    }
                }
                return true;
            }

            std::string to_hex(const std::string &text)
            {
                std::ostringstream hex;
                for (char c : text)
                {
                    hex << std::hex << std::setw(2) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                }
                return hex.str();
            }
        }

        HostapdManager::HostapdManager(CommandRunner &runner,
                                       const core::AccessPointConfig &config,
                                       const std::string &runtime_dir,
                                       const std::string &interface,
                                       std::chrono::milliseconds timeout)
            : runner_(runner), config_(config), interface_(interface), timeout_(timeout),
              logger_(core::get_logger("HostapdManager"))
        {
            config_dir_ = runtime_dir;
            config_file_ = config_dir_ / ("hostapd-" + interface + ".conf");
            pid_file_ = config_dir_ / ("hostapd-" + interface + ".pid");
        }

        bool HostapdManager::start(int channel)
        {
            logger_->info("Starting hostapd",
                          core::LogContext()
                              .add("interface", interface_)
                              .add("channel", channel)
                              .add("hw_mode", hw_mode_for_channel(channel)));

            auto text = render_config(config_, interface_, channel);
            if (text.empty())
            {
                logger_->error("Passphrase contains characters hostapd cannot accept");
                return false;
            }

            try
            {
                std::filesystem::create_directories(config_dir_);

                // Holds the passphrase: restrict the empty file before anything is written to it
                {
                    std::ofstream create(config_file_, std::ios::trunc);
                    if (!create)
                    {
                        logger_->error("Cannot create hostapd config file", core::LogContext().add("file", config_file_.string()));
                        return false;
                    }
                }
                std::filesystem::permissions(config_file_,
                                             std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                             std::filesystem::perm_options::replace);

                std::ofstream stream(config_file_, std::ios::trunc);
                stream << text;
                stream.close();
                if (!stream)
                {
                    logger_->error("Failed writing hostapd config file", core::LogContext().add("file", config_file_.string()));
                    remove_generated_files();
                    return false;
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Error writing hostapd config file", core::LogContext().add("error", e.what()));
                remove_generated_files();
                return false;
            }

            auto result = runner_.run({"hostapd", "-B", "-P", pid_file_.string(), config_file_.string()}, timeout_);
            if (!result.ok())
            {
                logger_->error("hostapd failed to start",
                               core::LogContext()
                                   .add("exit_code", result.exit_code)
                                   .add("timed_out", result.timed_out)
                                   .add("output", result.output.empty() ? result.error : result.output));
                if (!stop())
                {
                    logger_->warning("hostapd left running after failed start");
                }
                return false;
            }

            logger_->info("hostapd running", core::LogContext().add("interface", interface_));
            return true;
        }

        bool HostapdManager::stop()
        {
            bool stopped = true;
            if (auto pid = read_pid_file(pid_file_.string()))
            {
                logger_->debug("Stopping hostapd", core::LogContext().add("pid", *pid));
                stopped = terminate_process(*pid, std::chrono::seconds(2));
                if (!stopped)
                {
                    logger_->warning("hostapd did not exit", core::LogContext().add("pid", *pid));
                }
            }

            remove_generated_files();
            return stopped;
        }

        bool HostapdManager::is_running() const
        {
            auto pid = read_pid_file(pid_file_.string());
            return pid && process_alive(*pid);
        }

        const char *HostapdManager::hw_mode_for_channel(int channel)
        {
            return channel > 14 ? "a" : "g";
        }

        std::string HostapdManager::render_config(const core::AccessPointConfig &config,
                                                  const std::string &interface,
                                                  int channel)
        {
            if (!is_printable_ascii(config.password))
            {
                return "";
            }

            const std::string hw_mode = hw_mode_for_channel(channel);

            std::ostringstream conf;
            conf << "# hotspotd access point on " << interface << "\n";
            conf << "# Auto-generated - do not edit manually\n\n";

            conf << "interface=" << interface << "\n";
            conf << "driver=nl80211\n";
            if (is_printable_ascii(config.ssid))
            {
                conf << "ssid=" << config.ssid << "\n";
            }
            else
            {
                conf << "ssid2=" << to_hex(config.ssid) << "\n";
                conf << "utf8_ssid=1\n";
            }
            conf << "hw_mode=" << hw_mode << "\n";
            conf << "channel=" << channel << "\n";
            conf << "country_code=" << config.country_code << "\n";
            conf << "ieee80211d=1\n";
            conf << "ieee80211n=1\n";
            if (hw_mode == "a")
            {
                conf << "ieee80211ac=1\n";
            }
            conf << "wmm_enabled=1\n";
            conf << "auth_algs=1\n";
            conf << "ignore_broadcast_ssid=" << (config.hidden ? 1 : 0) << "\n";
            conf << "wpa=2\n";
            conf << "wpa_key_mgmt=WPA-PSK\n";
            conf << "rsn_pairwise=CCMP\n";
            conf << "wpa_passphrase=" << config.password << "\n";
            return conf.str();
        }

        void HostapdManager::remove_generated_files()
        {
            for (const auto &path : {config_file_, pid_file_})
            {
                std::error_code ec;
                std::filesystem::remove(path, ec);
                if (ec)
                {
                    logger_->warning("Error removing hostapd file",
                                     core::LogContext().add("file", path.string()).add("error", ec.message()));
                }
            }
        }

    } // namespace infrastructure
} // namespace hotspotd
