#ifndef HOTSPOTD_SERVICES_CAPABILITY_PROBE_HPP
#define HOTSPOTD_SERVICES_CAPABILITY_PROBE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

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

        struct ConcurrencyInfo
        {
            bool supported = false;
            int channels = 1;
        };

        /**
         * Everything the inventory wants to know about one radio
         */
        struct RadioCapabilities
        {
            std::optional<std::string> phy;
            bool ap_support = true;
            bool supports_5ghz = false;
            ConcurrencyInfo concurrency;
            int current_channel = 6;
            bool channel_known = false;
            bool in_monitor_mode = false;
        };

        /**
         * Parsers for `iw dev <if> info` and `iw <phy> info` output.
         * Each returns "unknown" (nullopt) or a documented default when the
         * text does not contain what it looks for.
         */
        namespace iw_parsers
        {
            // "wiphy 0" -> "phy0"
            std::optional<std::string> parse_phy_name(const std::string &dev_info);

            // nullopt when no "Supported interface modes" block is present
            std::optional<bool> parse_ap_mode_support(const std::string &phy_info);

            bool parse_5ghz_support(const std::string &phy_info);

            // Unsupported unless one combination admits a managed and an AP
            // interface at the same time with total >= 2
            ConcurrencyInfo parse_concurrency(const std::string &phy_info);

            std::optional<int> parse_channel(const std::string &dev_info);

            bool parse_monitor_mode(const std::string &dev_info);

            // True if the frequency line for `channel` carries a no-IR/passive-scan flag
            bool parse_channel_no_ir(const std::string &phy_info, int channel);
        }

        /**
         * Per-radio capability queries. Tool failures never propagate: AP and
         * 5 GHz fall back to supported/unsupported respectively, concurrency to
         * unsupported, the channel to 6.
         */
        class CapabilityProbe
        {
        public:
            static constexpr int DEFAULT_CHANNEL = 6;

            CapabilityProbe(infrastructure::CommandRunner &runner, std::chrono::milliseconds timeout);

            RadioCapabilities probe(const std::string &interface);

            bool ap_mode_supported(const std::string &interface);
            bool supports_5ghz(const std::string &interface);
            ConcurrencyInfo concurrency(const std::string &interface);
            int current_channel(const std::string &interface);
            bool in_monitor_mode(const std::string &interface);
            bool channel_no_ir(const std::string &interface, int channel);

        private:
            std::optional<std::string> dev_info(const std::string &interface);
            std::optional<std::string> phy_info(const std::string &interface);
            std::optional<std::string> phy_info_for(const std::string &phy);

            infrastructure::CommandRunner &runner_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_CAPABILITY_PROBE_HPP
