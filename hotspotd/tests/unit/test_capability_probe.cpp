#include <gtest/gtest.h>

#include "services/capability_probe.hpp"
#include "support/fake_command_runner.hpp"

using namespace hotspotd;
using namespace hotspotd::services;
using test_support::FakeCommandRunner;
using namespace std::chrono_literals;

namespace
{
    const char *const DEV_INFO_MANAGED =
        "Interface wlan0\n"
        "\tifindex 3\n"
        "\twdev 0x1\n"
        "\taddr 3c:a9:f4:10:22:33\n"
        "\tssid HomeNet\n"
        "\ttype managed\n"
        "\twiphy 0\n"
        "\tchannel 11 (2462 MHz), width: 20 MHz, center1: 2462 MHz\n"
        "\ttxpower 22.00 dBm\n";

    const char *const DEV_INFO_MONITOR =
        "Interface wlan1mon\n"
        "\tifindex 5\n"
        "\ttype monitor\n"
        "\twiphy 1\n";

    // Trimmed `iw phy phy0 info` of an Intel AX200
    const char *const PHY_INFO_CONCURRENT =
        "Wiphy phy0\n"
        "\twiphy index: 0\n"
        "\tmax # scan SSIDs: 20\n"
        "\tBand 1:\n"
        "\t\tFrequencies:\n"
        "\t\t\t* 2412 MHz [1] (22.0 dBm)\n"
        "\t\t\t* 2437 MHz [6] (22.0 dBm)\n"
        "\t\t\t* 2462 MHz [11] (22.0 dBm)\n"
        "\tBand 2:\n"
        "\t\tFrequencies:\n"
        "\t\t\t* 5180 MHz [36] (22.0 dBm)\n"
        "\t\t\t* 5260 MHz [52] (22.0 dBm) (no IR, radar detection)\n"
        "\t\t\t* 5745 MHz [149] (22.0 dBm)\n"
        "\tSupported interface modes:\n"
        "\t\t * IBSS\n"
        "\t\t * managed\n"
        "\t\t * AP\n"
        "\t\t * AP/VLAN\n"
        "\t\t * monitor\n"
        "\t\t * P2P-client\n"
        "\t\t * P2P-GO\n"
        "\t\t * P2P-device\n"
        "\tvalid interface combinations:\n"
        "\t\t * #{ managed } <= 1, #{ AP, P2P-client, P2P-GO } <= 1, #{ P2P-device } <= 1,\n"
        "\t\t   total <= 3, #channels <= 2\n"
        "\tHT Capability overrides:\n"
        "\t\t * MCS: ff ff ff ff ff ff ff ff ff ff\n";

    // 2.4 GHz USB dongle: AP capable, one managed+AP on one channel
    const char *const PHY_INFO_SINGLE_CHANNEL =
        "Wiphy phy1\n"
        "\tBand 1:\n"
        "\t\tFrequencies:\n"
        "\t\t\t* 2412 MHz [1] (20.0 dBm)\n"
        "\t\t\t* 2467 MHz [12] (disabled)\n"
        "\t\t\t* 2484 MHz [14] (no IR)\n"
        "\tSupported interface modes:\n"
        "\t\t * managed\n"
        "\t\t * AP\n"
        "\t\t * monitor\n"
        "\tvalid interface combinations:\n"
        "\t\t * #{ managed } <= 1, #{ AP } <= 1,\n"
        "\t\t   total <= 2, #channels <= 1\n";

    const char *const PHY_INFO_NO_AP =
        "Wiphy phy2\n"
        "\tSupported interface modes:\n"
        "\t\t * IBSS\n"
        "\t\t * managed\n"
        "\t\t * monitor\n"
        "\tvalid interface combinations:\n"
        "\t\t * #{ managed, AP } <= 1,\n"
        "\t\t   total <= 1, #channels <= 1\n";
}

TEST(IwParsersTest, PhyName)
{
    EXPECT_EQ(iw_parsers::parse_phy_name(DEV_INFO_MANAGED).value_or(""), "phy0");
    EXPECT_FALSE(iw_parsers::parse_phy_name("Interface wlan0\n\ttype managed\n").has_value());
}

TEST(IwParsersTest, ApModeSupport)
{
    EXPECT_EQ(iw_parsers::parse_ap_mode_support(PHY_INFO_CONCURRENT), std::optional<bool>(true));
    EXPECT_EQ(iw_parsers::parse_ap_mode_support(PHY_INFO_NO_AP), std::optional<bool>(false));
    EXPECT_FALSE(iw_parsers::parse_ap_mode_support("Wiphy phy0\n").has_value());
}

TEST(IwParsersTest, ApVlanIsNotAp)
{
    const char *vlan_only =
        "Wiphy phy3\n"
        "\tSupported interface modes:\n"
        "\t\t * managed\n"
        "\t\t * AP/VLAN\n"
        "\tBand 1:\n";
    EXPECT_EQ(iw_parsers::parse_ap_mode_support(vlan_only), std::optional<bool>(false));
}

TEST(IwParsersTest, FiveGhzMarkers)
{
    EXPECT_TRUE(iw_parsers::parse_5ghz_support(PHY_INFO_CONCURRENT));
    EXPECT_FALSE(iw_parsers::parse_5ghz_support(PHY_INFO_SINGLE_CHANNEL));
}

TEST(IwParsersTest, ConcurrencyMultiChannel)
{
    auto info = iw_parsers::parse_concurrency(PHY_INFO_CONCURRENT);
    EXPECT_TRUE(info.supported);
    EXPECT_EQ(info.channels, 2);
}

TEST(IwParsersTest, ConcurrencySingleChannel)
{
    auto info = iw_parsers::parse_concurrency(PHY_INFO_SINGLE_CHANNEL);
    EXPECT_TRUE(info.supported);
    EXPECT_EQ(info.channels, 1);
}

TEST(IwParsersTest, SharedSingleSlotIsNotConcurrency)
{
    auto info = iw_parsers::parse_concurrency(PHY_INFO_NO_AP);
    EXPECT_FALSE(info.supported);
}

TEST(IwParsersTest, ConcurrencyNeedsBothRolesInOneCombination)
{
    const char *split =
        "\tvalid interface combinations:\n"
        "\t\t * #{ managed } <= 2, total <= 2, #channels <= 1\n"
        "\t\t * #{ AP } <= 2, total <= 2, #channels <= 1\n";
    EXPECT_FALSE(iw_parsers::parse_concurrency(split).supported);
}

TEST(IwParsersTest, ConcurrencyUnparseableDefaultsToUnsupported)
{
    EXPECT_FALSE(iw_parsers::parse_concurrency("").supported);
    EXPECT_FALSE(iw_parsers::parse_concurrency("\tvalid interface combinations:\n\t\t * garbage\n").supported);
}

TEST(IwParsersTest, OversizedNumbersDoNotThrow)
{
    const char *huge_limits =
        "\tvalid interface combinations:\n"
        "\t\t * #{ managed } <= 99999999999999999999, #{ AP } <= 1,\n"
        "\t\t   total <= 2, #channels <= 2\n"
        "\t\t * #{ managed } <= 1, #{ AP } <= 1,\n"
        "\t\t   total <= 99999999999999999999, #channels <= 99999999999999999999\n";
    ConcurrencyInfo info;
    EXPECT_NO_THROW(info = iw_parsers::parse_concurrency(huge_limits));
    EXPECT_FALSE(info.supported);

    std::optional<int> channel;
    EXPECT_NO_THROW(channel = iw_parsers::parse_channel("Interface wlan0\n\tchannel 99999999999999999999 (2462 MHz)\n"));
    EXPECT_FALSE(channel.has_value());
}

TEST(CapabilityProbeTest, OversizedChannelFallsBackToDefault)
{
    FakeCommandRunner runner;
    runner.on_output({"iw", "dev", "wlan0", "info"},
                     "Interface wlan0\n\twiphy 0\n\tchannel 99999999999999999999 (2462 MHz)\n");
    runner.on_failure({"iw", "phy0"});

    CapabilityProbe probe(runner, 2000ms);
    EXPECT_EQ(probe.current_channel("wlan0"), CapabilityProbe::DEFAULT_CHANNEL);
    EXPECT_FALSE(probe.probe("wlan0").channel_known);
}

TEST(IwParsersTest, ChannelAndMonitor)
{
    EXPECT_EQ(iw_parsers::parse_channel(DEV_INFO_MANAGED).value_or(0), 11);
    EXPECT_FALSE(iw_parsers::parse_channel(DEV_INFO_MONITOR).has_value());
    EXPECT_FALSE(iw_parsers::parse_monitor_mode(DEV_INFO_MANAGED));
    EXPECT_TRUE(iw_parsers::parse_monitor_mode(DEV_INFO_MONITOR));
}

TEST(IwParsersTest, NoIrChannel)
{
    EXPECT_TRUE(iw_parsers::parse_channel_no_ir(PHY_INFO_CONCURRENT, 52));
    EXPECT_FALSE(iw_parsers::parse_channel_no_ir(PHY_INFO_CONCURRENT, 36));
    EXPECT_FALSE(iw_parsers::parse_channel_no_ir(PHY_INFO_CONCURRENT, 1));
    EXPECT_TRUE(iw_parsers::parse_channel_no_ir(PHY_INFO_SINGLE_CHANNEL, 14));
    EXPECT_FALSE(iw_parsers::parse_channel_no_ir(PHY_INFO_SINGLE_CHANNEL, 100));
}

TEST(CapabilityProbeTest, ProbesThroughIw)
{
    FakeCommandRunner runner;
    runner.on_output({"iw", "dev", "wlan0", "info"}, DEV_INFO_MANAGED);
    runner.on_output({"iw", "phy0", "info"}, PHY_INFO_CONCURRENT);

    CapabilityProbe probe(runner, 2000ms);
    auto caps = probe.probe("wlan0");

    EXPECT_EQ(caps.phy.value_or(""), "phy0");
    EXPECT_TRUE(caps.ap_support);
    EXPECT_TRUE(caps.supports_5ghz);
    EXPECT_TRUE(caps.concurrency.supported);
    EXPECT_EQ(caps.concurrency.channels, 2);
    EXPECT_EQ(caps.current_channel, 11);
    EXPECT_TRUE(caps.channel_known);
    EXPECT_FALSE(caps.in_monitor_mode);

    EXPECT_EQ(probe.current_channel("wlan0"), 11);
    EXPECT_TRUE(probe.channel_no_ir("wlan0", 52));
}

TEST(CapabilityProbeTest, ToolFailureUsesSafeDefaults)
{
    FakeCommandRunner runner;
    runner.on_failure({"iw"});

    CapabilityProbe probe(runner, 2000ms);
    auto caps = probe.probe("wlan0");

    EXPECT_TRUE(caps.ap_support);
    EXPECT_FALSE(caps.supports_5ghz);
    EXPECT_FALSE(caps.concurrency.supported);
    EXPECT_EQ(caps.current_channel, CapabilityProbe::DEFAULT_CHANNEL);
    EXPECT_FALSE(caps.channel_known);

    EXPECT_TRUE(probe.ap_mode_supported("wlan0"));
    EXPECT_FALSE(probe.supports_5ghz("wlan0"));
    EXPECT_FALSE(probe.concurrency("wlan0").supported);
    EXPECT_EQ(probe.current_channel("wlan0"), 6);
    EXPECT_FALSE(probe.in_monitor_mode("wlan0"));
    EXPECT_FALSE(probe.channel_no_ir("wlan0", 52));
}

TEST(CapabilityProbeTest, TimeoutIsAFailure)
{
    FakeCommandRunner runner;
    runner.on({"iw"}, [](const FakeCommandRunner::Args &)
              {
                  infrastructure::CommandResult result;
                  result.launched = true;
                  result.timed_out = true;
                  return result; });

    CapabilityProbe probe(runner, 2000ms);
    EXPECT_FALSE(probe.concurrency("wlan0").supported);
    EXPECT_TRUE(probe.ap_mode_supported("wlan0"));
}

TEST(CapabilityProbeTest, PhyFailureAfterDevInfo)
{
    FakeCommandRunner runner;
    runner.on_output({"iw", "dev", "wlan0", "info"}, DEV_INFO_MANAGED);
    runner.on_failure({"iw", "phy0"});

    CapabilityProbe probe(runner, 2000ms);
    auto caps = probe.probe("wlan0");
    EXPECT_TRUE(caps.ap_support);
    EXPECT_FALSE(caps.concurrency.supported);
    EXPECT_EQ(caps.current_channel, 11);
}

TEST(CapabilityProbeTest, MonitorModeRadio)
{
    FakeCommandRunner runner;
    runner.on_output({"iw", "dev", "wlan1mon", "info"}, DEV_INFO_MONITOR);
    runner.on_output({"iw", "phy1", "info"}, PHY_INFO_SINGLE_CHANNEL);

    CapabilityProbe probe(runner, 2000ms);
    auto caps = probe.probe("wlan1mon");
    EXPECT_TRUE(caps.in_monitor_mode);
    EXPECT_EQ(caps.current_channel, 6);
    EXPECT_TRUE(probe.in_monitor_mode("wlan1mon"));
}
