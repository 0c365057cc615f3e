#include <gtest/gtest.h>

#include "services/interface_selector.hpp"
#include "support/interface_builders.hpp"

using namespace hotspotd;
using namespace hotspotd::services;
using namespace hotspotd::test_support;

namespace
{
    bool mentions(const std::vector<std::string> &warnings, const std::string &text)
    {
        for (const auto &warning : warnings)
        {
            if (warning.find(text) != std::string::npos)
                return true;
        }
        return false;
    }
}

TEST(InterfaceSelectorTest, EthernetUplinkWithUsbRadio)
{
    std::vector<core::Interface> interfaces = {
        connected(ethernet("enp3s0"), "Wired connection 1"),
        wifi("wlan0"),
        usb_wifi("wlx00c0ca"),
    };

    auto result = InterfaceSelector::select_from(interfaces, std::nullopt);
    EXPECT_EQ(result.internet_interface.value_or(""), "enp3s0");
    EXPECT_EQ(result.hotspot_interface.value_or(""), "wlx00c0ca");
    EXPECT_FALSE(result.high_risk);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_NE(result.rationale.find("USB"), std::string::npos);
}

TEST(InterfaceSelectorTest, SelectionIsDeterministic)
{
    std::vector<core::Interface> interfaces = {
        connected(wifi("wlan0"), "HomeNet"),
        usb_wifi("wlx1"),
        usb_wifi("wlx2"),
    };
    auto first = InterfaceSelector::select_from(interfaces, std::nullopt);
    auto second = InterfaceSelector::select_from(interfaces, std::nullopt);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.hotspot_interface.value_or(""), "wlx1");
}

TEST(InterfaceSelectorTest, SingleRadioWithoutConcurrencyIsHighRisk)
{
    std::vector<core::Interface> interfaces = {
        connected(wifi("wlan0"), "HomeNet"),
        ethernet("enp3s0"),
    };

    auto result = InterfaceSelector::select_from(interfaces, std::nullopt);
    EXPECT_EQ(result.internet_interface.value_or(""), "wlan0");
    EXPECT_EQ(result.hotspot_interface.value_or(""), "wlan0");
    EXPECT_TRUE(result.high_risk);
    EXPECT_TRUE(mentions(result.warnings, "High risk"));
}

TEST(InterfaceSelectorTest, ConcurrentRadioSharesUplinkSafely)
{
    std::vector<core::Interface> interfaces = {
        concurrent(connected(wifi("wlan0"), "HomeNet"), 2),
    };

    auto result = InterfaceSelector::select_from(interfaces, std::nullopt);
    EXPECT_EQ(result.hotspot_interface.value_or(""), "wlan0");
    EXPECT_FALSE(result.high_risk);
    EXPECT_NE(result.rationale.find("STA+AP"), std::string::npos);
}

TEST(InterfaceSelectorTest, WiredAlternativeRemovesRisk)
{
    std::vector<core::Interface> interfaces = {
        connected(wifi("wlan0"), "HomeNet"),
        connected(ethernet("enp3s0"), "Wired", false),
    };

    auto result = InterfaceSelector::select_from(interfaces, std::string("wlan0"));
    EXPECT_EQ(result.hotspot_interface.value_or(""), "wlan0");
    EXPECT_FALSE(result.high_risk);
}

TEST(InterfaceSelectorTest, NoInternetSourceWarns)
{
    std::vector<core::Interface> interfaces = {wifi("wlan0")};

    auto result = InterfaceSelector::select_from(interfaces, std::nullopt);
    EXPECT_FALSE(result.internet_interface.has_value());
    EXPECT_EQ(result.hotspot_interface.value_or(""), "wlan0");
    EXPECT_TRUE(mentions(result.warnings, "No internet source"));
    EXPECT_FALSE(result.high_risk);
}

TEST(InterfaceSelectorTest, MonitorModeRadioIsExcluded)
{
    auto monitor = usb_wifi("wlan1mon");
    monitor.in_monitor_mode = true;
    std::vector<core::Interface> interfaces = {
        connected(ethernet("enp3s0"), "Wired"),
        monitor,
        wifi("wlan0"),
    };

    auto result = InterfaceSelector::select_from(interfaces, std::nullopt);
    EXPECT_EQ(result.hotspot_interface.value_or(""), "wlan0");
    EXPECT_TRUE(mentions(result.warnings, "wlan1mon is in monitor mode"));
}

TEST(InterfaceSelectorTest, NoApRadio)
{
    auto radio = wifi("wlan0");
    radio.ap_support = false;
    std::vector<core::Interface> interfaces = {connected(ethernet("enp3s0"), "Wired"), radio};

    auto result = InterfaceSelector::select_from(interfaces, std::nullopt);
    EXPECT_FALSE(result.hotspot_interface.has_value());
    EXPECT_TRUE(mentions(result.warnings, "No Wi-Fi adapter with AP support"));
}

TEST(InterfaceSelectorTest, ManualOverrideNotFound)
{
    std::vector<core::Interface> interfaces = {
        connected(ethernet("enp3s0"), "Wired"),
        usb_wifi("wlx00c0ca"),
    };

    auto result = InterfaceSelector::select_from(interfaces, std::string("eth9"));
    EXPECT_EQ(result.internet_interface.value_or(""), "eth9");
    EXPECT_EQ(result.hotspot_interface.value_or(""), "wlx00c0ca");
    EXPECT_TRUE(mentions(result.warnings, "'eth9' was not found"));
}

TEST(InterfaceSelectorTest, VirtualInterfaceOnUplinkRadioIsNotASecondAdapter)
{
    auto uplink = connected(usb_wifi("wlan0"), "HomeNet");
    uplink.phy = "phy0";
    auto sibling = usb_wifi("ap0");
    sibling.state = "unmanaged";
    sibling.phy = "phy0";

    auto result = InterfaceSelector::select_from({uplink, sibling}, std::nullopt);
    EXPECT_EQ(result.internet_interface.value_or(""), "wlan0");
    EXPECT_NE(result.hotspot_interface.value_or(""), "ap0");
    EXPECT_EQ(result.rationale.find("dedicated"), std::string::npos);
    EXPECT_TRUE(result.high_risk);
}

TEST(InterfaceSelectorTest, MobileBeatsConnectedWifi)
{
    auto modem = connected(ethernet("wwan0"), "Carrier", false);
    modem.type = core::InterfaceType::MOBILE;
    std::vector<core::Interface> interfaces = {
        connected(wifi("wlan0"), "HomeNet", false),
        modem,
    };

    auto result = InterfaceSelector::select_from(interfaces, std::nullopt);
    EXPECT_EQ(result.internet_interface.value_or(""), "wwan0");
    EXPECT_EQ(result.hotspot_interface.value_or(""), "wlan0");
    EXPECT_FALSE(result.high_risk);
}
