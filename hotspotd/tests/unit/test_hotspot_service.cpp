#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include "core/config.hpp"
#include "core/hotspot_service.hpp"
#include "support/countdown_token.hpp"
#include "support/fake_command_runner.hpp"
#include "support/fake_iptables.hpp"

using namespace hotspotd;
using namespace hotspotd::test_support;

namespace
{
    class HotspotServiceTest : public ::testing::Test
    {
    protected:
        HotspotServiceTest() : tables_(FakeIptables::attach(runner_))
        {
            dir_ = std::filesystem::path(::testing::TempDir()) /
                   ("hotspotd_service_" +
                    std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
            std::filesystem::remove_all(dir_);
            std::filesystem::create_directories(dir_);

            config_ = core::HotspotConfig::create_default();
            config_->paths.runtime_dir = (dir_ / "run").string();
            config_->paths.status_file = (dir_ / "status.json").string();
            config_->paths.pid_file = (dir_ / "hotspotd.pid").string();

            // Wired uplink plus a USB adapter
            runner_.on_output({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"},
                              "enp3s0:ethernet:connected:Wired connection 1\n"
                              "wlx00c0ca:wifi:disconnected:\n"
                              "lo:loopback:unmanaged:\n");
            runner_.on_output({"nmcli", "-t", "-f", "DEVICE,STATE", "device"},
                              "enp3s0:connected\nwlx00c0ca:disconnected\n");
            runner_.on_output({"readlink", "-f", "/sys/class/net/enp3s0/device"},
                              "/sys/devices/pci0000:00/0000:00:1f.6\n");
            runner_.on_output({"readlink", "-f", "/sys/class/net/wlx00c0ca/device"},
                              "/sys/devices/pci0000:00/0000:00:14.0/usb1/1-2/1-2:1.0\n");
            runner_.on_output({"ip", "-4", "-o", "addr", "show", "dev", "enp3s0"},
                              "2: enp3s0    inet 192.168.0.17/24 brd 192.168.0.255 scope global dynamic enp3s0\n");
            runner_.on_output({"ip", "route", "get"}, "1.1.1.1 via 192.168.0.1 dev enp3s0 src 192.168.0.17\n");
            runner_.on_output({"iw", "dev", "wlx00c0ca", "info"}, "Interface wlx00c0ca\n\ttype managed\n\twiphy 1\n");
            runner_.on_output({"iw", "phy1", "info"},
                              "Wiphy phy1\n"
                              "\tSupported interface modes:\n"
                              "\t\t * managed\n"
                              "\t\t * AP\n"
                              "\tvalid interface combinations:\n"
                              "\t\t * #{ managed, AP } <= 1,\n"
                              "\t\t   total <= 1, #channels <= 1\n");
        }

        ~HotspotServiceTest() override
        {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        std::unique_ptr<core::HotspotService> make_service()
        {
            return std::make_unique<core::HotspotService>(std::move(config_), runner_, out_, err_);
        }

        nlohmann::json status() const
        {
            std::ifstream stream(dir_ / "status.json");
            return nlohmann::json::parse(stream);
        }

        FakeCommandRunner runner_;
        std::shared_ptr<FakeIptables> tables_;
        std::unique_ptr<core::HotspotConfig> config_;
        std::filesystem::path dir_;
        std::ostringstream out_;
        std::ostringstream err_;
    };
}

TEST(HotspotServiceConstructionTest, NullConfigIsRejected)
{
    FakeCommandRunner runner;
    EXPECT_THROW(core::HotspotService(nullptr, runner), std::invalid_argument);
}

TEST_F(HotspotServiceTest, ListInterfaces)
{
    auto service = make_service();
    auto list = service->list_interfaces();

    ASSERT_TRUE(list.is_array());
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]["name"], "enp3s0");
    EXPECT_EQ(list[0]["type"], "ethernet");
    EXPECT_EQ(list[0]["is_internet_source"], true);
    EXPECT_EQ(list[0]["ip_address"], "192.168.0.17");
    EXPECT_EQ(list[1]["name"], "wlx00c0ca");
    EXPECT_EQ(list[1]["type"], "wifi");
    EXPECT_EQ(list[1]["is_usb"], true);
    EXPECT_EQ(list[1]["ap_support"], true);
    EXPECT_TRUE(list[1]["connection_name"].is_null());
    EXPECT_EQ(list[1]["label"], "USB Wi-Fi Adapter [AP] (wlx00c0ca)");
}

TEST_F(HotspotServiceTest, Recommend)
{
    auto service = make_service();
    auto selection = service->recommend();

    EXPECT_EQ(selection["internet_interface"], "enp3s0");
    EXPECT_EQ(selection["hotspot_interface"], "wlx00c0ca");
    EXPECT_EQ(selection["high_risk"], false);
    EXPECT_TRUE(selection["warnings"].empty());
    EXPECT_FALSE(selection["rationale"].get<std::string>().empty());
}

TEST_F(HotspotServiceTest, PreflightFailureStopsBeforeAnyChange)
{
    config_->ap.password = "short";
    auto service = make_service();
    CountdownToken token(1);

    EXPECT_EQ(service->run(token), 1);
    EXPECT_NE(err_.str().find("ERROR: Password must be at least 8 characters"), std::string::npos);
    EXPECT_EQ(status()["status"], "error");
    EXPECT_EQ(status()["is_error"], true);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "hotspotd.pid"));
    EXPECT_FALSE(runner_.called({"nmcli", "connection", "add"}));
    EXPECT_EQ(token.waits, 0);
}

TEST_F(HotspotServiceTest, FullSessionUntilCancelled)
{
    auto service = make_service();
    CountdownToken token(1);

    EXPECT_EQ(service->run(token), 0);

    EXPECT_NE(out_.str().find("Hotspot ACTIVE on wlx00c0ca (dual-adapter, SSID MintHotspot)"), std::string::npos);
    EXPECT_NE(out_.str().find("Hotspot stopped"), std::string::npos);
    EXPECT_TRUE(err_.str().empty()) << err_.str();
    EXPECT_EQ(status()["status"], "stopped");
    EXPECT_EQ(status()["message"], "Stopped");

    EXPECT_TRUE(runner_.called({"nmcli", "connection", "up", "temp_hotspot_con", "ifname", "wlx00c0ca"}));
    EXPECT_EQ(runner_.calls().back(), (FakeCommandRunner::Args{"nmcli", "connection", "delete", "temp_hotspot_con"}));
    EXPECT_FALSE(tables_->has_chain("mangle", "HOTSPOTD_MSS"));
    EXPECT_FALSE(tables_->has_chain("nat", "HOTSPOTD_POST"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "hotspotd.pid"));
    EXPECT_EQ(token.waits, 1);
}

TEST_F(HotspotServiceTest, StartFailureReleasesEverything)
{
    runner_.on_failure({"nmcli", "connection", "up"}, 4, "Error: Connection activation failed");
    auto service = make_service();
    CountdownToken token(1);

    EXPECT_EQ(service->run(token), 1);
    EXPECT_NE(err_.str().find("NetworkManager could not activate the access point on wlx00c0ca"), std::string::npos);
    EXPECT_EQ(status()["status"], "error");
    EXPECT_FALSE(std::filesystem::exists(dir_ / "hotspotd.pid"));
    EXPECT_EQ(token.waits, 0);
}

TEST_F(HotspotServiceTest, StopWithoutRunningInstance)
{
    auto service = make_service();

    EXPECT_EQ(service->stop(), 0);
    EXPECT_NE(out_.str().find("Hotspot stopped"), std::string::npos);
    EXPECT_EQ(status()["status"], "stopped");
    EXPECT_TRUE(runner_.called({"nmcli", "connection", "delete", "temp_hotspot_con"}));
}
