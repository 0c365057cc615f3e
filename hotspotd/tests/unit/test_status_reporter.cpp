#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "infrastructure/status_reporter.hpp"

using namespace hotspotd::infrastructure;

namespace
{
    nlohmann::json read_json(const std::string &path)
    {
        std::ifstream stream(path);
        return nlohmann::json::parse(stream);
    }
}

TEST(StatusReporterTest, WritesDocument)
{
    std::string path = ::testing::TempDir() + "hotspotd_status_test.json";
    StatusReporter reporter(path);

    auto before = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    ASSERT_TRUE(reporter.active("Hotspot ACTIVE on ap0"));

    auto document = read_json(path);
    EXPECT_EQ(document["status"], "active");
    EXPECT_EQ(document["message"], "Hotspot ACTIVE on ap0");
    EXPECT_EQ(document["is_error"], false);
    EXPECT_GE(document["timestamp"].get<long long>(), before);
    std::remove(path.c_str());
}

TEST(StatusReporterTest, LaterWriteReplacesEarlier)
{
    std::string path = ::testing::TempDir() + "hotspotd_status_replace.json";
    StatusReporter reporter(path);

    ASSERT_TRUE(reporter.active("up"));
    ASSERT_TRUE(reporter.error("Password must be at least 8 characters for WPA2 security."));

    auto document = read_json(path);
    EXPECT_EQ(document["status"], "error");
    EXPECT_EQ(document["is_error"], true);
    EXPECT_EQ(document.size(), 4u);

    ASSERT_TRUE(reporter.stopped("Stopped"));
    EXPECT_EQ(read_json(path)["status"], "stopped");

    // No temporary files left beside the status file
    int siblings = 0;
    for (const auto &entry : std::filesystem::directory_iterator(std::filesystem::path(path).parent_path()))
    {
        if (entry.path().filename().string().rfind("hotspotd_status_replace.json", 0) == 0)
            ++siblings;
    }
    EXPECT_EQ(siblings, 1);
    std::remove(path.c_str());
}

TEST(StatusReporterTest, CreatesParentDirectory)
{
    auto dir = std::filesystem::path(::testing::TempDir()) / "hotspotd_status_dir";
    std::filesystem::remove_all(dir);
    StatusReporter reporter((dir / "status.json").string());

    EXPECT_TRUE(reporter.stopped("Stopped"));
    EXPECT_TRUE(std::filesystem::exists(dir / "status.json"));
    std::filesystem::remove_all(dir);
}

TEST(StatusReporterTest, UnwritableLocationFails)
{
    StatusReporter reporter("/proc/hotspotd/status.json");
    EXPECT_FALSE(reporter.error("boom"));
}
