#include <gtest/gtest.h>

#include "services/firewall_manager.hpp"
#include "support/fake_command_runner.hpp"
#include "support/fake_iptables.hpp"

using namespace hotspotd;
using namespace hotspotd::services;
using namespace hotspotd::test_support;
using namespace std::chrono_literals;

namespace
{
    const std::string BLOCKED = "aa:bb:cc:dd:ee:ff";
    const std::string FRIEND = "11:22:33:44:55:66";
    const std::string STRANGER = "de:ad:be:ef:00:01";

    class FirewallManagerTest : public ::testing::Test
    {
    protected:
        FirewallManagerTest() : tables_(FakeIptables::attach(runner_)), firewall_(runner_, 1000ms) {}

        FakeCommandRunner runner_;
        std::shared_ptr<FakeIptables> tables_;
        FirewallManager firewall_;
    };
}

TEST(FirewallRulesTest, BlockModeOrder)
{
    auto policy = core::MacPolicy::from_strings("block", {"AA:BB:CC:DD:EE:FF"});
    auto rules = FirewallManager::build_rules("wlx00c0ca", std::string("enp3s0"), policy);

    ASSERT_EQ(rules.size(), 6u);
    EXPECT_EQ(rules[0], (FirewallRule{"nat", "HOTSPOTD_POST", {"-o", "enp3s0", "-j", "MASQUERADE"}}));
    EXPECT_EQ(rules[1], (FirewallRule{"filter", "HOTSPOTD_FWD",
                                      {"-i", "wlx00c0ca", "-o", "enp3s0", "-m", "mac", "--mac-source", BLOCKED, "-j", "DROP"}}));
    EXPECT_EQ(rules[2], (FirewallRule{"filter", "HOTSPOTD_FWD",
                                      {"-m", "conntrack", "--ctstate", "RELATED,ESTABLISHED", "-j", "ACCEPT"}}));
    EXPECT_EQ(rules[3], (FirewallRule{"filter", "HOTSPOTD_FWD", {"-i", "enp3s0", "-o", "wlx00c0ca", "-j", "ACCEPT"}}));
    EXPECT_EQ(rules[4], (FirewallRule{"filter", "HOTSPOTD_FWD", {"-i", "wlx00c0ca", "-o", "enp3s0", "-j", "ACCEPT"}}));
    EXPECT_EQ(rules[5].table, "mangle");
    EXPECT_EQ(rules[5].chain, "HOTSPOTD_MSS");
}

TEST(FirewallRulesTest, AllowModeDropsEveryoneElse)
{
    auto policy = core::MacPolicy::from_strings("allow", {FRIEND});
    auto rules = FirewallManager::build_rules("ap0", std::string("wlan0"), policy);

    ASSERT_EQ(rules.size(), 6u);
    EXPECT_EQ(rules[1].spec.back(), "ACCEPT");
    EXPECT_EQ(rules[2], (FirewallRule{"filter", "HOTSPOTD_FWD", {"-i", "ap0", "-j", "DROP"}}));
    for (const auto &rule : rules)
    {
        EXPECT_NE(rule.spec, (std::vector<std::string>{"-i", "ap0", "-o", "wlan0", "-j", "ACCEPT"}));
    }
}

TEST(FirewallRulesTest, NoUpstreamMeansNoNat)
{
    auto rules = FirewallManager::build_rules("wlan0", std::nullopt, core::MacPolicy{});
    for (const auto &rule : rules)
    {
        EXPECT_NE(rule.table, "nat");
    }
    EXPECT_EQ(rules[1], (FirewallRule{"filter", "HOTSPOTD_FWD", {"-i", "wlan0", "-j", "ACCEPT"}}));
}

TEST(FirewallRulesTest, CommandForm)
{
    FirewallRule rule{"nat", "HOTSPOTD_POST", {"-o", "eth0", "-j", "MASQUERADE"}};
    EXPECT_EQ(rule.to_command(),
              (std::vector<std::string>{"iptables", "-t", "nat", "-A", "HOTSPOTD_POST", "-o", "eth0", "-j", "MASQUERADE"}));
}

TEST_F(FirewallManagerTest, ApplyInstallsChainsAndForwarding)
{
    ASSERT_TRUE(firewall_.apply("wlx00c0ca", std::string("enp3s0"), core::MacPolicy{}));

    EXPECT_TRUE(runner_.called({"sysctl", "-w", "net.ipv4.ip_forward=1"}));
    EXPECT_EQ(tables_->jumps("nat", "POSTROUTING", "HOTSPOTD_POST"), 1);
    EXPECT_EQ(tables_->jumps("filter", "FORWARD", "HOTSPOTD_FWD"), 1);
    EXPECT_EQ(tables_->jumps("mangle", "FORWARD", "HOTSPOTD_MSS"), 1);
    EXPECT_EQ(tables_->rules("nat", "HOTSPOTD_POST").size(), 1u);
    EXPECT_EQ(tables_->rules("mangle", "HOTSPOTD_MSS").size(), 1u);
}

TEST_F(FirewallManagerTest, ReapplyIsIdempotent)
{
    auto policy = core::MacPolicy::from_strings("block", {BLOCKED});
    ASSERT_TRUE(firewall_.apply("wlx00c0ca", std::string("enp3s0"), policy));
    auto first_nat = tables_->rules("nat", "HOTSPOTD_POST");
    auto first_fwd = tables_->rules("filter", "HOTSPOTD_FWD");

    ASSERT_TRUE(firewall_.apply("wlx00c0ca", std::string("enp3s0"), policy));
    EXPECT_EQ(tables_->rules("nat", "HOTSPOTD_POST"), first_nat);
    EXPECT_EQ(tables_->rules("filter", "HOTSPOTD_FWD"), first_fwd);
    EXPECT_EQ(tables_->jumps("filter", "FORWARD", "HOTSPOTD_FWD"), 1);
    EXPECT_EQ(tables_->jumps("nat", "POSTROUTING", "HOTSPOTD_POST"), 1);
}

TEST_F(FirewallManagerTest, UpstreamChangeReplacesRules)
{
    ASSERT_TRUE(firewall_.apply("ap0", std::string("wlan0"), core::MacPolicy{}));
    ASSERT_TRUE(firewall_.apply("ap0", std::string("enp3s0"), core::MacPolicy{}));

    const auto &nat = tables_->rules("nat", "HOTSPOTD_POST");
    ASSERT_EQ(nat.size(), 1u);
    EXPECT_EQ(nat.front(), (std::vector<std::string>{"-o", "enp3s0", "-j", "MASQUERADE"}));
    EXPECT_EQ(tables_->forward_verdict("ap0", "enp3s0", STRANGER), "ACCEPT");
    for (const auto &rule : tables_->rules("filter", "HOTSPOTD_FWD"))
    {
        EXPECT_EQ(std::find(rule.begin(), rule.end(), "wlan0"), rule.end());
    }
}

TEST_F(FirewallManagerTest, BlockedAddressIsDropped)
{
    ASSERT_TRUE(firewall_.apply("wlx00c0ca", std::string("enp3s0"),
                                core::MacPolicy::from_strings("block", {"AA:BB:CC:DD:EE:FF"})));

    EXPECT_EQ(tables_->forward_verdict("wlx00c0ca", "enp3s0", BLOCKED), "DROP");
    EXPECT_EQ(tables_->forward_verdict("wlx00c0ca", "enp3s0", BLOCKED, true), "DROP");
    EXPECT_EQ(tables_->forward_verdict("wlx00c0ca", "enp3s0", STRANGER), "ACCEPT");
}

TEST_F(FirewallManagerTest, AllowListAdmitsOnlyListedAddresses)
{
    ASSERT_TRUE(firewall_.apply("ap0", std::string("wlan0"), core::MacPolicy::from_strings("allow", {FRIEND})));

    EXPECT_EQ(tables_->forward_verdict("ap0", "wlan0", FRIEND), "ACCEPT");
    EXPECT_EQ(tables_->forward_verdict("ap0", "wlan0", STRANGER), "DROP");
    EXPECT_EQ(tables_->forward_verdict("ap0", "wlan0", STRANGER, true), "DROP");
    // Return traffic towards the hotspot
    EXPECT_EQ(tables_->forward_verdict("wlan0", "ap0", "", true), "ACCEPT");
}

TEST_F(FirewallManagerTest, EmptyAllowListDropsEveryone)
{
    ASSERT_TRUE(firewall_.apply("ap0", std::string("wlan0"), core::MacPolicy::from_strings("allow", {})));
    EXPECT_EQ(tables_->forward_verdict("ap0", "wlan0", FRIEND), "DROP");
}

TEST_F(FirewallManagerTest, RemoveLeavesNoTrace)
{
    ASSERT_TRUE(firewall_.apply("ap0", std::string("wlan0"), core::MacPolicy{}));
    firewall_.remove();

    EXPECT_FALSE(tables_->has_chain("nat", "HOTSPOTD_POST"));
    EXPECT_FALSE(tables_->has_chain("filter", "HOTSPOTD_FWD"));
    EXPECT_FALSE(tables_->has_chain("mangle", "HOTSPOTD_MSS"));
    EXPECT_TRUE(tables_->rules("filter", "FORWARD").empty());
    EXPECT_TRUE(tables_->rules("nat", "POSTROUTING").empty());
}

TEST_F(FirewallManagerTest, RemoveWithoutChainsIsHarmless)
{
    firewall_.remove();
    EXPECT_TRUE(tables_->has_chain("filter", "FORWARD"));
    EXPECT_FALSE(tables_->has_chain("filter", "HOTSPOTD_FWD"));
}

TEST_F(FirewallManagerTest, RemoveDropsDuplicateJumps)
{
    ASSERT_TRUE(firewall_.apply("ap0", std::string("wlan0"), core::MacPolicy{}));
    tables_->execute({"iptables", "-t", "filter", "-I", "FORWARD", "1", "-j", "HOTSPOTD_FWD"});
    ASSERT_EQ(tables_->jumps("filter", "FORWARD", "HOTSPOTD_FWD"), 2);

    firewall_.remove();
    EXPECT_EQ(tables_->jumps("filter", "FORWARD", "HOTSPOTD_FWD"), 0);
    EXPECT_FALSE(tables_->has_chain("filter", "HOTSPOTD_FWD"));
}

TEST_F(FirewallManagerTest, ForeignRulesSurvive)
{
    tables_->execute({"iptables", "-t", "filter", "-A", "FORWARD", "-i", "docker0", "-j", "ACCEPT"});
    ASSERT_TRUE(firewall_.apply("ap0", std::string("wlan0"), core::MacPolicy{}));
    firewall_.remove();

    const auto &forward = tables_->rules("filter", "FORWARD");
    ASSERT_EQ(forward.size(), 1u);
    EXPECT_EQ(forward.front(), (std::vector<std::string>{"-i", "docker0", "-j", "ACCEPT"}));
}

TEST_F(FirewallManagerTest, MssClampOnly)
{
    ASSERT_TRUE(firewall_.apply_mss_clamp());
    EXPECT_EQ(tables_->rules("mangle", "HOTSPOTD_MSS").size(), 1u);
    EXPECT_FALSE(tables_->has_chain("nat", "HOTSPOTD_POST"));
}

TEST_F(FirewallManagerTest, ForwardingFailureIsReported)
{
    runner_.on_failure({"sysctl"}, 255, "permission denied");
    EXPECT_FALSE(firewall_.apply("ap0", std::string("wlan0"), core::MacPolicy{}));
    EXPECT_EQ(tables_->jumps("filter", "FORWARD", "HOTSPOTD_FWD"), 1);
}
