#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "policy/mode_policy.hpp"

namespace {

using sous::core::errors::get_error;
using sous::core::errors::get_value;
using sous::core::errors::is_error;
using sous::policy::Mode;
using sous::policy::ModePolicy;
using sous::policy::parse_mode;

TEST(ModePolicyTest, DefaultsToNormal) {
    ModePolicy policy;
    EXPECT_EQ(policy.current_mode(), Mode::Normal);
    EXPECT_FALSE(policy.auto_approve());
    EXPECT_FALSE(policy.read_only());
    EXPECT_EQ(policy.indicator(), "[normal]");
    ASSERT_EQ(policy.history().size(), 1u);
}

TEST(ModePolicyTest, ModeFlags) {
    ModePolicy policy(Mode::Plan);
    EXPECT_TRUE(policy.read_only());
    EXPECT_FALSE(policy.auto_approve());

    policy.set_mode(Mode::Yolo);
    EXPECT_TRUE(policy.auto_approve());
    EXPECT_FALSE(policy.read_only());

    policy.set_mode(Mode::Architect);
    EXPECT_TRUE(policy.read_only());
    EXPECT_NE(policy.prompt_modifier().find("ARCHITECT MODE"), std::string::npos);
}

TEST(ModePolicyTest, CycleVisitsEveryModeAndWraps) {
    ModePolicy policy;
    const Mode expected[] = {Mode::Auto, Mode::Plan, Mode::Yolo, Mode::Architect, Mode::Normal};
    Mode previous = Mode::Normal;
    for (const Mode next : expected) {
        const auto transition = policy.cycle_mode();
        EXPECT_EQ(transition.first, previous);
        EXPECT_EQ(transition.second, next);
        previous = next;
    }
    EXPECT_EQ(policy.current_mode(), Mode::Normal);
}

TEST(ModePolicyTest, HistoryIsBounded) {
    ModePolicy policy;
    for (int i = 0; i < 250; ++i) {
        policy.cycle_mode();
    }
    EXPECT_EQ(policy.history().size(), ModePolicy::kMaxHistory);
}

TEST(ModePolicyTest, ParsesNamesCaseInsensitively) {
    auto parsed = parse_mode("  PLAN ");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed), Mode::Plan);

    auto unknown = parse_mode("turbo");
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_mode");
    EXPECT_NE(get_error(unknown).message.find("architect"), std::string::npos);

    ModePolicy policy;
    auto rejected = policy.set_mode_from_name("turbo");
    EXPECT_TRUE(is_error(rejected));
    EXPECT_EQ(policy.current_mode(), Mode::Normal);
}

TEST(ModePolicyTest, AutoApproveRules) {
    ModePolicy policy(Mode::Normal);
    EXPECT_FALSE(policy.should_auto_approve("read_file"));

    policy.set_mode(Mode::Auto);
    EXPECT_TRUE(policy.should_auto_approve("write_file"));

    policy.set_mode(Mode::Plan);
    EXPECT_TRUE(policy.should_auto_approve("grep"));
    EXPECT_FALSE(policy.should_auto_approve("bash"));
}

TEST(ModePolicyTest, ReadOnlyModesBlockWrites) {
    ModePolicy policy(Mode::Plan);
    const auto blocked = policy.should_block("delete_file", R"({"path":"a.txt"})");
    EXPECT_TRUE(blocked.blocked);
    EXPECT_NE(blocked.reason.find("blocked in PLAN mode"), std::string::npos);

    EXPECT_FALSE(policy.should_block("read_file", R"({"path":"a.txt"})").blocked);
    EXPECT_FALSE(policy.should_block("bash", R"({"command":"ls -la"})").blocked);
    EXPECT_TRUE(policy.should_block("bash", R"({"command":"rm a.txt"})").blocked);

    policy.set_mode(Mode::Normal);
    EXPECT_FALSE(policy.should_block("delete_file", R"({"path":"a.txt"})").blocked);
}

TEST(ModePolicyTest, ForcedAutoApproveDoesNotLiftReadOnlyBlock) {
    ModePolicy policy(Mode::Plan);
    policy.force_auto_approve(true);
    EXPECT_TRUE(policy.should_auto_approve("write_file"));
    EXPECT_TRUE(policy.should_block("write_file", "{}").blocked);
}

TEST(ModePolicyTest, ForcedFlagResetsOnTransition) {
    ModePolicy policy(Mode::Normal);
    policy.force_auto_approve(true);
    EXPECT_TRUE(policy.auto_approve());
    policy.set_mode(Mode::Normal);
    EXPECT_FALSE(policy.auto_approve());
}

TEST(ModePolicyTest, TransitionMessage) {
    ModePolicy policy;
    EXPECT_EQ(policy.transition_message(Mode::Normal, Mode::Auto),
              "Mode: NORMAL -> AUTO\n[auto] Auto-approve all tool executions.");
}

TEST(ModePolicyTest, SnapshotJson) {
    ModePolicy policy(Mode::Normal);
    policy.set_mode(Mode::Plan);
    const auto snapshot = nlohmann::json::parse(policy.snapshot_json());
    EXPECT_EQ(snapshot["current_mode"], "plan");
    EXPECT_EQ(snapshot["read_only"], true);
    EXPECT_EQ(snapshot["auto_approve"], false);
    ASSERT_EQ(snapshot["history"].size(), 2u);
    EXPECT_EQ(snapshot["history"][0]["mode"], "normal");
    EXPECT_TRUE(snapshot["history"][1]["at_ms"].is_number_integer());
}

}  // namespace
