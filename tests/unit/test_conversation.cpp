#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "protocol/message_contract.hpp"
#include "session/conversation.hpp"
#include "session/session_stats.hpp"

namespace {

using sous::core::errors::get_error;
using sous::core::errors::is_error;
using sous::protocol::Message;
using sous::protocol::Role;
using sous::protocol::ToolCall;
using sous::session::Conversation;
using sous::session::SessionStats;

Message assistant_calling(const std::vector<std::string>& ids) {
    Message message;
    message.role = Role::Assistant;
    std::vector<ToolCall> calls;
    for (const auto& id : ids) {
        calls.push_back(ToolCall{std::nullopt, id, "bash", R"({"command":"ls"})"});
    }
    message.tool_calls = calls;
    return message;
}

Message assistant_text(const std::string& text) {
    Message message;
    message.role = Role::Assistant;
    message.content = text;
    return message;
}

TEST(ConversationTest, StartsWithSystemMessage) {
    Conversation conversation("be careful");
    ASSERT_EQ(conversation.size(), 1u);
    EXPECT_EQ(conversation.back().role, Role::System);
    EXPECT_EQ(conversation.back().content.value_or(""), "be careful");

    conversation.set_system_prompt("be brief");
    EXPECT_EQ(conversation.messages().front().content.value_or(""), "be brief");
}

TEST(ConversationTest, AppendToLastJoinsWithBlankLine) {
    Conversation conversation("sys");
    conversation.append(Message::user("fix the build"));
    conversation.append_to_last("<warning>context is large</warning>");
    EXPECT_EQ(conversation.back().content.value_or(""),
              "fix the build\n\n<warning>context is large</warning>");
}

TEST(ConversationTest, ReadyOnlyAfterUserOrToolMessage) {
    Conversation conversation("sys");
    auto at_start = conversation.check_ready_for_query();
    ASSERT_TRUE(is_error(at_start));
    EXPECT_EQ(get_error(at_start).code, "conversation_desync");

    conversation.append(Message::user("hi"));
    EXPECT_FALSE(is_error(conversation.check_ready_for_query()));

    conversation.append(assistant_text("hello"));
    EXPECT_TRUE(is_error(conversation.check_ready_for_query()));

    conversation.append(assistant_calling({"c1"}));
    conversation.append(Message::tool_result("c1", "bash", "ok"));
    EXPECT_FALSE(is_error(conversation.check_ready_for_query()));
}

TEST(ConversationTest, RepairAnswersDanglingToolCalls) {
    Conversation conversation("sys");
    conversation.append(Message::user("run things"));
    conversation.append(assistant_calling({"c1", "c2", "c3"}));
    conversation.append(Message::tool_result("c2", "bash", "done"));

    EXPECT_EQ(conversation.repair(), 2u);
    const auto& messages = conversation.messages();
    ASSERT_EQ(messages.size(), 6u);
    EXPECT_EQ(messages[3].tool_call_id.value_or(""), "c2");
    EXPECT_EQ(messages[4].tool_call_id.value_or(""), "c1");
    EXPECT_EQ(messages[4].content.value_or(""), Conversation::kInterruptedToolResult);
    EXPECT_EQ(messages[5].tool_call_id.value_or(""), "c3");
    EXPECT_FALSE(is_error(conversation.check_ready_for_query()));

    EXPECT_EQ(conversation.repair(), 0u);
    EXPECT_EQ(conversation.size(), 6u);
}

TEST(ConversationTest, RepairInsertsResultsBeforeLaterMessages) {
    Conversation conversation("sys");
    conversation.append(Message::user("go"));
    conversation.append(assistant_calling({"c1"}));
    conversation.append(Message::user("are you there?"));

    EXPECT_EQ(conversation.repair(), 1u);
    const auto& messages = conversation.messages();
    ASSERT_EQ(messages.size(), 5u);
    EXPECT_EQ(messages[3].role, Role::Tool);
    EXPECT_EQ(messages[4].role, Role::User);
}

TEST(ConversationTest, RepairDropsTrailingEmptyAssistant) {
    Conversation conversation("sys");
    conversation.append(Message::user("hi"));
    conversation.append(assistant_text(""));
    EXPECT_EQ(conversation.repair(), 0u);
    EXPECT_EQ(conversation.size(), 2u);
    EXPECT_EQ(conversation.back().role, Role::User);
}

TEST(ConversationTest, SummaryAndResetKeepSystemMessage) {
    Conversation conversation("sys");
    conversation.append(Message::user("a"));
    conversation.append(assistant_text("b"));

    conversation.replace_with_summary("we did a and b");
    ASSERT_EQ(conversation.size(), 2u);
    EXPECT_EQ(conversation.messages()[0].role, Role::System);
    EXPECT_EQ(conversation.messages()[1].content.value_or(""), "we did a and b");

    conversation.reset_to_system();
    EXPECT_EQ(conversation.size(), 1u);
}

TEST(ConversationTest, RestoreInsertsSystemWhenMissing) {
    Conversation conversation("sys");
    conversation.restore({Message::user("old question"), assistant_text("old answer")});
    ASSERT_EQ(conversation.size(), 3u);
    EXPECT_EQ(conversation.messages()[0].content.value_or(""), "sys");

    conversation.restore({Message::system("saved"), Message::user("q")});
    ASSERT_EQ(conversation.size(), 2u);
    EXPECT_EQ(conversation.messages()[0].content.value_or(""), "saved");
}

TEST(ConversationTest, EstimatesQuarterOfCharacters) {
    Conversation conversation(std::string(40, 's'));
    conversation.append(Message::user(std::string(40, 'u')));
    EXPECT_EQ(conversation.estimate_tokens(), 20);
}

TEST(SessionStatsTest, RecordsUsageAndCost) {
    SessionStats stats;
    stats.input_price_per_million = 2.0;
    stats.output_price_per_million = 8.0;
    stats.record_usage(1000, 200);
    stats.record_usage(1500, 300);

    EXPECT_EQ(stats.session_prompt_tokens, 2500);
    EXPECT_EQ(stats.session_completion_tokens, 500);
    EXPECT_EQ(stats.last_turn_prompt_tokens, 1500);
    EXPECT_EQ(stats.context_tokens, 1800);
    EXPECT_EQ(stats.session_total_tokens(), 3000);
    EXPECT_DOUBLE_EQ(stats.session_cost(), 2500 * 2.0 / 1e6 + 500 * 8.0 / 1e6);

    stats.turns = 4;
    stats.reset_keep_pricing();
    EXPECT_EQ(stats.turns, 0);
    EXPECT_EQ(stats.session_total_tokens(), 0);
    EXPECT_DOUBLE_EQ(stats.input_price_per_million, 2.0);
}

}  // namespace
