#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "llm/stream_accumulator.hpp"

namespace {

using sous::core::errors::ErrorCategory;
using sous::core::errors::get_error;
using sous::core::errors::get_value;
using sous::core::errors::is_error;
using sous::llm::StreamAccumulator;
using sous::protocol::Fragment;
using sous::protocol::ToolCall;
using sous::protocol::Usage;

Fragment text_fragment(const std::string& text) {
    Fragment fragment;
    fragment.message.content = text;
    return fragment;
}

Fragment call_fragment(std::optional<int> index, const std::string& id, const std::string& name,
                       const std::string& arguments) {
    Fragment fragment;
    fragment.message.tool_calls = std::vector<ToolCall>{ToolCall{index, id, name, arguments}};
    return fragment;
}

Fragment usage_fragment(std::int64_t prompt, std::int64_t completion) {
    Fragment fragment;
    fragment.usage = Usage{prompt, completion};
    return fragment;
}

std::vector<std::string> push_all(StreamAccumulator& accumulator,
                                  const std::vector<Fragment>& fragments) {
    std::vector<std::string> emitted;
    for (const auto& fragment : fragments) {
        auto pushed = accumulator.push(fragment);
        EXPECT_FALSE(is_error(pushed));
        if (!is_error(pushed) && get_value(pushed).has_value()) {
            emitted.push_back(*get_value(pushed));
        }
    }
    return emitted;
}

TEST(StreamAccumulatorTest, BatchesTextEveryNContentFragments) {
    StreamAccumulator accumulator(2);
    const auto emitted = push_all(accumulator, {text_fragment("a"), text_fragment("b"),
                                                text_fragment("c"), usage_fragment(10, 3)});
    ASSERT_EQ(emitted.size(), 1u);
    EXPECT_EQ(emitted[0], "ab");
    EXPECT_EQ(accumulator.flush_text().value_or(""), "c");
    EXPECT_FALSE(accumulator.flush_text().has_value());

    auto finished = accumulator.finish();
    ASSERT_FALSE(is_error(finished));
    EXPECT_EQ(get_value(finished).message.content.value_or(""), "abc");
    EXPECT_EQ(accumulator.fragment_count(), 4u);
}

TEST(StreamAccumulatorTest, BatchSizeOneEmitsEveryFragment) {
    StreamAccumulator accumulator(1);
    const auto emitted =
        push_all(accumulator, {text_fragment("x"), text_fragment(""), text_fragment("y")});
    EXPECT_EQ(emitted, (std::vector<std::string>{"x", "y"}));
}

TEST(StreamAccumulatorTest, MergesArgumentsByIndexInFirstSeenOrder) {
    StreamAccumulator accumulator(5);
    push_all(accumulator, {call_fragment(1, "call_b", "grep", "{\"pat"),
                           call_fragment(0, "call_a", "read_file", "{\"path\":"),
                           call_fragment(1, "", "", "tern\":\"x\"}"),
                           call_fragment(0, "", "", "\"a.txt\"}"), usage_fragment(5, 5)});

    auto finished = accumulator.finish();
    ASSERT_FALSE(is_error(finished));
    const auto& calls = get_value(finished).message.tool_calls.value();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].id, "call_b");
    EXPECT_EQ(calls[0].name, "grep");
    EXPECT_EQ(calls[0].arguments, "{\"pattern\":\"x\"}");
    EXPECT_EQ(calls[1].id, "call_a");
    EXPECT_EQ(calls[1].arguments, "{\"path\":\"a.txt\"}");
}

TEST(StreamAccumulatorTest, LaterIdAndNameFillBlanks) {
    StreamAccumulator accumulator(5);
    push_all(accumulator, {call_fragment(0, "", "", "{}"), call_fragment(0, "call_z", "bash", ""),
                           call_fragment(0, "ignored", "other", ""), usage_fragment(1, 1)});
    auto finished = accumulator.finish();
    ASSERT_FALSE(is_error(finished));
    const auto& call = get_value(finished).message.tool_calls->front();
    EXPECT_EQ(call.id, "call_z");
    EXPECT_EQ(call.name, "bash");
}

TEST(StreamAccumulatorTest, MissingIndexIsFatal) {
    StreamAccumulator accumulator(5);
    auto pushed = accumulator.push(call_fragment(std::nullopt, "call_1", "bash", "{}"));
    ASSERT_TRUE(is_error(pushed));
    EXPECT_EQ(get_error(pushed).category, ErrorCategory::Protocol);
    EXPECT_EQ(get_error(pushed).code, "malformed_stream_missing_index");
}

TEST(StreamAccumulatorTest, FirstFinishReasonWins) {
    StreamAccumulator accumulator(5);
    Fragment first = text_fragment("done");
    first.finish_reason = "tool_calls";
    Fragment last = usage_fragment(1, 1);
    last.finish_reason = "stop";
    push_all(accumulator, {text_fragment("a"), first, last});

    auto finished = accumulator.finish();
    ASSERT_FALSE(is_error(finished));
    EXPECT_EQ(get_value(finished).finish_reason.value_or(""), "tool_calls");
}

TEST(StreamAccumulatorTest, UsageComesFromLastCarrier) {
    StreamAccumulator accumulator(5);
    push_all(accumulator, {usage_fragment(10, 1), text_fragment("a"), usage_fragment(12, 4),
                           text_fragment("b")});
    auto finished = accumulator.finish();
    ASSERT_FALSE(is_error(finished));
    EXPECT_EQ(get_value(finished).usage.prompt_tokens, 12);
    EXPECT_EQ(get_value(finished).usage.completion_tokens, 4);
}

TEST(StreamAccumulatorTest, MissingUsageIsFatal) {
    StreamAccumulator accumulator(5);
    push_all(accumulator, {text_fragment("no usage anywhere")});
    auto finished = accumulator.finish();
    ASSERT_TRUE(is_error(finished));
    EXPECT_EQ(get_error(finished).code, "missing_usage");
}

TEST(StreamAccumulatorTest, EmptyStreamIsFatal) {
    StreamAccumulator accumulator(5);
    auto finished = accumulator.finish();
    ASSERT_TRUE(is_error(finished));
    EXPECT_EQ(get_error(finished).code, "empty_stream");
}

TEST(StreamAccumulatorTest, ToolCallFlushesPendingText) {
    StreamAccumulator accumulator(10);
    push_all(accumulator, {text_fragment("Let me look. ")});
    auto pushed = accumulator.push(call_fragment(0, "call_1", "read_file", "{}"));
    ASSERT_FALSE(is_error(pushed));
    EXPECT_EQ(get_value(pushed).value_or(""), "Let me look. ");
}

TEST(StreamAccumulatorTest, MissingCallIdIsGenerated) {
    StreamAccumulator accumulator(5);
    push_all(accumulator, {call_fragment(0, "", "bash", "{}"), usage_fragment(1, 1)});
    auto finished = accumulator.finish();
    ASSERT_FALSE(is_error(finished));
    EXPECT_EQ(get_value(finished).message.tool_calls->front().id.rfind("call-", 0), 0u);
}

}  // namespace
