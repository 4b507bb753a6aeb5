#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "exec/command_parser.hpp"
#include "exec/text_decoding.hpp"

namespace {

using sous::core::errors::get_error;
using sous::core::errors::get_value;
using sous::core::errors::is_error;
using sous::exec::decode_utf8_lossy;
using sous::exec::split_command;

TEST(CommandParserTest, SplitsOnWhitespace) {
    auto result = split_command("  ls   -la\tsrc  ");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), (std::vector<std::string>{"ls", "-la", "src"}));
}

TEST(CommandParserTest, KeepsQuotedWordsTogether) {
    auto result = split_command(R"(grep "two words" 'single $HOME' mixed"quo"ted)");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              (std::vector<std::string>{"grep", "two words", "single $HOME", "mixedquoted"}));
}

TEST(CommandParserTest, HandlesEscapes) {
    auto result = split_command(R"(echo a\ b "say \"hi\"" 'back\slash')");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              (std::vector<std::string>{"echo", "a b", "say \"hi\"", "back\\slash"}));
}

TEST(CommandParserTest, EmptyQuotesMakeAnEmptyWord) {
    auto result = split_command("printf ''");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), (std::vector<std::string>{"printf", ""}));
}

TEST(CommandParserTest, BlankInputHasNoWords) {
    auto result = split_command("   ");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).empty());
}

TEST(CommandParserTest, UnclosedQuoteIsSyntaxError) {
    auto result = split_command("echo \"unterminated");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_command_syntax");
    EXPECT_NE(get_error(result).message.find("no closing quotation"), std::string::npos);
}

TEST(CommandParserTest, TrailingBackslashIsSyntaxError) {
    auto result = split_command("echo oops\\");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_command_syntax");
}

TEST(TextDecodingTest, PassesValidUtf8Through) {
    const std::string text = "caf\xC3\xA9 \xE2\x9C\x93";
    EXPECT_EQ(decode_utf8_lossy(text), text);
}

TEST(TextDecodingTest, ReplacesInvalidBytes) {
    EXPECT_EQ(decode_utf8_lossy("a\xFFz"), "a\xEF\xBF\xBDz");
}

TEST(TextDecodingTest, ReplacesTruncatedSequence) {
    EXPECT_EQ(decode_utf8_lossy("ok\xE2\x9C"), "ok\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(TextDecodingTest, RejectsOverlongAndSurrogateForms) {
    EXPECT_EQ(decode_utf8_lossy("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(decode_utf8_lossy("\xED\xA0\x80").substr(0, 3), "\xEF\xBF\xBD");
}

}  // namespace
