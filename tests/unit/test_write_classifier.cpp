#include <string>
#include <gtest/gtest.h>
#include "policy/write_classifier.hpp"

namespace {

using sous::policy::extract_command;
using sous::policy::is_write_command;
using sous::policy::is_write_operation;

TEST(WriteClassifierTest, ReadOnlyCommands) {
    EXPECT_FALSE(is_write_command("ls -la"));
    EXPECT_FALSE(is_write_command("cat README.md | grep sous"));
    EXPECT_FALSE(is_write_command("git status"));
    EXPECT_FALSE(is_write_command("git -C repo log --oneline"));
    EXPECT_FALSE(is_write_command("sed -n 1,10p file.txt"));
    EXPECT_FALSE(is_write_command("npm test"));
    EXPECT_FALSE(is_write_command("ls missing 2>/dev/null"));
}

TEST(WriteClassifierTest, MutatingUtilities) {
    EXPECT_TRUE(is_write_command("rm notes.txt"));
    EXPECT_TRUE(is_write_command("mkdir -p build"));
    EXPECT_TRUE(is_write_command("ls && touch marker"));
    EXPECT_TRUE(is_write_command("echo x | tee out.log"));
    EXPECT_TRUE(is_write_command("/bin/mv a b"));
}

TEST(WriteClassifierTest, RedirectionIsAWrite) {
    EXPECT_TRUE(is_write_command("echo hi > out.txt"));
    EXPECT_TRUE(is_write_command("echo hi >> out.txt"));
}

TEST(WriteClassifierTest, InPlaceEditors) {
    EXPECT_TRUE(is_write_command("sed -i s/a/b/ file.txt"));
    EXPECT_TRUE(is_write_command("sed --in-place=.bak s/a/b/ file.txt"));
    EXPECT_TRUE(is_write_command("perl -pi -e 's/a/b/' file.txt"));
}

TEST(WriteClassifierTest, GitSubcommands) {
    EXPECT_TRUE(is_write_command("git commit -m 'wip'"));
    EXPECT_TRUE(is_write_command("git -C repo push origin main"));
    EXPECT_TRUE(is_write_command("git -c user.name=x cherry-pick abc"));
    EXPECT_FALSE(is_write_command("git diff HEAD~1"));
}

TEST(WriteClassifierTest, PackageInstalls) {
    EXPECT_TRUE(is_write_command("npm install left-pad"));
    EXPECT_TRUE(is_write_command("pip uninstall requests"));
    EXPECT_TRUE(is_write_command("cargo add serde"));
}

TEST(WriteClassifierTest, WrappersAndSubstitutions) {
    EXPECT_TRUE(is_write_command("sudo rm -rf build"));
    EXPECT_TRUE(is_write_command("env FOO=1 touch x"));
    EXPECT_TRUE(is_write_command("echo $(rm x)"));
    EXPECT_TRUE(is_write_command("FOO=bar rm x"));
}

TEST(WriteClassifierTest, ToolLevelDecision) {
    EXPECT_TRUE(is_write_operation("write_file", "{}"));
    EXPECT_TRUE(is_write_operation("delete_file", R"({"path":"a"})"));
    EXPECT_FALSE(is_write_operation("read_file", R"({"path":"a"})"));
    EXPECT_FALSE(is_write_operation("grep", R"({"pattern":"x"})"));
    EXPECT_TRUE(is_write_operation("bash", R"({"command":"rm a"})"));
    EXPECT_FALSE(is_write_operation("bash", R"({"command":"ls"})"));
}

TEST(WriteClassifierTest, UnparseableCommandArgumentsCountAsWrite) {
    EXPECT_TRUE(is_write_operation("bash", "not json"));
    EXPECT_TRUE(is_write_operation("bash", R"({"cmd":"ls"})"));
    EXPECT_FALSE(extract_command("[1,2]").has_value());
    EXPECT_EQ(extract_command(R"({"command":"pwd"})").value_or(""), "pwd");
}

}  // namespace
