#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "core/config/runtime_config.hpp"
#include "exec/safe_environment.hpp"
#include "exec/secure_executor.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool.hpp"

namespace {

using sous::core::config::default_runtime_config;
using sous::core::config::RuntimeConfig;
using sous::core::errors::get_error;
using sous::core::errors::get_value;
using sous::core::errors::is_error;
using sous::protocol::ToolPermission;
using sous::tools::Tool;
using sous::tools::ToolContext;
using sous::tools::ToolRegistry;
using sous::tools::truncate_output;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::weakly_canonical(
            std::filesystem::temp_directory_path() /
            (".tmp_tools_" + sous::core::config::random_hex(10)));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

class BuiltinToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        RuntimeConfig config = default_runtime_config();
        config.workdir = workspace_.root();
        config.tool_permissions["read_file"] = ToolPermission::Always;
        auto executor = std::make_shared<sous::exec::SecureCommandExecutor>(
            workspace_.root(), config.executor,
            sous::exec::build_safe_environment(
                {{"PATH", "/usr/local/bin:/usr/bin:/bin"},
                 {"HOME", workspace_.root().string()}}));
        ASSERT_FALSE(is_error(sous::tools::register_builtin_tools(registry_, config, executor)));
    }

    Tool& tool(const std::string& name) {
        Tool* found = registry_.find(name);
        EXPECT_NE(found, nullptr) << name;
        return *found;
    }

    TempWorkspace workspace_;
    ToolRegistry registry_;
    ToolContext context_;
};

TEST_F(BuiltinToolsTest, RegistersFiveToolsWithSchemas) {
    EXPECT_EQ(registry_.names(),
              (std::vector<std::string>{"bash", "delete_file", "grep", "read_file", "write_file"}));
    for (const auto& schema : registry_.schemas()) {
        EXPECT_FALSE(schema.description.empty()) << schema.name;
        EXPECT_NE(schema.parameters_json.find("\"type\":\"object\""), std::string::npos);
    }
    EXPECT_EQ(registry_.default_permission("read_file").value_or(ToolPermission::Never),
              ToolPermission::Always);
    EXPECT_FALSE(registry_.default_permission("bash").has_value());
    EXPECT_EQ(registry_.find("apply_patch"), nullptr);
}

TEST_F(BuiltinToolsTest, ValidateRejectsMissingArguments) {
    auto status = tool("write_file").validate(R"({"path":"a.txt"})");
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "invalid_tool_arguments");

    EXPECT_TRUE(is_error(tool("read_file").validate("not json")));
    EXPECT_FALSE(is_error(tool("read_file").validate(R"({"path":"a.txt"})")));

    auto empty_pattern = tool("grep").validate(R"({"pattern":""})");
    ASSERT_TRUE(is_error(empty_pattern));
    EXPECT_EQ(get_error(empty_pattern).code, "empty_search_pattern");
}

TEST_F(BuiltinToolsTest, WriteThenReadRange) {
    auto written = tool("write_file").execute(
        R"({"path":"notes/todo.txt","content":"one\ntwo\nthree\n"})", context_);
    ASSERT_FALSE(is_error(written));
    EXPECT_TRUE(get_value(written).success);
    EXPECT_NE(get_value(written).output.find("Created"), std::string::npos);
    EXPECT_EQ(read_file(workspace_.root() / "notes/todo.txt"), "one\ntwo\nthree\n");

    auto read = tool("read_file").execute(R"({"path":"notes/todo.txt","offset":1,"limit":1})",
                                          context_);
    ASSERT_FALSE(is_error(read));
    EXPECT_TRUE(get_value(read).success);
    EXPECT_EQ(get_value(read).output, "two\n");
}

TEST_F(BuiltinToolsTest, WriteRespectsOverwriteFlag) {
    write_file(workspace_.root() / "keep.txt", "original");
    auto refused = tool("write_file").execute(
        R"({"path":"keep.txt","content":"new","overwrite":false})", context_);
    ASSERT_FALSE(is_error(refused));
    EXPECT_FALSE(get_value(refused).success);
    EXPECT_EQ(read_file(workspace_.root() / "keep.txt"), "original");
}

TEST_F(BuiltinToolsTest, FileToolsStayInsideWorkspace) {
    auto escaped = tool("write_file").execute(
        R"({"path":"../escape.txt","content":"x"})", context_);
    ASSERT_TRUE(is_error(escaped));
    EXPECT_EQ(get_error(escaped).code, "path_outside_workspace");
    EXPECT_FALSE(std::filesystem::exists(workspace_.root().parent_path() / "escape.txt"));
}

TEST_F(BuiltinToolsTest, ReadReportsMissingAndBinaryFiles) {
    auto missing = tool("read_file").execute(R"({"path":"nope.txt"})", context_);
    ASSERT_FALSE(is_error(missing));
    EXPECT_FALSE(get_value(missing).success);
    EXPECT_NE(get_value(missing).error_message.find("does not exist"), std::string::npos);

    write_file(workspace_.root() / "blob.bin", std::string("ab\0cd", 5));
    auto binary = tool("read_file").execute(R"({"path":"blob.bin"})", context_);
    ASSERT_FALSE(is_error(binary));
    EXPECT_FALSE(get_value(binary).success);
}

TEST_F(BuiltinToolsTest, GrepFindsLiteralMatches) {
    write_file(workspace_.root() / "src/a.cpp", "int main() {}\n// sous marker\n");
    write_file(workspace_.root() / ".hidden/b.cpp", "sous marker\n");

    auto found = tool("grep").execute(R"({"pattern":"sous marker"})", context_);
    ASSERT_FALSE(is_error(found));
    EXPECT_TRUE(get_value(found).success);
    EXPECT_EQ(get_value(found).output, "src/a.cpp:2:// sous marker\n");

    auto none = tool("grep").execute(R"({"pattern":"absent text"})", context_);
    ASSERT_FALSE(is_error(none));
    EXPECT_EQ(get_value(none).output, "No matches found.");
}

TEST_F(BuiltinToolsTest, DeleteRemovesRegularFilesOnly) {
    write_file(workspace_.root() / "old.txt", "x");
    auto deleted = tool("delete_file").execute(R"({"path":"old.txt"})", context_);
    ASSERT_FALSE(is_error(deleted));
    EXPECT_TRUE(get_value(deleted).success);
    EXPECT_FALSE(std::filesystem::exists(workspace_.root() / "old.txt"));

    std::filesystem::create_directories(workspace_.root() / "dir");
    auto refused = tool("delete_file").execute(R"({"path":"dir"})", context_);
    ASSERT_FALSE(is_error(refused));
    EXPECT_FALSE(get_value(refused).success);
}

TEST_F(BuiltinToolsTest, BashRunsAndReportsFailures) {
    auto echoed = tool("bash").execute(R"({"command":"echo hello"})", context_);
    ASSERT_FALSE(is_error(echoed));
    EXPECT_TRUE(get_value(echoed).success);
    EXPECT_EQ(get_value(echoed).output, "hello\n");

    auto failed = tool("bash").execute(R"({"command":"ls missing-dir"})", context_);
    ASSERT_FALSE(is_error(failed));
    EXPECT_FALSE(get_value(failed).success);
    EXPECT_NE(get_value(failed).error_message.find("exit code"), std::string::npos);
}

TEST_F(BuiltinToolsTest, BashPermissionComesFromClassifier) {
    EXPECT_EQ(tool("bash").permission(R"({"command":"ls -la"})").value_or(ToolPermission::Ask),
              ToolPermission::Always);
    EXPECT_EQ(tool("bash").permission(R"({"command":"sudo ls"})").value_or(ToolPermission::Ask),
              ToolPermission::Never);
    EXPECT_EQ(tool("bash").permission("garbage").value_or(ToolPermission::Never),
              ToolPermission::Ask);
    EXPECT_FALSE(tool("write_file").permission("{}").has_value());
}

TEST_F(BuiltinToolsTest, BashRejectsUnboundedTimeout) {
    for (const char* args : {R"({"command":"sleep 2","timeout_ms":0})",
                             R"({"command":"sleep 2","timeout_ms":4294967296})",
                             R"({"command":"sleep 2","timeout_ms":-5})",
                             R"({"command":"sleep 2","timeout_ms":"100"})",
                             R"({"command":"sleep 2","timeout_ms":1.5})"}) {
        auto status = tool("bash").validate(args);
        ASSERT_TRUE(is_error(status)) << args;
        EXPECT_EQ(get_error(status).code, "invalid_tool_arguments") << args;
    }
    EXPECT_FALSE(is_error(tool("bash").validate(R"({"command":"ls","timeout_ms":4294967295})")));
    EXPECT_FALSE(is_error(tool("bash").validate(R"({"command":"ls"})")));

    auto ran = tool("bash").execute(R"({"command":"sleep 2","timeout_ms":0})", context_);
    ASSERT_TRUE(is_error(ran));
    EXPECT_EQ(get_error(ran).code, "invalid_tool_arguments");
}

TEST_F(BuiltinToolsTest, NonUtf8TextIsReplaced) {
    write_file(workspace_.root() / "latin1.txt", "caf\xe9 menu\n");

    auto read = tool("read_file").execute(R"({"path":"latin1.txt"})", context_);
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).output, "caf\xEF\xBF\xBD menu\n");

    auto found = tool("grep").execute(R"({"pattern":"menu"})", context_);
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found).output, "latin1.txt:1:caf\xEF\xBF\xBD menu\n");
}

TEST_F(BuiltinToolsTest, ResetRestoresBashDirectory) {
    std::filesystem::create_directories(workspace_.root() / "sub");
    ASSERT_FALSE(is_error(tool("bash").execute(R"({"command":"cd sub"})", context_)));
    auto inside = tool("bash").execute(R"({"command":"pwd"})", context_);
    ASSERT_FALSE(is_error(inside));
    EXPECT_EQ(get_value(inside).output, (workspace_.root() / "sub").string() + "\n");

    registry_.reset_all();
    auto after = tool("bash").execute(R"({"command":"pwd"})", context_);
    ASSERT_FALSE(is_error(after));
    EXPECT_EQ(get_value(after).output, workspace_.root().string() + "\n");
}

TEST(ToolRegistryTest, RejectsDuplicateAndNullTools) {
    ToolRegistry registry;
    const sous::policy::WorkspaceGuard guard(std::filesystem::temp_directory_path());
    ASSERT_FALSE(is_error(
        registry.register_tool(std::make_unique<sous::tools::ReadFileTool>(guard))));
    auto duplicate = registry.register_tool(std::make_unique<sous::tools::ReadFileTool>(guard));
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_tool");

    auto null_tool = registry.register_tool(nullptr);
    ASSERT_TRUE(is_error(null_tool));
    EXPECT_EQ(get_error(null_tool).code, "invalid_tool");
}

TEST(TruncateOutputTest, KeepsShortText) {
    EXPECT_EQ(truncate_output("short", 10), "short");
}

TEST(TruncateOutputTest, CutsOnCharacterBoundary) {
    // "é" is two bytes; a cut after byte 2 would split it.
    const std::string text = "a\xC3\xA9" "bcdef";
    const auto out = truncate_output(text, 2);
    EXPECT_EQ(out.rfind("a\n", 0), 0u);
    EXPECT_NE(out.find("7 bytes omitted"), std::string::npos);
}

}  // namespace
