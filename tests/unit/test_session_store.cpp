#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "session/session_store.hpp"

namespace {

using sous::core::errors::get_error;
using sous::core::errors::get_value;
using sous::core::errors::is_error;
using sous::protocol::Message;
using sous::protocol::Role;
using sous::protocol::ToolCall;
using sous::session::JsonSessionStore;
using sous::session::SessionSnapshot;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                (".tmp_session_store_" + sous::core::config::random_hex(10));
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

SessionSnapshot make_snapshot(const std::string& id, std::int64_t saved_at_ms) {
    SessionSnapshot snapshot;
    snapshot.session_id = id;
    snapshot.saved_at_ms = saved_at_ms;
    snapshot.mode = "plan";
    snapshot.auto_approve = false;
    snapshot.tool_names = {"bash", "read_file"};
    snapshot.workdir = "/work";
    snapshot.mode_state_json = R"({"current_mode":"plan"})";
    snapshot.stats.turns = 3;
    snapshot.stats.session_prompt_tokens = 1200;
    snapshot.stats.tool_calls_rejected = 1;

    Message assistant;
    assistant.role = Role::Assistant;
    assistant.tool_calls = std::vector<ToolCall>{
        ToolCall{std::nullopt, "call-1", "read_file", R"({"path":"a.txt"})"}};
    snapshot.messages = {Message::system("sys"), Message::user("read a.txt"), assistant,
                         Message::tool_result("call-1", "read_file", "contents")};
    return snapshot;
}

TEST(SessionStoreTest, SavesAndLoadsSnapshot) {
    TempWorkspace workspace;
    JsonSessionStore store(workspace.root() / "sessions");
    ASSERT_FALSE(is_error(store.save_interaction(make_snapshot("sess-abc", 10))));

    auto path = store.session_path("sess-abc");
    ASSERT_FALSE(is_error(path));
    EXPECT_TRUE(std::filesystem::exists(get_value(path)));
    EXPECT_EQ(get_value(path).filename().string(), "session_sess-abc.json");

    auto loaded = store.load_session("sess-abc");
    ASSERT_FALSE(is_error(loaded));
    const auto& snapshot = get_value(loaded);
    EXPECT_EQ(snapshot.mode, "plan");
    EXPECT_EQ(snapshot.tool_names, (std::vector<std::string>{"bash", "read_file"}));
    EXPECT_EQ(snapshot.stats.turns, 3);
    EXPECT_EQ(snapshot.stats.session_prompt_tokens, 1200);
    EXPECT_EQ(snapshot.stats.tool_calls_rejected, 1);
    ASSERT_EQ(snapshot.messages.size(), 4u);
    ASSERT_TRUE(snapshot.messages[2].has_tool_calls());
    EXPECT_EQ(snapshot.messages[2].tool_calls->front().id, "call-1");
    EXPECT_EQ(snapshot.messages[3].tool_call_id.value_or(""), "call-1");
    EXPECT_NE(snapshot.mode_state_json.find("plan"), std::string::npos);
}

TEST(SessionStoreTest, SaveOverwritesSameSession) {
    TempWorkspace workspace;
    JsonSessionStore store(workspace.root());
    auto snapshot = make_snapshot("sess-1", 10);
    ASSERT_FALSE(is_error(store.save_interaction(snapshot)));
    snapshot.messages.push_back(Message::user("more"));
    ASSERT_FALSE(is_error(store.save_interaction(snapshot)));

    auto loaded = store.load_session("sess-1");
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).messages.size(), 5u);
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "session_sess-1.json.tmp"));
}

TEST(SessionStoreTest, FindsLatestBySaveTime) {
    TempWorkspace workspace;
    JsonSessionStore store(workspace.root());
    ASSERT_FALSE(is_error(store.save_interaction(make_snapshot("sess-old", 100))));
    ASSERT_FALSE(is_error(store.save_interaction(make_snapshot("sess-new", 300))));
    ASSERT_FALSE(is_error(store.save_interaction(make_snapshot("sess-mid", 200))));
    {
        std::ofstream junk(workspace.root() / "session_broken.json");
        junk << "{not json";
    }

    auto latest = store.find_latest_session();
    ASSERT_FALSE(is_error(latest));
    EXPECT_EQ(get_value(latest).session_id, "sess-new");
}

TEST(SessionStoreTest, MissingSessionsAreReported) {
    TempWorkspace workspace;
    JsonSessionStore store(workspace.root() / "empty");
    auto latest = store.find_latest_session();
    ASSERT_TRUE(is_error(latest));
    EXPECT_EQ(get_error(latest).code, "session_not_found");

    auto missing = store.load_session("sess-missing");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "session_not_found");
}

TEST(SessionStoreTest, RejectsPathLikeIds) {
    TempWorkspace workspace;
    JsonSessionStore store(workspace.root());
    auto loaded = store.load_session("../etc/passwd");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_session_id");
}

TEST(SessionStoreTest, CorruptFileIsAnError) {
    TempWorkspace workspace;
    {
        std::ofstream out(workspace.root() / "session_bad.json");
        out << R"({"metadata":{}})";
    }
    JsonSessionStore store(workspace.root());
    auto loaded = store.load_session("bad");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "session_corrupt");
}

}  // namespace
