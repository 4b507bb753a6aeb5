#include <string>
#include <gtest/gtest.h>
#include "session/session_registry.hpp"

namespace {

using sous::core::errors::get_error;
using sous::core::errors::get_value;
using sous::core::errors::is_error;
using sous::session::SessionRegistry;
using sous::session::SessionState;

TEST(SessionRegistryTest, OpenGeneratesIdWhenNoneGiven) {
    SessionRegistry registry;
    auto opened = registry.open_session();
    ASSERT_FALSE(is_error(opened));
    EXPECT_EQ(get_value(opened).rfind("sess-", 0), 0u);

    auto state = registry.state(get_value(opened));
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), SessionState::Idle);
    EXPECT_EQ(registry.session_count(), 1u);
}

TEST(SessionRegistryTest, RejectsDuplicateIds) {
    SessionRegistry registry;
    ASSERT_FALSE(is_error(registry.open_session(std::string("sess-1"))));
    auto again = registry.open_session(std::string("sess-1"));
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "session_exists");
}

TEST(SessionRegistryTest, OneTurnAtATime) {
    SessionRegistry registry;
    ASSERT_FALSE(is_error(registry.open_session(std::string("s"))));
    auto token = registry.begin_turn("s");
    ASSERT_FALSE(is_error(token));
    EXPECT_FALSE(get_value(token)->load());

    auto second = registry.begin_turn("s");
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).code, "turn_in_progress");

    auto ended = registry.end_turn("s");
    ASSERT_FALSE(is_error(ended));
    EXPECT_EQ(get_value(ended), SessionState::Idle);
    EXPECT_FALSE(is_error(registry.begin_turn("s")));
}

TEST(SessionRegistryTest, CancelSetsTokenAndNextTurnStartsFresh) {
    SessionRegistry registry;
    ASSERT_FALSE(is_error(registry.open_session(std::string("s"))));
    auto token = registry.begin_turn("s");
    ASSERT_FALSE(is_error(token));

    auto cancelled = registry.cancel("s");
    ASSERT_FALSE(is_error(cancelled));
    EXPECT_EQ(get_value(cancelled), SessionState::Cancelled);
    EXPECT_TRUE(get_value(token)->load());

    auto next = registry.begin_turn("s");
    ASSERT_FALSE(is_error(next));
    EXPECT_FALSE(get_value(next)->load());
}

TEST(SessionRegistryTest, CancelWithoutRunningTurnFails) {
    SessionRegistry registry;
    ASSERT_FALSE(is_error(registry.open_session(std::string("s"))));
    auto cancelled = registry.cancel("s");
    ASSERT_TRUE(is_error(cancelled));
    EXPECT_EQ(get_error(cancelled).code, "invalid_state_transition");
}

TEST(SessionRegistryTest, ClosedSessionRejectsTurns) {
    SessionRegistry registry;
    ASSERT_FALSE(is_error(registry.open_session(std::string("s"))));
    auto closed = registry.close("s");
    ASSERT_FALSE(is_error(closed));
    EXPECT_EQ(get_value(closed), SessionState::Closed);

    auto turn = registry.begin_turn("s");
    ASSERT_TRUE(is_error(turn));
    EXPECT_EQ(get_error(turn).code, "session_closed");
}

TEST(SessionRegistryTest, UnknownSession) {
    SessionRegistry registry;
    auto state = registry.state("nope");
    ASSERT_TRUE(is_error(state));
    EXPECT_EQ(get_error(state).code, "session_not_found");
    EXPECT_TRUE(is_error(registry.end_turn("nope")));
    EXPECT_TRUE(is_error(registry.cancel_token("nope")));
}

}  // namespace
