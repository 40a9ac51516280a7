#include "conversation_state_machine.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

TEST(ConversationStateTest, StartsIdle) {
    ConversationStateMachine sm;
    EXPECT_EQ(sm.getState(), kConversationStateIdle);
    EXPECT_FALSE(sm.isActive());
}

TEST(ConversationStateTest, NormalLifecycle) {
    ConversationStateMachine sm;
    EXPECT_TRUE(sm.transitionTo(kConversationStateStarting));
    EXPECT_TRUE(sm.isActive());
    EXPECT_TRUE(sm.transitionTo(kConversationStateListening));
    EXPECT_TRUE(sm.transitionTo(kConversationStateMuted));
    EXPECT_TRUE(sm.transitionTo(kConversationStateListening));
    EXPECT_TRUE(sm.transitionTo(kConversationStateStopped));
    EXPECT_FALSE(sm.isActive());

    // 停止后可以重新开始
    EXPECT_TRUE(sm.transitionTo(kConversationStateStarting));
}

TEST(ConversationStateTest, ErrorPathEndsStopped) {
    ConversationStateMachine sm;
    sm.transitionTo(kConversationStateStarting);
    EXPECT_TRUE(sm.transitionTo(kConversationStateError));
    EXPECT_FALSE(sm.isActive());
    EXPECT_FALSE(sm.canTransitionTo(kConversationStateListening));
    EXPECT_TRUE(sm.transitionTo(kConversationStateStopped));
}

TEST(ConversationStateTest, RejectsInvalidTransitions) {
    ConversationStateMachine sm;
    EXPECT_FALSE(sm.transitionTo(kConversationStateListening));
    EXPECT_FALSE(sm.transitionTo(kConversationStateMuted));
    EXPECT_FALSE(sm.transitionTo(kConversationStateError));
    EXPECT_EQ(sm.getState(), kConversationStateIdle);

    sm.transitionTo(kConversationStateStarting);
    EXPECT_FALSE(sm.transitionTo(kConversationStateMuted));
    EXPECT_FALSE(sm.transitionTo(kConversationStateIdle));

    EXPECT_FALSE(ConversationStateMachine::isValidTransition(
        kConversationStateMuted, kConversationStateStarting));
    EXPECT_FALSE(ConversationStateMachine::isValidTransition(
        kConversationStateStopped, kConversationStateListening));
}

TEST(ConversationStateTest, SameStateIsNoop) {
    ConversationStateMachine sm;
    int calls = 0;
    sm.addStateChangeListener([&calls](ConversationState, ConversationState) { calls++; });
    EXPECT_TRUE(sm.transitionTo(kConversationStateIdle));
    EXPECT_EQ(calls, 0);
}

TEST(ConversationStateTest, NotifiesListeners) {
    ConversationStateMachine sm;
    std::vector<std::pair<ConversationState, ConversationState>> seen;
    const int id = sm.addStateChangeListener(
        [&seen](ConversationState from, ConversationState to) {
            seen.emplace_back(from, to);
        });

    sm.transitionTo(kConversationStateStarting);
    sm.transitionTo(kConversationStateListening);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, kConversationStateIdle);
    EXPECT_EQ(seen[1].second, kConversationStateListening);

    sm.removeStateChangeListener(id);
    sm.transitionTo(kConversationStateStopped);
    EXPECT_EQ(seen.size(), 2u);
}

TEST(ConversationStateTest, ListenerMayTransitionAgain) {
    ConversationStateMachine sm;
    sm.addStateChangeListener([&sm](ConversationState, ConversationState to) {
        if (to == kConversationStateError) {
            sm.transitionTo(kConversationStateStopped);
        }
    });
    sm.transitionTo(kConversationStateStarting);
    sm.transitionTo(kConversationStateError);
    EXPECT_EQ(sm.getState(), kConversationStateStopped);
}

TEST(ConversationStateTest, ResetReturnsToIdle) {
    ConversationStateMachine sm;
    sm.transitionTo(kConversationStateStarting);
    sm.reset();
    EXPECT_EQ(sm.getState(), kConversationStateIdle);
}

TEST(ConversationStateTest, Names) {
    EXPECT_STREQ(GetConversationStateName(kConversationStateListening), "Listening");
    EXPECT_STREQ(GetConversationStateName(kConversationStateMuted), "Muted");
    EXPECT_STREQ(GetConversationErrorKindName(kConversationErrorToken), "Token");
}
