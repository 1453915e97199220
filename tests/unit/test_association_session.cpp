/**
 * @file test_association_session.cpp
 * @brief Unit tests for the AssociationSession state machine
 */

#include <gtest/gtest.h>
#include "nfcassociation/domain/model/AssociationSession.hpp"

using namespace nfcassociation::domain::model;
using namespace std::chrono_literals;

namespace {

class AssociationSessionTest : public ::testing::Test {
protected:
    std::chrono::system_clock::time_point t0_ =
        std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));

    AssociationSession makeSession(int timeoutSeconds = 60, bool overrideMode = false) {
        return AssociationSession::create("p1", timeoutSeconds, overrideMode, t0_);
    }
};

// --- Creation ---

TEST_F(AssociationSessionTest, StartsListening) {
    auto session = makeSession();

    EXPECT_EQ(session.getState(), AssociationState::LISTENING);
    EXPECT_EQ(session.getPlaylistId(), "p1");
    EXPECT_EQ(session.getTimeoutSeconds(), 60);
    EXPECT_FALSE(session.isOverrideMode());
    EXPECT_FALSE(session.getDetectedTag().has_value());
    EXPECT_FALSE(session.getCompletedAt().has_value());
    EXPECT_EQ(session.getTimeoutAt(), t0_ + 60s);
}

TEST_F(AssociationSessionTest, GeneratesDistinctIds) {
    auto a = makeSession();
    auto b = makeSession();
    EXPECT_NE(a.getSessionId(), b.getSessionId());
    EXPECT_EQ(a.getSessionId().toString().length(), 36u);
}

// --- Liveness ---

TEST_F(AssociationSessionTest, IsActiveUntilDeadline) {
    auto session = makeSession(60);

    EXPECT_TRUE(session.isActive(t0_));
    EXPECT_TRUE(session.isActive(t0_ + 59s));
    EXPECT_FALSE(session.isActive(t0_ + 60s));
    EXPECT_FALSE(session.isActive(t0_ + 61s));
}

TEST_F(AssociationSessionTest, IsExpiredRegardlessOfState) {
    auto session = makeSession(10);
    session.stop(t0_ + 1s);

    EXPECT_FALSE(session.isExpired(t0_ + 9s));
    EXPECT_TRUE(session.isExpired(t0_ + 10s));
}

TEST_F(AssociationSessionTest, TerminalSessionIsNeverActive) {
    auto session = makeSession(60);
    session.markSuccess(TagIdentifier::of("04f7eda4df6181"), t0_ + 1s);

    EXPECT_FALSE(session.isActive(t0_ + 2s));
    EXPECT_EQ(session.getRemainingSeconds(t0_ + 2s), 0);
}

TEST_F(AssociationSessionTest, RemainingSecondsCountsDown) {
    auto session = makeSession(60);
    EXPECT_EQ(session.getRemainingSeconds(t0_ + 15s), 45);
    EXPECT_EQ(session.getRemainingSeconds(t0_ + 75s), 0);
}

// --- Transitions ---

TEST_F(AssociationSessionTest, MarkSuccessRecordsTag) {
    auto session = makeSession();
    auto tag = TagIdentifier::of("04f7eda4df6181");

    session.markSuccess(tag, t0_ + 5s);

    EXPECT_EQ(session.getState(), AssociationState::SUCCESS);
    ASSERT_TRUE(session.getDetectedTag().has_value());
    EXPECT_EQ(*session.getDetectedTag(), tag);
    EXPECT_EQ(session.getCompletedAt(), t0_ + 5s);
    EXPECT_TRUE(session.isTerminal());
}

TEST_F(AssociationSessionTest, MarkDuplicateRecordsConflict) {
    auto session = makeSession();
    session.markDuplicate(TagIdentifier::of("04f7eda4df6181"), "p0", t0_ + 1s);

    EXPECT_EQ(session.getState(), AssociationState::DUPLICATE);
    EXPECT_EQ(session.getConflictPlaylistId(), "p0");
    EXPECT_TRUE(session.getDetectedTag().has_value());
}

TEST_F(AssociationSessionTest, MarkErrorRecordsMessage) {
    auto session = makeSession();
    session.markError("disk full", std::nullopt, t0_ + 1s);

    EXPECT_EQ(session.getState(), AssociationState::ERROR);
    EXPECT_EQ(session.getErrorMessage(), "disk full");
    EXPECT_FALSE(session.getDetectedTag().has_value());
}

TEST_F(AssociationSessionTest, StopAndTimeoutAreTerminal) {
    auto stopped = makeSession();
    stopped.stop(t0_ + 1s);
    EXPECT_EQ(stopped.getState(), AssociationState::STOPPED);

    auto timedOut = makeSession();
    timedOut.markTimeout(t0_ + 61s);
    EXPECT_EQ(timedOut.getState(), AssociationState::TIMEOUT);
}

TEST_F(AssociationSessionTest, TerminalStatesRejectFurtherTransitions) {
    auto session = makeSession();
    session.stop(t0_ + 1s);

    EXPECT_THROW(session.markSuccess(TagIdentifier::of("abcd"), t0_ + 2s),
                 shared::exception::DomainException);
    EXPECT_THROW(session.markTimeout(t0_ + 2s), shared::exception::DomainException);
    EXPECT_THROW(session.stop(t0_ + 2s), shared::exception::DomainException);
    EXPECT_EQ(session.getState(), AssociationState::STOPPED);
}

// --- State enum ---

TEST(AssociationStateTest, RoundTripsNames) {
    for (auto state : {AssociationState::LISTENING, AssociationState::SUCCESS,
                       AssociationState::DUPLICATE, AssociationState::STOPPED,
                       AssociationState::TIMEOUT, AssociationState::ERROR,
                       AssociationState::CANCELLED}) {
        EXPECT_EQ(parseAssociationState(toString(state)), state);
    }
    EXPECT_THROW(parseAssociationState("listening"), std::invalid_argument);
}

TEST(AssociationStateTest, OnlyListeningIsNonTerminal) {
    EXPECT_FALSE(isTerminal(AssociationState::LISTENING));
    EXPECT_TRUE(isTerminal(AssociationState::CANCELLED));
    EXPECT_TRUE(isValidTransition(AssociationState::LISTENING, AssociationState::TIMEOUT));
    EXPECT_FALSE(isValidTransition(AssociationState::SUCCESS, AssociationState::ERROR));
    EXPECT_FALSE(isValidTransition(AssociationState::LISTENING, AssociationState::LISTENING));
}

} // namespace
