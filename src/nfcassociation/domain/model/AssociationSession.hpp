/**
 * @file AssociationSession.hpp
 * @brief Entity for one time-boxed attempt to bind a tag to a playlist
 */

#pragma once

#include "shared/domain/Entity.hpp"
#include "shared/exception/Exceptions.hpp"
#include "SessionId.hpp"
#include "TagIdentifier.hpp"
#include "AssociationState.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace nfcassociation::domain::model {

/**
 * @brief Association Session Entity
 *
 * Starts in LISTENING and moves exactly once to a terminal state. Expiry is
 * derived from the clock on every query; only the cleanup sweep records it
 * as TIMEOUT.
 */
class AssociationSession : public shared::domain::Entity<SessionId> {
public:
    static constexpr int DEFAULT_TIMEOUT_SECONDS = 60;

private:
    std::string playlistId_;
    AssociationState state_ = AssociationState::LISTENING;
    std::optional<TagIdentifier> detectedTag_;
    std::optional<std::string> conflictPlaylistId_;
    std::optional<std::string> errorMessage_;
    TimePoint startedAt_;
    int timeoutSeconds_;
    bool overrideMode_;
    std::optional<TimePoint> completedAt_;

    AssociationSession(SessionId id, std::string playlistId, TimePoint startedAt,
                       int timeoutSeconds, bool overrideMode)
        : Entity(std::move(id), startedAt),
          playlistId_(std::move(playlistId)),
          startedAt_(startedAt),
          timeoutSeconds_(timeoutSeconds),
          overrideMode_(overrideMode) {}

    void transitionTo(AssociationState next, TimePoint at) {
        if (!isValidTransition(state_, next)) {
            throw shared::exception::DomainException(
                "INVALID_STATE_TRANSITION",
                "Cannot move session " + id_.toString() + " from " +
                toString(state_) + " to " + toString(next)
            );
        }
        state_ = next;
        completedAt_ = at;
        touch(at);
    }

public:
    /**
     * @brief Create a new LISTENING session
     */
    static AssociationSession create(
        std::string playlistId,
        int timeoutSeconds,
        bool overrideMode,
        TimePoint startedAt = Clock::now()
    ) {
        return AssociationSession(SessionId::generate(), std::move(playlistId),
                                  startedAt, timeoutSeconds, overrideMode);
    }

    // Getters
    [[nodiscard]] const SessionId& getSessionId() const noexcept { return id_; }
    [[nodiscard]] const std::string& getPlaylistId() const noexcept { return playlistId_; }
    [[nodiscard]] AssociationState getState() const noexcept { return state_; }
    [[nodiscard]] const std::optional<TagIdentifier>& getDetectedTag() const noexcept { return detectedTag_; }
    [[nodiscard]] const std::optional<std::string>& getConflictPlaylistId() const noexcept { return conflictPlaylistId_; }
    [[nodiscard]] const std::optional<std::string>& getErrorMessage() const noexcept { return errorMessage_; }
    [[nodiscard]] TimePoint getStartedAt() const noexcept { return startedAt_; }
    [[nodiscard]] int getTimeoutSeconds() const noexcept { return timeoutSeconds_; }
    [[nodiscard]] bool isOverrideMode() const noexcept { return overrideMode_; }
    [[nodiscard]] const std::optional<TimePoint>& getCompletedAt() const noexcept { return completedAt_; }

    [[nodiscard]] TimePoint getTimeoutAt() const {
        return startedAt_ + std::chrono::seconds(timeoutSeconds_);
    }

    /**
     * @brief LISTENING and not yet past the deadline
     */
    [[nodiscard]] bool isActive(TimePoint now = Clock::now()) const {
        return state_ == AssociationState::LISTENING && now < getTimeoutAt();
    }

    /**
     * @brief Past the deadline, regardless of state
     */
    [[nodiscard]] bool isExpired(TimePoint now = Clock::now()) const {
        return now >= getTimeoutAt();
    }

    [[nodiscard]] bool isTerminal() const noexcept {
        return model::isTerminal(state_);
    }

    [[nodiscard]] int getRemainingSeconds(TimePoint now = Clock::now()) const {
        if (!isActive(now)) return 0;
        auto left = std::chrono::duration_cast<std::chrono::seconds>(getTimeoutAt() - now);
        return static_cast<int>(left.count());
    }

    // Domain methods

    void markSuccess(const TagIdentifier& tag, TimePoint at = Clock::now()) {
        transitionTo(AssociationState::SUCCESS, at);
        detectedTag_ = tag;
    }

    void markDuplicate(const TagIdentifier& tag, const std::string& conflictPlaylistId,
                       TimePoint at = Clock::now()) {
        transitionTo(AssociationState::DUPLICATE, at);
        detectedTag_ = tag;
        conflictPlaylistId_ = conflictPlaylistId;
    }

    void stop(TimePoint at = Clock::now()) {
        transitionTo(AssociationState::STOPPED, at);
    }

    void markTimeout(TimePoint at = Clock::now()) {
        transitionTo(AssociationState::TIMEOUT, at);
    }

    /**
     * @param tag Tag being processed when the failure happened, if known
     */
    void markError(const std::string& message, const std::optional<TagIdentifier>& tag,
                   TimePoint at = Clock::now()) {
        transitionTo(AssociationState::ERROR, at);
        errorMessage_ = message;
        if (tag) {
            detectedTag_ = tag;
        }
    }
};

} // namespace nfcassociation::domain::model
