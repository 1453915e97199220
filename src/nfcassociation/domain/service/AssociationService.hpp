/**
 * @file AssociationService.hpp
 * @brief Domain service binding NFC tags to playlists through sessions
 */

#pragma once

#include "nfcassociation/domain/model/AssociationSession.hpp"
#include "nfcassociation/domain/model/DetectionResult.hpp"
#include "nfcassociation/domain/model/NfcTag.hpp"
#include "nfcassociation/domain/model/SessionId.hpp"
#include "nfcassociation/domain/model/TagIdentifier.hpp"
#include "nfcassociation/domain/port/IPlaylistSyncPort.hpp"
#include "nfcassociation/domain/repository/INfcTagRepository.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nfcassociation::domain::service {

/**
 * @brief Session registry plus the conflict / override policy
 *
 * Two locks:
 * - registryMutex_ guards the session registry and is never held across
 *   repository or playlist-sync calls.
 * - detectionMutex_ serializes read-modify-write of tag records
 *   (processTagDetection, dissociateTag).
 *
 * A detection claims its session (marks it pending) under the registry
 * lock, performs I/O unlocked, then finalizes the transition. Pending
 * sessions stay LISTENING; the sweep and explicit stops leave them alone.
 */
class AssociationService {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using ClockFn = std::function<TimePoint()>;

    static constexpr size_t DEFAULT_HISTORY_LIMIT = 256;

    /**
     * @param tagRepository Tag store (required)
     * @param playlistSync Playlist-side collaborator, may be null
     * @param clock Time source, system_clock::now when empty
     * @param historyLimit Number of terminal sessions kept for findSession
     */
    AssociationService(std::shared_ptr<repository::INfcTagRepository> tagRepository,
                       std::shared_ptr<port::IPlaylistSyncPort> playlistSync,
                       ClockFn clock = nullptr,
                       size_t historyLimit = DEFAULT_HISTORY_LIMIT);

    AssociationService(const AssociationService&) = delete;
    AssociationService& operator=(const AssociationService&) = delete;

    /**
     * @brief Register a new LISTENING session
     * @throws exception::ValidationError blank playlist id or timeout <= 0
     * @throws exception::ConflictError playlist already has an active session
     */
    model::AssociationSession startAssociationSession(
        const std::string& playlistId,
        int timeoutSeconds = model::AssociationSession::DEFAULT_TIMEOUT_SECONDS,
        bool overrideMode = false);

    /**
     * @brief Record a detection and apply it to the selected session
     *
     * The hinted session is used when it is active, otherwise the first
     * active session in creation order. Failures while a session is
     * targeted are captured on the session and reported in the result.
     */
    model::DetectionResult processTagDetection(
        const model::TagIdentifier& tag,
        const std::optional<model::SessionId>& sessionId = std::nullopt);

    /**
     * @return false if unknown, already terminal, or a detection is in flight
     */
    bool stopAssociationSession(const model::SessionId& sessionId);

    /**
     * @brief Move expired LISTENING sessions to TIMEOUT
     *
     * Every registry read below applies the same expiry, so the sweep only
     * matters for sessions nobody looks at.
     * @return Number of sessions timed out by this call
     */
    int cleanupExpiredSessions();

    /**
     * @return false if the tag is unknown
     */
    bool dissociateTag(const model::TagIdentifier& identifier);

    /**
     * @brief Snapshots of the sessions active right now
     */
    [[nodiscard]] std::vector<model::AssociationSession> getActiveSessions();

    [[nodiscard]] bool hasActiveSessions();

    /**
     * @brief Active or retained terminal session, TIMEOUT once past its deadline
     */
    [[nodiscard]] std::optional<model::AssociationSession> findSession(const model::SessionId& sessionId);

    [[nodiscard]] std::optional<model::NfcTag> findTag(const model::TagIdentifier& identifier) const;

    [[nodiscard]] bool hasPlaylistSync() const noexcept { return playlistSync_ != nullptr; }

private:
    struct SessionEntry {
        model::AssociationSession session;
        bool pending = false;
    };

    /** Outcome computed outside the registry lock, applied by finalizeSession */
    struct Outcome {
        model::AssociationState state;
        std::optional<std::string> conflictPlaylistId;
        std::optional<std::string> errorMessage;
    };

    [[nodiscard]] TimePoint now() const;

    std::optional<model::AssociationSession> claimSession(
        const std::optional<model::SessionId>& hint, TimePoint at);

    model::AssociationState finalizeSession(const model::SessionId& sessionId,
                                            const model::TagIdentifier& tag,
                                            const Outcome& outcome,
                                            TimePoint at);

    model::DetectionResult applyToSession(model::NfcTag& tag,
                                          const model::AssociationSession& session,
                                          TimePoint at);

    /** Caller holds registryMutex_ */
    void retire(const std::string& sessionId);

    /** Caller holds registryMutex_; pending sessions are skipped */
    int expireLocked(TimePoint at);

    std::shared_ptr<repository::INfcTagRepository> tagRepository_;
    std::shared_ptr<port::IPlaylistSyncPort> playlistSync_;
    ClockFn clock_;
    size_t historyLimit_;

    std::mutex registryMutex_;
    std::unordered_map<std::string, SessionEntry> sessions_;
    std::vector<std::string> activeOrder_;
    std::deque<std::string> history_;

    std::mutex detectionMutex_;
};

} // namespace nfcassociation::domain::service
