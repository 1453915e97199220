/**
 * @file AssociationService.cpp
 * @brief AssociationService implementation
 */

#include "nfcassociation/domain/service/AssociationService.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nfcassociation::domain::service {

using namespace nfcassociation::domain::model;
using exception::ConflictError;
using exception::ValidationError;

namespace {

bool isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
}

} // anonymous namespace

AssociationService::AssociationService(std::shared_ptr<repository::INfcTagRepository> tagRepository,
                                       std::shared_ptr<port::IPlaylistSyncPort> playlistSync,
                                       ClockFn clock,
                                       size_t historyLimit)
    : tagRepository_(std::move(tagRepository)),
      playlistSync_(std::move(playlistSync)),
      clock_(std::move(clock)),
      historyLimit_(historyLimit) {
    if (!tagRepository_) {
        throw std::invalid_argument("AssociationService requires a tag repository");
    }
    if (!playlistSync_) {
        spdlog::warn("[AssociationService] No playlist sync configured, associations stay in the tag store only");
    }
}

AssociationService::TimePoint AssociationService::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

// --- Sessions ---

AssociationSession AssociationService::startAssociationSession(const std::string& playlistId,
                                                               int timeoutSeconds,
                                                               bool overrideMode) {
    if (isBlank(playlistId)) {
        throw ValidationError("Playlist ID is required");
    }
    if (timeoutSeconds <= 0) {
        throw ValidationError("Timeout must be positive, got " + std::to_string(timeoutSeconds));
    }

    auto at = now();
    std::lock_guard<std::mutex> lock(registryMutex_);
    expireLocked(at);

    for (const auto& id : activeOrder_) {
        const auto& entry = sessions_.at(id);
        if (entry.session.getPlaylistId() == playlistId &&
            (entry.pending || entry.session.isActive(at))) {
            throw ConflictError("Association session already active for playlist " + playlistId);
        }
    }

    auto session = AssociationSession::create(playlistId, timeoutSeconds, overrideMode, at);
    std::string id = session.getSessionId().toString();
    sessions_.emplace(id, SessionEntry{session, false});
    activeOrder_.push_back(id);

    spdlog::info("[AssociationService] Started session {} for playlist {} (timeout={}s, override={})",
                 id, playlistId, timeoutSeconds, overrideMode);
    return session;
}

bool AssociationService::stopAssociationSession(const SessionId& sessionId) {
    auto at = now();
    std::lock_guard<std::mutex> lock(registryMutex_);
    expireLocked(at);

    auto it = sessions_.find(sessionId.toString());
    if (it == sessions_.end()) {
        spdlog::debug("[AssociationService] Stop requested for unknown session {}", sessionId.toString());
        return false;
    }
    auto& entry = it->second;
    if (entry.session.isTerminal()) {
        return false;
    }
    if (entry.pending) {
        spdlog::info("[AssociationService] Session {} is processing a detection, stop ignored",
                     sessionId.toString());
        return false;
    }

    entry.session.stop(at);
    retire(it->first);
    spdlog::info("[AssociationService] Stopped session {}", sessionId.toString());
    return true;
}

int AssociationService::cleanupExpiredSessions() {
    auto at = now();
    std::lock_guard<std::mutex> lock(registryMutex_);
    return expireLocked(at);
}

std::vector<AssociationSession> AssociationService::getActiveSessions() {
    auto at = now();
    std::lock_guard<std::mutex> lock(registryMutex_);
    expireLocked(at);

    std::vector<AssociationSession> active;
    for (const auto& id : activeOrder_) {
        const auto& session = sessions_.at(id).session;
        if (session.isActive(at)) {
            active.push_back(session);
        }
    }
    return active;
}

bool AssociationService::hasActiveSessions() {
    auto at = now();
    std::lock_guard<std::mutex> lock(registryMutex_);
    expireLocked(at);
    return std::any_of(activeOrder_.begin(), activeOrder_.end(), [&](const std::string& id) {
        return sessions_.at(id).session.isActive(at);
    });
}

std::optional<AssociationSession> AssociationService::findSession(const SessionId& sessionId) {
    auto at = now();
    std::lock_guard<std::mutex> lock(registryMutex_);
    expireLocked(at);
    auto it = sessions_.find(sessionId.toString());
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.session;
}

void AssociationService::retire(const std::string& sessionId) {
    activeOrder_.erase(std::remove(activeOrder_.begin(), activeOrder_.end(), sessionId),
                       activeOrder_.end());
    history_.push_back(sessionId);
    while (history_.size() > historyLimit_) {
        sessions_.erase(history_.front());
        history_.pop_front();
    }
}

int AssociationService::expireLocked(TimePoint at) {
    std::vector<std::string> expired;
    for (const auto& id : activeOrder_) {
        auto& entry = sessions_.at(id);
        if (!entry.pending &&
            entry.session.getState() == AssociationState::LISTENING &&
            entry.session.isExpired(at)) {
            entry.session.markTimeout(at);
            expired.push_back(id);
        }
    }

    for (const auto& id : expired) {
        retire(id);
        spdlog::info("[AssociationService] Session {} timed out", id);
    }
    return static_cast<int>(expired.size());
}

std::optional<AssociationSession> AssociationService::claimSession(const std::optional<SessionId>& hint,
                                                                   TimePoint at) {
    std::lock_guard<std::mutex> lock(registryMutex_);
    expireLocked(at);

    auto claimable = [&](const SessionEntry& entry) {
        return !entry.pending && entry.session.isActive(at);
    };

    if (hint) {
        auto it = sessions_.find(hint->toString());
        if (it != sessions_.end() && claimable(it->second)) {
            it->second.pending = true;
            return it->second.session;
        }
        spdlog::debug("[AssociationService] Session {} not active, falling back to creation order",
                      hint->toString());
    }

    for (const auto& id : activeOrder_) {
        auto& entry = sessions_.at(id);
        if (claimable(entry)) {
            entry.pending = true;
            return entry.session;
        }
    }
    return std::nullopt;
}

AssociationState AssociationService::finalizeSession(const SessionId& sessionId,
                                                     const TagIdentifier& tag,
                                                     const Outcome& outcome,
                                                     TimePoint at) {
    std::lock_guard<std::mutex> lock(registryMutex_);

    auto it = sessions_.find(sessionId.toString());
    if (it == sessions_.end()) {
        // Claimed sessions are in activeOrder_ and cannot be evicted
        throw shared::exception::DomainException(
            "SESSION_LOST", "Session " + sessionId.toString() + " vanished during processing");
    }
    auto& entry = it->second;
    entry.pending = false;

    switch (outcome.state) {
        case AssociationState::SUCCESS:
            entry.session.markSuccess(tag, at);
            break;
        case AssociationState::DUPLICATE:
            entry.session.markDuplicate(tag, outcome.conflictPlaylistId.value_or(""), at);
            break;
        default:
            entry.session.markError(outcome.errorMessage.value_or("Unknown error"), tag, at);
            break;
    }
    retire(it->first);
    return entry.session.getState();
}

// --- Detections ---

DetectionResult AssociationService::processTagDetection(const TagIdentifier& tag,
                                                        const std::optional<SessionId>& sessionId) {
    std::lock_guard<std::mutex> detectionLock(detectionMutex_);
    auto at = now();

    auto existing = tagRepository_->findByIdentifier(tag);
    NfcTag record = existing ? *existing : NfcTag::create(tag, at);
    record.markDetected(at);

    auto session = claimSession(sessionId, at);
    if (!session) {
        tagRepository_->save(record);
        spdlog::debug("[AssociationService] Tag {} detected with no active session (count={})",
                      tag.getUid(), record.getDetectionCount());

        DetectionResult result;
        result.action = DetectionAction::TAG_DETECTED;
        result.tagId = tag.getUid();
        result.associatedPlaylistId = record.getAssociatedPlaylistId();
        result.noActiveSessions = true;
        return result;
    }

    try {
        return applyToSession(record, *session, at);
    } catch (const std::exception& e) {
        spdlog::error("[AssociationService] Detection of {} failed for session {}: {}",
                      tag.getUid(), session->getSessionId().toString(), e.what());

        auto state = finalizeSession(session->getSessionId(), tag,
                                     Outcome{AssociationState::ERROR, std::nullopt, std::string(e.what())},
                                     at);

        DetectionResult result;
        result.action = DetectionAction::ASSOCIATION_ERROR;
        result.tagId = tag.getUid();
        result.sessionId = session->getSessionId().toString();
        result.playlistId = session->getPlaylistId();
        result.sessionState = state;
        result.errorMessage = e.what();
        return result;
    }
}

DetectionResult AssociationService::applyToSession(NfcTag& tag,
                                                   const AssociationSession& session,
                                                   TimePoint at) {
    const auto& uid = tag.getIdentifier().getUid();
    const auto& playlistId = session.getPlaylistId();

    DetectionResult result;
    result.tagId = uid;
    result.sessionId = session.getSessionId().toString();
    result.playlistId = playlistId;

    auto bound = tag.getAssociatedPlaylistId();
    bool boundElsewhere = bound && *bound != playlistId;

    if (boundElsewhere && !session.isOverrideMode()) {
        tagRepository_->save(tag);
        spdlog::warn("[AssociationService] Tag {} already associated with playlist {}, session {} is DUPLICATE",
                     uid, *bound, *result.sessionId);

        result.action = DetectionAction::DUPLICATE_ASSOCIATION;
        result.existingPlaylistId = bound;
        result.sessionState = finalizeSession(session.getSessionId(), tag.getIdentifier(),
                                              Outcome{AssociationState::DUPLICATE, bound, std::nullopt},
                                              at);
        return result;
    }

    if (boundElsewhere) {
        spdlog::warn("[AssociationService] Override: moving tag {} from playlist {} to {}",
                     uid, *bound, playlistId);
        result.previousPlaylistId = tag.dissociateFromPlaylist(at);
    }
    tag.associateWithPlaylist(playlistId, at);
    tagRepository_->save(tag);

    std::optional<std::string> syncFailure;
    if (playlistSync_) {
        try {
            if (result.previousPlaylistId && !playlistSync_->removeNfcTagAssociation(uid)) {
                spdlog::warn("[AssociationService] Could not clear tag {} from playlist {}",
                             uid, *result.previousPlaylistId);
            }
            if (playlistSync_->updateNfcTagAssociation(playlistId, uid)) {
                result.playlistSynced = true;
            } else {
                syncFailure = "Playlist sync failed for tag " + uid + " -> playlist " + playlistId;
            }
        } catch (const shared::exception::InfrastructureException& e) {
            syncFailure = "Playlist sync failed: " + e.getMessage();
        }
    } else {
        spdlog::warn("[AssociationService] Playlist sync not available, association of {} kept in tag store only",
                     uid);
    }

    if (syncFailure) {
        spdlog::error("[AssociationService] {}", *syncFailure);
        result.action = DetectionAction::ASSOCIATION_FAILED;
        result.errorMessage = syncFailure;
        result.sessionState = finalizeSession(session.getSessionId(), tag.getIdentifier(),
                                              Outcome{AssociationState::ERROR, std::nullopt, syncFailure},
                                              at);
        return result;
    }

    spdlog::info("[AssociationService] Associated tag {} with playlist {} (session {})",
                 uid, playlistId, *result.sessionId);
    result.action = DetectionAction::ASSOCIATION_SUCCESS;
    result.sessionState = finalizeSession(session.getSessionId(), tag.getIdentifier(),
                                          Outcome{AssociationState::SUCCESS, std::nullopt, std::nullopt},
                                          at);
    return result;
}

// --- Tags ---

bool AssociationService::dissociateTag(const TagIdentifier& identifier) {
    std::lock_guard<std::mutex> detectionLock(detectionMutex_);

    auto tag = tagRepository_->findByIdentifier(identifier);
    if (!tag) {
        return false;
    }

    auto previous = tag->dissociateFromPlaylist(now());
    tagRepository_->save(*tag);

    if (playlistSync_ && previous) {
        try {
            if (!playlistSync_->removeNfcTagAssociation(identifier.getUid())) {
                spdlog::warn("[AssociationService] Playlist side still references tag {}", identifier.getUid());
            }
        } catch (const shared::exception::InfrastructureException& e) {
            spdlog::warn("[AssociationService] Could not clear tag {} on playlist side: {}",
                         identifier.getUid(), e.getMessage());
        }
    }

    spdlog::info("[AssociationService] Dissociated tag {} from playlist {}",
                 identifier.getUid(), previous.value_or("none"));
    return true;
}

std::optional<NfcTag> AssociationService::findTag(const TagIdentifier& identifier) const {
    return tagRepository_->findByIdentifier(identifier);
}

} // namespace nfcassociation::domain::service
