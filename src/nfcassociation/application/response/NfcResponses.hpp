/**
 * @file NfcResponses.hpp
 * @brief Response DTOs for NFC association use cases
 */

#pragma once

#include "nfcassociation/domain/model/AssociationSession.hpp"
#include "nfcassociation/domain/model/NfcTag.hpp"
#include "nfcassociation/domain/port/INfcHardwarePort.hpp"
#include <json/json.h>
#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace nfcassociation::application::response {

using namespace nfcassociation::domain::model;

inline std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

/**
 * @brief Association session as seen by API clients
 */
struct SessionResponse {
    std::string sessionId;
    std::string playlistId;
    std::string state;
    int timeoutSeconds = 0;
    int remainingSeconds = 0;
    bool overrideMode = false;
    std::string startedAt;
    std::string timeoutAt;
    std::optional<std::string> detectedTag;
    std::optional<std::string> conflictPlaylistId;
    std::optional<std::string> errorMessage;

    static SessionResponse fromDomain(const AssociationSession& session,
                                      std::chrono::system_clock::time_point now) {
        SessionResponse response;
        response.sessionId = session.getSessionId().toString();
        response.playlistId = session.getPlaylistId();
        response.state = toString(session.getState());
        response.timeoutSeconds = session.getTimeoutSeconds();
        response.remainingSeconds = session.getRemainingSeconds(now);
        response.overrideMode = session.isOverrideMode();
        response.startedAt = formatTimestamp(session.getStartedAt());
        response.timeoutAt = formatTimestamp(session.getTimeoutAt());
        if (session.getDetectedTag()) {
            response.detectedTag = session.getDetectedTag()->getUid();
        }
        response.conflictPlaylistId = session.getConflictPlaylistId();
        response.errorMessage = session.getErrorMessage();
        return response;
    }

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json;
        json["sessionId"] = sessionId;
        json["playlistId"] = playlistId;
        json["state"] = state;
        json["timeoutSeconds"] = timeoutSeconds;
        json["remainingSeconds"] = remainingSeconds;
        json["overrideMode"] = overrideMode;
        json["startedAt"] = startedAt;
        json["timeoutAt"] = timeoutAt;
        if (detectedTag) json["detectedTag"] = *detectedTag;
        if (conflictPlaylistId) json["conflictPlaylistId"] = *conflictPlaylistId;
        if (errorMessage) json["errorMessage"] = *errorMessage;
        return json;
    }
};

/**
 * @brief Result of startAssociationUseCase
 */
struct StartAssociationResponse {
    SessionResponse session;
    std::string message;

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json = session.toJson();
        json["success"] = true;
        json["message"] = message;
        return json;
    }
};

/**
 * @brief Result of getStatusUseCase
 */
struct NfcStatusResponse {
    std::vector<SessionResponse> activeSessions;
    domain::port::HardwareStatus hardware;
    bool detecting = false;
    bool systemRunning = false;
    bool playlistSyncAvailable = false;

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json;
        Json::Value sessions(Json::arrayValue);
        for (const auto& session : activeSessions) {
            sessions.append(session.toJson());
        }
        json["activeSessions"] = sessions;
        json["activeSessionCount"] = static_cast<int>(activeSessions.size());
        json["hardware"] = hardware.toJson();
        json["detecting"] = detecting;
        json["systemRunning"] = systemRunning;
        json["playlistSyncAvailable"] = playlistSyncAvailable;
        return json;
    }
};

/**
 * @brief Tag record as seen by API clients
 */
struct TagResponse {
    std::string tagId;
    std::optional<std::string> associatedPlaylistId;
    int detectionCount = 0;
    std::optional<std::string> lastDetectedAt;

    static TagResponse fromDomain(const NfcTag& tag) {
        TagResponse response;
        response.tagId = tag.getIdentifier().getUid();
        response.associatedPlaylistId = tag.getAssociatedPlaylistId();
        response.detectionCount = tag.getDetectionCount();
        if (tag.getLastDetectedAt()) {
            response.lastDetectedAt = formatTimestamp(*tag.getLastDetectedAt());
        }
        return response;
    }

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json;
        json["tagId"] = tagId;
        json["associatedPlaylistId"] = associatedPlaylistId ? Json::Value(*associatedPlaylistId)
                                                            : Json::Value(Json::nullValue);
        json["detectionCount"] = detectionCount;
        json["lastDetectedAt"] = lastDetectedAt ? Json::Value(*lastDetectedAt)
                                                : Json::Value(Json::nullValue);
        return json;
    }
};

} // namespace nfcassociation::application::response
