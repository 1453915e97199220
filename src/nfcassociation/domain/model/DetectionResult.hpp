/**
 * @file DetectionResult.hpp
 * @brief Outcome of processing one tag detection
 */

#pragma once

#include "AssociationState.hpp"
#include <json/json.h>
#include <optional>
#include <string>
#include <stdexcept>

namespace nfcassociation::domain::model {

/**
 * @brief What a detection turned into
 */
enum class DetectionAction {
    TAG_DETECTED,           // No active session, plain detection
    ASSOCIATION_SUCCESS,    // Session bound the tag
    DUPLICATE_ASSOCIATION,  // Tag bound elsewhere, override off
    ASSOCIATION_FAILED,     // Tag bound locally, playlist side not updated
    ASSOCIATION_ERROR       // Processing failed, session moved to ERROR
};

inline std::string toString(DetectionAction action) {
    switch (action) {
        case DetectionAction::TAG_DETECTED: return "tag_detected";
        case DetectionAction::ASSOCIATION_SUCCESS: return "association_success";
        case DetectionAction::DUPLICATE_ASSOCIATION: return "duplicate_association";
        case DetectionAction::ASSOCIATION_FAILED: return "association_failed";
        case DetectionAction::ASSOCIATION_ERROR: return "association_error";
        default: throw std::invalid_argument("Unknown DetectionAction");
    }
}

/**
 * @brief Result record delivered to association callbacks
 */
struct DetectionResult {
    DetectionAction action = DetectionAction::TAG_DETECTED;
    std::string tagId;
    std::optional<std::string> sessionId;
    std::optional<std::string> playlistId;
    std::optional<AssociationState> sessionState;
    std::optional<std::string> existingPlaylistId;
    std::optional<std::string> previousPlaylistId;
    std::optional<std::string> associatedPlaylistId;
    std::optional<std::string> errorMessage;
    bool noActiveSessions = false;
    bool playlistSynced = false;

    [[nodiscard]] bool isSuccess() const noexcept {
        return action == DetectionAction::ASSOCIATION_SUCCESS;
    }

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json;
        json["action"] = toString(action);
        json["tagId"] = tagId;
        if (sessionId) json["sessionId"] = *sessionId;
        if (playlistId) json["playlistId"] = *playlistId;
        if (sessionState) json["sessionState"] = toString(*sessionState);
        if (existingPlaylistId) json["existingPlaylistId"] = *existingPlaylistId;
        if (previousPlaylistId) json["previousPlaylistId"] = *previousPlaylistId;
        if (errorMessage) json["errorMessage"] = *errorMessage;

        if (action == DetectionAction::TAG_DETECTED) {
            json["noActiveSessions"] = noActiveSessions;
            json["associatedPlaylistId"] = associatedPlaylistId ? Json::Value(*associatedPlaylistId)
                                                                : Json::Value(Json::nullValue);
        }
        if (action == DetectionAction::ASSOCIATION_SUCCESS ||
            action == DetectionAction::ASSOCIATION_FAILED) {
            json["playlistSynced"] = playlistSynced;
        }
        return json;
    }
};

} // namespace nfcassociation::domain::model
