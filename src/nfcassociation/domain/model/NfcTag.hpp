/**
 * @file NfcTag.hpp
 * @brief Aggregate Root for a physical NFC tag
 */

#pragma once

#include "shared/domain/AggregateRoot.hpp"
#include "TagIdentifier.hpp"
#include <json/json.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <string>

namespace nfcassociation::domain::model {

/**
 * @brief NFC Tag Aggregate Root
 *
 * Records which playlist the tag is bound to and how often it was seen.
 * The binding is either absent or a non-blank playlist id.
 */
class NfcTag : public shared::domain::AggregateRoot<TagIdentifier> {
private:
    std::optional<std::string> associatedPlaylistId_;
    std::optional<TimePoint> lastDetectedAt_;
    int detectionCount_ = 0;
    Json::Value metadata_{Json::objectValue};

    NfcTag(TagIdentifier identifier, TimePoint createdAt)
        : AggregateRoot(std::move(identifier), createdAt) {}

    static bool isBlank(const std::string& value) {
        return std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isspace(c);
        });
    }

public:
    /**
     * @brief Create a tag seen for the first time
     */
    static NfcTag create(TagIdentifier identifier, TimePoint createdAt = Clock::now()) {
        return NfcTag(std::move(identifier), createdAt);
    }

    /**
     * @brief Reconstruct from persistence
     */
    static NfcTag reconstruct(
        TagIdentifier identifier,
        std::optional<std::string> associatedPlaylistId,
        std::optional<TimePoint> lastDetectedAt,
        int detectionCount,
        Json::Value metadata,
        TimePoint createdAt,
        int version
    ) {
        NfcTag tag(std::move(identifier), createdAt);
        if (associatedPlaylistId && !isBlank(*associatedPlaylistId)) {
            tag.associatedPlaylistId_ = std::move(associatedPlaylistId);
        }
        tag.lastDetectedAt_ = lastDetectedAt;
        tag.detectionCount_ = std::max(0, detectionCount);
        if (metadata.isObject()) {
            tag.metadata_ = std::move(metadata);
        }
        tag.setVersion(version);
        return tag;
    }

    // Getters
    [[nodiscard]] const TagIdentifier& getIdentifier() const noexcept { return id_; }
    [[nodiscard]] const std::optional<std::string>& getAssociatedPlaylistId() const noexcept { return associatedPlaylistId_; }
    [[nodiscard]] const std::optional<TimePoint>& getLastDetectedAt() const noexcept { return lastDetectedAt_; }
    [[nodiscard]] int getDetectionCount() const noexcept { return detectionCount_; }
    [[nodiscard]] const Json::Value& getMetadata() const noexcept { return metadata_; }

    [[nodiscard]] bool isAssociated() const noexcept {
        return associatedPlaylistId_.has_value();
    }

    [[nodiscard]] bool isAssociatedWith(const std::string& playlistId) const {
        return associatedPlaylistId_ && *associatedPlaylistId_ == playlistId;
    }

    // Domain methods

    void markDetected(TimePoint at = Clock::now()) {
        ++detectionCount_;
        lastDetectedAt_ = at;
        incrementVersion(at);
    }

    /**
     * @throws exception::ValidationError if playlistId is blank
     */
    void associateWithPlaylist(const std::string& playlistId, TimePoint at = Clock::now()) {
        if (isBlank(playlistId)) {
            throw exception::ValidationError("Playlist ID must not be empty");
        }
        associatedPlaylistId_ = playlistId;
        incrementVersion(at);
    }

    /**
     * @return The playlist the tag was bound to, if any
     */
    std::optional<std::string> dissociateFromPlaylist(TimePoint at = Clock::now()) {
        auto previous = std::move(associatedPlaylistId_);
        associatedPlaylistId_.reset();
        if (previous) {
            incrementVersion(at);
        }
        return previous;
    }

    void setMetadata(const std::string& key, const Json::Value& value) {
        metadata_[key] = value;
        incrementVersion(Clock::now());
    }
};

} // namespace nfcassociation::domain::model
