/**
 * @file PostgresPlaylistSyncAdapter.cpp
 * @brief PostgresPlaylistSyncAdapter implementation
 */

#include "nfcassociation/infrastructure/adapter/PostgresPlaylistSyncAdapter.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include <spdlog/spdlog.h>

namespace nfcassociation::infrastructure::adapter {

using domain::exception::SyncError;
using domain::port::PlaylistRef;

PostgresPlaylistSyncAdapter::PostgresPlaylistSyncAdapter(std::shared_ptr<persistence::IQueryExecutor> executor)
    : executor_(std::move(executor)) {
    if (!executor_) {
        throw std::invalid_argument("PostgresPlaylistSyncAdapter: executor cannot be nullptr");
    }
}

bool PostgresPlaylistSyncAdapter::updateNfcTagAssociation(const std::string& playlistId,
                                                          const std::string& tagId) {
    try {
        // A tag lives on at most one playlist
        int updated = executor_->executeCommand(
            "WITH cleared AS ("
            "  UPDATE playlists SET nfc_tag_id = NULL WHERE nfc_tag_id = $1 AND id::text <> $2"
            ") "
            "UPDATE playlists SET nfc_tag_id = $1 WHERE id::text = $2",
            {tagId, playlistId});

        if (updated == 0) {
            spdlog::warn("[PostgresPlaylistSyncAdapter] Playlist {} not found, tag {} not recorded",
                         playlistId, tagId);
            return false;
        }
        spdlog::debug("[PostgresPlaylistSyncAdapter] Playlist {} now references tag {}", playlistId, tagId);
        return true;
    } catch (const shared::exception::InfrastructureException& e) {
        throw SyncError("Failed to record tag " + tagId + " on playlist " + playlistId + ": " + e.getMessage());
    }
}

bool PostgresPlaylistSyncAdapter::removeNfcTagAssociation(const std::string& tagId) {
    try {
        int cleared = executor_->executeCommand(
            "UPDATE playlists SET nfc_tag_id = NULL WHERE nfc_tag_id = $1", {tagId});
        spdlog::debug("[PostgresPlaylistSyncAdapter] Cleared tag {} from {} playlist(s)", tagId, cleared);
        return true;
    } catch (const shared::exception::InfrastructureException& e) {
        throw SyncError("Failed to clear tag " + tagId + ": " + e.getMessage());
    }
}

std::optional<PlaylistRef> PostgresPlaylistSyncAdapter::findByNfcTag(const std::string& tagId) {
    Json::Value rows;
    try {
        rows = executor_->executeQuery(
            "SELECT id::text AS id, title, nfc_tag_id FROM playlists WHERE nfc_tag_id = $1 LIMIT 1",
            {tagId});
    } catch (const shared::exception::InfrastructureException& e) {
        throw SyncError("Failed to look up playlist for tag " + tagId + ": " + e.getMessage());
    }

    if (rows.empty()) {
        return std::nullopt;
    }

    const auto& row = rows[0];
    PlaylistRef ref;
    ref.id = row["id"].asString();
    ref.title = row["title"].isNull() ? "" : row["title"].asString();
    if (!row["nfc_tag_id"].isNull()) {
        ref.nfcTagId = row["nfc_tag_id"].asString();
    }
    return ref;
}

} // namespace nfcassociation::infrastructure::adapter
