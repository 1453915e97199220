/**
 * @file PostgresPlaylistSyncAdapter.hpp
 * @brief Writes tag associations to the playlists table
 */

#pragma once

#include "nfcassociation/domain/port/IPlaylistSyncPort.hpp"
#include "nfcassociation/infrastructure/persistence/IQueryExecutor.hpp"
#include <memory>

namespace nfcassociation::infrastructure::adapter {

/**
 * @brief IPlaylistSyncPort over playlists.nfc_tag_id
 *
 * The playlists table belongs to the playlist subsystem; this adapter only
 * touches its nfc_tag_id column. Database failures surface as SyncError.
 */
class PostgresPlaylistSyncAdapter : public domain::port::IPlaylistSyncPort {
public:
    explicit PostgresPlaylistSyncAdapter(std::shared_ptr<persistence::IQueryExecutor> executor);

    bool updateNfcTagAssociation(const std::string& playlistId, const std::string& tagId) override;
    bool removeNfcTagAssociation(const std::string& tagId) override;
    std::optional<domain::port::PlaylistRef> findByNfcTag(const std::string& tagId) override;

private:
    std::shared_ptr<persistence::IQueryExecutor> executor_;
};

} // namespace nfcassociation::infrastructure::adapter
