/**
 * @file IPlaylistSyncPort.hpp
 * @brief Port for the denormalized tag column on the playlist store
 */

#pragma once

#include <optional>
#include <string>

namespace nfcassociation::domain::port {

/**
 * @brief Minimal view of a playlist returned by tag lookups
 */
struct PlaylistRef {
    std::string id;
    std::string title;
    std::optional<std::string> nfcTagId;
};

/**
 * @brief Playlist store collaborator
 *
 * Implementations report failure either through a false return or by
 * throwing exception::SyncError.
 */
class IPlaylistSyncPort {
public:
    virtual ~IPlaylistSyncPort() = default;

    /**
     * @brief Record tagId on the playlist, clearing it from any other playlist
     * @return false if the playlist does not exist or the write failed
     */
    virtual bool updateNfcTagAssociation(const std::string& playlistId, const std::string& tagId) = 0;

    /**
     * @brief Clear tagId from whichever playlist holds it
     * @return false if the write failed
     */
    virtual bool removeNfcTagAssociation(const std::string& tagId) = 0;

    /**
     * @brief Playlist bound to tagId, used by the playback lookup
     */
    virtual std::optional<PlaylistRef> findByNfcTag(const std::string& tagId) = 0;
};

} // namespace nfcassociation::domain::port
