/**
 * @file INfcTagRepository.hpp
 * @brief Repository interface for NfcTag aggregate
 */

#pragma once

#include "../model/NfcTag.hpp"
#include "../model/TagIdentifier.hpp"
#include <optional>
#include <string>
#include <vector>

namespace nfcassociation::domain::repository {

using namespace nfcassociation::domain::model;

/**
 * @brief Repository interface for NfcTag aggregate
 *
 * Source of truth for which playlist a tag believes it is bound to.
 */
class INfcTagRepository {
public:
    virtual ~INfcTagRepository() = default;

    /**
     * @brief Find a tag by its normalized identifier
     */
    virtual std::optional<NfcTag> findByIdentifier(const TagIdentifier& identifier) = 0;

    /**
     * @brief Save or update a tag (upsert)
     */
    virtual void save(const NfcTag& tag) = 0;

    /**
     * @brief Tags currently bound to a playlist
     */
    virtual std::vector<NfcTag> findByPlaylistId(const std::string& playlistId) = 0;

    virtual std::vector<NfcTag> findAll() = 0;

    /**
     * @return true if a tag was removed
     */
    virtual bool deleteByIdentifier(const TagIdentifier& identifier) = 0;

    virtual int count() = 0;
};

} // namespace nfcassociation::domain::repository
