/**
 * @file PostgresNfcTagRepository.hpp
 * @brief PostgreSQL implementation of INfcTagRepository
 */

#pragma once

#include "nfcassociation/domain/repository/INfcTagRepository.hpp"
#include "nfcassociation/infrastructure/persistence/IQueryExecutor.hpp"
#include <memory>

namespace nfcassociation::infrastructure::repository {

using namespace nfcassociation::domain::model;
using nfcassociation::domain::repository::INfcTagRepository;

/**
 * @brief nfc_tag table access
 *
 * Timestamps are stored as epoch milliseconds (BIGINT), metadata as JSONB.
 */
class PostgresNfcTagRepository : public INfcTagRepository {
public:
    explicit PostgresNfcTagRepository(std::shared_ptr<persistence::IQueryExecutor> executor);

    /**
     * @brief Create the nfc_tag table and its playlist index if missing
     */
    void ensureSchema();

    std::optional<NfcTag> findByIdentifier(const TagIdentifier& identifier) override;
    void save(const NfcTag& tag) override;
    std::vector<NfcTag> findByPlaylistId(const std::string& playlistId) override;
    std::vector<NfcTag> findAll() override;
    bool deleteByIdentifier(const TagIdentifier& identifier) override;
    int count() override;

private:
    static NfcTag mapRowToTag(const Json::Value& row);

    std::shared_ptr<persistence::IQueryExecutor> executor_;
};

} // namespace nfcassociation::infrastructure::repository
