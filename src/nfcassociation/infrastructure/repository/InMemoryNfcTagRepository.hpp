/**
 * @file InMemoryNfcTagRepository.hpp
 * @brief Process-local NfcTag store
 */

#pragma once

#include "nfcassociation/domain/repository/INfcTagRepository.hpp"
#include <map>
#include <mutex>

namespace nfcassociation::infrastructure::repository {

using namespace nfcassociation::domain::model;
using nfcassociation::domain::repository::INfcTagRepository;

/**
 * @brief Mutex-guarded map keyed by normalized UID, ordered for stable listings
 */
class InMemoryNfcTagRepository : public INfcTagRepository {
public:
    std::optional<NfcTag> findByIdentifier(const TagIdentifier& identifier) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tags_.find(identifier.getUid());
        if (it == tags_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void save(const NfcTag& tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tags_.insert_or_assign(tag.getIdentifier().getUid(), tag);
    }

    std::vector<NfcTag> findByPlaylistId(const std::string& playlistId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<NfcTag> result;
        for (const auto& [uid, tag] : tags_) {
            if (tag.isAssociatedWith(playlistId)) {
                result.push_back(tag);
            }
        }
        return result;
    }

    std::vector<NfcTag> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<NfcTag> result;
        result.reserve(tags_.size());
        for (const auto& [uid, tag] : tags_) {
            result.push_back(tag);
        }
        return result;
    }

    bool deleteByIdentifier(const TagIdentifier& identifier) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return tags_.erase(identifier.getUid()) > 0;
    }

    int count() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(tags_.size());
    }

private:
    std::mutex mutex_;
    std::map<std::string, NfcTag> tags_;
};

} // namespace nfcassociation::infrastructure::repository
