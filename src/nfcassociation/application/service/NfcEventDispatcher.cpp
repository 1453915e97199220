/**
 * @file NfcEventDispatcher.cpp
 * @brief NfcEventDispatcher implementation
 */

#include "nfcassociation/application/service/NfcEventDispatcher.hpp"
#include <spdlog/spdlog.h>

namespace nfcassociation::application::service {

void NfcEventDispatcher::registerTagDetectedCallback(TagDetectedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    tagDetectedCallbacks_.push_back(std::move(callback));
}

void NfcEventDispatcher::registerAssociationCallback(AssociationCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    associationCallbacks_.push_back(std::move(callback));
}

void NfcEventDispatcher::publishTagDetected(const std::string& uid) const {
    std::vector<TagDetectedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = tagDetectedCallbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(uid);
        } catch (const std::exception& e) {
            spdlog::error("[NfcEventDispatcher] Tag detected callback failed for {}: {}", uid, e.what());
        }
    }
}

void NfcEventDispatcher::publishAssociation(const domain::model::DetectionResult& result) const {
    std::vector<AssociationCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = associationCallbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            spdlog::error("[NfcEventDispatcher] Association callback failed ({}): {}",
                          domain::model::toString(result.action), e.what());
        }
    }
}

size_t NfcEventDispatcher::tagDetectedSubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tagDetectedCallbacks_.size();
}

size_t NfcEventDispatcher::associationSubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return associationCallbacks_.size();
}

} // namespace nfcassociation::application::service
