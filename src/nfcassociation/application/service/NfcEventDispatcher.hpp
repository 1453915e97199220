#pragma once

/**
 * @file NfcEventDispatcher.hpp
 * @brief Subscriber lists for playback and association events
 */

#include "nfcassociation/domain/model/DetectionResult.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace nfcassociation::application::service {

/**
 * @brief Owns the two callback lists of the NFC subsystem
 *
 * Constructed by the composition root and injected into the
 * NfcApplicationService. Callbacks run on the publishing thread; a throwing
 * subscriber is logged and skipped.
 */
class NfcEventDispatcher {
public:
    using TagDetectedCallback = std::function<void(const std::string& uid)>;
    using AssociationCallback = std::function<void(const domain::model::DetectionResult& result)>;

    void registerTagDetectedCallback(TagDetectedCallback callback);
    void registerAssociationCallback(AssociationCallback callback);

    /** @brief Notify playback subscribers with the raw hardware UID */
    void publishTagDetected(const std::string& uid) const;

    /** @brief Notify association subscribers */
    void publishAssociation(const domain::model::DetectionResult& result) const;

    [[nodiscard]] size_t tagDetectedSubscriberCount() const;
    [[nodiscard]] size_t associationSubscriberCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<TagDetectedCallback> tagDetectedCallbacks_;
    std::vector<AssociationCallback> associationCallbacks_;
};

} // namespace nfcassociation::application::service
