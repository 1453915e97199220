#pragma once

/**
 * @file NfcApplicationService.hpp
 * @brief NFC use cases, hardware wiring and the playback-blocking rule
 */

#include "nfcassociation/application/response/NfcResponses.hpp"
#include "nfcassociation/application/service/NfcEventDispatcher.hpp"
#include "nfcassociation/application/worker/DetectionWorker.hpp"
#include "nfcassociation/domain/port/INfcHardwarePort.hpp"
#include "nfcassociation/domain/service/AssociationService.hpp"
#include "nfcassociation/application/worker/SessionCleanupScheduler.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace nfcassociation::application::service {

/**
 * @brief Application service of the NFC association context
 *
 * A hardware detection is handed to the DetectionWorker; the hardware thread
 * only parses the UID and records whether playback is allowed, which is the
 * case when no association session is active at arrival time. Association
 * subscribers see every processed detection, playback subscribers only the
 * ones that arrived while no session was active.
 */
class NfcApplicationService {
public:
    struct Options {
        int defaultTimeoutSeconds = 60;
        int maxTimeoutSeconds = 600;
        std::chrono::milliseconds cleanupInterval = std::chrono::seconds(30);
    };

    /**
     * @param hardware Reader adapter, may be null (association API only)
     * @param associationService Domain service
     * @param dispatcher Subscriber lists shared with the composition root
     */
    NfcApplicationService(std::shared_ptr<domain::port::INfcHardwarePort> hardware,
                          std::shared_ptr<domain::service::AssociationService> associationService,
                          std::shared_ptr<NfcEventDispatcher> dispatcher,
                          Options options);
    ~NfcApplicationService();

    NfcApplicationService(const NfcApplicationService&) = delete;
    NfcApplicationService& operator=(const NfcApplicationService&) = delete;

    // --- System lifecycle ---

    /**
     * @brief Start tag detection and the cleanup sweep
     * @throws exception::HardwareError if the reader cannot start
     */
    void startSystem();

    /**
     * @brief Stop the cleanup sweep and tag detection
     *
     * Queued detections still complete and reach the subscribers.
     * @throws exception::HardwareError if the reader cannot stop
     */
    void stopSystem();

    [[nodiscard]] bool isRunning() const noexcept { return running_; }

    // --- Use cases ---

    /**
     * @throws exception::ValidationError blank playlist or timeout out of range
     * @throws exception::ConflictError playlist already has an active session
     */
    response::StartAssociationResponse startAssociationUseCase(
        const std::string& playlistId,
        std::optional<int> timeoutSeconds = std::nullopt,
        bool overrideMode = false);

    /**
     * @return false if the session had already finished
     * @throws exception::NotFoundError unknown session
     */
    bool stopAssociationUseCase(const std::string& sessionId);

    /**
     * @throws exception::NotFoundError unknown or evicted session
     */
    response::SessionResponse getSessionUseCase(const std::string& sessionId);

    response::NfcStatusResponse getStatusUseCase();

    /**
     * @throws exception::ValidationError malformed tag id
     * @throws exception::NotFoundError tag never seen
     */
    bool dissociateUseCase(const std::string& tagId);

    // --- Subscribers ---

    void registerTagDetectedCallback(NfcEventDispatcher::TagDetectedCallback callback);
    void registerAssociationCallback(NfcEventDispatcher::AssociationCallback callback);

    // --- Hardware events ---

    /**
     * @brief Entry point for the reader thread, never blocks on processing
     */
    void onTagDetected(const std::string& uid);

    void onTagRemoved();

    /** @brief Block until every queued detection has been processed */
    void waitForPendingDetections();

private:
    void processDetection(const domain::model::TagIdentifier& tag,
                          const std::string& rawUid,
                          bool playbackAllowed);

    std::shared_ptr<domain::port::INfcHardwarePort> hardware_;
    std::shared_ptr<domain::service::AssociationService> associationService_;
    std::shared_ptr<NfcEventDispatcher> dispatcher_;
    Options options_;

    std::atomic<bool> running_{false};
    worker::SessionCleanupScheduler cleanupScheduler_;

    // Declared last: destroyed first, draining detections while the
    // collaborators above are still alive
    worker::DetectionWorker worker_;
};

} // namespace nfcassociation::application::service
