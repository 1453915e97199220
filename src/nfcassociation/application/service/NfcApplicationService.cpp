/**
 * @file NfcApplicationService.cpp
 * @brief NfcApplicationService implementation
 */

#include "nfcassociation/application/service/NfcApplicationService.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include <spdlog/spdlog.h>

namespace nfcassociation::application::service {

using namespace nfcassociation::domain::model;
using domain::exception::NotFoundError;
using domain::exception::ValidationError;

namespace {

SessionId parseSessionIdOrNotFound(const std::string& sessionId) {
    try {
        return SessionId::of(sessionId);
    } catch (const ValidationError&) {
        throw NotFoundError("Association session not found: " + sessionId);
    }
}

} // anonymous namespace

NfcApplicationService::NfcApplicationService(std::shared_ptr<domain::port::INfcHardwarePort> hardware,
                                             std::shared_ptr<domain::service::AssociationService> associationService,
                                             std::shared_ptr<NfcEventDispatcher> dispatcher,
                                             Options options)
    : hardware_(std::move(hardware)),
      associationService_(std::move(associationService)),
      dispatcher_(std::move(dispatcher)),
      options_(options),
      cleanupScheduler_(options.cleanupInterval) {
    if (!associationService_ || !dispatcher_) {
        throw std::invalid_argument("NfcApplicationService requires an association service and a dispatcher");
    }

    cleanupScheduler_.setCleanupFn([this]() {
        return associationService_->cleanupExpiredSessions();
    });

    if (hardware_) {
        hardware_->setTagDetectedCallback([this](const std::string& uid) { onTagDetected(uid); });
        hardware_->setTagRemovedCallback([this]() { onTagRemoved(); });
    } else {
        spdlog::warn("[NfcApplicationService] No NFC hardware adapter, tag detection disabled");
    }
}

NfcApplicationService::~NfcApplicationService() {
    cleanupScheduler_.stop();
    if (hardware_) {
        hardware_->setTagDetectedCallback(nullptr);
        hardware_->setTagRemovedCallback(nullptr);
    }
}

// --- System lifecycle ---

void NfcApplicationService::startSystem() {
    if (running_) {
        spdlog::debug("[NfcApplicationService] System already running");
        return;
    }

    if (hardware_) {
        hardware_->startDetection();
    }
    cleanupScheduler_.start();
    running_ = true;

    spdlog::info("[NfcApplicationService] NFC system started (cleanup every {} ms)",
                 options_.cleanupInterval.count());
}

void NfcApplicationService::stopSystem() {
    cleanupScheduler_.stop();
    running_ = false;

    if (hardware_) {
        hardware_->stopDetection();
    }
    spdlog::info("[NfcApplicationService] NFC system stopped");
}

// --- Use cases ---

response::StartAssociationResponse NfcApplicationService::startAssociationUseCase(
    const std::string& playlistId,
    std::optional<int> timeoutSeconds,
    bool overrideMode) {

    int timeout = timeoutSeconds.value_or(options_.defaultTimeoutSeconds);
    if (timeout > options_.maxTimeoutSeconds) {
        throw ValidationError("Timeout must not exceed " + std::to_string(options_.maxTimeoutSeconds) +
                              " seconds, got " + std::to_string(timeout));
    }

    auto session = associationService_->startAssociationSession(playlistId, timeout, overrideMode);

    response::StartAssociationResponse response;
    response.session = response::SessionResponse::fromDomain(session, std::chrono::system_clock::now());
    response.message = "Association session started, waiting for a tag";
    return response;
}

bool NfcApplicationService::stopAssociationUseCase(const std::string& sessionId) {
    auto id = parseSessionIdOrNotFound(sessionId);
    if (!associationService_->findSession(id)) {
        throw NotFoundError("Association session not found: " + sessionId);
    }
    return associationService_->stopAssociationSession(id);
}

response::SessionResponse NfcApplicationService::getSessionUseCase(const std::string& sessionId) {
    auto session = associationService_->findSession(parseSessionIdOrNotFound(sessionId));
    if (!session) {
        throw NotFoundError("Association session not found: " + sessionId);
    }
    return response::SessionResponse::fromDomain(*session, std::chrono::system_clock::now());
}

response::NfcStatusResponse NfcApplicationService::getStatusUseCase() {
    response::NfcStatusResponse status;

    auto now = std::chrono::system_clock::now();
    for (const auto& session : associationService_->getActiveSessions()) {
        status.activeSessions.push_back(response::SessionResponse::fromDomain(session, now));
    }

    if (hardware_) {
        status.hardware = hardware_->getHardwareStatus();
        status.detecting = hardware_->isDetecting();
    } else {
        status.hardware.hardwareType = "none";
    }
    status.systemRunning = running_;
    status.playlistSyncAvailable = associationService_->hasPlaylistSync();
    return status;
}

bool NfcApplicationService::dissociateUseCase(const std::string& tagId) {
    auto tag = TagIdentifier::of(tagId);
    if (!associationService_->dissociateTag(tag)) {
        throw NotFoundError("NFC tag not found: " + tag.getUid());
    }
    return true;
}

// --- Subscribers ---

void NfcApplicationService::registerTagDetectedCallback(NfcEventDispatcher::TagDetectedCallback callback) {
    dispatcher_->registerTagDetectedCallback(std::move(callback));
}

void NfcApplicationService::registerAssociationCallback(NfcEventDispatcher::AssociationCallback callback) {
    dispatcher_->registerAssociationCallback(std::move(callback));
}

// --- Hardware events ---

void NfcApplicationService::onTagDetected(const std::string& uid) {
    std::optional<TagIdentifier> tag;
    try {
        tag = TagIdentifier::of(uid);
    } catch (const ValidationError& e) {
        spdlog::warn("[NfcApplicationService] Ignoring invalid tag UID '{}': {}", uid, e.getMessage());
        return;
    }

    // Decided at arrival: processing may end the session before callbacks run
    bool playbackAllowed = !associationService_->hasActiveSessions();

    bool queued = worker_.submit([this, parsed = *tag, uid, playbackAllowed]() {
        processDetection(parsed, uid, playbackAllowed);
    });
    if (!queued) {
        spdlog::warn("[NfcApplicationService] Detection of {} dropped during shutdown", uid);
    }
}

void NfcApplicationService::onTagRemoved() {
    spdlog::debug("[NfcApplicationService] Tag removed");
}

void NfcApplicationService::waitForPendingDetections() {
    worker_.waitUntilIdle();
}

void NfcApplicationService::processDetection(const TagIdentifier& tag,
                                             const std::string& rawUid,
                                             bool playbackAllowed) {
    DetectionResult result;
    try {
        result = associationService_->processTagDetection(tag);
    } catch (const std::exception& e) {
        spdlog::error("[NfcApplicationService] Processing tag {} failed: {}", tag.getUid(), e.what());
        result.action = DetectionAction::ASSOCIATION_ERROR;
        result.tagId = tag.getUid();
        result.errorMessage = e.what();
    }

    dispatcher_->publishAssociation(result);

    if (playbackAllowed) {
        dispatcher_->publishTagDetected(rawUid);
    } else {
        spdlog::info("[NfcApplicationService] Playback suppressed for tag {} (association in progress)",
                     tag.getUid());
    }
}

} // namespace nfcassociation::application::service
