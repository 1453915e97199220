/**
 * @file main.cpp
 * @brief Music box NFC association service entry point
 *
 * Loads configuration, wires the NFC association context and serves the
 * REST API with Drogon.
 */

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include "shared/config/AppConfig.hpp"
#include "shared/logging/Logger.hpp"
#include "nfcassociation/application/service/NfcApplicationService.hpp"
#include "nfcassociation/domain/port/IPlaylistSyncPort.hpp"
#include "nfcassociation/domain/service/AssociationService.hpp"
#include "nfcassociation/infrastructure/ServiceContainer.hpp"
#include "nfcassociation/infrastructure/controller/NfcHandler.hpp"

using namespace drogon;
using namespace nfcassociation;

namespace {

/**
 * @brief Stand-in for the playback coordinator: resolves the playlist bound
 * to a scanned tag
 */
void onPlaybackRequested(infrastructure::ServiceContainer& container, const std::string& uid) {
    try {
        auto tag = domain::model::TagIdentifier::of(uid);

        if (auto* playlistSync = container.playlistSync()) {
            if (auto playlist = playlistSync->findByNfcTag(tag.getUid())) {
                spdlog::info("[Playback] Tag {} starts playlist {} ({})", uid, playlist->id, playlist->title);
                return;
            }
        }
        auto record = container.associationService()->findTag(tag);
        if (record && record->getAssociatedPlaylistId()) {
            spdlog::info("[Playback] Tag {} starts playlist {}", uid, *record->getAssociatedPlaylistId());
        } else {
            spdlog::info("[Playback] Tag {} is not associated with any playlist", uid);
        }
    } catch (const std::exception& e) {
        spdlog::error("[Playback] Lookup for tag {} failed: {}", uid, e.what());
    }
}

} // anonymous namespace

int main() {
    shared::config::AppConfig config;
    try {
        config = shared::config::AppConfig::fromEnvironment();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    shared::logging::Logger::initialize("musicbox-nfc", config.logLevel, config.logFile);

    try {
        config.validate();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    spdlog::info("=================================================");
    spdlog::info("  Music Box NFC Association Service");
    spdlog::info("=================================================");
    spdlog::info("Server port: {}", config.serverPort);
    spdlog::info("Storage: {}", config.storageBackend);
    spdlog::info("Session timeout: {}s (max {}s), cleanup every {}s",
                 config.sessionTimeoutSeconds, config.maxSessionTimeoutSeconds,
                 config.cleanupIntervalSeconds);

    infrastructure::ServiceContainer container;
    if (!container.initialize(config)) {
        return 1;
    }

    auto* nfcService = container.nfcApplicationService();

    nfcService->registerTagDetectedCallback([&container](const std::string& uid) {
        onPlaybackRequested(container, uid);
    });
    nfcService->registerAssociationCallback([](const domain::model::DetectionResult& result) {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        spdlog::info("[Broadcast] nfc_association {}", Json::writeString(writer, result.toJson()));
    });

    try {
        nfcService->startSystem();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to start NFC system: {}", e.what());
        return 1;
    }

    infrastructure::controller::NfcHandler nfcHandler(nfcService, container.mockHardware());
    nfcHandler.registerRoutes(app());

    // Enable CORS
    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
        resp->addHeader("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
    });

    spdlog::info("Starting HTTP server on port {}...", config.serverPort);
    app().addListener("0.0.0.0", static_cast<uint16_t>(config.serverPort))
        .setThreadNum(static_cast<size_t>(config.threadNum))
        .run();

    container.shutdown();
    return 0;
}
