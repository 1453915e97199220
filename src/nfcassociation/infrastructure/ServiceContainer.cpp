/**
 * @file ServiceContainer.cpp
 * @brief ServiceContainer implementation
 */

#include "nfcassociation/infrastructure/ServiceContainer.hpp"
#include "shared/config/AppConfig.hpp"

#include <spdlog/spdlog.h>

// Infrastructure
#include "nfcassociation/infrastructure/adapter/MockNfcHardwareAdapter.hpp"
#include "nfcassociation/infrastructure/adapter/PostgresPlaylistSyncAdapter.hpp"
#include "nfcassociation/infrastructure/persistence/PostgresQueryExecutor.hpp"
#include "nfcassociation/infrastructure/repository/InMemoryNfcTagRepository.hpp"
#include "nfcassociation/infrastructure/repository/PostgresNfcTagRepository.hpp"

// Services
#include "nfcassociation/application/service/NfcApplicationService.hpp"
#include "nfcassociation/application/service/NfcEventDispatcher.hpp"
#include "nfcassociation/domain/service/AssociationService.hpp"

namespace nfcassociation::infrastructure {

struct ServiceContainer::Impl {
    std::shared_ptr<persistence::IQueryExecutor> queryExecutor;

    std::shared_ptr<domain::repository::INfcTagRepository> tagRepository;
    std::shared_ptr<domain::port::IPlaylistSyncPort> playlistSync;
    std::shared_ptr<adapter::MockNfcHardwareAdapter> mockHardware;

    std::shared_ptr<domain::service::AssociationService> associationService;
    std::shared_ptr<application::service::NfcEventDispatcher> eventDispatcher;
    std::unique_ptr<application::service::NfcApplicationService> nfcApplicationService;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const shared::config::AppConfig& config) {
    spdlog::info("Initializing NFC association service dependencies...");

    try {
        // Step 1-2: Storage
        if (config.storageBackend == "postgres") {
            impl_->queryExecutor = std::make_shared<persistence::PostgresQueryExecutor>(
                persistence::PostgresQueryExecutor::buildConnInfo(
                    config.dbHost, config.dbPort, config.dbName, config.dbUser, config.dbPassword));

            auto tagRepository = std::make_shared<repository::PostgresNfcTagRepository>(impl_->queryExecutor);
            tagRepository->ensureSchema();
            impl_->tagRepository = tagRepository;
            impl_->playlistSync = std::make_shared<adapter::PostgresPlaylistSyncAdapter>(impl_->queryExecutor);
            spdlog::info("PostgreSQL storage initialized ({}:{}/{})", config.dbHost, config.dbPort, config.dbName);
        } else {
            impl_->tagRepository = std::make_shared<repository::InMemoryNfcTagRepository>();
            spdlog::info("In-memory tag storage initialized");
        }

        // Step 3: Hardware
        impl_->mockHardware = std::make_shared<adapter::MockNfcHardwareAdapter>();
        spdlog::info("NFC hardware adapter: {}", config.hardware);

        // Step 4: Domain service
        impl_->associationService = std::make_shared<domain::service::AssociationService>(
            impl_->tagRepository,
            impl_->playlistSync,
            nullptr,
            static_cast<size_t>(config.sessionHistoryLimit));

        // Step 5: Application service
        impl_->eventDispatcher = std::make_shared<application::service::NfcEventDispatcher>();

        application::service::NfcApplicationService::Options options;
        options.defaultTimeoutSeconds = config.sessionTimeoutSeconds;
        options.maxTimeoutSeconds = config.maxSessionTimeoutSeconds;
        options.cleanupInterval = std::chrono::seconds(config.cleanupIntervalSeconds);

        impl_->nfcApplicationService = std::make_unique<application::service::NfcApplicationService>(
            impl_->mockHardware,
            impl_->associationService,
            impl_->eventDispatcher,
            options);

        spdlog::info("NFC association service dependencies initialized");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Service initialization failed: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (impl_->nfcApplicationService) {
        try {
            impl_->nfcApplicationService->stopSystem();
        } catch (const std::exception& e) {
            spdlog::error("Failed to stop NFC system cleanly: {}", e.what());
        }
    }

    // Reverse dependency order
    impl_->nfcApplicationService.reset();
    impl_->eventDispatcher.reset();
    impl_->associationService.reset();
    impl_->mockHardware.reset();
    impl_->playlistSync.reset();
    impl_->tagRepository.reset();
    impl_->queryExecutor.reset();
}

domain::repository::INfcTagRepository* ServiceContainer::tagRepository() const {
    return impl_->tagRepository.get();
}

domain::port::IPlaylistSyncPort* ServiceContainer::playlistSync() const {
    return impl_->playlistSync.get();
}

domain::service::AssociationService* ServiceContainer::associationService() const {
    return impl_->associationService.get();
}

application::service::NfcEventDispatcher* ServiceContainer::eventDispatcher() const {
    return impl_->eventDispatcher.get();
}

application::service::NfcApplicationService* ServiceContainer::nfcApplicationService() const {
    return impl_->nfcApplicationService.get();
}

adapter::MockNfcHardwareAdapter* ServiceContainer::mockHardware() const {
    return impl_->mockHardware.get();
}

} // namespace nfcassociation::infrastructure
