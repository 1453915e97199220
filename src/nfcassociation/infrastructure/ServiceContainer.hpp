#pragma once

/**
 * @file ServiceContainer.hpp
 * @brief Owns the object graph of the NFC association service
 */

#include <memory>

namespace shared::config { struct AppConfig; }

namespace nfcassociation::domain::repository { class INfcTagRepository; }
namespace nfcassociation::domain::port { class IPlaylistSyncPort; }
namespace nfcassociation::domain::service { class AssociationService; }
namespace nfcassociation::application::service {
    class NfcApplicationService;
    class NfcEventDispatcher;
}
namespace nfcassociation::infrastructure::adapter { class MockNfcHardwareAdapter; }

namespace nfcassociation::infrastructure {

/**
 * @brief Centralized container for every long-lived component
 *
 * Initialization order:
 * 1. Query executor (postgres storage only)
 * 2. Tag repository and playlist sync adapter
 * 3. Hardware adapter
 * 4. AssociationService
 * 5. Event dispatcher and NfcApplicationService
 */
class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const shared::config::AppConfig& config);

    /**
     * @brief Stop the NFC system and release components (called by the destructor)
     */
    void shutdown();

    domain::repository::INfcTagRepository* tagRepository() const;
    domain::port::IPlaylistSyncPort* playlistSync() const;
    domain::service::AssociationService* associationService() const;
    application::service::NfcEventDispatcher* eventDispatcher() const;
    application::service::NfcApplicationService* nfcApplicationService() const;

    /** @brief Mock reader, null when a real adapter is configured */
    adapter::MockNfcHardwareAdapter* mockHardware() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nfcassociation::infrastructure
