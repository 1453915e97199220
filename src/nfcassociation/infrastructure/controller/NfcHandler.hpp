#pragma once

/**
 * @file NfcHandler.hpp
 * @brief HTTP endpoints of the NFC association service
 */

#include <drogon/drogon.h>
#include <functional>
#include <string>

namespace nfcassociation::application::service {
class NfcApplicationService;
}

namespace nfcassociation::infrastructure::adapter {
class MockNfcHardwareAdapter;
}

namespace nfcassociation::infrastructure::controller {

/**
 * @brief Thin Drogon layer over NfcApplicationService
 *
 * Error mapping: ValidationError 400, NotFoundError 404, ConflictError 409,
 * SyncError 502, HardwareError 503, anything else 500.
 */
class NfcHandler {
public:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    /**
     * @param service Application service (non-owning)
     * @param mockHardware Mock reader for /api/nfc/simulate, may be null (non-owning)
     */
    NfcHandler(application::service::NfcApplicationService* service,
               adapter::MockNfcHardwareAdapter* mockHardware);

    /** @brief Register every route on the Drogon app */
    void registerRoutes(drogon::HttpAppFramework& app);

    /** @brief POST /api/nfc/scan - Start an association session */
    void handleStartScan(const drogon::HttpRequestPtr& req, Callback&& callback);

    /** @brief DELETE /api/nfc/session/{sessionId} - Stop a session */
    void handleStopSession(const drogon::HttpRequestPtr& req, Callback&& callback,
                           const std::string& sessionId);

    /** @brief GET /api/nfc/session/{sessionId} - Session details */
    void handleGetSession(const drogon::HttpRequestPtr& req, Callback&& callback,
                          const std::string& sessionId);

    /** @brief GET /api/nfc/status - Active sessions and reader state */
    void handleStatus(const drogon::HttpRequestPtr& req, Callback&& callback);

    /** @brief DELETE /api/nfc/associate/{tagId} - Remove a tag's association */
    void handleDissociate(const drogon::HttpRequestPtr& req, Callback&& callback,
                          const std::string& tagId);

    /** @brief POST /api/nfc/simulate - Inject a tag through the mock reader */
    void handleSimulate(const drogon::HttpRequestPtr& req, Callback&& callback);

    /** @brief GET /api/health */
    void handleHealth(const drogon::HttpRequestPtr& req, Callback&& callback);

private:
    /** Runs fn and maps layer exceptions to HTTP responses */
    void respond(const std::string& context, Callback& callback,
                 const std::function<drogon::HttpResponsePtr()>& fn);

    application::service::NfcApplicationService* service_;
    adapter::MockNfcHardwareAdapter* mockHardware_;
};

} // namespace nfcassociation::infrastructure::controller
