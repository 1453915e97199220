/**
 * @file NfcHandler.cpp
 * @brief NfcHandler implementation
 */

#include "nfcassociation/infrastructure/controller/NfcHandler.hpp"
#include "nfcassociation/application/service/NfcApplicationService.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include "nfcassociation/infrastructure/adapter/MockNfcHardwareAdapter.hpp"
#include <spdlog/spdlog.h>
#include <optional>

using namespace drogon;

namespace nfcassociation::infrastructure::controller {

using namespace nfcassociation::domain::exception;

namespace {

HttpResponsePtr jsonResponse(const Json::Value& body, HttpStatusCode status = k200OK) {
    auto resp = HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(status);
    return resp;
}

HttpResponsePtr errorResponse(const shared::exception::BaseException& e, HttpStatusCode status) {
    return jsonResponse(e.toJson(), status);
}

/**
 * Accepts timeoutSeconds, or timeoutMs rounded up to whole seconds
 */
std::optional<int> readTimeoutSeconds(const Json::Value& body) {
    if (body.isMember("timeoutSeconds")) {
        if (!body["timeoutSeconds"].isInt()) {
            throw ValidationError("timeoutSeconds must be an integer");
        }
        return body["timeoutSeconds"].asInt();
    }
    if (body.isMember("timeoutMs")) {
        if (!body["timeoutMs"].isInt()) {
            throw ValidationError("timeoutMs must be an integer");
        }
        int ms = body["timeoutMs"].asInt();
        return ms <= 0 ? ms : (ms + 999) / 1000;
    }
    return std::nullopt;
}

std::string readPlaylistId(const Json::Value& body) {
    const Json::Value& value = body.isMember("playlistId") ? body["playlistId"] : body["playlist_id"];
    if (!value.isString()) {
        throw ValidationError("playlistId is required");
    }
    return value.asString();
}

} // anonymous namespace

NfcHandler::NfcHandler(application::service::NfcApplicationService* service,
                       adapter::MockNfcHardwareAdapter* mockHardware)
    : service_(service), mockHardware_(mockHardware) {}

void NfcHandler::registerRoutes(HttpAppFramework& app) {
    app.registerHandler("/api/nfc/scan",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            handleStartScan(req, std::move(callback));
        }, {Post});
    app.registerHandler("/api/nfc/session/{sessionId}",
        [this](const HttpRequestPtr& req, Callback&& callback, const std::string& sessionId) {
            handleStopSession(req, std::move(callback), sessionId);
        }, {Delete});
    app.registerHandler("/api/nfc/session/{sessionId}",
        [this](const HttpRequestPtr& req, Callback&& callback, const std::string& sessionId) {
            handleGetSession(req, std::move(callback), sessionId);
        }, {Get});
    app.registerHandler("/api/nfc/status",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            handleStatus(req, std::move(callback));
        }, {Get});
    app.registerHandler("/api/nfc/associate/{tagId}",
        [this](const HttpRequestPtr& req, Callback&& callback, const std::string& tagId) {
            handleDissociate(req, std::move(callback), tagId);
        }, {Delete});
    app.registerHandler("/api/nfc/simulate",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            handleSimulate(req, std::move(callback));
        }, {Post});
    app.registerHandler("/api/health",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            handleHealth(req, std::move(callback));
        }, {Get});

    spdlog::info("[NfcHandler] Routes registered under /api/nfc");
}

void NfcHandler::respond(const std::string& context, Callback& callback,
                         const std::function<HttpResponsePtr()>& fn) {
    try {
        callback(fn());
    } catch (const ValidationError& e) {
        callback(errorResponse(e, k400BadRequest));
    } catch (const NotFoundError& e) {
        callback(errorResponse(e, k404NotFound));
    } catch (const ConflictError& e) {
        callback(errorResponse(e, k409Conflict));
    } catch (const SyncError& e) {
        spdlog::error("[{}] {}", context, e.getMessage());
        callback(errorResponse(e, k502BadGateway));
    } catch (const HardwareError& e) {
        spdlog::error("[{}] {}", context, e.getMessage());
        callback(errorResponse(e, k503ServiceUnavailable));
    } catch (const std::exception& e) {
        spdlog::error("[{}] {}", context, e.what());
        Json::Value body;
        body["success"] = false;
        body["error"] = "Internal server error";
        callback(jsonResponse(body, k500InternalServerError));
    }
}

void NfcHandler::handleStartScan(const HttpRequestPtr& req, Callback&& callback) {
    spdlog::info("POST /api/nfc/scan");
    respond("NfcHandler::startScan", callback, [&]() {
        auto body = req->getJsonObject();
        if (!body) {
            throw ValidationError("Request body must be a JSON object");
        }

        auto response = service_->startAssociationUseCase(
            readPlaylistId(*body),
            readTimeoutSeconds(*body),
            body->get("overrideMode", body->get("override_mode", false)).asBool());

        return jsonResponse(response.toJson());
    });
}

void NfcHandler::handleStopSession(const HttpRequestPtr&, Callback&& callback,
                                   const std::string& sessionId) {
    spdlog::info("DELETE /api/nfc/session/{}", sessionId);
    respond("NfcHandler::stopSession", callback, [&]() {
        bool stopped = service_->stopAssociationUseCase(sessionId);

        Json::Value body;
        body["success"] = true;
        body["sessionId"] = sessionId;
        body["stopped"] = stopped;
        body["message"] = stopped ? "Association session stopped" : "Association session already finished";
        return jsonResponse(body);
    });
}

void NfcHandler::handleGetSession(const HttpRequestPtr&, Callback&& callback,
                                  const std::string& sessionId) {
    respond("NfcHandler::getSession", callback, [&]() {
        return jsonResponse(service_->getSessionUseCase(sessionId).toJson());
    });
}

void NfcHandler::handleStatus(const HttpRequestPtr&, Callback&& callback) {
    respond("NfcHandler::status", callback, [&]() {
        return jsonResponse(service_->getStatusUseCase().toJson());
    });
}

void NfcHandler::handleDissociate(const HttpRequestPtr&, Callback&& callback,
                                  const std::string& tagId) {
    spdlog::info("DELETE /api/nfc/associate/{}", tagId);
    respond("NfcHandler::dissociate", callback, [&]() {
        service_->dissociateUseCase(tagId);

        Json::Value body;
        body["success"] = true;
        body["tagId"] = tagId;
        body["message"] = "Tag association removed";
        return jsonResponse(body);
    });
}

void NfcHandler::handleSimulate(const HttpRequestPtr& req, Callback&& callback) {
    respond("NfcHandler::simulate", callback, [&]() {
        if (!mockHardware_) {
            throw HardwareError("Tag simulation requires the mock NFC reader");
        }
        auto body = req->getJsonObject();
        if (!body || !(*body)["tagId"].isString()) {
            throw ValidationError("tagId is required");
        }

        std::string tagId = (*body)["tagId"].asString();
        if (!mockHardware_->simulateTagDetection(tagId)) {
            throw HardwareError("NFC reader is not running");
        }

        Json::Value result;
        result["success"] = true;
        result["tagId"] = tagId;
        result["message"] = "Tag detection queued";
        return jsonResponse(result, k202Accepted);
    });
}

void NfcHandler::handleHealth(const HttpRequestPtr&, Callback&& callback) {
    Json::Value response(Json::objectValue);
    response["status"] = service_->isRunning() ? "UP" : "DEGRADED";
    response["service"] = "musicbox-nfc";
    response["timestamp"] = trantor::Date::now().toFormattedString(false);
    callback(jsonResponse(response));
}

} // namespace nfcassociation::infrastructure::controller
