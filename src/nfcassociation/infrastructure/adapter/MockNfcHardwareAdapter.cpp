/**
 * @file MockNfcHardwareAdapter.cpp
 * @brief MockNfcHardwareAdapter implementation
 */

#include "nfcassociation/infrastructure/adapter/MockNfcHardwareAdapter.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include <spdlog/spdlog.h>

namespace nfcassociation::infrastructure::adapter {

using domain::exception::HardwareError;

void MockNfcHardwareAdapter::startDetection() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (startFailure_) {
            throw HardwareError(*startFailure_);
        }
    }
    if (detecting_.exchange(true)) {
        spdlog::debug("[MockNfcHardwareAdapter] Detection already running");
        return;
    }
    spdlog::info("[MockNfcHardwareAdapter] Mock NFC reader started");
}

void MockNfcHardwareAdapter::stopDetection() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopFailure_) {
            throw HardwareError(*stopFailure_);
        }
    }
    if (!detecting_.exchange(false)) {
        return;
    }
    spdlog::info("[MockNfcHardwareAdapter] Mock NFC reader stopped");
}

void MockNfcHardwareAdapter::setTagDetectedCallback(TagDetectedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    tagDetectedCallback_ = std::move(callback);
}

void MockNfcHardwareAdapter::setTagRemovedCallback(TagRemovedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    tagRemovedCallback_ = std::move(callback);
}

domain::port::HardwareStatus MockNfcHardwareAdapter::getHardwareStatus() const {
    domain::port::HardwareStatus status;
    status.available = true;
    status.detecting = detecting_;
    status.hardwareType = "mock";

    std::lock_guard<std::mutex> lock(mutex_);
    status.details["simulatedCount"] = simulatedCount_.load();
    status.details["lastUid"] = lastUid_ ? Json::Value(*lastUid_) : Json::Value(Json::nullValue);
    return status;
}

bool MockNfcHardwareAdapter::simulateTagDetection(const std::string& uid) {
    if (!detecting_) {
        spdlog::warn("[MockNfcHardwareAdapter] Cannot simulate tag {}, reader not running", uid);
        return false;
    }

    TagDetectedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = tagDetectedCallback_;
        lastUid_ = uid;
    }
    ++simulatedCount_;

    spdlog::info("[MockNfcHardwareAdapter] Simulating tag detection: {}", uid);
    if (callback) {
        callback(uid);
    }
    return true;
}

bool MockNfcHardwareAdapter::simulateTagRemoval() {
    if (!detecting_) {
        return false;
    }

    TagRemovedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = tagRemovedCallback_;
    }
    if (callback) {
        callback();
    }
    return true;
}

void MockNfcHardwareAdapter::setStartFailure(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(mutex_);
    startFailure_ = std::move(message);
}

void MockNfcHardwareAdapter::setStopFailure(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(mutex_);
    stopFailure_ = std::move(message);
}

} // namespace nfcassociation::infrastructure::adapter
