/**
 * @file INfcHardwarePort.hpp
 * @brief Port for the NFC reader driver
 */

#pragma once

#include <json/json.h>
#include <functional>
#include <string>

namespace nfcassociation::domain::port {

/**
 * @brief Snapshot of the reader state
 */
struct HardwareStatus {
    bool available = false;
    bool detecting = false;
    std::string hardwareType;
    Json::Value details{Json::objectValue};

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json;
        json["available"] = available;
        json["detecting"] = detecting;
        json["hardwareType"] = hardwareType;
        json["details"] = details;
        return json;
    }
};

/**
 * @brief NFC reader adapter
 *
 * Callbacks are invoked on the adapter's own thread. startDetection and
 * stopDetection are idempotent and throw exception::HardwareError on failure.
 */
class INfcHardwarePort {
public:
    using TagDetectedCallback = std::function<void(const std::string& uid)>;
    using TagRemovedCallback = std::function<void()>;

    virtual ~INfcHardwarePort() = default;

    virtual void startDetection() = 0;
    virtual void stopDetection() = 0;

    virtual void setTagDetectedCallback(TagDetectedCallback callback) = 0;
    virtual void setTagRemovedCallback(TagRemovedCallback callback) = 0;

    [[nodiscard]] virtual HardwareStatus getHardwareStatus() const = 0;
    [[nodiscard]] virtual bool isDetecting() const = 0;
};

} // namespace nfcassociation::domain::port
