/**
 * @file MockNfcHardwareAdapter.hpp
 * @brief Reader-less INfcHardwarePort for development and tests
 */

#pragma once

#include "nfcassociation/domain/port/INfcHardwarePort.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace nfcassociation::infrastructure::adapter {

/**
 * @brief Mock NFC reader
 *
 * Tags are injected with simulateTagDetection(); callbacks fire on the
 * caller's thread, as a driver thread would call them.
 */
class MockNfcHardwareAdapter : public domain::port::INfcHardwarePort {
public:
    MockNfcHardwareAdapter() = default;

    void startDetection() override;
    void stopDetection() override;

    void setTagDetectedCallback(TagDetectedCallback callback) override;
    void setTagRemovedCallback(TagRemovedCallback callback) override;

    [[nodiscard]] domain::port::HardwareStatus getHardwareStatus() const override;
    [[nodiscard]] bool isDetecting() const override { return detecting_; }

    /**
     * @brief Fire the tag-detected callback as if uid was read
     * @return false if detection is not running
     */
    bool simulateTagDetection(const std::string& uid);

    /**
     * @brief Fire the tag-removed callback
     * @return false if detection is not running
     */
    bool simulateTagRemoval();

    /**
     * @brief Make the next startDetection/stopDetection calls throw HardwareError
     */
    void setStartFailure(std::optional<std::string> message);
    void setStopFailure(std::optional<std::string> message);

    [[nodiscard]] int getSimulatedCount() const noexcept { return simulatedCount_; }

private:
    mutable std::mutex mutex_;
    TagDetectedCallback tagDetectedCallback_;
    TagRemovedCallback tagRemovedCallback_;
    std::optional<std::string> startFailure_;
    std::optional<std::string> stopFailure_;
    std::optional<std::string> lastUid_;

    std::atomic<bool> detecting_{false};
    std::atomic<int> simulatedCount_{0};
};

} // namespace nfcassociation::infrastructure::adapter
