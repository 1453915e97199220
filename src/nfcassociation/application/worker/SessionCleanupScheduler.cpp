/**
 * @file SessionCleanupScheduler.cpp
 * @brief SessionCleanupScheduler implementation
 */

#include "nfcassociation/application/worker/SessionCleanupScheduler.hpp"
#include <spdlog/spdlog.h>

namespace nfcassociation::application::worker {

SessionCleanupScheduler::SessionCleanupScheduler(std::chrono::milliseconds interval)
    : interval_(interval) {}

SessionCleanupScheduler::~SessionCleanupScheduler() {
    stop();
}

void SessionCleanupScheduler::setCleanupFn(CleanupFn fn) {
    cleanupFn_ = std::move(fn);
}

void SessionCleanupScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    thread_ = std::thread([this]() {
        spdlog::info("[SessionCleanupScheduler] Started (interval {} ms)", interval_.count());

        while (running_) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, interval_, [this]() { return !running_; });
            }
            if (!running_) break;

            try {
                int cleaned = cleanupFn_ ? cleanupFn_() : 0;
                if (cleaned > 0) {
                    spdlog::info("[SessionCleanupScheduler] Cleaned up {} expired session(s)", cleaned);
                }
            } catch (const std::exception& e) {
                spdlog::error("[SessionCleanupScheduler] Cleanup failed: {}", e.what());
            }
            ++iterations_;
        }

        spdlog::info("[SessionCleanupScheduler] Stopped");
    });
}

void SessionCleanupScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace nfcassociation::application::worker
