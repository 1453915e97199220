#pragma once

/**
 * @file SessionCleanupScheduler.hpp
 * @brief Periodic sweep of expired association sessions
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace nfcassociation::application::worker {

/**
 * @brief Runs a cleanup function at a fixed interval on its own thread
 *
 * stop() wakes the thread immediately; an iteration already running is
 * allowed to finish before the join returns.
 */
class SessionCleanupScheduler {
public:
    using CleanupFn = std::function<int()>;

    explicit SessionCleanupScheduler(std::chrono::milliseconds interval = std::chrono::seconds(30));
    ~SessionCleanupScheduler();

    SessionCleanupScheduler(const SessionCleanupScheduler&) = delete;
    SessionCleanupScheduler& operator=(const SessionCleanupScheduler&) = delete;

    /** @brief Set the sweep callback, returns the number of sessions cleaned */
    void setCleanupFn(CleanupFn fn);

    /** @brief Start the sweep thread (no-op if already running) */
    void start();

    /** @brief Stop the sweep thread and join it */
    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return running_; }

    /** @brief Number of completed sweep iterations since construction */
    [[nodiscard]] int getIterationCount() const noexcept { return iterations_; }

private:
    std::chrono::milliseconds interval_;
    CleanupFn cleanupFn_;

    std::atomic<bool> running_{false};
    std::atomic<int> iterations_{0};

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace nfcassociation::application::worker
