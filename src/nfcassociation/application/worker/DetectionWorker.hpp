#pragma once

/**
 * @file DetectionWorker.hpp
 * @brief Single serializing worker for hardware detection events
 */

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace nfcassociation::application::worker {

/**
 * @brief FIFO queue drained by one thread
 *
 * Tasks run in submission order, one at a time. The destructor drains the
 * queue before joining, so accepted work always completes.
 */
class DetectionWorker {
public:
    using Task = std::function<void()>;

    DetectionWorker();
    ~DetectionWorker();

    DetectionWorker(const DetectionWorker&) = delete;
    DetectionWorker& operator=(const DetectionWorker&) = delete;

    /**
     * @brief Queue a task; never blocks on task execution
     * @return false once shutdown has begun
     */
    bool submit(Task task);

    /** @brief Block until the queue is empty and no task is running */
    void waitUntilIdle();

    /** @brief Stop accepting work, finish queued tasks, join the thread */
    void shutdown();

    [[nodiscard]] size_t pendingCount() const;

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable workCv_;
    std::condition_variable idleCv_;
    std::deque<Task> queue_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace nfcassociation::application::worker
