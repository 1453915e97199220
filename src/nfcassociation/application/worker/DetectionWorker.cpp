/**
 * @file DetectionWorker.cpp
 * @brief DetectionWorker implementation
 */

#include "nfcassociation/application/worker/DetectionWorker.hpp"
#include <spdlog/spdlog.h>

namespace nfcassociation::application::worker {

DetectionWorker::DetectionWorker() : thread_([this]() { run(); }) {}

DetectionWorker::~DetectionWorker() {
    shutdown();
}

bool DetectionWorker::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            spdlog::warn("[DetectionWorker] Rejected task, worker is shutting down");
            return false;
        }
        queue_.push_back(std::move(task));
    }
    workCv_.notify_one();
    return true;
}

void DetectionWorker::waitUntilIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [this]() { return queue_.empty() && !busy_; });
}

void DetectionWorker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    workCv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

size_t DetectionWorker::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + (busy_ ? 1 : 0);
}

void DetectionWorker::run() {
    spdlog::debug("[DetectionWorker] Worker thread started");

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            workCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;  // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[DetectionWorker] Task failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idleCv_.notify_all();
    }

    idleCv_.notify_all();
    spdlog::debug("[DetectionWorker] Worker thread stopped");
}

} // namespace nfcassociation::application::worker
