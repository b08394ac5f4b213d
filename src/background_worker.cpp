#include "background_worker.h"
#include "logger.h"
#include <chrono>
#include <exception>

namespace parley {

BackgroundWorker::BackgroundWorker(const std::string& name) : name_(name) {
    thread_ = std::thread(&BackgroundWorker::run, this);
    Logger::debug("Background worker started: " + name_);
}

BackgroundWorker::~BackgroundWorker() {
    shutdown();
}

bool BackgroundWorker::post(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    job_cv_.notify_one();
    return true;
}

bool BackgroundWorker::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto idle = [this] { return jobs_.empty() && !busy_; };
    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void BackgroundWorker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ && !thread_.joinable()) {
            return;
        }
        shutdown_ = true;
        if (!jobs_.empty()) {
            Logger::debug("Background worker " + name_ + " dropping " +
                          std::to_string(jobs_.size()) + " queued job(s)");
            jobs_.clear();
        }
    }
    job_cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

size_t BackgroundWorker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size() + (busy_ ? 1 : 0);
}

void BackgroundWorker::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_cv_.wait(lock, [this] { return shutdown_ || !jobs_.empty(); });
            if (shutdown_) break;
            job = std::move(jobs_.front());
            jobs_.pop_front();
            busy_ = true;
        }

        try {
            job();
        } catch (const std::exception& e) {
            Logger::error("Background job on " + name_ + " threw: " + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_ = false;
    }
    idle_cv_.notify_all();
}

} // namespace parley
