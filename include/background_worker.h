#pragma once

#include <string>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <atomic>

namespace parley {

/**
 * @brief Single thread that runs queued jobs in order
 *
 * Used for work that must stay off the turn path: session compression and
 * index rebuilds. Jobs still queued at shutdown are dropped.
 */
class BackgroundWorker {
public:
    using Job = std::function<void()>;

    explicit BackgroundWorker(const std::string& name);
    ~BackgroundWorker();

    // Non-copyable
    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    /// Queue a job; false after shutdown()
    bool post(Job job);

    /**
     * @brief Block until the queue is empty and no job is running
     * @param timeout_ms 0 = wait indefinitely
     * @return false on timeout
     */
    bool wait_idle(int timeout_ms = 0);

    /// Stop accepting jobs, finish the running one and join the thread
    void shutdown();

    size_t pending() const;

private:
    void run();

    std::string name_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable job_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    bool busy_ = false;
    std::atomic<bool> shutdown_{false};
};

} // namespace parley
