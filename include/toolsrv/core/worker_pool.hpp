#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace toolsrv {

// ---------------------------------------------------------------------------
// WorkerPool: fixed number of threads draining a FIFO job queue.
//
// Jobs that throw are logged and discarded; the worker keeps running.
// Shutdown() lets queued jobs finish, then joins. Post() after shutdown
// returns false.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    using Job = std::function<void()>;

    WorkerPool(std::size_t threads, std::string name);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool Post(Job job);
    void Shutdown();

    [[nodiscard]] std::size_t Size() const noexcept { return workers_.size(); }
    [[nodiscard]] std::size_t Pending() const;

private:
    void WorkerLoop();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Job> jobs_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace toolsrv
