#include <toolsrv/core/worker_pool.hpp>

#include <toolsrv/core/log.hpp>

#include <exception>

namespace toolsrv {

WorkerPool::WorkerPool(std::size_t threads, std::string name)
    : name_(std::move(name)) {
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

bool WorkerPool::Post(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

std::size_t WorkerPool::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void WorkerPool::WorkerLoop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        try {
            job();
        } catch (const std::exception& e) {
            LogError(name_, std::string("worker job threw: ") + e.what());
        } catch (...) {
            LogError(name_, "worker job threw a non-standard exception");
        }
    }
}

} // namespace toolsrv
