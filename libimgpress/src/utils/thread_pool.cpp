#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <utility>

namespace imgpress {

namespace {

constexpr std::string_view kTag = "pool";

} // namespace

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        queue_.clear();
    }
    work_cv_.notify_all();
    // jthread destructors request stop and join
    workers_.clear();
}

void ThreadPool::enqueue(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("enqueue on a stopped ThreadPool");
        }
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            if (!work_cv_.wait(lock, st, [this] { return stopping_ || !queue_.empty(); })) {
                return; // stop requested on this worker
            }
            if (queue_.empty()) {
                return; // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        bool failed = false;
        try {
            task(st);
        } catch (const std::exception& e) {
            failed = true;
            Logger::log(LogLevel::Error, std::string("Task failed: ") + e.what(), kTag);
        }
        finish_task(failed);
    }
}

void ThreadPool::finish_task(const bool failed) {
    {
        std::lock_guard lock(mutex_);
        --running_;
        if (failed) ++failed_;
    }
    idle_cv_.notify_all();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void ThreadPool::request_stop() {
    std::size_t dropped = 0;
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        dropped = queue_.size();
        queue_.clear();
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    if (dropped > 0) {
        Logger::log(LogLevel::Debug, "Dropped " + std::to_string(dropped) + " queued tasks", kTag);
    }
}

std::size_t ThreadPool::failed_tasks() const {
    std::lock_guard lock(mutex_);
    return failed_;
}

} // namespace imgpress
