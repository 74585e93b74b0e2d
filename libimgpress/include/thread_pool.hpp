/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool running fire-and-forget compression tasks.
 */

#ifndef IMGPRESS_THREAD_POOL_HPP
#define IMGPRESS_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace imgpress {

/**
 * @brief Runs queued tasks on a fixed set of std::jthread workers.
 *
 * @details Tasks return nothing and receive the worker's stop_token. There
 * is no future to carry a failure back: an exception escaping a task is
 * logged on the "pool" tag and counted in failed_tasks(), and the worker
 * carries on with the next task.
 */
class ThreadPool {
public:
    using Task = std::function<void(std::stop_token)>;

    /**
     * @param threads Number of worker threads; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Stops and joins the workers. Tasks still queued are discarded;
     * call wait_idle() first to drain them.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue @p task for a worker.
     * @throws std::runtime_error once request_stop() has been called.
     */
    void enqueue(Task task);

    /**
     * @brief Block until the queue is empty and no task is running.
     */
    void wait_idle();

    /**
     * @brief Drop queued tasks and signal running ones through their stop_token.
     */
    void request_stop();

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

    /// Tasks that ended with an exception since construction.
    [[nodiscard]] std::size_t failed_tasks() const;

private:
    void worker_loop(const std::stop_token& st);
    void finish_task(bool failed);

    mutable std::mutex mutex_;              ///< guards everything below except workers_
    std::condition_variable_any work_cv_;   ///< new task or stop
    std::condition_variable idle_cv_;       ///< a task finished or the queue was dropped
    std::deque<Task> queue_;
    std::size_t running_{0};
    std::size_t failed_{0};
    bool stopping_{false};
    std::vector<std::jthread> workers_;     ///< declared last: joined before the members above die
};

} // namespace imgpress

#endif // IMGPRESS_THREAD_POOL_HPP
