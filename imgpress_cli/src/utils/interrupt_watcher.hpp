#ifndef IMGPRESS_INTERRUPT_WATCHER_HPP
#define IMGPRESS_INTERRUPT_WATCHER_HPP

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <stop_token>
#include <thread>
#include <utility>

/**
 * @brief Delivers SIGINT/SIGTERM to a callback running on an ordinary thread.
 *
 * @details The installed signal handler only stores the signal number in a
 * sig_atomic_t. A watcher thread polls it and invokes the callback, which is
 * therefore free to lock mutexes, log and print. One watcher per process.
 */
class InterruptWatcher {
public:
    using Callback = std::function<void(int)>;

    explicit InterruptWatcher(Callback on_interrupt,
                              const std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50))
        : on_interrupt_(std::move(on_interrupt)) {
        pending_signal_ = 0;
        std::signal(SIGINT, &InterruptWatcher::handle_signal);
        std::signal(SIGTERM, &InterruptWatcher::handle_signal);

        watcher_ = std::jthread([this, poll_interval](const std::stop_token& st) {
            while (!st.stop_requested()) {
                const int sig = pending_signal_;
                if (sig != 0) {
                    pending_signal_ = 0;
                    triggered_.store(true);
                    on_interrupt_(sig);
                }
                std::this_thread::sleep_for(poll_interval);
            }
        });
    }

    ~InterruptWatcher() {
        watcher_.request_stop();
        if (watcher_.joinable()) watcher_.join();
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    /// True once a signal has been handed to the callback.
    [[nodiscard]] bool triggered() const { return triggered_.load(); }

private:
    static void handle_signal(const int sig) {
        pending_signal_ = sig;
    }

    static inline volatile std::sig_atomic_t pending_signal_ = 0;

    Callback on_interrupt_;
    std::atomic<bool> triggered_{false};
    std::jthread watcher_; ///< declared last: stopped before the callback goes away
};

#endif // IMGPRESS_INTERRUPT_WATCHER_HPP
