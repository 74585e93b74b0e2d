/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between BatchExecutor and its observers.
 */

#ifndef IMGPRESS_EVENT_BUS_HPP
#define IMGPRESS_EVENT_BUS_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace imgpress {

/**
 * @brief Delivers events from the worker threads to subscribers.
 *
 * @details Handlers of one bus never run concurrently: publish() holds the
 * bus lock for the whole delivery, so subscribers may keep unsynchronized
 * state (progress counters, the CSV result list). Handlers must not publish
 * on the same bus.
 *
 * Every handler of an event runs even if an earlier one throws; the first
 * exception is rethrown to the publisher once delivery is over.
 */
class EventBus {
public:
    /**
     * @brief Register @p handler for events of type @p Event.
     * @tparam Event Event struct, e.g. FileProcessCompleteEvent.
     * @param handler Callable taking `const Event&`.
     */
    template <typename Event, typename Handler>
    void subscribe(Handler&& handler) {
        std::function<void(const Event&)> typed(std::forward<Handler>(handler));
        std::lock_guard lock(mutex_);
        handlers_[std::type_index(typeid(Event))].emplace_back(
            [typed = std::move(typed)](const void* event) {
                typed(*static_cast<const Event*>(event));
            });
    }

    /**
     * @brief Deliver @p event to every handler subscribed to its type.
     * @throws whatever the first failing handler threw.
     */
    template <typename Event>
    void publish(const Event& event) {
        std::exception_ptr first_error;
        {
            std::lock_guard lock(mutex_);
            const auto it = handlers_.find(std::type_index(typeid(Event)));
            if (it == handlers_.end()) return;
            for (const auto& handler : it->second) {
                try {
                    handler(&event);
                } catch (...) {
                    if (!first_error) first_error = std::current_exception();
                }
            }
        }
        if (first_error) std::rethrow_exception(first_error);
    }

    /// Number of handlers registered for @p Event.
    template <typename Event>
    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(Event)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

private:
    using Erased = std::function<void(const void*)>;

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Erased>> handlers_;
};

} // namespace imgpress

#endif // IMGPRESS_EVENT_BUS_HPP
