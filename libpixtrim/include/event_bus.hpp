//
// Created by Giuseppe Francione on 20/10/25.
//

/**
 * @file event_bus.hpp
 * @brief Thread-safe, type-indexed publish/subscribe bus.
 */

#ifndef PIXTRIM_EVENT_BUS_HPP
#define PIXTRIM_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace pixtrim {

    /**
     * @brief Decouples producers (executor, aggregator, updater) from the
     * consumers that render progress.
     *
     * Handlers for one event type run on the publishing thread, in
     * subscription order. publish() snapshots the handler list before
     * invoking it, so a handler may itself publish or subscribe.
     * Handlers called from worker threads must do their own locking.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> handlers;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                handlers = it->second;
            }
            for (const auto& fn : handlers) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace pixtrim

#endif // PIXTRIM_EVENT_BUS_HPP
