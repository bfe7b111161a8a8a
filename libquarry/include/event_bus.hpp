/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus for extraction progress events.
 */

#ifndef QUARRY_EVENT_BUS_HPP
#define QUARRY_EVENT_BUS_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace quarry {

    /**
     * @brief Type-keyed publish/subscribe event bus.
     *
     * @details ExtractionExecutor publishes from worker threads; the CLI and
     * the report generator subscribe. Handlers are copied out under the lock
     * and invoked after releasing it, so a handler may publish or subscribe
     * without deadlocking. Handlers for the same event can run concurrently
     * when several threads publish; they must synchronize their own state.
     */
    class EventBus {
    public:
        using SubscriptionId = std::uint64_t;

        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to one event type.
         * @tparam Event The event struct type (e.g., DocumentCompleteEvent).
         * @return An id usable with unsubscribe().
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            auto callback = std::make_shared<Callback>([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
            std::lock_guard lock(mtx_);
            const SubscriptionId id = ++last_id_;
            subscribers_[std::type_index(typeid(Event))].push_back({id, std::move(callback)});
            return id;
        }

        /// Removes a handler. Unknown ids are ignored.
        void unsubscribe(const SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, entries] : subscribers_) {
                std::erase_if(entries, [id](const Entry& entry) { return entry.id == id; });
            }
        }

        /**
         * @brief Publish an event to every subscriber of its type, in subscription order.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<std::shared_ptr<Callback>> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets.reserve(it->second.size());
                for (const auto& entry : it->second) {
                    targets.push_back(entry.callback);
                }
            }
            for (const auto& fn : targets) {
                (*fn)(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;

        struct Entry {
            SubscriptionId id;
            std::shared_ptr<Callback> callback;
        };

        std::unordered_map<std::type_index, std::vector<Entry>> subscribers_;
        SubscriptionId last_id_ = 0;
        std::mutex mtx_;
    };

} // namespace quarry

#endif // QUARRY_EVENT_BUS_HPP
