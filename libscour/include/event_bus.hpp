/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe bus shared by the pipeline and its front ends.
 */

#ifndef SCOUR_EVENT_BUS_HPP
#define SCOUR_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace scour {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details Producers (SanitizationOrchestrator, Scour) broadcast events
     * without knowing who listens; the CLI and tests subscribe per event type.
     *
     * publish() may be called from several worker threads at once. The
     * handler list is copied under the lock and invoked outside it, so a
     * handler may itself publish or subscribe. Handlers must be thread-safe.
     */
    class EventBus {
    public:
        using SubscriptionId = std::size_t;

        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @return Id accepted by unsubscribe().
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            auto callback = std::make_shared<Callback>([h = std::move(handler)](const void* e) {
                h(*static_cast<const Event*>(e));
            });
            std::lock_guard lock(mtx_);
            const SubscriptionId id = ++last_id_;
            subscribers_[std::type_index(typeid(Event))].push_back({id, std::move(callback)});
            return id;
        }

        /**
         * @brief Remove a handler. Unknown ids are ignored.
         */
        void unsubscribe(const SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, entries] : subscribers_) {
                std::erase_if(entries, [id](const Entry& e) { return e.id == id; });
            }
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<std::shared_ptr<Callback>> snapshot;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                snapshot.reserve(it->second.size());
                for (const auto& entry : it->second) snapshot.push_back(entry.callback);
            }
            for (const auto& fn : snapshot) {
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
        mutable std::mutex mtx_;
    };

} // namespace scour

#endif // SCOUR_EVENT_BUS_HPP
