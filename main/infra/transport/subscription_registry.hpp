#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infra/transport/i_read_transport.hpp"

namespace transport
{

    // Local subscriptions of one transport. Thread-safe.
    //
    // Every entry carries its own delivery mutex: callbacks of one subscription
    // are serialized, different subscriptions may be notified in parallel.
    // The table lock is never held while a callback runs, so callbacks may
    // subscribe or unsubscribe freely.
    class SubscriptionRegistry
    {
    public:
        struct Entry
        {
            SubscriptionId id = kInvalidSubscription;
            std::set<std::string> filter; // empty = all entities
            StateChangeCallback cb;

            // Guards delivery and `last_known`.
            std::mutex delivery_mutex;
            // Polling only: last record seen per entity.
            std::unordered_map<std::string, ha::StatePtr> last_known;

            bool matches(const std::string &entity_id) const
            {
                return filter.empty() || filter.count(entity_id) > 0;
            }
        };
        using EntryPtr = std::shared_ptr<Entry>;

        SubscriptionId add(const std::vector<std::string> &entity_ids, StateChangeCallback cb);
        bool remove(SubscriptionId id);
        void clear();

        std::size_t size() const;
        bool empty() const;

        // Entries alive at the time of the call. Removing an entry later does
        // not cancel a delivery that already started.
        std::vector<EntryPtr> snapshot() const;

        // True if any subscription has an empty filter.
        bool wants_all() const;
        // Union of all filters.
        std::set<std::string> wanted_ids() const;

        // Invoke every matching callback.
        void dispatch(const std::string &entity_id, const ha::StatePtr &new_state, const ha::StatePtr &old_state) const;

        // Invoke one callback under its delivery mutex. The caller must hold
        // `entry.delivery_mutex` when `locked` is true.
        static void deliver(Entry &entry, const std::string &entity_id,
                            const ha::StatePtr &new_state, const ha::StatePtr &old_state,
                            bool locked = false);

    private:
        mutable std::mutex mutex_;
        std::unordered_map<SubscriptionId, EntryPtr> entries_;
        SubscriptionId next_id_ = 1;
    };

} // namespace transport
