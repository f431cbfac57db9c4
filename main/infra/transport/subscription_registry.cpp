#include "infra/transport/subscription_registry.hpp"

#include <exception>
#include <utility>

#include "esp_log.h"

namespace transport
{

    namespace
    {
        static const char *TAG = "subs";
    }

    SubscriptionId SubscriptionRegistry::add(const std::vector<std::string> &entity_ids, StateChangeCallback cb)
    {
        auto entry = std::make_shared<Entry>();
        entry->filter.insert(entity_ids.begin(), entity_ids.end());
        entry->cb = std::move(cb);

        std::lock_guard<std::mutex> lock(mutex_);
        entry->id = next_id_++;
        if (next_id_ == kInvalidSubscription)
            next_id_ = 1;
        entries_[entry->id] = entry;
        return entry->id;
    }

    bool SubscriptionRegistry::remove(SubscriptionId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(id) > 0;
    }

    void SubscriptionRegistry::clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    std::size_t SubscriptionRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    bool SubscriptionRegistry::empty() const
    {
        return size() == 0;
    }

    std::vector<SubscriptionRegistry::EntryPtr> SubscriptionRegistry::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EntryPtr> out;
        out.reserve(entries_.size());
        for (const auto &kv : entries_)
            out.push_back(kv.second);
        return out;
    }

    bool SubscriptionRegistry::wants_all() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &kv : entries_)
        {
            if (kv.second->filter.empty())
                return true;
        }
        return false;
    }

    std::set<std::string> SubscriptionRegistry::wanted_ids() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string> out;
        for (const auto &kv : entries_)
            out.insert(kv.second->filter.begin(), kv.second->filter.end());
        return out;
    }

    void SubscriptionRegistry::dispatch(const std::string &entity_id,
                                        const ha::StatePtr &new_state,
                                        const ha::StatePtr &old_state) const
    {
        for (const EntryPtr &entry : snapshot())
        {
            if (entry->matches(entity_id))
                deliver(*entry, entity_id, new_state, old_state);
        }
    }

    void SubscriptionRegistry::deliver(Entry &entry, const std::string &entity_id,
                                       const ha::StatePtr &new_state, const ha::StatePtr &old_state,
                                       bool locked)
    {
        if (!entry.cb)
            return;

        std::unique_lock<std::mutex> lock(entry.delivery_mutex, std::defer_lock);
        if (!locked)
            lock.lock();

        try
        {
            entry.cb(entity_id, new_state, old_state);
        }
        catch (const std::exception &e)
        {
            ESP_LOGE(TAG, "subscription %u callback failed for %s: %s",
                     static_cast<unsigned>(entry.id), entity_id.c_str(), e.what());
        }
        catch (...)
        {
            ESP_LOGE(TAG, "subscription %u callback failed for %s",
                     static_cast<unsigned>(entry.id), entity_id.c_str());
        }
    }

} // namespace transport
