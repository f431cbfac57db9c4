#include "infra/transport/rest_read_transport.hpp"

#include <atomic>
#include <set>
#include <utility>

#include "esp_check.h"
#include "esp_log.h"

#include "core/hub_err.h"

namespace transport
{

    namespace
    {
        static const char *TAG = "rest_read";

        // Registry fallbacks rendered through POST /api/template when the
        // config endpoints are not reachable (e.g. outside the supervisor proxy).
        const char *kDeviceRegistryTemplate = R"jinja({% set devices = namespace(list=[]) %}
{% set seen = namespace(ids=[]) %}
{% for state in states %}
  {% set dev_id = device_id(state.entity_id) %}
  {% if dev_id and dev_id not in seen.ids %}
    {% set seen.ids = seen.ids + [dev_id] %}
    {% set dev_identifiers = device_attr(dev_id, 'identifiers') %}
    {% set dev_connections = device_attr(dev_id, 'connections') %}
    {% set dev_config_entries = device_attr(dev_id, 'config_entries') %}
    {% set devices.list = devices.list + [{
      'id': dev_id,
      'name': device_attr(dev_id, 'name'),
      'manufacturer': device_attr(dev_id, 'manufacturer'),
      'model': device_attr(dev_id, 'model'),
      'sw_version': device_attr(dev_id, 'sw_version'),
      'hw_version': device_attr(dev_id, 'hw_version'),
      'identifiers': dev_identifiers | list if dev_identifiers else [],
      'config_entries': dev_config_entries | list if dev_config_entries else [],
      'connections': dev_connections | list if dev_connections else [],
      'area_id': device_attr(dev_id, 'area_id'),
      'name_by_user': device_attr(dev_id, 'name_by_user')
    }] %}
  {% endif %}
{% endfor %}
{{ devices.list | tojson }})jinja";

        const char *kEntityRegistryTemplate = R"jinja({% set entities = namespace(list=[]) %}
{% for state in states %}
  {% set entities.list = entities.list + [{
    'entity_id': state.entity_id,
    'disabled_by': none,
    'hidden_by': none,
    'platform': state.attributes.get('platform', ''),
    'device_id': device_id(state.entity_id)
  }] %}
{% endfor %}
{{ entities.list | tojson }})jinja";

        const char *kAreaRegistryTemplate = R"jinja({% set areas = namespace(list=[]) %}
{% for area in areas() %}
  {% set areas.list = areas.list + [{
    'area_id': area,
    'name': area_name(area),
    'picture': none,
    'aliases': [],
    'floor_id': none,
    'icon': none,
    'labels': []
  }] %}
{% endfor %}
{{ areas.list | tojson }})jinja";

        // Clears the flag on every exit path of a tick.
        class TickGuard
        {
        public:
            explicit TickGuard(std::atomic<bool> &flag) : flag_(flag) {}
            ~TickGuard() { flag_ = false; }
            TickGuard(const TickGuard &) = delete;
            TickGuard &operator=(const TickGuard &) = delete;

        private:
            std::atomic<bool> &flag_;
        };

        bool same_observation(const ha::StatePtr &prev, const ha::StatePtr &next)
        {
            return prev && prev->state == next->state && prev->last_changed == next->last_changed;
        }
    } // namespace

    RestReadTransport::RestReadTransport(Options options, IHttpClient &http, sched::IScheduler &scheduler)
        : options_(std::move(options)), http_(http)
    {
        poll_timer_ = scheduler.create_blocking_timer("rest_poll", [this]()
                                                      { poll_once(); });
        kick_timer_ = scheduler.create_blocking_timer("rest_kick", [this]()
                                                      { poll_once(); });
    }

    RestReadTransport::~RestReadTransport()
    {
        stop_polling();
    }

    std::string RestReadTransport::url(const char *path) const
    {
        std::string out = options_.base_url;
        if (path[0] != '/')
            out += '/';
        out += path;
        return out;
    }

    esp_err_t RestReadTransport::get_json(const std::string &target, json::Ptr &out, int *status)
    {
        HttpResponse res;
        ESP_RETURN_ON_ERROR(http_.request("GET", target, std::string(), options_.access_token, res),
                            TAG, "GET %s failed", target.c_str());
        if (status)
            *status = res.status;
        if (res.status == 404)
            return ESP_ERR_NOT_FOUND;
        if (!res.ok())
        {
            ESP_LOGW(TAG, "GET %s -> %d", target.c_str(), res.status);
            return ESP_ERR_INVALID_RESPONSE;
        }
        out = json::parse(res.body);
        if (!out)
        {
            ESP_LOGW(TAG, "GET %s: body is not JSON", target.c_str());
            return ESP_ERR_INVALID_RESPONSE;
        }
        return ESP_OK;
    }

    esp_err_t RestReadTransport::connect()
    {
        ESP_LOGI(TAG, "Checking REST API at %s", options_.base_url.c_str());
        HttpResponse res;
        esp_err_t err = http_.request("GET", url("/"), std::string(), options_.access_token, res);
        if (err != ESP_OK || !res.ok())
        {
            ESP_LOGE(TAG, "REST API health check failed: %s, status %d", esp_err_to_name(err), res.status);
            connected_ = false;
            return HUB_ERR_CONNECTION;
        }
        connected_ = true;
        ESP_LOGI(TAG, "Connected to REST API");
        return ESP_OK;
    }

    void RestReadTransport::disconnect()
    {
        stop_polling();
        connected_ = false;
        ESP_LOGI(TAG, "Disconnected");
    }

    esp_err_t RestReadTransport::wait_until_ready()
    {
        if (connected_)
            return ESP_OK;
        return connect();
    }

    esp_err_t RestReadTransport::render_template(const char *tmpl, json::Ptr &out)
    {
        json::Ptr request(cJSON_CreateObject());
        if (!request)
            return ESP_ERR_NO_MEM;
        cJSON_AddStringToObject(request.get(), "template", tmpl);

        HttpResponse res;
        ESP_RETURN_ON_ERROR(http_.request("POST", url("/template"), json::print(request.get()),
                                          options_.access_token, res),
                            TAG, "POST /template failed");
        if (!res.ok())
        {
            ESP_LOGW(TAG, "Template API failed: %d", res.status);
            return ESP_ERR_INVALID_RESPONSE;
        }
        out = json::parse(res.body);
        if (!cJSON_IsArray(out.get()))
        {
            ESP_LOGW(TAG, "Template API returned no JSON array");
            return ESP_ERR_INVALID_RESPONSE;
        }
        return ESP_OK;
    }

    esp_err_t RestReadTransport::list_registry(const char *path, const char *fallback_template, json::Ptr &out)
    {
        if (get_json(url(path), out) == ESP_OK && cJSON_IsArray(out.get()))
            return ESP_OK;

        ESP_LOGI(TAG, "Using template fallback for %s", path);
        esp_err_t err = render_template(fallback_template, out);
        if (err == ESP_OK)
            ESP_LOGI(TAG, "%s: %d entries via template", path, cJSON_GetArraySize(out.get()));
        return err;
    }

    esp_err_t RestReadTransport::list_devices(json::Ptr &out)
    {
        return list_registry("/config/device_registry", kDeviceRegistryTemplate, out);
    }

    esp_err_t RestReadTransport::list_entity_registry(json::Ptr &out)
    {
        return list_registry("/config/entity_registry", kEntityRegistryTemplate, out);
    }

    esp_err_t RestReadTransport::list_area_registry(json::Ptr &out)
    {
        return list_registry("/config/area_registry", kAreaRegistryTemplate, out);
    }

    esp_err_t RestReadTransport::get_services_for_target(const cJSON *, bool, json::Ptr &out)
    {
        ESP_LOGD(TAG, "get_services_for_target not supported over REST");
        out.reset(cJSON_CreateArray());
        return out ? ESP_OK : ESP_ERR_NO_MEM;
    }

    esp_err_t RestReadTransport::get_services_by_domain(const std::string &, std::vector<std::string> &out)
    {
        ESP_LOGD(TAG, "get_services_by_domain not supported over REST");
        out.clear();
        return ESP_OK;
    }

    esp_err_t RestReadTransport::get_state(const std::string &entity_id, ha::StatePtr &out)
    {
        json::Ptr body;
        const std::string path = "/states/" + entity_id;
        esp_err_t err = get_json(url(path.c_str()), body);
        if (err != ESP_OK)
            return err;
        out = ha::parse_state(body.get());
        return out ? ESP_OK : ESP_ERR_INVALID_RESPONSE;
    }

    esp_err_t RestReadTransport::get_all_states(std::vector<ha::StatePtr> &out)
    {
        json::Ptr body;
        ESP_RETURN_ON_ERROR(get_json(url("/states"), body), TAG, "fetching states failed");
        if (!cJSON_IsArray(body.get()))
            return ESP_ERR_INVALID_RESPONSE;
        out = ha::parse_state_list(body.get());
        return ESP_OK;
    }

    esp_err_t RestReadTransport::get_states(const std::vector<std::string> &entity_ids, ha::StateMap &out)
    {
        out.clear();
        if (entity_ids.empty())
            return ESP_OK;

        // One bulk fetch is cheaper than one request per entity.
        std::vector<ha::StatePtr> all;
        ESP_RETURN_ON_ERROR(get_all_states(all), TAG, "bulk fetch failed");

        const std::set<std::string> wanted(entity_ids.begin(), entity_ids.end());
        for (const ha::StatePtr &record : all)
        {
            if (wanted.count(record->entity_id))
                out[record->entity_id] = record;
        }
        return ESP_OK;
    }

    SubscriptionId RestReadTransport::subscribe_to_state_changes(const std::vector<std::string> &entity_ids,
                                                                 StateChangeCallback cb)
    {
        SubscriptionId id = subscriptions_.add(entity_ids, std::move(cb));
        ESP_LOGI(TAG, "Subscription %u added (%u entities%s)", static_cast<unsigned>(id),
                 static_cast<unsigned>(entity_ids.size()), entity_ids.empty() ? ", all" : "");
        if (!poll_timer_->is_active())
            start_polling();
        return id;
    }

    void RestReadTransport::unsubscribe(SubscriptionId id)
    {
        if (!subscriptions_.remove(id))
            return;
        ESP_LOGI(TAG, "Subscription %u removed", static_cast<unsigned>(id));
        if (subscriptions_.empty())
            stop_polling();
    }

    void RestReadTransport::unsubscribe_all()
    {
        subscriptions_.clear();
        stop_polling();
    }

    bool RestReadTransport::is_polling() const
    {
        return poll_timer_->is_active();
    }

    void RestReadTransport::start_polling()
    {
        ESP_LOGI(TAG, "Polling every %u ms", static_cast<unsigned>(options_.poll_interval_ms));
        poll_timer_->start_periodic(options_.poll_interval_ms);
        // First snapshot without waiting a full interval.
        kick_timer_->start_once(0);
    }

    void RestReadTransport::stop_polling()
    {
        if (poll_timer_->is_active())
            ESP_LOGI(TAG, "Polling stopped");
        poll_timer_->stop();
        kick_timer_->stop();
    }

    void RestReadTransport::poll_once()
    {
        if (tick_in_progress_.exchange(true))
            return;
        TickGuard guard(tick_in_progress_);

        const std::vector<SubscriptionRegistry::EntryPtr> entries = subscriptions_.snapshot();
        if (entries.empty())
            return;

        std::vector<ha::StatePtr> records;
        esp_err_t err = ESP_OK;
        if (subscriptions_.wants_all())
        {
            err = get_all_states(records);
        }
        else
        {
            const std::set<std::string> ids = subscriptions_.wanted_ids();
            ha::StateMap states;
            err = get_states(std::vector<std::string>(ids.begin(), ids.end()), states);
            for (const auto &kv : states)
                records.push_back(kv.second);
        }
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "Poll failed: %s", hub_err_to_name(err));
            return;
        }

        for (const SubscriptionRegistry::EntryPtr &entry : entries)
        {
            std::lock_guard<std::mutex> lock(entry->delivery_mutex);
            for (const ha::StatePtr &record : records)
            {
                if (!entry->matches(record->entity_id))
                    continue;
                ha::StatePtr previous;
                auto it = entry->last_known.find(record->entity_id);
                if (it != entry->last_known.end())
                    previous = it->second;
                if (!same_observation(previous, record))
                    SubscriptionRegistry::deliver(*entry, record->entity_id, record, previous, true);
                entry->last_known[record->entity_id] = record;
            }
        }
    }

} // namespace transport
