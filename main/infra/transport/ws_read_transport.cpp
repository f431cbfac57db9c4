#include "infra/transport/ws_read_transport.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <set>
#include <utility>

#include "esp_check.h"
#include "esp_log.h"

#include "core/hub_err.h"

namespace transport
{

    namespace
    {
        static const char *TAG = "ws_read";

        // call() gives the sweep timer this much extra time before giving up
        // on its own.
        constexpr std::uint32_t kCallGraceMs = 1000;

        struct CallOutcome
        {
            esp_err_t err = ESP_FAIL;
            json::Ptr response;
        };
    } // namespace

    WsReadTransport::WsReadTransport(Options options, std::unique_ptr<IWsLink> link, sched::IScheduler &scheduler)
        : options_(std::move(options)), link_(std::move(link)), scheduler_(scheduler)
    {
        reconnect_timer_ = scheduler_.create_timer("ws_reconnect", [this]()
                                                   { on_reconnect_timer(); });
        watchdog_timer_ = scheduler_.create_timer("ws_watchdog", [this]()
                                                  { on_watchdog(); });
        sweep_timer_ = scheduler_.create_timer("ws_sweep", [this]()
                                               { sweep_expired(); });
    }

    WsReadTransport::~WsReadTransport()
    {
        disconnect();
    }

    esp_err_t WsReadTransport::connect()
    {
        return connect_within(options_.handshake_timeout_ms);
    }

    esp_err_t WsReadTransport::connect_within(std::uint32_t timeout_ms)
    {
        bool need_attempt = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = false;
            auth_failed_ = false;
            if (state_ == State::Ready)
                return ESP_OK;
            need_attempt = (state_ == State::Disconnected);
        }

        if (need_attempt)
        {
            reconnect_timer_->stop();
            esp_err_t err = start_attempt();
            if (err != ESP_OK)
                return err;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        bool finished = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]()
                                     { return attempt_result_ != ESP_ERR_NOT_FINISHED || shutdown_; });
        if (!finished)
        {
            ESP_LOGW(TAG, "No auth_ok within %u ms", static_cast<unsigned>(timeout_ms));
            return ESP_ERR_TIMEOUT;
        }
        if (shutdown_ && attempt_result_ == ESP_ERR_NOT_FINISHED)
            return HUB_ERR_CONNECTION;
        return attempt_result_;
    }

    void WsReadTransport::disconnect()
    {
        std::map<int, PendingRequest> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
            if (attempt_result_ == ESP_ERR_NOT_FINISHED)
                attempt_result_ = HUB_ERR_CONNECTION;
            state_ = State::Disconnected;
            upstream_subscribed_ = false;
            subscribe_in_flight_ = false;
            pending.swap(pending_);
        }
        cv_.notify_all();

        reconnect_timer_->stop();
        watchdog_timer_->stop();
        sweep_timer_->stop();
        link_->close();
        fail_all(pending, HUB_ERR_CONNECTION_CLOSED);
    }

    bool WsReadTransport::is_connected() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == State::Ready;
    }

    esp_err_t WsReadTransport::wait_until_ready()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = cv_.wait_for(lock, std::chrono::milliseconds(options_.handshake_timeout_ms), [this]()
                                  { return state_ == State::Ready || shutdown_ || auth_failed_; });
        if (state_ == State::Ready)
            return ESP_OK;
        if (auth_failed_)
            return HUB_ERR_AUTH;
        return ready ? HUB_ERR_CONNECTION : ESP_ERR_TIMEOUT;
    }

    WsReadTransport::State WsReadTransport::state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool WsReadTransport::is_upstream_subscribed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return upstream_subscribed_;
    }

    esp_err_t WsReadTransport::start_attempt()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_)
                return HUB_ERR_CONNECTION;
            state_ = State::Connecting;
            attempt_result_ = ESP_ERR_NOT_FINISHED;
            next_id_ = 1;
        }

        // Drop whatever is left of the previous channel.
        link_->close();

        watchdog_timer_->start_once(options_.handshake_timeout_ms);

        IWsLink::Handlers handlers;
        handlers.on_open = [this]()
        { handle_open(); };
        handlers.on_text = [this](const char *data, size_t len)
        { handle_text(data, len); };
        handlers.on_close = [this]()
        { handle_channel_down(); };

        ESP_LOGI(TAG, "Connecting to %s", options_.url.c_str());
        esp_err_t err = link_->open(options_.url, std::move(handlers));
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "Failed to open channel: %s", esp_err_to_name(err));
            watchdog_timer_->stop();
            teardown("open failed", false);
            return HUB_ERR_CONNECTION;
        }
        return ESP_OK;
    }

    void WsReadTransport::handle_open()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Connecting)
            state_ = State::AwaitingAuth;
    }

    void WsReadTransport::handle_text(const char *data, size_t len)
    {
        WsMessage msg = decode_ws_message(data, len);
        ESP_LOGD(TAG, "<- %s (%u bytes)", ws_message_type_name(msg.type), static_cast<unsigned>(len));

        switch (msg.type)
        {
        case WsMessage::Type::AuthRequired:
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                state_ = State::AwaitingAuth;
            }
            esp_err_t err = link_->send_text(encode_auth(options_.access_token));
            if (err != ESP_OK)
                ESP_LOGE(TAG, "Failed to send auth: %s", esp_err_to_name(err));
            break;
        }
        case WsMessage::Type::AuthOk:
        {
            bool resubscribe = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                state_ = State::Ready;
                attempt_result_ = ESP_OK;
                next_id_ = 1;
                upstream_subscribed_ = false;
                subscribe_in_flight_ = false;
                resubscribe = !subscriptions_.empty();
            }
            cv_.notify_all();
            watchdog_timer_->stop();
            sweep_timer_->start_periodic(options_.request_sweep_ms);
            ESP_LOGI(TAG, "Authenticated");
            if (resubscribe)
                activate_state_subscription();
            break;
        }
        case WsMessage::Type::AuthInvalid:
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auth_failed_ = true;
                attempt_result_ = HUB_ERR_AUTH;
                state_ = State::Disconnected;
            }
            cv_.notify_all();
            ESP_LOGE(TAG, "Authentication failed: %s", msg.message.c_str());
            // The link cannot be closed from its own task.
            watchdog_timer_->start_once(0);
            break;
        }
        case WsMessage::Type::Result:
        {
            PendingRequest request;
            bool found = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = pending_.find(msg.id);
                if (it != pending_.end())
                {
                    request = std::move(it->second);
                    pending_.erase(it);
                    found = true;
                }
            }
            if (!found)
            {
                ESP_LOGW(TAG, "Result for unknown id %d", msg.id);
                break;
            }
            if (request.done)
                request.done(ESP_OK, std::move(msg.root));
            break;
        }
        case WsMessage::Type::Event:
            if (msg.event_type == "state_changed" && !msg.entity_id.empty())
                subscriptions_.dispatch(msg.entity_id, msg.new_state, msg.old_state);
            else
                ESP_LOGD(TAG, "Ignoring event '%s'", msg.event_type.c_str());
            break;
        case WsMessage::Type::Unknown:
            ESP_LOGW(TAG, "Dropping message of type '%s'", msg.type_name.c_str());
            break;
        case WsMessage::Type::Malformed:
        default:
            ESP_LOGW(TAG, "Dropping malformed frame (%u bytes)", static_cast<unsigned>(len));
            break;
        }
    }

    void WsReadTransport::handle_channel_down()
    {
        watchdog_timer_->stop();
        teardown("channel closed", false);
    }

    void WsReadTransport::on_watchdog()
    {
        bool rejected = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == State::Ready)
                return;
            if (state_ == State::Disconnected && !auth_failed_)
                return;
            rejected = auth_failed_;
        }
        teardown(rejected ? "auth rejected" : "handshake timeout", true);
    }

    void WsReadTransport::on_reconnect_timer()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_ || auth_failed_ || state_ != State::Disconnected)
                return;
        }
        ESP_LOGI(TAG, "Reconnecting");
        esp_err_t err = start_attempt();
        if (err != ESP_OK)
            ESP_LOGW(TAG, "Reconnect attempt failed: %s", hub_err_to_name(err));
    }

    void WsReadTransport::teardown(const char *reason, bool close_link)
    {
        std::map<int, PendingRequest> pending;
        bool reconnect = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (attempt_result_ == ESP_ERR_NOT_FINISHED)
                attempt_result_ = close_link ? ESP_ERR_TIMEOUT : HUB_ERR_CONNECTION;
            state_ = State::Disconnected;
            upstream_subscribed_ = false;
            subscribe_in_flight_ = false;
            pending.swap(pending_);
            reconnect = !shutdown_ && !auth_failed_;
        }
        cv_.notify_all();

        ESP_LOGW(TAG, "Channel down (%s), %u pending request(s) failed",
                 reason, static_cast<unsigned>(pending.size()));

        sweep_timer_->stop();
        if (close_link)
            link_->close();
        fail_all(pending, HUB_ERR_CONNECTION_CLOSED);

        if (reconnect)
        {
            ESP_LOGI(TAG, "Reconnecting in %u ms", static_cast<unsigned>(options_.reconnect_delay_ms));
            reconnect_timer_->start_once(options_.reconnect_delay_ms);
        }
    }

    void WsReadTransport::fail_all(std::map<int, PendingRequest> &pending, esp_err_t err)
    {
        for (auto &kv : pending)
        {
            if (kv.second.done)
                kv.second.done(err, nullptr);
        }
        pending.clear();
    }

    void WsReadTransport::sweep_expired()
    {
        const std::int64_t now = scheduler_.now_ms();
        std::vector<std::pair<int, PendingRequest>> expired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = pending_.begin(); it != pending_.end();)
            {
                if (it->second.deadline_ms <= now)
                {
                    expired.emplace_back(it->first, std::move(it->second));
                    it = pending_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }
        for (auto &item : expired)
        {
            ESP_LOGW(TAG, "Request %d timed out", item.first);
            if (item.second.done)
                item.second.done(HUB_ERR_REQUEST_TIMEOUT, nullptr);
        }
    }

    int WsReadTransport::call_async(json::Ptr command, Completion done)
    {
        if (!cJSON_IsObject(command.get()))
        {
            if (done)
                done(ESP_ERR_INVALID_ARG, nullptr);
            return 0;
        }

        std::lock_guard<std::mutex> send_lock(send_mutex_);
        int id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Ready)
            {
                id = -1;
            }
            else
            {
                id = next_id_++;
                PendingRequest request;
                request.done = std::move(done);
                request.deadline_ms = scheduler_.now_ms() + options_.request_timeout_ms;
                pending_[id] = std::move(request);
            }
        }
        if (id < 0)
        {
            if (done)
                done(HUB_ERR_CONNECTION, nullptr);
            return 0;
        }

        cJSON_DeleteItemFromObjectCaseSensitive(command.get(), "id");
        cJSON_AddNumberToObject(command.get(), "id", id);
        const std::string payload = json::print(command.get());
        ESP_LOGD(TAG, "-> %s", payload.c_str());

        esp_err_t err = payload.empty() ? ESP_ERR_NO_MEM : link_->send_text(payload);
        if (err == ESP_OK)
            return id;

        ESP_LOGW(TAG, "Send of request %d failed: %s", id, esp_err_to_name(err));
        PendingRequest request;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it != pending_.end())
            {
                request = std::move(it->second);
                pending_.erase(it);
                found = true;
            }
        }
        if (found && request.done)
            request.done(HUB_ERR_CONNECTION, nullptr);
        return 0;
    }

    esp_err_t WsReadTransport::call(const cJSON *command, json::Ptr &response)
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool ready = cv_.wait_for(lock, std::chrono::milliseconds(options_.request_timeout_ms), [this]()
                                      { return state_ == State::Ready || shutdown_ || auth_failed_; });
            if (!ready)
                return HUB_ERR_REQUEST_TIMEOUT;
            if (state_ != State::Ready)
                return auth_failed_ ? HUB_ERR_AUTH : HUB_ERR_CONNECTION;
        }

        auto promise = std::make_shared<std::promise<CallOutcome>>();
        std::future<CallOutcome> future = promise->get_future();
        int id = call_async(json::duplicate(command), [promise](esp_err_t err, json::Ptr resp)
                            {
                                CallOutcome outcome;
                                outcome.err = err;
                                outcome.response = std::move(resp);
                                promise->set_value(std::move(outcome)); });

        auto wait = std::chrono::milliseconds(options_.request_timeout_ms + kCallGraceMs);
        if (future.wait_for(wait) != std::future_status::ready)
        {
            bool removed = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                removed = pending_.erase(id) > 0;
            }
            if (removed)
                return HUB_ERR_REQUEST_TIMEOUT;
            // Completed while we were giving up.
            future.wait();
        }

        CallOutcome outcome = future.get();
        if (outcome.err != ESP_OK)
            return outcome.err;

        response = std::move(outcome.response);
        if (!json::get_bool(response.get(), "success", false))
        {
            const cJSON *error = cJSON_GetObjectItemCaseSensitive(response.get(), "error");
            ESP_LOGW(TAG, "Command '%s' failed: %s", json::get_string(command, "type", "?"),
                     json::get_string(error, "message", "unknown error"));
            return HUB_ERR_COMMAND_FAILED;
        }
        return ESP_OK;
    }

    esp_err_t WsReadTransport::request_result(json::Ptr command, json::Ptr &result)
    {
        json::Ptr response;
        ESP_RETURN_ON_ERROR(call(command.get(), response), TAG, "%s failed",
                            json::get_string(command.get(), "type", "?"));
        result.reset(cJSON_DetachItemFromObjectCaseSensitive(response.get(), "result"));
        if (!result)
            result.reset(cJSON_CreateNull());
        return ESP_OK;
    }

    void WsReadTransport::activate_state_subscription()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Ready || upstream_subscribed_ || subscribe_in_flight_)
                return;
            subscribe_in_flight_ = true;
        }

        json::Ptr command = make_command("subscribe_events");
        if (command)
            cJSON_AddStringToObject(command.get(), "event_type", "state_changed");
        call_async(std::move(command), [this](esp_err_t err, json::Ptr resp)
                   {
                       bool ok = (err == ESP_OK) && json::get_bool(resp.get(), "success", false);
                       {
                           std::lock_guard<std::mutex> lock(mutex_);
                           subscribe_in_flight_ = false;
                           upstream_subscribed_ = ok;
                       }
                       if (ok)
                           ESP_LOGI(TAG, "Subscribed to state_changed");
                       else
                           ESP_LOGW(TAG, "subscribe_events failed: %s",
                                    err == ESP_OK ? "rejected" : hub_err_to_name(err)); });
    }

    esp_err_t WsReadTransport::list_devices(json::Ptr &out)
    {
        return request_result(make_command("config/device_registry/list"), out);
    }

    esp_err_t WsReadTransport::list_entity_registry(json::Ptr &out)
    {
        return request_result(make_command("config/entity_registry/list"), out);
    }

    esp_err_t WsReadTransport::list_area_registry(json::Ptr &out)
    {
        return request_result(make_command("config/area_registry/list"), out);
    }

    esp_err_t WsReadTransport::get_services_for_target(const cJSON *target, bool expand_group, json::Ptr &out)
    {
        json::Ptr command = make_command("get_services_for_target");
        if (!command)
            return ESP_ERR_NO_MEM;
        json::Ptr target_copy = target ? json::duplicate(target) : json::Ptr(cJSON_CreateObject());
        cJSON_AddItemToObject(command.get(), "target", target_copy.release());
        cJSON_AddBoolToObject(command.get(), "expand_group", expand_group);
        return request_result(std::move(command), out);
    }

    esp_err_t WsReadTransport::get_services_by_domain(const std::string &domain, std::vector<std::string> &out)
    {
        json::Ptr result;
        ESP_RETURN_ON_ERROR(request_result(make_command("get_services"), result), TAG, "get_services failed");

        out.clear();
        const cJSON *services = cJSON_GetObjectItemCaseSensitive(result.get(), domain.c_str());
        const cJSON *service = nullptr;
        cJSON_ArrayForEach(service, services)
        {
            if (service->string)
                out.push_back(domain + "." + service->string);
        }
        std::sort(out.begin(), out.end());
        return ESP_OK;
    }

    esp_err_t WsReadTransport::get_all_states(std::vector<ha::StatePtr> &out)
    {
        json::Ptr result;
        ESP_RETURN_ON_ERROR(request_result(make_command("get_states"), result), TAG, "get_states failed");
        if (!cJSON_IsArray(result.get()))
            return ESP_ERR_INVALID_RESPONSE;
        out = ha::parse_state_list(result.get());
        return ESP_OK;
    }

    esp_err_t WsReadTransport::get_states(const std::vector<std::string> &entity_ids, ha::StateMap &out)
    {
        out.clear();
        if (entity_ids.empty())
            return ESP_OK;

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

    esp_err_t WsReadTransport::get_state(const std::string &entity_id, ha::StatePtr &out)
    {
        ha::StateMap states;
        ESP_RETURN_ON_ERROR(get_states({entity_id}, states), TAG, "get_state(%s) failed", entity_id.c_str());
        auto it = states.find(entity_id);
        if (it == states.end())
            return ESP_ERR_NOT_FOUND;
        out = it->second;
        return ESP_OK;
    }

    SubscriptionId WsReadTransport::subscribe_to_state_changes(const std::vector<std::string> &entity_ids,
                                                               StateChangeCallback cb)
    {
        SubscriptionId id = subscriptions_.add(entity_ids, std::move(cb));
        ESP_LOGI(TAG, "Subscription %u added (%u entities%s)", static_cast<unsigned>(id),
                 static_cast<unsigned>(entity_ids.size()), entity_ids.empty() ? ", all" : "");
        activate_state_subscription();
        return id;
    }

    void WsReadTransport::unsubscribe(SubscriptionId id)
    {
        if (subscriptions_.remove(id))
            ESP_LOGI(TAG, "Subscription %u removed", static_cast<unsigned>(id));
    }

    void WsReadTransport::unsubscribe_all()
    {
        subscriptions_.clear();
    }

} // namespace transport
