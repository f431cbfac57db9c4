#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "cJSON.h"
#include "core/json_util.hpp"
#include "infra/transport/ws_link.hpp"

namespace fakes
{

    // In-process stand-in for a Home Assistant WebSocket endpoint.
    // Server frames are delivered synchronously on the calling thread.
    class FakeWsLink : public transport::IWsLink
    {
    public:
        // Called for every command that carries an id.
        using Responder = std::function<void(FakeWsLink &link, const cJSON *command)>;

        bool fail_open = false;
        // false: the socket "connects" but the server never says anything.
        bool server_speaks = true;
        bool accept_auth = true;
        Responder responder;

        esp_err_t open(const std::string &uri, Handlers handlers) override
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                uri_ = uri;
                ++open_count_;
                if (fail_open)
                    return ESP_FAIL;
                handlers_ = std::move(handlers);
                open_ = true;
            }
            if (!server_speaks)
                return ESP_OK;
            Handlers h = handlers_copy();
            if (h.on_open)
                h.on_open();
            push(R"({"type":"auth_required","ha_version":"2024.6.0"})");
            return ESP_OK;
        }

        esp_err_t send_text(const std::string &payload) override
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!open_)
                    return ESP_ERR_INVALID_STATE;
                sent_.push_back(payload);
            }
            cv_.notify_all();

            json::Ptr msg = json::parse(payload);
            const char *type = json::get_string(msg.get(), "type", "");
            if (std::string(type) == "auth")
            {
                push(accept_auth ? R"({"type":"auth_ok","ha_version":"2024.6.0"})"
                                 : R"({"type":"auth_invalid","message":"Invalid access token or password"})");
                return ESP_OK;
            }
            if (responder && cJSON_GetObjectItemCaseSensitive(msg.get(), "id"))
                responder(*this, msg.get());
            return ESP_OK;
        }

        void close() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            handlers_ = Handlers();
        }

        bool is_open() const override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return open_;
        }

        // Server -> client frame.
        void push(const std::string &frame)
        {
            Handlers h = handlers_copy();
            if (h.on_text)
                h.on_text(frame.data(), frame.size());
        }

        void push_result(int id, const std::string &result_json, bool success = true)
        {
            std::string frame = "{\"id\":" + std::to_string(id) + ",\"type\":\"result\",\"success\":" +
                                (success ? "true" : "false");
            if (success)
                frame += ",\"result\":" + result_json;
            else
                frame += ",\"error\":{\"code\":\"unknown_command\",\"message\":\"Unknown command.\"}";
            frame += "}";
            push(frame);
        }

        void push_state_changed(const std::string &entity_id, const std::string &new_value,
                                const std::string &old_value, const std::string &last_changed = "2024-06-01T10:00:00+00:00")
        {
            auto state = [&](const std::string &value)
            {
                if (value.empty())
                    return std::string("null");
                return "{\"entity_id\":\"" + entity_id + "\",\"state\":\"" + value +
                       "\",\"attributes\":{},\"last_changed\":\"" + last_changed +
                       "\",\"last_updated\":\"" + last_changed + "\"}";
            };
            push("{\"type\":\"event\",\"event\":{\"event_type\":\"state_changed\",\"data\":{\"entity_id\":\"" +
                 entity_id + "\",\"new_state\":" + state(new_value) + ",\"old_state\":" + state(old_value) + "}}}");
        }

        // Server side close.
        void drop()
        {
            Handlers h;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                open_ = false;
                h = handlers_;
                handlers_ = Handlers();
            }
            if (h.on_close)
                h.on_close();
        }

        std::vector<std::string> sent() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_;
        }

        // Commands (frames with an id) of the given type.
        std::vector<json::Ptr> commands(const std::string &type) const
        {
            std::vector<json::Ptr> out;
            for (const std::string &frame : sent())
            {
                json::Ptr msg = json::parse(frame);
                if (type == json::get_string(msg.get(), "type", "") &&
                    cJSON_GetObjectItemCaseSensitive(msg.get(), "id"))
                    out.push_back(std::move(msg));
            }
            return out;
        }

        bool wait_for_sent(size_t count, std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [&]()
                                { return sent_.size() >= count; });
        }

        int open_count() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return open_count_;
        }

    private:
        Handlers handlers_copy() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return handlers_;
        }

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::string uri_;
        Handlers handlers_;
        bool open_ = false;
        int open_count_ = 0;
        std::vector<std::string> sent_;
    };

} // namespace fakes
