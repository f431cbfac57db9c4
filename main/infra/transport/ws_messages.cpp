#include "infra/transport/ws_messages.hpp"

#include <cstring>

namespace transport
{

    namespace
    {

        void decode_event(WsMessage &msg)
        {
            const cJSON *event = cJSON_GetObjectItemCaseSensitive(msg.root.get(), "event");
            if (!cJSON_IsObject(event))
            {
                msg.type = WsMessage::Type::Unknown;
                return;
            }
            msg.event_type = json::get_string(event, "event_type", "");

            const cJSON *data = cJSON_GetObjectItemCaseSensitive(event, "data");
            if (!cJSON_IsObject(data))
                return;
            msg.entity_id = json::get_string(data, "entity_id", "");
            msg.new_state = ha::parse_state(cJSON_GetObjectItemCaseSensitive(data, "new_state"));
            msg.old_state = ha::parse_state(cJSON_GetObjectItemCaseSensitive(data, "old_state"));
        }

        void decode_result(WsMessage &msg)
        {
            const cJSON *root = msg.root.get();
            if (!json::get_int(root, "id", msg.id))
            {
                msg.type = WsMessage::Type::Unknown;
                return;
            }
            msg.success = json::get_bool(root, "success", false);
            if (!msg.success)
            {
                const cJSON *error = cJSON_GetObjectItemCaseSensitive(root, "error");
                msg.message = json::get_string(error, "message", "unknown error");
            }
        }

    } // namespace

    WsMessage decode_ws_message(const char *data, size_t len)
    {
        WsMessage msg;
        msg.root = json::parse(data, len);
        if (!cJSON_IsObject(msg.root.get()))
        {
            msg.type = WsMessage::Type::Malformed;
            return msg;
        }

        const char *type = json::get_string(msg.root.get(), "type");
        if (!type)
        {
            msg.type = WsMessage::Type::Unknown;
            return msg;
        }
        msg.type_name = type;

        if (std::strcmp(type, "auth_required") == 0)
        {
            msg.type = WsMessage::Type::AuthRequired;
        }
        else if (std::strcmp(type, "auth_ok") == 0)
        {
            msg.type = WsMessage::Type::AuthOk;
        }
        else if (std::strcmp(type, "auth_invalid") == 0)
        {
            msg.type = WsMessage::Type::AuthInvalid;
            msg.message = json::get_string(msg.root.get(), "message", "unknown reason");
        }
        else if (std::strcmp(type, "result") == 0)
        {
            msg.type = WsMessage::Type::Result;
            decode_result(msg);
        }
        else if (std::strcmp(type, "event") == 0)
        {
            msg.type = WsMessage::Type::Event;
            decode_event(msg);
        }
        else
        {
            msg.type = WsMessage::Type::Unknown;
        }
        return msg;
    }

    const char *ws_message_type_name(WsMessage::Type type)
    {
        switch (type)
        {
        case WsMessage::Type::AuthRequired:
            return "auth_required";
        case WsMessage::Type::AuthOk:
            return "auth_ok";
        case WsMessage::Type::AuthInvalid:
            return "auth_invalid";
        case WsMessage::Type::Result:
            return "result";
        case WsMessage::Type::Event:
            return "event";
        case WsMessage::Type::Unknown:
            return "unknown";
        case WsMessage::Type::Malformed:
        default:
            return "malformed";
        }
    }

    std::string encode_auth(const std::string &access_token)
    {
        json::Ptr root(cJSON_CreateObject());
        if (!root)
            return std::string();
        cJSON_AddStringToObject(root.get(), "type", "auth");
        cJSON_AddStringToObject(root.get(), "access_token", access_token.c_str());
        return json::print(root.get());
    }

    json::Ptr make_command(const char *type)
    {
        json::Ptr root(cJSON_CreateObject());
        if (root && type)
            cJSON_AddStringToObject(root.get(), "type", type);
        return root;
    }

} // namespace transport
