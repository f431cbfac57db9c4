#pragma once

#include <cstddef>
#include <string>

#include "core/json_util.hpp"
#include "core/state_record.hpp"

namespace transport
{

    // Inbound frame of the HA WebSocket API, decoded into a closed set of kinds.
    struct WsMessage
    {
        enum class Type
        {
            AuthRequired,
            AuthOk,
            AuthInvalid,
            Result,
            Event,
            Unknown,   // valid JSON, type we do not handle
            Malformed, // not a JSON object
        };

        Type type = Type::Malformed;
        std::string type_name;

        // Result
        int id = -1;
        bool success = false;

        // AuthInvalid reason / Result error message
        std::string message;

        // Event (event_type == "state_changed" carries the fields below)
        std::string event_type;
        std::string entity_id;
        ha::StatePtr new_state;
        ha::StatePtr old_state;

        // Whole decoded frame; a Result hands it to the waiting caller.
        json::Ptr root;
    };

    WsMessage decode_ws_message(const char *data, size_t len);

    const char *ws_message_type_name(WsMessage::Type type);

    // {"type":"auth","access_token":...}
    std::string encode_auth(const std::string &access_token);

    // {"type":<type>}; the transport adds the id when sending.
    json::Ptr make_command(const char *type);

} // namespace transport
