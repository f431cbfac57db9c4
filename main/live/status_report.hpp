#pragma once

#include "core/json_util.hpp"
#include "infra/transport/i_read_transport.hpp"
#include "infra/transport/transport_factory.hpp"

namespace live {

// {readTransport, writeTransport, wsAvailable, restAvailable, connected}
json::Ptr build_status_json(const transport::IReadTransport& transport, const transport::TransportStatus& status);

} // namespace live
