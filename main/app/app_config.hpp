#pragma once

#include <cstdint>

namespace app_config
{

    // Window for the whole WS handshake (open -> auth_ok) of one attempt.
    constexpr std::uint32_t kWsHandshakeTimeoutMs = 10000;

    // Startup race: how long the selector waits for WS before falling back to REST.
    constexpr std::uint32_t kWsConnectRaceTimeoutMs = 5000;

    // Per-command timeout on the WS channel.
    constexpr std::uint32_t kWsRequestTimeoutMs = 10000;

    // Delay between a dropped WS channel and the next connect attempt.
    constexpr std::uint32_t kWsReconnectDelayMs = 5000;

    // How often pending WS requests are checked against their deadline.
    constexpr std::uint32_t kWsRequestSweepMs = 250;

    // REST polling interval while subscriptions exist.
    constexpr std::uint32_t kRestPollIntervalMs = 1000;

    // esp_http_client timeout for a single REST request.
    constexpr int kHttpTimeoutMs = 15000;

    // Port of the live tracking WebSocket server.
    constexpr std::uint16_t kLivePort = 42069;

} // namespace app_config
