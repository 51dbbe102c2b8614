#pragma once

#include "anthem/client/AnthemConfig.hpp"
#include "anthem/core/Expected.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace anthem {

/**
 * @brief Timing knobs for the startup sequence and the read loop.
 *
 * Defaults come from `anthem::config`; tests shrink them to keep runs short.
 */
struct ProtocolTiming {
    std::chrono::milliseconds listenerStartup = config::ANTHEM_LISTENER_STARTUP;
    std::chrono::milliseconds echoSettle = config::ANTHEM_ECHO_SETTLE;
    int inputSlots = config::ANTHEM_INPUT_SLOTS;
    std::chrono::milliseconds inputQueryInterval = config::ANTHEM_INPUT_QUERY_INTERVAL;
    std::chrono::milliseconds discoveryTimeout = config::ANTHEM_DISCOVERY_TIMEOUT;
    std::chrono::milliseconds statusQueryInterval = config::ANTHEM_STATUS_QUERY_INTERVAL;
    std::chrono::milliseconds readTimeout = config::ANTHEM_READ_TIMEOUT;
    std::size_t readChunk = config::ANTHEM_READ_CHUNK;
};

/**
 * @brief Identity and connection policy of one receiver.
 *
 * Built once from configuration and never modified by the client.
 */
struct DeviceConfig {
    std::string name = "Anthem";
    std::string host;
    std::uint16_t port = config::ANTHEM_PORT_DEFAULT;

    /// Per-attempt connect timeout.
    std::chrono::milliseconds timeout = config::ANTHEM_CONNECT_TIMEOUT;

    /// Zones the surrounding integration exposes; zone 1 is the main room.
    std::vector<int> zones{1};

    ProtocolTiming timing{};

    /// Rejects configurations the client could never connect with.
    expected<void> validate() const;
};

} // namespace anthem
