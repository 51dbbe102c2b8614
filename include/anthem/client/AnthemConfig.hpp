#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace anthem::config {

/**
 * @brief Constants that define the Anthem control protocol and its pacing.
 *
 * The receiver's input buffer is small; the intervals below keep bursts of
 * commands from overrunning it.
 */

// Networking ------------------------------------------------------------------
constexpr std::uint16_t ANTHEM_PORT_DEFAULT = 14999;
constexpr std::chrono::milliseconds ANTHEM_CONNECT_TIMEOUT{5000};
constexpr int ANTHEM_CONNECT_ATTEMPTS = 5;
constexpr std::chrono::milliseconds ANTHEM_RETRY_DELAY{2000};

// Read loop -------------------------------------------------------------------
constexpr std::chrono::milliseconds ANTHEM_READ_TIMEOUT{60000}; // liveness, not an error
constexpr std::size_t ANTHEM_READ_CHUNK = 1024;
constexpr std::size_t ANTHEM_MAX_LINE_BYTES = 4096; // longer unterminated data is dropped

// Startup sequence ------------------------------------------------------------
constexpr std::chrono::milliseconds ANTHEM_LISTENER_STARTUP{100};
constexpr std::chrono::milliseconds ANTHEM_ECHO_SETTLE{50};

// Input discovery -------------------------------------------------------------
constexpr int ANTHEM_INPUT_SLOTS = 15;
constexpr std::chrono::milliseconds ANTHEM_INPUT_QUERY_INTERVAL{50};
constexpr std::chrono::milliseconds ANTHEM_DISCOVERY_TIMEOUT{3000};

// Status polling --------------------------------------------------------------
constexpr std::chrono::milliseconds ANTHEM_STATUS_QUERY_INTERVAL{100};

// Value ranges ----------------------------------------------------------------
constexpr int ANTHEM_VOLUME_MIN_DB = -90;
constexpr int ANTHEM_VOLUME_MAX_DB = 0;
constexpr int ANTHEM_MAX_ZONES = 8;

} // namespace anthem::config
