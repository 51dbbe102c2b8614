#pragma once

#include "anthem/client/DeviceConfig.hpp"
#include "anthem/core/Expected.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace anthem {

/**
 * @brief Once-per-connection handshake that asks the receiver for the name
 *        of every input slot.
 *
 * The client sends `ISN<n>?` for each slot, paced so the receiver's input
 * buffer keeps up, then waits until every slot has answered or the bounded
 * timeout expires. Answers arrive on the read loop, which calls
 * `markAnswered()`. Missing slots are logged and otherwise ignored.
 */
class InputDiscovery {
public:
    using SendFn = std::function<expected<void>(const std::string&)>;

    /**
     * @brief Run the whole handshake.
     * @param send Writes one command to the receiver.
     * @param timing Slot count, query interval and overall timeout.
     * @param deviceName Used in log lines only.
     * @return true when every slot answered before the timeout.
     */
    bool run(const SendFn& send, const ProtocolTiming& timing, std::string_view deviceName);

    /// Reset the pending set to 1..@p slots.
    void begin(int slots);

    /// Record an answer for @p input; wakes the waiter once the set is empty.
    void markAnswered(int input);

    /// Block until every slot answered or @p timeout elapsed.
    bool waitUntilComplete(std::chrono::milliseconds timeout);

    std::set<int> pending() const;

    /// True once a handshake finished on the current connection.
    bool discovered() const;

    /// Forget the previous connection's handshake.
    void reset();

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::set<int> pendingInputs;
    bool finished = false;
};

} // namespace anthem
