#include "anthem/client/InputDiscovery.hpp"

#include "anthem/log/Log.hpp"
#include "anthem/protocol/AnthemCommand.hpp"

#include <sstream>
#include <thread>

namespace anthem {

namespace command = protocol::command;

bool InputDiscovery::run(const SendFn& send, const ProtocolTiming& timing,
                         std::string_view deviceName) {
    logInfo("[InputDiscovery] discovering input names for ", deviceName, "\n");

    begin(timing.inputSlots);

    bool linkLost = false;
    for (int input = 1; input <= timing.inputSlots; ++input) {
        if (auto sent = send(command::queryInputName(input)); !sent) {
            logError("[InputDiscovery] query for input ", input, " failed: ",
                     sent.error().message(), "\n");
            if (sent.error() == std::errc::not_connected) {
                linkLost = true; // no point queueing the rest or waiting
                break;
            }
        }
        std::this_thread::sleep_for(timing.inputQueryInterval);
    }

    const bool complete = linkLost ? false : waitUntilComplete(timing.discoveryTimeout);

    {
        std::lock_guard lock(mutex);
        finished = true;
    }

    if (!complete) {
        std::ostringstream missing;
        for (int input : pending()) {
            missing << ' ' << input;
        }
        logWarning("[InputDiscovery] incomplete for ", deviceName,
                   ", no answer from inputs:", missing.str(), "\n");
    } else {
        logInfo("[InputDiscovery] completed for ", deviceName, "\n");
    }
    return complete;
}

void InputDiscovery::begin(int slots) {
    std::lock_guard lock(mutex);
    pendingInputs.clear();
    for (int input = 1; input <= slots; ++input) {
        pendingInputs.insert(input);
    }
    finished = false;
}

void InputDiscovery::markAnswered(int input) {
    bool empty = false;
    {
        std::lock_guard lock(mutex);
        if (pendingInputs.erase(input) == 0) {
            return;
        }
        empty = pendingInputs.empty();
    }
    if (empty) {
        cv.notify_all();
    }
}

bool InputDiscovery::waitUntilComplete(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex);
    return cv.wait_for(lock, timeout, [this] { return pendingInputs.empty(); });
}

std::set<int> InputDiscovery::pending() const {
    std::lock_guard lock(mutex);
    return pendingInputs;
}

bool InputDiscovery::discovered() const {
    std::lock_guard lock(mutex);
    return finished;
}

void InputDiscovery::reset() {
    std::lock_guard lock(mutex);
    pendingInputs.clear();
    finished = false;
}

} // namespace anthem
