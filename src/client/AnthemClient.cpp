/**
 * @brief Implements the Anthem receiver link: connect/retry, startup
 *        sequence, read loop, and command issuance.
 */
#include "anthem/client/AnthemClient.hpp"

#include "anthem/log/Log.hpp"
#include "anthem/net/NetConfig.hpp"
#include "anthem/net/Resolve.hpp"
#include "anthem/net/TcpClient.hpp"
#include "anthem/protocol/AnthemCommand.hpp"
#include "anthem/protocol/AnthemResponse.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <system_error>
#include <variant>

namespace anthem {

namespace asio = net::asio;
namespace command = protocol::command;

namespace {
// Client whose read loop runs on this thread, if any.
thread_local const AnthemClient* currentReadLoop = nullptr;
} // namespace

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

AnthemClient::AnthemClient(DeviceConfig config)
: AnthemClient(std::move(config), std::make_unique<net::TcpClient>())
{}

AnthemClient::AnthemClient(DeviceConfig config, std::unique_ptr<net::Transport> link)
: deviceConfig(std::move(config))
, transport(std::move(link))
, readBuffer(std::max<std::size_t>(deviceConfig.timing.readChunk, 1))
{}

AnthemClient::~AnthemClient() {
    // Orderly shutdown: stop the read loop and close the link.
    disconnect();
}

expected<void>
AnthemClient::connect(int maxRetries, std::chrono::milliseconds retryDelay) {
    if (onReadLoop()) {
        if (isConnected()) {
            return {};
        }
        // The old worker is this thread; it cannot be joined or replaced here.
        logError("[AnthemClient] connect() from the update callback is not allowed\n");
        return unexpected(std::errc::resource_deadlock_would_occur);
    }

    std::lock_guard lock(lifecycleMutex);

    if (isConnected()) {
        return {};
    }

    if (auto valid = deviceConfig.validate(); !valid) {
        return valid;
    }
    if (maxRetries < 1) {
        logError("[AnthemClient] connect needs at least one attempt, got ", maxRetries, "\n");
        return unexpected(std::errc::invalid_argument);
    }

    // A loop left over from a dropped link must be gone before the new one.
    stopReadLoop();

    stateFlag = ConnectionState::Connecting;
    if (auto opened = openWithRetry(maxRetries, retryDelay); !opened) {
        stateFlag = ConnectionState::Disconnected;
        return opened;
    }

    stateFlag = ConnectionState::Connected;
    logInfo("[AnthemClient] connected to ", deviceConfig.name, "\n");

    if (framer.pending() > 0) {
        logInfo("[AnthemClient] dropping ", framer.pending(), " bytes of an unfinished line\n");
    }
    framer.reset();
    discovery.reset();
    startReadLoop();

    runStartupSequence();
    return {};
}

expected<void>
AnthemClient::openWithRetry(int maxRetries, std::chrono::milliseconds retryDelay) {
    connectAttempts = 0;
    std::error_code last = std::make_error_code(std::errc::not_connected);

    for (int attempt = 1; attempt <= maxRetries; ++attempt) {
        ++connectAttempts;
        logInfo("[AnthemClient] connecting to ", deviceConfig.name, " at ",
                deviceConfig.host, ":", deviceConfig.port,
                " (attempt ", attempt, "/", maxRetries, ")\n");

        std::error_code ec;
        try {
            ec = transport->connect(deviceConfig.host, deviceConfig.port, deviceConfig.timeout);
        } catch (const std::exception& e) {
            // Unknown failure: spend the remaining budget on it.
            logError("[AnthemClient] unexpected connect error to ", deviceConfig.name,
                     ": ", e.what(), " (attempt ", attempt, "/", maxRetries, ")\n");
            last = std::make_error_code(std::errc::io_error);
            if (attempt < maxRetries) {
                std::this_thread::sleep_for(retryDelay);
            }
            continue;
        }

        if (!ec) {
            return {};
        }
        last = ec;

        if (!net::isTransientConnectError(ec)) {
            logError("[AnthemClient] connection error to ", deviceConfig.name, ": ",
                     ec.message(), "\n");
            return unexpected(ec);
        }

        logError("[AnthemClient] connect to ", deviceConfig.name, " failed: ", ec.message(),
                 " (attempt ", attempt, "/", maxRetries, ")\n");
        if (attempt < maxRetries) {
            std::this_thread::sleep_for(retryDelay);
        }
    }

    logError("[AnthemClient] giving up on ", deviceConfig.name, " after ",
             maxRetries, " attempts: ", last.message(), "\n");
    return unexpected(last);
}

void AnthemClient::runStartupSequence() {
    const auto& timing = deviceConfig.timing;

    // Let the read loop start draining before the first command goes out.
    std::this_thread::sleep_for(timing.listenerStartup);

    if (auto sent = sendCommand(command::echoOff()); !sent) {
        logError("[AnthemClient] echo-off failed: ", sent.error().message(), "\n");
    }
    std::this_thread::sleep_for(timing.echoSettle);

    discovery.run([this](const std::string& cmd) { return sendCommand(cmd); },
                  timing, deviceConfig.name);

    if (auto sent = queryPower(1); !sent) {
        logError("[AnthemClient] initial power query failed: ", sent.error().message(), "\n");
    }
}

void AnthemClient::disconnect() {
    if (onReadLoop()) {
        // Stop the loop and drop the state; the next connect() or
        // disconnect() from another thread joins the worker and closes.
        readRunning = false;
        if (stateFlag.exchange(ConnectionState::Disconnected) == ConnectionState::Connected) {
            logInfo("[AnthemClient] disconnect requested from update callback for ",
                    deviceConfig.name, "\n");
        }
        return;
    }

    std::lock_guard lock(lifecycleMutex);

    if (!isConnected()) {
        // Reap whatever a dropped link left behind; nothing to report.
        stopReadLoop();
        if (transport->isOpen()) {
            transport->close();
        }
        return;
    }

    logInfo("[AnthemClient] disconnecting from ", deviceConfig.name, "\n");

    stopReadLoop();
    transport->close();

    stateFlag = ConnectionState::Disconnected;
    logInfo("[AnthemClient] disconnected from ", deviceConfig.name, "\n");
}

expected<void> AnthemClient::sendCommand(std::string_view cmd) {
    if (!isConnected()) {
        logWarning("[AnthemClient] cannot send ", cmd, ": not connected\n");
        return unexpected(std::errc::not_connected);
    }

    std::string line(cmd);
    line.push_back('\r');

    std::error_code ec;
    {
        std::lock_guard lock(writeMutex);
        try {
            ec = transport->writeAll(line);
        } catch (const std::exception& e) {
            logError("[AnthemClient] write threw: ", e.what(), "\n");
            ec = std::make_error_code(std::errc::io_error);
        }
    }

    if (ec) {
        logError("[AnthemClient] error sending ", cmd, ": ", ec.message(), "\n");
        markDisconnected("write failed");
        return unexpected(ec);
    }

    logInfo("[AnthemClient] TX ", cmd, "\n");
    return {};
}

expected<void> AnthemClient::powerOn(int zone) { return sendCommand(command::powerOn(zone)); }
expected<void> AnthemClient::powerOff(int zone) { return sendCommand(command::powerOff(zone)); }

expected<void> AnthemClient::setVolume(int db, int zone) {
    return sendCommand(command::setVolume(zone, db));
}

expected<void> AnthemClient::volumeUp(int zone) { return sendCommand(command::volumeUp(zone)); }
expected<void> AnthemClient::volumeDown(int zone) { return sendCommand(command::volumeDown(zone)); }

expected<void> AnthemClient::setMute(bool muted, int zone) {
    return sendCommand(command::setMute(zone, muted));
}

expected<void> AnthemClient::selectInput(int input, int zone) {
    return sendCommand(command::selectInput(zone, input));
}

expected<void> AnthemClient::queryPower(int zone) { return sendCommand(command::queryPower(zone)); }
expected<void> AnthemClient::queryVolume(int zone) { return sendCommand(command::queryVolume(zone)); }
expected<void> AnthemClient::queryMute(int zone) { return sendCommand(command::queryMute(zone)); }
expected<void> AnthemClient::queryInput(int zone) { return sendCommand(command::queryInput(zone)); }
expected<void> AnthemClient::queryModel() { return sendCommand(command::queryModel()); }

expected<void> AnthemClient::queryAllStatus(int zone) {
    const std::array<std::string, 4> queries{
        command::queryPower(zone),
        command::queryVolume(zone),
        command::queryMute(zone),
        command::queryInput(zone),
    };
    for (std::size_t i = 0; i < queries.size(); ++i) {
        if (i > 0) {
            std::this_thread::sleep_for(deviceConfig.timing.statusQueryInterval);
        }
        if (auto sent = sendCommand(queries[i]); !sent) {
            return sent;
        }
    }
    return {};
}

expected<void> AnthemClient::queryDeviceInfo() {
    const std::array<std::string, 4> queries{
        command::queryModel(),
        command::queryDeviceName(),
        command::queryRegion(),
        command::querySoftwareVersion(),
    };
    for (std::size_t i = 0; i < queries.size(); ++i) {
        if (i > 0) {
            std::this_thread::sleep_for(deviceConfig.timing.statusQueryInterval);
        }
        if (auto sent = sendCommand(queries[i]); !sent) {
            return sent;
        }
    }
    return {};
}

std::string AnthemClient::inputName(int input) const {
    return cache.inputName(input).value_or(protocol::defaultInputName(input));
}

std::optional<int> AnthemClient::inputNumberByName(std::string_view name) const {
    return cache.inputNumberByName(name);
}

void AnthemClient::setUpdateCallback(UpdateCallback callback) {
    std::lock_guard lock(callbackMutex);
    updateCallback = std::move(callback);
}

void AnthemClient::startReadLoop() {
    readRunning = true;
    readWorker = std::thread([this] { readLoop(); });
}

void AnthemClient::stopReadLoop() {
    readRunning = false;
    if (!readWorker.joinable()) {
        return;
    }
    transport->cancel();
    readWorker.join();
}

bool AnthemClient::onReadLoop() const {
    return currentReadLoop == this;
}

void AnthemClient::readLoop() {
    currentReadLoop = this;
    logInfo("[AnthemClient] read loop started for ", deviceConfig.name, "\n");

    try {
        while (readRunning && isConnected()) {
            std::size_t bytesRead = 0;
            const auto ec = transport->readSome(readBuffer.data(), readBuffer.size(),
                                                deviceConfig.timing.readTimeout, bytesRead);

            if (ec == std::errc::timed_out) {
                continue; // quiet receiver, keep listening
            }
            if (ec == std::errc::operation_canceled && !readRunning) {
                break;    // disconnect() cancelled us
            }
            if (ec == asio::error::eof || (!ec && bytesRead == 0)) {
                markDisconnected("connection closed by receiver");
                break;
            }
            if (ec) {
                logError("[AnthemClient] read error from ", deviceConfig.name, ": ",
                         ec.message(), "\n");
                markDisconnected("read failed");
                break;
            }

            framer.append(std::string_view(readBuffer.data(), bytesRead));
            while (auto line = framer.nextLine()) {
                processLine(*line);
            }
        }
    } catch (const std::exception& e) {
        logError("[AnthemClient] read loop error: ", e.what(), "\n");
        markDisconnected("read loop failed");
    }

    logInfo("[AnthemClient] read loop ended for ", deviceConfig.name, "\n");
    currentReadLoop = nullptr;
}

void AnthemClient::processLine(const std::string& line) {
    const auto event = protocol::parseResponse(line);
    logInfo("[AnthemClient] RX ", line, " (", protocol::eventName(event), ")\n");
    if (!cache.apply(event)) {
        return;
    }

    if (const auto* slot = std::get_if<protocol::InputNameDiscovered>(&event)) {
        logInfo("[AnthemClient] input ", slot->input, " is '", slot->name, "'\n");
        discovery.markAnswered(slot->input);
    } else if (const auto* model = std::get_if<protocol::ModelReported>(&event)) {
        logInfo("[AnthemClient] device model: ", model->model, "\n");
    }

    notifyObserver(line);
}

void AnthemClient::notifyObserver(const std::string& line) {
    UpdateCallback callback;
    {
        std::lock_guard lock(callbackMutex);
        callback = updateCallback;
    }
    if (!callback) {
        return;
    }

    try {
        callback(line);
    } catch (const std::exception& e) {
        logError("[AnthemClient] update callback threw: ", e.what(), "\n");
    } catch (...) {
        logError("[AnthemClient] update callback threw a non-standard exception\n");
    }
}

void AnthemClient::markDisconnected(std::string_view reason) {
    auto expectedState = ConnectionState::Connected;
    if (stateFlag.compare_exchange_strong(expectedState, ConnectionState::Disconnected)) {
        logWarning("[AnthemClient] ", deviceConfig.name, ": ", reason, "\n");
    }
}

} // namespace anthem
