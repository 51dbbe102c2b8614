#pragma once
#include "anthem/client/DeviceConfig.hpp"
#include "anthem/client/InputDiscovery.hpp"
#include "anthem/core/Expected.hpp"
#include "anthem/core/StateCache.hpp"
#include "anthem/net/Transport.hpp"
#include "anthem/protocol/LineFramer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace anthem {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

const char* toString(ConnectionState state);

/**
 * @brief Stateful client for one Anthem receiver on its TCP control port.
 *
 * Responsibilities:
 * - Open the link with bounded retries and run the startup sequence
 *   (echo off, input-name discovery, zone 1 power query).
 * - Drain notifications on a background read loop, parse them, and keep
 *   `StateCache` current.
 * - Encode and send zone commands. Commands never touch the cache; the
 *   receiver's notification is the only source of truth.
 *
 * Threading model:
 * - `connect()` / `disconnect()` are serialised by one lifecycle mutex.
 * - Writes are serialised by a write mutex, so command lines never interleave.
 * - The read loop runs on its own worker thread, one per connection. The
 *   update callback runs on that thread. From there `disconnect()` only stops
 *   the loop, and `connect()` fails with `resource_deadlock_would_occur`
 *   unless the client is still connected.
 *
 * No method throws; failures come back as `expected` errors or as absent
 * cache values.
 */
class AnthemClient {
public:
    using UpdateCallback = std::function<void(const std::string& line)>;

    explicit AnthemClient(DeviceConfig config);

    /// Use a caller-supplied transport instead of a TCP socket.
    AnthemClient(DeviceConfig config, std::unique_ptr<net::Transport> transport);

    ~AnthemClient();

    // non-copyable / non-movable
    AnthemClient(const AnthemClient&) = delete;
    AnthemClient& operator=(const AnthemClient&) = delete;
    AnthemClient(AnthemClient&&) = delete;
    AnthemClient& operator=(AnthemClient&&) = delete;

    /**
     * @brief Connect, retrying transient failures.
     * @param maxRetries Total number of attempts (at least 1).
     * @param retryDelay Pause between attempts.
     *
     * Returns success immediately when already connected.
     */
    expected<void> connect(int maxRetries = anthem::config::ANTHEM_CONNECT_ATTEMPTS,
                           std::chrono::milliseconds retryDelay = anthem::config::ANTHEM_RETRY_DELAY);

    void disconnect();                  // idempotent
    void close() { disconnect(); }

    /// Send one raw command line; the carriage return is appended here.
    expected<void> sendCommand(std::string_view command);

    // Zone commands -----------------------------------------------------------
    expected<void> powerOn(int zone = 1);
    expected<void> powerOff(int zone = 1);
    expected<void> setVolume(int db, int zone = 1);
    expected<void> volumeUp(int zone = 1);
    expected<void> volumeDown(int zone = 1);
    expected<void> setMute(bool muted, int zone = 1);
    expected<void> selectInput(int input, int zone = 1);

    // Queries: answers arrive asynchronously as notifications ---------------
    expected<void> queryPower(int zone = 1);
    expected<void> queryVolume(int zone = 1);
    expected<void> queryMute(int zone = 1);
    expected<void> queryInput(int zone = 1);
    expected<void> queryModel();

    /// Power, volume, mute and input queries, paced by `statusQueryInterval`.
    expected<void> queryAllStatus(int zone = 1);

    /// Model, name, region and software version queries.
    expected<void> queryDeviceInfo();

    // Cached state ------------------------------------------------------------
    std::optional<ZoneState> zoneState(int zone) const { return cache.zone(zone); }
    std::optional<StateCache::CachedValue> cachedValue(std::string_view key,
                                                       std::optional<int> zone = std::nullopt) const {
        return cache.value(key, zone);
    }
    std::optional<std::string> model() const { return cache.model(); }
    std::optional<std::string> reportedName() const { return cache.deviceName(); }
    std::optional<std::string> region() const { return cache.region(); }
    std::optional<std::string> softwareVersion() const { return cache.softwareVersion(); }
    const StateCache& state() const { return cache; }

    std::map<int, std::string> inputNames() const { return cache.inputNames(); }

    /// Discovered name, or "Input <n>" when the slot never answered.
    std::string inputName(int input) const;
    std::optional<int> inputNumberByName(std::string_view name) const;
    bool inputNamesDiscovered() const { return discovery.discovered(); }

    /// Single slot: a new callback replaces the previous one. Pass an empty
    /// function to clear it.
    void setUpdateCallback(UpdateCallback callback);

    // Identity and status -----------------------------------------------------
    bool isConnected() const { return connectionState() == ConnectionState::Connected; }
    ConnectionState connectionState() const { return stateFlag.load(); }
    const DeviceConfig& config() const { return deviceConfig; }
    const std::string& deviceName() const { return deviceConfig.name; }
    const std::string& deviceHost() const { return deviceConfig.host; }

    /// Number of transport connect attempts made by the most recent connect().
    int lastConnectAttempts() const { return connectAttempts.load(); }

private:
    expected<void> openWithRetry(int maxRetries, std::chrono::milliseconds retryDelay);
    void runStartupSequence();

    void startReadLoop();
    void stopReadLoop();
    void readLoop();
    bool onReadLoop() const;

    void processLine(const std::string& line);
    void notifyObserver(const std::string& line);

    void markDisconnected(std::string_view reason);

    DeviceConfig deviceConfig;
    std::unique_ptr<net::Transport> transport;

    StateCache cache;
    InputDiscovery discovery;
    protocol::LineFramer framer;
    std::vector<char> readBuffer;

    std::mutex lifecycleMutex;
    std::mutex writeMutex;
    std::atomic<ConnectionState> stateFlag{ConnectionState::Disconnected};
    std::atomic<int> connectAttempts{0};

    std::thread readWorker;
    std::atomic<bool> readRunning{false};

    mutable std::mutex callbackMutex;
    UpdateCallback updateCallback{};
};

} // namespace anthem
