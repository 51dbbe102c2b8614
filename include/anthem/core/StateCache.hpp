#pragma once

#include "anthem/protocol/AnthemResponse.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace anthem {

/**
 * @brief Last reported state of one zone. Unset fields are unknown.
 */
struct ZoneState {
    std::optional<bool> power;
    std::optional<int> volume;       // dB, -90..0
    std::optional<bool> muted;
    std::optional<int> input;
    std::optional<std::string> inputName;
    std::optional<std::string> audioFormat;
};

/**
 * @brief Last-known-value store fed exclusively by parsed notifications.
 *
 * Nothing is pre-populated: a key appears only once the receiver has
 * reported it. Commands never write here; the receiver's own notification
 * is what updates the cache.
 *
 * Thread safety: all members lock an internal mutex and return copies, so
 * the read loop can apply events while callers read from other threads.
 */
class StateCache {
public:
    using CachedValue = std::variant<bool, int, std::string>;

    /// Apply one parsed event. Returns false for `Unrecognized`.
    bool apply(const protocol::ResponseEvent& event);

    std::optional<ZoneState> zone(int zone) const;

    std::optional<std::string> model() const;
    std::optional<std::string> deviceName() const;
    std::optional<std::string> region() const;
    std::optional<std::string> softwareVersion() const;

    std::map<int, std::string> inputNames() const;
    std::optional<std::string> inputName(int input) const;
    std::optional<int> inputNumberByName(std::string_view name) const;

    /**
     * @brief Look a value up by its protocol key.
     *
     * Global keys: "model", "device_name", "region", "software_version".
     * Zone keys (with @p zone): "power", "volume", "muted", "input",
     * "input_name", "audio_format". Unknown keys and unreported values
     * both yield std::nullopt.
     */
    std::optional<CachedValue> value(std::string_view key,
                                     std::optional<int> zone = std::nullopt) const;

    bool empty() const;

private:
    struct Visitor;

    mutable std::mutex mutex;
    std::optional<std::string> model_;
    std::optional<std::string> deviceName_;
    std::optional<std::string> region_;
    std::optional<std::string> softwareVersion_;
    std::map<int, std::string> inputNames_;
    std::map<int, ZoneState> zones_;
};

} // namespace anthem
