#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace anthem::protocol {

/**
 * @brief Typed outcome of parsing one notification line from the receiver.
 *
 * Every line maps to exactly one alternative; `Unrecognized` covers anything
 * the client does not track, malformed arguments included. Applying an event
 * to the cache is the job of `StateCache::apply()`.
 */
struct Unrecognized {};

struct ModelReported { std::string model; };
struct DeviceNameReported { std::string name; };
struct RegionReported { std::string region; };
struct SoftwareVersionReported { std::string version; };

/// `ISN<n>"<name>"`; an empty name is already replaced by "Input <n>".
struct InputNameDiscovered {
    int input = 0;
    std::string name;
};

struct PowerChanged { int zone = 0; bool on = false; };
struct VolumeChanged { int zone = 0; int db = 0; };
struct MuteChanged { int zone = 0; bool muted = false; };
struct InputChanged { int zone = 0; int input = 0; };
struct InputNameChanged { int zone = 0; std::string name; };
struct AudioFormatChanged { int zone = 0; std::string format; };

using ResponseEvent = std::variant<
    Unrecognized,
    ModelReported,
    DeviceNameReported,
    RegionReported,
    SoftwareVersionReported,
    InputNameDiscovered,
    PowerChanged,
    VolumeChanged,
    MuteChanged,
    InputChanged,
    InputNameChanged,
    AudioFormatChanged>;

/// Classify a trimmed protocol line.
ResponseEvent parseResponse(std::string_view line);

inline bool isRecognized(const ResponseEvent& event) {
    return !std::holds_alternative<Unrecognized>(event);
}

/// Short label for logging, e.g. "power" or "input-name".
const char* eventName(const ResponseEvent& event);

/// Fallback label for an input slot without a name.
std::string defaultInputName(int input);

} // namespace anthem::protocol
