#include "anthem/protocol/AnthemResponse.hpp"

#include "anthem/protocol/LineFramer.hpp"

#include <array>
#include <charconv>
#include <optional>

namespace anthem::protocol {
namespace {

bool startsWith(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Parses a run of digits (with optional sign when allowed) at the front of
// @p text and advances it past them.
std::optional<int> takeInt(std::string_view& text, bool allowSign) {
    std::size_t pos = 0;
    if (allowSign && !text.empty() && (text[0] == '-' || text[0] == '+')) {
        pos = 1;
    }
    std::size_t end = pos;
    while (end < text.size() && isDigit(text[end])) ++end;
    if (end == pos) {
        return std::nullopt;
    }

    // from_chars rejects a leading '+'.
    const std::size_t first = (text[0] == '+') ? 1 : 0;
    int value = 0;
    const auto* begin = text.data() + first;
    const auto [ptr, ec] = std::from_chars(begin, text.data() + end, value);
    if (ec != std::errc{} || ptr != text.data() + end) {
        return std::nullopt;
    }
    text.remove_prefix(end);
    return value;
}

// `"<text>"` at the front of @p text; returns the text between the quotes.
std::optional<std::string_view> takeQuoted(std::string_view text) {
    if (text.empty() || text.front() != '"') {
        return std::nullopt;
    }
    const auto close = text.find('"', 1);
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    return text.substr(1, close - 1);
}

std::optional<bool> takeFlag(std::string_view text) {
    if (text.empty()) return std::nullopt;
    if (text.front() == '0') return false;
    if (text.front() == '1') return true;
    return std::nullopt;
}

ResponseEvent parseInputName(std::string_view rest) {
    const auto input = takeInt(rest, false);
    if (!input) {
        return Unrecognized{};
    }
    const auto quoted = takeQuoted(rest);
    if (!quoted) {
        return Unrecognized{};
    }
    const auto name = trim(*quoted);
    return InputNameDiscovered{*input, name.empty() ? defaultInputName(*input) : std::string(name)};
}

constexpr std::array<std::string_view, 6> ZONE_VERBS{"POW", "VOL", "MUT", "INP", "SIP", "AIC"};

ResponseEvent parseZoneVerb(int zone, std::string_view verb, std::string_view arg) {
    if (verb == "POW") {
        if (auto flag = takeFlag(arg)) return PowerChanged{zone, *flag};
    } else if (verb == "VOL") {
        if (auto db = takeInt(arg, true)) return VolumeChanged{zone, *db};
    } else if (verb == "MUT") {
        if (auto flag = takeFlag(arg)) return MuteChanged{zone, *flag};
    } else if (verb == "INP") {
        if (auto input = takeInt(arg, false)) return InputChanged{zone, *input};
    } else if (verb == "SIP") {
        if (auto name = takeQuoted(arg)) return InputNameChanged{zone, std::string(*name)};
    } else if (verb == "AIC") {
        if (auto format = takeQuoted(arg)) return AudioFormatChanged{zone, std::string(*format)};
    }
    return Unrecognized{};
}

ResponseEvent parseZone(std::string_view rest) {
    const auto zone = takeInt(rest, false);
    if (!zone) {
        return Unrecognized{};
    }

    // First known verb after the zone number wins; quoted text is skipped so
    // a source called "POWER AMP" cannot masquerade as a power report.
    std::size_t i = 0;
    while (i < rest.size()) {
        if (rest[i] == '"') {
            const auto close = rest.find('"', i + 1);
            if (close == std::string_view::npos) break;
            i = close + 1;
            continue;
        }
        for (auto verb : ZONE_VERBS) {
            if (startsWith(rest.substr(i), verb)) {
                return parseZoneVerb(*zone, verb, rest.substr(i + verb.size()));
            }
        }
        ++i;
    }
    return Unrecognized{};
}

} // namespace

std::string defaultInputName(int input) {
    return "Input " + std::to_string(input);
}

ResponseEvent parseResponse(std::string_view line) {
    if (startsWith(line, "IDM")) {
        return ModelReported{std::string(trim(line.substr(3)))};
    }
    if (startsWith(line, "IDN")) {
        return DeviceNameReported{std::string(trim(line.substr(3)))};
    }
    if (startsWith(line, "IDR")) {
        return RegionReported{std::string(trim(line.substr(3)))};
    }
    if (startsWith(line, "IDS")) {
        return SoftwareVersionReported{std::string(trim(line.substr(3)))};
    }
    if (startsWith(line, "ISN")) {
        return parseInputName(line.substr(3));
    }
    if (startsWith(line, "Z")) {
        return parseZone(line.substr(1));
    }
    return Unrecognized{};
}

const char* eventName(const ResponseEvent& event) {
    struct Namer {
        const char* operator()(const Unrecognized&) const { return "unrecognized"; }
        const char* operator()(const ModelReported&) const { return "model"; }
        const char* operator()(const DeviceNameReported&) const { return "device-name"; }
        const char* operator()(const RegionReported&) const { return "region"; }
        const char* operator()(const SoftwareVersionReported&) const { return "software-version"; }
        const char* operator()(const InputNameDiscovered&) const { return "input-slot-name"; }
        const char* operator()(const PowerChanged&) const { return "power"; }
        const char* operator()(const VolumeChanged&) const { return "volume"; }
        const char* operator()(const MuteChanged&) const { return "mute"; }
        const char* operator()(const InputChanged&) const { return "input"; }
        const char* operator()(const InputNameChanged&) const { return "input-name"; }
        const char* operator()(const AudioFormatChanged&) const { return "audio-format"; }
    };
    return std::visit(Namer{}, event);
}

} // namespace anthem::protocol
