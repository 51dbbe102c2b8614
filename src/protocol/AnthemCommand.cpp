#include "anthem/protocol/AnthemCommand.hpp"

#include "anthem/client/AnthemConfig.hpp"

#include <algorithm>

namespace anthem::protocol::command {
namespace {
std::string zoneCommand(int zone, const char* verb, const std::string& arg = {}) {
    return "Z" + std::to_string(zone) + verb + arg;
}
} // namespace

int clampVolume(int db) noexcept {
    return std::clamp(db, config::ANTHEM_VOLUME_MIN_DB, config::ANTHEM_VOLUME_MAX_DB);
}

std::string powerOn(int zone) { return zoneCommand(zone, "POW", "1"); }
std::string powerOff(int zone) { return zoneCommand(zone, "POW", "0"); }

std::string setVolume(int zone, int db) {
    return zoneCommand(zone, "VOL", std::to_string(clampVolume(db)));
}

std::string volumeUp(int zone) { return zoneCommand(zone, "VUP"); }
std::string volumeDown(int zone) { return zoneCommand(zone, "VDN"); }

std::string setMute(int zone, bool muted) {
    return zoneCommand(zone, "MUT", muted ? "1" : "0");
}

std::string selectInput(int zone, int input) {
    return zoneCommand(zone, "INP", std::to_string(input));
}

std::string queryPower(int zone) { return zoneCommand(zone, "POW?"); }
std::string queryVolume(int zone) { return zoneCommand(zone, "VOL?"); }
std::string queryMute(int zone) { return zoneCommand(zone, "MUT?"); }
std::string queryInput(int zone) { return zoneCommand(zone, "INP?"); }

std::string queryModel() { return "IDM?"; }
std::string queryDeviceName() { return "IDN?"; }
std::string queryRegion() { return "IDR?"; }
std::string querySoftwareVersion() { return "IDS?"; }

std::string queryInputName(int input) {
    return "ISN" + std::to_string(input) + "?";
}

std::string echoOff() { return "ECH0"; }

} // namespace anthem::protocol::command
