#pragma once

#include <string>

namespace anthem::protocol::command {

// Outbound command strings, without the trailing carriage return the
// transport appends. Zones and inputs are 1-based.

std::string powerOn(int zone);
std::string powerOff(int zone);

/// `Z<zone>VOL<db>` with @p db clamped to [-90, 0].
std::string setVolume(int zone, int db);
std::string volumeUp(int zone);
std::string volumeDown(int zone);
std::string setMute(int zone, bool muted);
std::string selectInput(int zone, int input);

std::string queryPower(int zone);
std::string queryVolume(int zone);
std::string queryMute(int zone);
std::string queryInput(int zone);

std::string queryModel();
std::string queryDeviceName();
std::string queryRegion();
std::string querySoftwareVersion();
std::string queryInputName(int input);

/// Turns off command echo so only notifications come back.
std::string echoOff();

int clampVolume(int db) noexcept;

} // namespace anthem::protocol::command
