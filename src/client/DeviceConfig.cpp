#include "anthem/client/DeviceConfig.hpp"

#include "anthem/log/Log.hpp"

namespace anthem {

expected<void> DeviceConfig::validate() const {
    if (host.empty()) {
        logError("[DeviceConfig] '", name, "' has no host\n");
        return unexpected(std::errc::invalid_argument);
    }
    if (port == 0) {
        logError("[DeviceConfig] '", name, "' has port 0\n");
        return unexpected(std::errc::invalid_argument);
    }
    for (int zone : zones) {
        if (zone < 1 || zone > config::ANTHEM_MAX_ZONES) {
            logError("[DeviceConfig] '", name, "' zone ", zone, " out of range 1..",
                     config::ANTHEM_MAX_ZONES, "\n");
            return unexpected(std::errc::invalid_argument);
        }
    }
    if (timeout.count() <= 0) {
        logError("[DeviceConfig] '", name, "' has a non-positive connect timeout\n");
        return unexpected(std::errc::invalid_argument);
    }
    if (timing.inputSlots < 0 || timing.readChunk == 0
        || timing.readTimeout.count() <= 0 || timing.discoveryTimeout.count() <= 0) {
        logError("[DeviceConfig] '", name, "' has invalid protocol timing\n");
        return unexpected(std::errc::invalid_argument);
    }
    return {};
}

} // namespace anthem
