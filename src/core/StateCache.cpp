#include "anthem/core/StateCache.hpp"

namespace anthem {

using namespace protocol;

// Called with the cache mutex held.
struct StateCache::Visitor {
    StateCache& cache;

    bool operator()(const Unrecognized&) const { return false; }
    bool operator()(const ModelReported& e) const { cache.model_ = e.model; return true; }
    bool operator()(const DeviceNameReported& e) const { cache.deviceName_ = e.name; return true; }
    bool operator()(const RegionReported& e) const { cache.region_ = e.region; return true; }
    bool operator()(const SoftwareVersionReported& e) const { cache.softwareVersion_ = e.version; return true; }
    bool operator()(const InputNameDiscovered& e) const { cache.inputNames_[e.input] = e.name; return true; }
    bool operator()(const PowerChanged& e) const { cache.zones_[e.zone].power = e.on; return true; }
    bool operator()(const VolumeChanged& e) const { cache.zones_[e.zone].volume = e.db; return true; }
    bool operator()(const MuteChanged& e) const { cache.zones_[e.zone].muted = e.muted; return true; }
    bool operator()(const InputChanged& e) const { cache.zones_[e.zone].input = e.input; return true; }
    bool operator()(const InputNameChanged& e) const { cache.zones_[e.zone].inputName = e.name; return true; }
    bool operator()(const AudioFormatChanged& e) const { cache.zones_[e.zone].audioFormat = e.format; return true; }
};

bool StateCache::apply(const ResponseEvent& event) {
    std::lock_guard lock(mutex);
    return std::visit(Visitor{*this}, event);
}

std::optional<ZoneState> StateCache::zone(int zone) const {
    std::lock_guard lock(mutex);
    auto it = zones_.find(zone);
    if (it == zones_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> StateCache::model() const {
    std::lock_guard lock(mutex);
    return model_;
}

std::optional<std::string> StateCache::deviceName() const {
    std::lock_guard lock(mutex);
    return deviceName_;
}

std::optional<std::string> StateCache::region() const {
    std::lock_guard lock(mutex);
    return region_;
}

std::optional<std::string> StateCache::softwareVersion() const {
    std::lock_guard lock(mutex);
    return softwareVersion_;
}

std::map<int, std::string> StateCache::inputNames() const {
    std::lock_guard lock(mutex);
    return inputNames_;
}

std::optional<std::string> StateCache::inputName(int input) const {
    std::lock_guard lock(mutex);
    auto it = inputNames_.find(input);
    if (it == inputNames_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> StateCache::inputNumberByName(std::string_view name) const {
    std::lock_guard lock(mutex);
    for (const auto& [input, inputName] : inputNames_) {
        if (inputName == name) {
            return input;
        }
    }
    return std::nullopt;
}

std::optional<StateCache::CachedValue>
StateCache::value(std::string_view key, std::optional<int> zone) const {
    std::lock_guard lock(mutex);

    auto wrap = [](const auto& field) -> std::optional<CachedValue> {
        if (!field) return std::nullopt;
        return CachedValue{*field};
    };

    if (!zone) {
        if (key == "model") return wrap(model_);
        if (key == "device_name") return wrap(deviceName_);
        if (key == "region") return wrap(region_);
        if (key == "software_version") return wrap(softwareVersion_);
        return std::nullopt;
    }

    auto it = zones_.find(*zone);
    if (it == zones_.end()) {
        return std::nullopt;
    }
    const ZoneState& state = it->second;
    if (key == "power") return wrap(state.power);
    if (key == "volume") return wrap(state.volume);
    if (key == "muted") return wrap(state.muted);
    if (key == "input") return wrap(state.input);
    if (key == "input_name") return wrap(state.inputName);
    if (key == "audio_format") return wrap(state.audioFormat);
    return std::nullopt;
}

bool StateCache::empty() const {
    std::lock_guard lock(mutex);
    return !model_ && !deviceName_ && !region_ && !softwareVersion_
        && inputNames_.empty() && zones_.empty();
}

} // namespace anthem
