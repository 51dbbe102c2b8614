#include "anthem/client/AnthemClient.hpp"
#include "anthem/log/Log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace anthem;

namespace {

std::atomic<bool> keepRunning{true};

void onSignal(int) {
    keepRunning = false;
}

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <host> [port] [name]\n"
              << "  Connects to an Anthem receiver, prints every notification,\n"
              << "  and dumps the cached zone state on Ctrl-C.\n";
}

void printZone(const AnthemClient& client, int zone) {
    const auto state = client.zoneState(zone);
    std::cout << "Zone " << zone << ":";
    if (!state) {
        std::cout << " (no reports)\n";
        return;
    }
    if (state->power) std::cout << " power=" << (*state->power ? "on" : "off");
    if (state->volume) std::cout << " volume=" << *state->volume << "dB";
    if (state->muted) std::cout << " muted=" << (*state->muted ? "yes" : "no");
    if (state->input) std::cout << " input=" << *state->input
                                << " (" << client.inputName(*state->input) << ")";
    if (state->audioFormat) std::cout << " format=" << *state->audioFormat;
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    DeviceConfig config;
    config.host = argv[1];
    if (argc > 2) {
        const long port = std::strtol(argv[2], nullptr, 10);
        if (port <= 0 || port > 65535) {
            std::cerr << "invalid port: " << argv[2] << "\n";
            return 2;
        }
        config.port = static_cast<std::uint16_t>(port);
    }
    if (argc > 3) {
        config.name = argv[3];
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    AnthemClient client(config);
    client.setUpdateCallback([](const std::string& line) {
        std::cout << "<- " << line << std::endl;
    });

    if (auto r = client.connect(); !r) {
        const auto err = r.error();
        std::cerr << "Connect failed: " << err.message()
                  << " (" << err.category().name() << ":" << err.value() << ")\n";
        return 1;
    }

    if (auto r = client.queryDeviceInfo(); !r) {
        logError("device info query failed: ", r.error().message(), "\n");
    }
    for (int zone : config.zones) {
        if (auto r = client.queryAllStatus(zone); !r) {
            logError("status query for zone ", zone, " failed: ", r.error().message(), "\n");
        }
    }

    while (keepRunning && client.isConnected()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (client.state().empty()) {
        std::cout << "The receiver reported nothing.\n";
    }
    std::cout << "Model: " << client.model().value_or("?") << "\n";
    for (const auto& [input, name] : client.inputNames()) {
        std::cout << "Input " << input << ": " << name << "\n";
    }
    for (int zone : config.zones) {
        printZone(client, zone);
    }

    client.disconnect();
    std::cout << "Done." << std::endl;
    return 0;
}
