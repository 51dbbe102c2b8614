#include "anthem/client/AnthemClient.hpp"
#include "TestAssert.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;

#define REQUIRE(cond, msg) \
    do { \
        if (!(cond)) { \
            std::fprintf(stderr, "REQUIRE FAILED: %s @ %s:%d\n", msg, __FILE__, __LINE__); \
            std::exit(1); \
        } \
    } while (0)

namespace {

/**
 * Minimal receiver on 127.0.0.1: answers input-name, power and model
 * queries and echoes set commands back as notifications, one client at a
 * time.
 */
class DummyReceiver {
public:
    DummyReceiver() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(listenFd_ >= 0, "socket");

        int opt = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0; // let the OS choose

        REQUIRE(::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
        REQUIRE(::listen(listenFd_, 4) == 0, "listen");

        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0, "getsockname");
        port_ = ntohs(addr.sin_port);

        running_.store(true);
        thread_ = std::thread([this] { run(); });
    }

    ~DummyReceiver() { stop(); }

    void stop() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }
        ::shutdown(listenFd_, SHUT_RDWR);
        ::close(listenFd_);
        dropClient();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // Close the current client connection from the receiver side.
    void dropClient() {
        const int fd = clientFd_.exchange(-1);
        if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
            ::close(fd);
        }
    }

    std::uint16_t port() const { return port_; }
    int connectionsAccepted() const { return acceptedCount_.load(); }

    std::vector<std::string> received() {
        std::lock_guard lock(mutex_);
        return received_;
    }

    bool hasReceived(const std::string& line) {
        std::lock_guard lock(mutex_);
        for (const auto& r : received_) {
            if (r == line) return true;
        }
        return false;
    }

private:
    void run() {
        while (running_.load()) {
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0) {
                if (!running_.load()) break;
                continue;
            }
            acceptedCount_.fetch_add(1);
            clientFd_.store(client);
            serve(client);
        }
    }

    void serve(int fd) {
        std::string pending;
        char buf[256];
        for (;;) {
            const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            pending.append(buf, static_cast<std::size_t>(n));

            std::size_t cr;
            while ((cr = pending.find('\r')) != std::string::npos) {
                const std::string line = pending.substr(0, cr);
                pending.erase(0, cr + 1);
                {
                    std::lock_guard lock(mutex_);
                    received_.push_back(line);
                }
                const std::string reply = answer(line);
                if (!reply.empty()) {
                    ::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL);
                }
            }
        }
        int expected = fd;
        if (clientFd_.compare_exchange_strong(expected, -1)) {
            ::close(fd);
        }
    }

    static std::string answer(const std::string& line) {
        if (line.rfind("ISN", 0) == 0 && line.back() == '?') {
            const auto slot = line.substr(3, line.size() - 4);
            return "ISN" + slot + "\"HDMI " + slot + "\"\r\n";
        }
        if (line == "Z1POW?") return "Z1POW1\r\n";
        if (line == "IDM?") return "IDMMRX 720\r\n";
        if (line.rfind("Z1VOL", 0) == 0 && line != "Z1VOL?") return line + "\r\n";
        if (line.rfind("Z1INP", 0) == 0 && line != "Z1INP?") {
            return line + "\r\nZ1SIP\"HDMI " + line.substr(5) + "\"\r\n";
        }
        return {};
    }

    int listenFd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<int> acceptedCount_{0};
    std::atomic<int> clientFd_{-1};
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> received_;
};

anthem::DeviceConfig loopbackConfig(std::uint16_t port) {
    anthem::DeviceConfig config;
    config.name = "Loopback MRX";
    config.host = "127.0.0.1";
    config.port = port;
    config.timeout = 500ms;
    config.timing.listenerStartup = 20ms;
    config.timing.echoSettle = 5ms;
    config.timing.inputQueryInterval = 2ms;
    config.timing.discoveryTimeout = 2000ms;
    config.timing.statusQueryInterval = 5ms;
    config.timing.readTimeout = 100ms; // several liveness timeouts per test
    return config;
}

// A port that refuses connections: bind, read the number, release it.
std::uint16_t closedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0, "socket");
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0, "getsockname");
    ::close(fd);
    return ntohs(addr.sin_port);
}

} // namespace

static void testSessionAgainstReceiver() {
    DummyReceiver receiver;
    anthem::AnthemClient client(loopbackConfig(receiver.port()));

    auto connected = client.connect(3, 50ms);
    ASSERT_TRUE(connected.has_value(), "connect to loopback receiver");
    if (!connected) return;

    ASSERT_TRUE(client.inputNamesDiscovered(), "discovery ran");
    ASSERT_EQ(client.inputNames().size(), std::size_t{15}, "all slots named");
    ASSERT_EQ(client.inputName(15), std::string("HDMI 15"), "slot name");
    ASSERT_TRUE(receiver.hasReceived("ECH0"), "echo disabled");

    ASSERT_TRUE(waitFor([&] {
        auto zone = client.zoneState(1);
        return zone && zone->power && *zone->power;
    }), "primed power state");

    // Survive a few read-loop liveness timeouts with no traffic.
    std::this_thread::sleep_for(350ms);
    ASSERT_TRUE(client.isConnected(), "quiet link stays up");

    ASSERT_TRUE(client.setVolume(-40).has_value(), "set volume");
    ASSERT_TRUE(waitFor([&] {
        auto zone = client.zoneState(1);
        return zone && zone->volume && *zone->volume == -40;
    }), "volume notification cached");

    ASSERT_TRUE(client.selectInput(4).has_value(), "select input");
    ASSERT_TRUE(waitFor([&] {
        auto zone = client.zoneState(1);
        return zone && zone->inputName && *zone->inputName == "HDMI 4";
    }), "input name notification cached");
    ASSERT_EQ(client.inputNumberByName("HDMI 4").value_or(-1), 4, "inverse lookup");

    ASSERT_TRUE(client.queryModel().has_value(), "model query");
    ASSERT_TRUE(waitFor([&] { return client.model().value_or("") == "MRX 720"; }), "model cached");

    receiver.dropClient();
    ASSERT_TRUE(waitFor([&] { return !client.isConnected(); }), "receiver hang-up noticed");
    ASSERT_TRUE(!client.powerOn().has_value(), "commands fail after hang-up");

    client.disconnect();
    client.disconnect();
    ASSERT_TRUE(client.connectionState() == anthem::ConnectionState::Disconnected, "disconnected");

    ASSERT_TRUE(client.connect(3, 50ms).has_value(), "reconnect");
    ASSERT_EQ(receiver.connectionsAccepted(), 2, "second session accepted");
    ASSERT_TRUE(client.model().value_or("") == "MRX 720", "cache survives reconnect");
    client.disconnect();
    ASSERT_TRUE(!client.isConnected(), "closed");
}

static void testRefusedConnectionRetries() {
    anthem::AnthemClient client(loopbackConfig(closedPort()));

    const auto start = std::chrono::steady_clock::now();
    auto connected = client.connect(2, 50ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(!connected.has_value(), "nothing listening");
    ASSERT_EQ(client.lastConnectAttempts(), 2, "both attempts used");
    ASSERT_TRUE(elapsed >= 50ms, "waited between attempts");
    ASSERT_TRUE(!client.isConnected(), "still disconnected");
}

int main() {
    testSessionAgainstReceiver();
    testRefusedConnectionRetries();
    return finishTests("AnthemLoopback");
}
