#pragma once
#include "anthem/net/NetConfig.hpp"
#include "anthem/net/Transport.hpp"

#include <atomic>
#include <memory>

namespace anthem::net {

/**
 * @brief `Transport` over a `tcp::socket` with deadlines and keepalive.
 *
 * Highlights:
 * - `connect(...)` resolves the host and tries each endpoint, each within the
 *   per-attempt timeout.
 * - `readSome(...)` blocks the caller while enforcing a deadline.
 * - `writeAll(...)` blocks until every byte is written; no deadline applies.
 * - All socket work runs on a strand of the owning `io_context`.
 *
 * The owning `asio::io_context` must be running while the API is used; by
 * default that is the process-wide `NetService`.
 */
class TcpClient : public Transport {
public:
    TcpClient();
    explicit TcpClient(std::shared_ptr<asio::io_context> io);
    ~TcpClient() override;

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    std::error_code connect(const std::string& host,
                            std::uint16_t port,
                            duration timeout) override;

    std::error_code connect(const tcp::endpoint& endpoint, duration timeout);

    std::error_code readSome(char* buffer,
                             std::size_t capacity,
                             duration timeout,
                             std::size_t& bytesRead) override;

    std::error_code writeAll(std::string_view data) override;

    // Best-effort cancellation of the pending read. Sticky until the next
    // connect so a read started right after cancel() also aborts.
    void cancel() override;

    void close() override;

    bool isOpen() const override { return open_.load(); }

private:
    std::error_code connectOne(const tcp::endpoint& endpoint, duration timeout);
    void closeOnStrand();

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    std::shared_ptr<asio::io_context> io_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    std::atomic<bool> cancelRequested_{false};
    std::atomic<bool> open_{false};
};

} // namespace anthem::net
