#pragma once
#include "anthem/net/NetConfig.hpp"

#include <memory>
#include <thread>

namespace anthem::net {

/**
 * @brief Owns the `asio::io_context` that drives every receiver socket and timer.
 *
 * One background thread runs the context, so all completion handlers execute
 * on that thread. Callers on other threads block on the results through
 * `with_deadline()` or `await_completion()`.
 *
 * Lifetime notes:
 * - Destroy clients before the service so their handlers finish while the
 *   context is still running.
 * - The destructor releases the work guard, stops the context and joins.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    void runLoop();

    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

/// Context of the process-wide service, for transports not given one.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace anthem::net
