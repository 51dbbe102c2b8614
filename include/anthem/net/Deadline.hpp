#pragma once
#include "anthem/net/NetConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

/**
 * @brief Blocking wrappers around Asio asynchronous operations.
 *
 * Pattern:
 * - The operation is started on the socket's executor, so the socket is only
 *   ever touched from the I/O thread.
 * - `with_deadline()` arms an `asio::steady_timer` beside it. When the timer
 *   fires first it only cancels the operation; the operation's own completion
 *   always delivers the result, so bytes that landed just before the
 *   deadline are still reported.
 * - The calling thread waits on a condition variable for the result.
 *
 * Safety notes:
 * - Completion handlers hold a `shared_ptr<Completion>`, never references to
 *   the caller's stack, so a handler that runs after the caller returned on
 *   a timeout writes into live memory.
 * - Buffers handed to the operation must outlive it. Transports keep their
 *   read buffer as a member and copy outgoing bytes into shared storage.
 *
 * Requirements:
 * - The associated `asio::io_context` must be running (see `NetService`),
 *   otherwise the wait never completes.
 */
namespace anthem::net {

struct IoResult {
    std::error_code ec;
    std::size_t bytesTransferred = 0;
};

namespace detail {

struct Completion {
    std::mutex m;
    std::condition_variable cv;
    bool done = false;
    IoResult result{asio::error::would_block, 0};
    bool expired = false;

    // Returns false when the other branch already completed.
    bool finish(const std::error_code& ec, std::size_t bytes) {
        {
            std::lock_guard<std::mutex> lk(m);
            if (done) return false;
            result.ec = ec;
            result.bytesTransferred = bytes;
            done = true;
        }
        cv.notify_one();
        return true;
    }

    bool finished() {
        std::lock_guard<std::mutex> lk(m);
        return done;
    }

    // Marks the deadline as passed; false when the operation already finished.
    bool expire() {
        std::lock_guard<std::mutex> lk(m);
        if (done) return false;
        expired = true;
        return true;
    }

    bool hasExpired() {
        std::lock_guard<std::mutex> lk(m);
        return expired;
    }

    IoResult wait() {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [&]{ return done; });
        return result;
    }
};

} // namespace detail

/**
 * Start `start_async(handler)` on `ex` and block until it completes. If
 * `timeout` elapses first, `cancel()` runs on `ex` and an aborted result is
 * reported as `asio::error::timed_out`. An operation that completes normally
 * after the deadline keeps its own result. `start_async` receives a handler
 * taking `(error_code, bytes)`; `cancel()` must make it complete.
 */
template<typename StartAsync, typename Cancel>
IoResult with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    auto st = std::make_shared<detail::Completion>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    asio::post(ex, [st, timer, timeout, start_async, cancel]() mutable {
        start_async([st, timer](const std::error_code& op_ec, std::size_t bytes) {
            std::error_code ec = op_ec;
            if (ec == asio::error::operation_aborted && st->hasExpired()) {
                ec = asio::error::timed_out;
            }
            st->finish(ec, bytes);
            timer->cancel();
        });

        if (st->finished()) {
            return; // completed inline, nothing to time
        }
        timer->expires_after(timeout);
        timer->async_wait([st, cancel](const std::error_code& tec) mutable {
            if (tec == asio::error::operation_aborted) {
                return;
            }
            if (st->expire()) {
                cancel();
            }
        });
    });

    return st->wait();
}

/**
 * Same as `with_deadline()` without a timer. Used for writes, which complete
 * as soon as the kernel accepts the bytes.
 */
template<typename StartAsync>
IoResult await_completion(asio::any_io_executor ex, StartAsync start_async) {
    auto st = std::make_shared<detail::Completion>();

    asio::post(ex, [st, start_async]() mutable {
        start_async([st](const std::error_code& op_ec, std::size_t bytes) {
            st->finish(op_ec, bytes);
        });
    });

    return st->wait();
}

} // namespace anthem::net
