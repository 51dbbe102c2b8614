#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace anthem::net {

/**
 * @brief Byte-stream link to one receiver.
 *
 * `AnthemClient` talks to the receiver only through this interface so the
 * connection manager can be driven by a scripted transport in tests.
 *
 * Threading contract:
 * - `readSome()` is called from the read-loop worker only.
 * - `writeAll()` may be called from any thread; the client serialises it.
 * - `cancel()` may be called from any thread and must make a pending or
 *   subsequent `readSome()` return `operation_canceled` promptly,
 *   until the next successful `connect()`.
 *
 * Errors compare equal to the matching `std::errc` value (timed_out,
 * operation_canceled, ...) so callers need not know the transport's
 * error category.
 */
class Transport {
public:
    using duration = std::chrono::milliseconds;

    virtual ~Transport() = default;

    /// Open a connection, giving up after @p timeout with `timed_out`.
    virtual std::error_code connect(const std::string& host,
                                    std::uint16_t port,
                                    duration timeout) = 0;

    /**
     * @brief Read whatever is available, up to @p capacity bytes.
     *
     * Returns `timed_out` when nothing arrived within @p timeout. A closed
     * peer is reported as `asio::error::eof` or as success with zero bytes.
     */
    virtual std::error_code readSome(char* buffer,
                                     std::size_t capacity,
                                     duration timeout,
                                     std::size_t& bytesRead) = 0;

    /// Write every byte of @p data; there is no deadline on writes.
    virtual std::error_code writeAll(std::string_view data) = 0;

    virtual void cancel() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

} // namespace anthem::net
