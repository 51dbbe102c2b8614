#pragma once
#include "anthem/net/NetConfig.hpp"

#include <cstdint>
#include <string>

namespace anthem::net {

/**
 * resolve
 *
 * Synchronous lookup of a receiver's host name or dotted address. The port is
 * passed as a service string so the resolver skips the services database.
 */
inline error_code resolve(
    asio::io_context& io,
    const std::string& host,
    std::uint16_t port,
    tcp::resolver::results_type& out)
{
    error_code ec;
    tcp::resolver r(io);
    out = r.resolve(host, std::to_string(port),
                    tcp::resolver::numeric_service, ec);
    return ec;
}

/**
 * True for connect failures worth another attempt after a delay: timeouts
 * and the refused/unreachable/reset family a receiver produces while it is
 * booting or its network interface is coming up.
 */
inline bool isTransientConnectError(const error_code& ec) {
    return ec == asio::error::timed_out
        || ec == asio::error::connection_refused
        || ec == asio::error::connection_reset
        || ec == asio::error::connection_aborted
        || ec == asio::error::network_unreachable
        || ec == asio::error::host_unreachable
        || ec == std::errc::timed_out
        || ec == std::errc::connection_refused
        || ec == std::errc::connection_reset
        || ec == std::errc::connection_aborted
        || ec == std::errc::network_unreachable
        || ec == std::errc::host_unreachable;
}

} // namespace anthem::net
