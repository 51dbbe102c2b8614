#pragma once

#include <asio.hpp>
#include <system_error>

namespace anthem::net {

/**
 * @brief Networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `anthem::net::asio` as the standalone Asio namespace.
 * - `anthem::net::tcp` as the protocol alias used by the receiver link.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;

} // namespace anthem::net
