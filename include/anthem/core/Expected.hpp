// Expected.hpp
// -----------------------------------------------------------------------------
// Success/error pair used across the client. Every fallible operation returns
// `anthem::expected<T>` carrying a std::error_code, either from std::errc or
// from one of the asio categories, so callers can branch on `if (!result)` and
// still log `result.error().message()`.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace anthem {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

/// Shorthand for the common `unexpected(std::make_error_code(std::errc::...))`.
[[nodiscard]] inline unexpected_t<std::error_code> unexpected(std::errc code) {
    return unexpected_t<std::error_code>(std::make_error_code(code));
}

} // namespace anthem
