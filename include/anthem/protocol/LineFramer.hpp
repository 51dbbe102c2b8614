#pragma once

#include "anthem/client/AnthemConfig.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace anthem::protocol {

/**
 * @brief Reassembles CR/LF-terminated protocol lines from arbitrary chunks.
 *
 * Bytes are decoded as ASCII: NUL and anything above 0x7F is dropped rather
 * than failing the chunk. Either terminator ends a line, whichever comes
 * first, so "\r\n" yields one line plus an empty one that `nextLine()` skips.
 * Lines are trimmed of surrounding whitespace and empty lines never surface.
 * Unterminated data longer than `maxPending` bytes is discarded with a
 * warning.
 */
class LineFramer {
public:
    explicit LineFramer(std::size_t limit = config::ANTHEM_MAX_LINE_BYTES)
    : maxPending(limit)
    {}

    /// Append a raw chunk as received from the socket.
    void append(std::string_view chunk);

    /// Pop the next complete, non-empty line, if any.
    std::optional<std::string> nextLine();

    /// Bytes held back waiting for a terminator.
    std::size_t pending() const { return buffer.size(); }

    void reset() { buffer.clear(); }

private:
    std::size_t maxPending;
    std::string buffer;
};

/// Strip leading and trailing ASCII whitespace.
std::string_view trim(std::string_view text);

} // namespace anthem::protocol
