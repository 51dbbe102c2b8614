#include "anthem/protocol/LineFramer.hpp"

#include "anthem/log/Log.hpp"

namespace anthem::protocol {
namespace {
bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}
} // namespace

std::string_view trim(std::string_view text) {
    while (!text.empty() && isSpace(text.front())) text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back())) text.remove_suffix(1);
    return text;
}

void LineFramer::append(std::string_view chunk) {
    buffer.reserve(buffer.size() + chunk.size());
    for (char c : chunk) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte == 0 || byte > 0x7F) {
            continue;
        }
        buffer.push_back(c);
    }

    if (buffer.size() > maxPending && buffer.find_first_of("\r\n") == std::string::npos) {
        logWarning("[LineFramer] dropping ", buffer.size(),
                   " bytes without a line terminator\n");
        buffer.clear();
    }
}

std::optional<std::string> LineFramer::nextLine() {
    for (;;) {
        const auto end = buffer.find_first_of("\r\n");
        if (end == std::string::npos) {
            return std::nullopt;
        }

        const auto line = trim(std::string_view(buffer).substr(0, end));
        std::string out(line);
        buffer.erase(0, end + 1);

        if (!out.empty()) {
            return out;
        }
    }
}

} // namespace anthem::protocol
