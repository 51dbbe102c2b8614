#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace anthem::log {

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setWarningLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler warningHandler, LogHandler errorHandler);
void resetLogHandlers();

void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

// Single string-like arguments go straight to the non-template sinks.
template<typename First, typename... Rest>
constexpr bool needsFormatting =
    (sizeof...(Rest) > 0) || !std::is_convertible<std::decay_t<First>, std::string_view>::value;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logWarning(First&& first, Rest&&... rest) {
    logWarning(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logError(First&& first, Rest&&... rest) {
    logError(std::string_view(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)));
}

} // namespace anthem::log

namespace anthem {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setWarningLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace anthem
