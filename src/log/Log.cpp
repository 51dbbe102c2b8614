#include "anthem/log/Log.hpp"

#include <iostream>
#include <mutex>

namespace anthem::log {

namespace {

LogHandler makeStreamSink(std::ostream& stream) {
    return [&stream](std::string_view message) {
        stream << message;
        stream.flush();
    };
}

LogHandler makeDefaultInfoSink() { return makeStreamSink(std::cout); }
LogHandler makeDefaultWarningSink() { return makeStreamSink(std::cerr); }
LogHandler makeDefaultErrorSink() { return makeStreamSink(std::cerr); }

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler warningHandler = makeDefaultWarningSink();
LogHandler errorHandler = makeDefaultErrorSink();

void dispatch(const LogHandler& slot, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = slot;
    }
    if (handler) {
        handler(message);
    }
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setWarningLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    warningHandler = handler ? std::move(handler) : makeDefaultWarningSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newWarning, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    warningHandler = newWarning ? std::move(newWarning) : makeDefaultWarningSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    warningHandler = makeDefaultWarningSink();
    errorHandler = makeDefaultErrorSink();
}

void logInfo(std::string_view message) {
    dispatch(infoHandler, message);
}

void logWarning(std::string_view message) {
    dispatch(warningHandler, message);
}

void logError(std::string_view message) {
    dispatch(errorHandler, message);
}

} // namespace anthem::log
