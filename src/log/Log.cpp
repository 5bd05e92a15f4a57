#include "qlink/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace qlink::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
LogHandler debugHandler;
std::atomic<bool> debugEnabled{false};

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

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void setDebugLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    debugEnabled = static_cast<bool>(handler);
    debugHandler = std::move(handler);
}

bool debugLogEnabled() {
    return debugEnabled.load(std::memory_order_relaxed);
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
    debugHandler = nullptr;
    debugEnabled = false;
}

void logInfo(std::string_view message) {
    dispatch(infoHandler, message);
}

void logError(std::string_view message) {
    dispatch(errorHandler, message);
}

void logDebug(std::string_view message) {
    if (!debugLogEnabled()) {
        return;
    }
    dispatch(debugHandler, message);
}

} // namespace qlink::log
