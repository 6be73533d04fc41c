#include "ecp/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace ecp::log {

namespace {

LogHandler makeStdoutSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeStderrSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

struct Sinks {
    LogHandler debug = makeStdoutSink();
    LogHandler info = makeStdoutSink();
    LogHandler error = makeStderrSink();
};

std::mutex sinkMutex;
Sinks sinks;
std::atomic<bool> debugEnabled{false};

void dispatch(LogHandler Sinks::*which, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = sinks.*which;
    }
    // Call outside the lock so a handler may log again.
    if (handler) {
        handler(message);
    }
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    sinks.info = handler ? std::move(handler) : makeStdoutSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    sinks.error = handler ? std::move(handler) : makeStderrSink();
}

void setDebugLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    sinks.debug = handler ? std::move(handler) : makeStdoutSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    sinks.info = newInfo ? std::move(newInfo) : makeStdoutSink();
    sinks.error = newError ? std::move(newError) : makeStderrSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    sinks = Sinks{};
}

void setDebugLogging(bool enabled) {
    debugEnabled.store(enabled, std::memory_order_relaxed);
}

bool debugLoggingEnabled() {
    return debugEnabled.load(std::memory_order_relaxed);
}

void logDebug(std::string_view message) {
    if (!debugLoggingEnabled()) {
        return;
    }
    dispatch(&Sinks::debug, message);
}

void logInfo(std::string_view message) {
    dispatch(&Sinks::info, message);
}

void logError(std::string_view message) {
    dispatch(&Sinks::error, message);
}

} // namespace ecp::log
