#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace ecp::log {

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setDebugLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

/// Debug output is dropped unless enabled. Off by default.
void setDebugLogging(bool enabled);
bool debugLoggingEnabled();

void logDebug(std::string_view message);
void logInfo(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableIfFormatted = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

} // namespace detail

template<typename First, typename... Rest,
         typename = detail::EnableIfFormatted<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (!debugLoggingEnabled()) {
        return; // skip formatting entirely
    }
    logDebug(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableIfFormatted<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    logInfo(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableIfFormatted<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    logError(detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace ecp::log

namespace ecp {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setDebugLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::setDebugLogging;
using log::logDebug;
using log::logInfo;
using log::logError;
} // namespace ecp
