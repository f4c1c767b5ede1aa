// src/log.hpp
// Internal helper for the injected on_log callback.

#pragma once

#include "stk/config.hpp"

#include <string>

namespace stk {
namespace log {

inline void emit(const LogCallback& callback, LogLevel level, const std::string& message) {
    if (callback) callback(level, message);
}

inline void debug(const LogCallback& cb, const std::string& msg) { emit(cb, LogLevel::Debug, msg); }
inline void info(const LogCallback& cb, const std::string& msg) { emit(cb, LogLevel::Info, msg); }
inline void warning(const LogCallback& cb, const std::string& msg) { emit(cb, LogLevel::Warning, msg); }
inline void error(const LogCallback& cb, const std::string& msg) { emit(cb, LogLevel::Error, msg); }
inline void critical(const LogCallback& cb, const std::string& msg) { emit(cb, LogLevel::Critical, msg); }

} // namespace log
} // namespace stk
