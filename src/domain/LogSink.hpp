/**
 * @file LogSink.hpp
 * @brief Callback type through which components report progress and errors.
 */

#pragma once
#include <functional>
#include <string>

namespace streamsieve::domain {

enum class LogLevel { Info, Warning, Error };

inline const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

/**
 * @brief Receives (level, component tag, message). Must be callable from any thread.
 */
using LogSink = std::function<void(LogLevel, const std::string&, const std::string&)>;

} // namespace streamsieve::domain
