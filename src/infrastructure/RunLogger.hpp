/**
 * @file RunLogger.hpp
 * @brief Console + file log sink for one run.
 */

#pragma once
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include "domain/LogSink.hpp"

namespace streamsieve::infrastructure {

/**
 * @class RunLogger
 * @brief Writes "<timestamp> [LEVEL] [Component] message" lines.
 *
 * Info goes to the regular stream, warnings and errors to the error stream; every
 * line is also appended to the log file when one is configured.
 */
class RunLogger {
public:
    /**
     * @param logFilePath File to append to; empty for console only.
     * @param out Stream for INFO lines.
     * @param err Stream for WARN / ERROR lines.
     */
    RunLogger(const std::string& logFilePath, std::ostream& out, std::ostream& err);

    void write(domain::LogLevel level, const std::string& component, const std::string& message);

    /** @brief Adapts this logger to the LogSink callback; the logger must outlive it. */
    domain::LogSink sink();

    /** @brief False if a log file was requested but could not be opened. */
    bool hasFile() const { return m_file.is_open(); }

private:
    std::ostream& m_out;
    std::ostream& m_err;
    std::ofstream m_file;
    std::mutex m_mutex;
};

} // namespace streamsieve::infrastructure
