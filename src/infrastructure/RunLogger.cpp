#include "infrastructure/RunLogger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace streamsieve::infrastructure {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string Timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm = ToLocalTime(tt);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}

} // namespace

RunLogger::RunLogger(const std::string& logFilePath, std::ostream& out, std::ostream& err)
    : m_out(out), m_err(err) {
    if (!logFilePath.empty()) {
        m_file.open(logFilePath, std::ios::app);
        if (!m_file.is_open()) {
            m_err << "[RunLogger] Could not open log file " << logFilePath << ", logging to console only" << std::endl;
        }
    }
}

void RunLogger::write(domain::LogLevel level, const std::string& component, const std::string& message) {
    std::ostringstream line;
    line << Timestamp() << " [" << domain::LogLevelToString(level) << "] [" << component << "] " << message;

    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostream& console = level == domain::LogLevel::Info ? m_out : m_err;
    console << line.str() << std::endl;
    if (m_file.is_open()) {
        m_file << line.str() << '\n';
        m_file.flush();
    }
}

domain::LogSink RunLogger::sink() {
    return [this](domain::LogLevel level, const std::string& component, const std::string& message) {
        write(level, component, message);
    };
}

} // namespace streamsieve::infrastructure
