#pragma once
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rdesk {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERR
};

struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string message;
};

const char* to_string(LogLevel level);
// Accepts TRACE, DEBUG, INFO, WARN, ERROR (or ERR), case-sensitive.
std::optional<LogLevel> parse_level(const std::string& s);

class Logger {
public:
    static Logger& get();

    bool should_log(LogLevel level) const;
    void log(LogLevel level, const std::string& msg);
    std::vector<LogMessage> get_recent_logs(size_t count = 100);
    void set_level(LogLevel level);
    LogLevel level() const;

    // Mirrors every emitted line to an append-only file. Empty path closes it.
    bool set_file(const std::string& path);

private:
    Logger() = default;
    mutable std::mutex mu_;
    LogLevel min_level_ = LogLevel::INFO;
    std::vector<LogMessage> buffer_;
    std::ofstream file_;
    static constexpr size_t MAX_LOGS = 100;
};

#define LOG_AT_LEVEL(level, msg) \
    do { if (rdesk::Logger::get().should_log(level)) rdesk::Logger::get().log(level, msg); } while(0)

#define LOG_TRACE(msg) LOG_AT_LEVEL(rdesk::LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) LOG_AT_LEVEL(rdesk::LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  LOG_AT_LEVEL(rdesk::LogLevel::INFO, msg)
#define LOG_WARN(msg)  LOG_AT_LEVEL(rdesk::LogLevel::WARN, msg)
#define LOG_ERROR(msg) LOG_AT_LEVEL(rdesk::LogLevel::ERR, msg)

} // namespace rdesk
