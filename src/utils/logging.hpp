#pragma once

#include <fstream>
#include <string>
#include <unordered_map>

namespace clerk::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

bool ParseLogLevel(const std::string& text, LogLevel& level);

struct LogMessage {
    LogLevel level;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
    std::string path = "agent.log";
};

// Append-only file sink. Created once at startup and handed to whoever logs;
// the file is flushed after every record and closed on destruction.
class Logger {
public:
    explicit Logger(LogConfig config);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool IsOpen() const { return file_.is_open(); }
    const LogConfig& Config() const { return config_; }

    void Log(LogLevel level, const std::string& message);
    void Log(const LogMessage& message);

    void Debug(const std::string& message) { Log(LogLevel::kDebug, message); }
    void Info(const std::string& message) { Log(LogLevel::kInfo, message); }
    void Warn(const std::string& message) { Log(LogLevel::kWarn, message); }
    void Error(const std::string& message) { Log(LogLevel::kError, message); }

    void Close();

private:
    LogConfig config_;
    std::ofstream file_;

    static std::string Timestamp();
};

}  // namespace clerk::utils
