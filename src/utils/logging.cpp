#include "utils/logging.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <utility>

#include "utils/common.hpp"

namespace clerk::utils {

bool ParseLogLevel(const std::string& text, LogLevel& level) {
    const auto lowered = ToLower(Trim(text));
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

Logger::Logger(LogConfig config)
    : config_(std::move(config)) {
    if (config_.path.empty()) {
        return;
    }
    const auto parent = std::filesystem::path(config_.path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    file_.open(config_.path, std::ios::out | std::ios::app);
}

Logger::~Logger() {
    Close();
}

void Logger::Log(LogLevel level, const std::string& message) {
    Log(LogMessage{level, message, {}});
}

void Logger::Log(const LogMessage& message) {
    if (!file_.is_open() || message.level < config_.min_level) {
        return;
    }
    file_ << Timestamp() << " - " << ToString(message.level) << " - " << message.message;
    const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : sorted) {
        file_ << " " << key << "=" << value;
    }
    file_ << "\n";
    file_.flush();
}

void Logger::Close() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

std::string Logger::Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm local_time{};
#if defined(_WIN32)
    localtime_s(&local_time, &time);
#else
    localtime_r(&time, &local_time);
#endif
    char buffer[20];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_time);
    char millis_buffer[5];
    std::snprintf(millis_buffer, sizeof(millis_buffer), ",%03d", static_cast<int>(millis));
    return std::string(buffer) + millis_buffer;
}

}  // namespace clerk::utils
