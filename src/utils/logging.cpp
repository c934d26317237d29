#include "utils/logging.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

#include "utils/common.hpp"

namespace autolab::utils {

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(Trim(value));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::Configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    if (file_.is_open()) {
        file_.close();
    }
    if (config_.file.empty()) {
        return;
    }
    std::error_code ec;
    const auto parent = std::filesystem::path(config_.file).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    file_.open(config_.file, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[log] cannot open " << config_.file << ", file sink disabled" << std::endl;
    }
}

LogLevel Logger::MinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::Write(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(message.level) < static_cast<int>(config_.min_level)) {
        return;
    }
    const auto line = FormatLogLine(message);
    if (config_.echo_to_stderr) {
        std::cerr << line << std::endl;
    }
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
}

std::string FormatLogLine(const LogMessage& message) {
    std::ostringstream oss;
    oss << NowIso() << ' ' << ToString(message.level) << " [" << message.tag << "] " << message.message;
    for (const auto& [key, value] : message.fields) {
        oss << ' ' << key << '=' << value;
    }
    return oss.str();
}

}  // namespace autolab::utils
