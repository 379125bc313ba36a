#include "carlink/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace carlink::core {

LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

std::optional<LogLevel> logLevelFromString(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

bool Logger::enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= current_level_;
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, message);
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::cout << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
              << '.' << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
              << "] [" << logLevelName(level) << "] " << message << std::endl;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::resetSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = nullptr;
}

} // namespace carlink::core
