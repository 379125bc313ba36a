#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <mutex>
#include <type_traits>
#include <functional>
#include <optional>

namespace carlink::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* logLevelName(LogLevel level);
std::optional<LogLevel> logLevelFromString(std::string_view name);

class Logger {
public:
    // Sink menerima level dan pesan yang sudah diformat (tanpa timestamp)
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Ganti output default (stdout) dengan sink lain, misalnya untuk testing
    static void setSink(Sink sink);
    static void resetSink();

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static std::string format(const std::string& fmt, Args&&... args) {
        return formatString(fmt, std::forward<Args>(args)...);
    }

private:
    static LogLevel current_level_;
    static std::mutex mutex_;
    static Sink sink_;

    static bool enabled(LogLevel level);

    // Kirim ke sink, atau ke stdout dengan timestamp lokal
    static void write(LogLevel level, const std::string& message);

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        if (!enabled(level)) return;
        write(level, formatString(format, std::forward<Args>(args)...));
    }

    template<typename T>
    static std::string toText(const T& value) {
        if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }
    }

    // Setiap "{}" diganti argumen berikutnya; placeholder berlebih dibiarkan
    template<typename... Args>
    static std::string formatString(const std::string& format, const Args&... args) {
        std::string out;
        out.reserve(format.size());
        size_t cursor = 0;
        auto substitute = [&](const std::string& text) {
            size_t pos = format.find("{}", cursor);
            if (pos == std::string::npos) return;
            out.append(format, cursor, pos - cursor);
            out += text;
            cursor = pos + 2;
        };
        (substitute(toText(args)), ...);
        out.append(format, cursor, std::string::npos);
        return out;
    }
};

} // namespace carlink::core
