#ifndef ATV_LOGGER_H
#define ATV_LOGGER_H

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "formatters.hpp"

enum class LogLevel { VERBOSE = 0, DEBUG = 1, INFO = 2, WARNING = 3, ERROR = 4 };

class Logger {
  public:
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) { m_level.store(level); }
    LogLevel getLevel() const { return m_level.load(); }

    // Accepts "verbose", "debug", "info", "warning"/"warn", "error"
    // (case-sensitive, lower case). Returns false for anything else.
    bool setLevel(std::string_view name) {
        auto level = levelFromString(name);
        if (!level) {
            return false;
        }
        m_level.store(*level);
        return true;
    }

    static std::optional<LogLevel> levelFromString(std::string_view name) {
        if (name == "verbose") return LogLevel::VERBOSE;
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "info") return LogLevel::INFO;
        if (name == "warning" || name == "warn") return LogLevel::WARNING;
        if (name == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    template <typename... Args>
    void log(LogLevel level,
             std::source_location location,
             fmt::format_string<Args...> fmt_str,
             Args&&... args) {
        if (level < m_level.load()) {
            return;
        }

        std::string message;
        try {
            message = fmt::format(fmt_str, std::forward<Args>(args)...);
        } catch (const fmt::format_error& e) {
            writeLine(compose(LogLevel::ERROR, location,
                              fmt::format("!!! Formatting Error: {} !!!", e.what())));
            return;
        }

        writeLine(compose(level, location, message));
    }

  private:
    Logger() : m_level(LogLevel::INFO) {}
    ~Logger() = default;

    void writeLine(const std::string& output) {
        std::lock_guard<std::mutex> lock(m_output_mutex);
        std::clog << output << std::endl;
    }

    static std::string compose(LogLevel level, const std::source_location& location,
                               const std::string& message) {
        std::time_t now =
            std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::string timestamp = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(now));
        bool is_multiline = (message.find('\n') != std::string::npos);
        return fmt::format("[{}] [{}] [{}] {}{}", timestamp, levelToString(level),
                           trimFunctionName(location.function_name()),
                           (is_multiline ? "\n" : " "), message);
    }

    // "void AndroidTV::Remote::RemoteSession::stop()" -> "RemoteSession::stop"
    static std::string_view
    trimFunctionName(std::string_view full_name) noexcept {
        size_t params_pos = full_name.find('(');
        if (params_pos == std::string_view::npos) {
            params_pos = full_name.length();
        }
        std::string_view name_and_prefix = full_name.substr(0, params_pos);
        size_t last_space_pos = name_and_prefix.rfind(' ');
        std::string_view candidate =
            (last_space_pos == std::string_view::npos)
                ? name_and_prefix
                : name_and_prefix.substr(last_space_pos + 1);
        size_t last_colon_pos = candidate.rfind("::");
        if (last_colon_pos == std::string_view::npos || last_colon_pos == 0) {
            return candidate;
        }
        size_t prev_colon_pos = candidate.rfind("::", last_colon_pos - 1);
        if (prev_colon_pos == std::string_view::npos) {
            return candidate;
        }
        return candidate.substr(prev_colon_pos + 2);
    }

    static std::string_view levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::VERBOSE: return "VERBOSE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
        }
        return "UNKNOWN";
    }

    std::atomic<LogLevel> m_level;
    std::mutex m_output_mutex;
};

#define LOG_VERBOSE(fmt, ...)                                                    \
    Logger::getInstance().log(LogLevel::VERBOSE, std::source_location::current(), \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_DEBUG(fmt, ...)                                                    \
    Logger::getInstance().log(LogLevel::DEBUG, std::source_location::current(), \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_INFO(fmt, ...)                                                     \
    Logger::getInstance().log(LogLevel::INFO, std::source_location::current(), \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_WARN(fmt, ...)                                                     \
    Logger::getInstance().log(LogLevel::WARNING,                               \
                              std::source_location::current(),                 \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_ERROR(fmt, ...)                                                    \
    Logger::getInstance().log(LogLevel::ERROR,                                 \
                              std::source_location::current(),                 \
                              fmt __VA_OPT__(, ) __VA_ARGS__)

#endif // ATV_LOGGER_H
