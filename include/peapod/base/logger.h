#ifndef PEAPOD_BASE_LOGGER_H
#define PEAPOD_BASE_LOGGER_H

#include <elio/log/logger.hpp>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace peapod {

// Alias for Elio's log level
using LogLevel = elio::log::level;

enum class LogOutput {
    Stdout,
    Stderr,
    File
};

// "stdout", "stderr" or "file"; "console" is accepted for stderr
LogOutput parse_log_output(const std::string& name);

class Logger {
public:
    ~Logger();

    static Logger& instance();

    // Level control
    void set_level(LogLevel level);
    LogLevel get_level() const;
    bool enabled(LogLevel level) const;

    // Output configuration. Falls back to stderr when File has no open file.
    void set_output(LogOutput output);
    LogOutput get_output() const;
    bool set_file_output(const std::string& path);
    void close_file_output();

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(elio::log::level::debug)) {
            log(elio::log::level::debug, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(elio::log::level::info)) {
            log(elio::log::level::info, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(elio::log::level::warning)) {
            log(elio::log::level::warning, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::error, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void fatal(fmt::format_string<Args...> fmt_str, Args&&... args) {
        fatal(fmt::format(fmt_str, std::forward<Args>(args)...));
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void close_file_output_locked();
    void write_log(LogLevel level, const std::string& message);

    LogLevel level_ = elio::log::level::info;
    LogOutput output_ = LogOutput::Stderr;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;
};

} // namespace peapod

#endif // PEAPOD_BASE_LOGGER_H
