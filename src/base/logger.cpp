#include "peapod/base/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace peapod {

namespace {

const char* level_to_string(LogLevel level) {
    switch (level) {
        case elio::log::level::debug: return "DEBUG";
        case elio::log::level::info: return "INFO";
        case elio::log::level::warning: return "WARN";
        case elio::log::level::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

LogOutput parse_log_output(const std::string& name) {
    if (name == "stdout") return LogOutput::Stdout;
    if (name == "file") return LogOutput::File;
    return LogOutput::Stderr;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_output_locked();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

void Logger::set_output(LogOutput output) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ = output;
}

LogOutput Logger::get_output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_;
}

bool Logger::set_file_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_output_locked();
    file_stream_ = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        file_stream_.reset();
        output_ = LogOutput::Stderr;
        return false;
    }
    output_ = LogOutput::File;
    return true;
}

void Logger::close_file_output() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_output_locked();
    if (output_ == LogOutput::File) {
        output_ = LogOutput::Stderr;
    }
}

void Logger::close_file_output_locked() {
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) return;
    write_log(level, message);
}

void Logger::write_log(LogLevel level, const std::string& message) {
    std::ostringstream oss;
    oss << "[" << get_timestamp() << "] [" << level_to_string(level) << "] " << message;
    std::string formatted = oss.str();

    switch (output_) {
        case LogOutput::Stdout:
            std::cout << formatted << std::endl;
            break;
        case LogOutput::File:
            if (file_stream_ && file_stream_->is_open()) {
                *file_stream_ << formatted << std::endl;
                break;
            }
            [[fallthrough]];
        case LogOutput::Stderr:
            std::cerr << formatted << std::endl;
            break;
    }
}

void Logger::debug(const std::string& message) {
    log(elio::log::level::debug, message);
}

void Logger::info(const std::string& message) {
    log(elio::log::level::info, message);
}

void Logger::warning(const std::string& message) {
    log(elio::log::level::warning, message);
}

void Logger::error(const std::string& message) {
    log(elio::log::level::error, message);
}

void Logger::fatal(const std::string& message) {
    log(elio::log::level::error, "FATAL: " + message);
}

} // namespace peapod
