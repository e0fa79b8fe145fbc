#include "upkit/logger.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace upkit {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(const std::filesystem::path& logPath, bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;

    if (logFile_.is_open()) {
        logFile_.close();
    }

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << logPath << std::endl;
    } else {
        logFile_ << "\n=== upkit session started: " << getTimestamp() << " ===\n";
    }
}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < minLevel_) return;

    std::string formattedMsg = "[" + getTimestamp() + "] [" + getLevelString(level) + "] " + message;

    if (logFile_.is_open()) {
        logFile_ << formattedMsg << std::endl;
    }

    if (verbose_ || level == LogLevel::WARNING || level == LogLevel::ERROR) {
        if (level == LogLevel::ERROR) {
            std::cerr << formattedMsg << std::endl;
        } else {
            std::cout << formattedMsg << std::endl;
        }
    }

    if (sink_) {
        sink_(level, formattedMsg);
    }
}

std::string Logger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&in_time_t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

} // namespace upkit
