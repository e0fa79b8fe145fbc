#ifndef UPKIT_LOGGER_HPP
#define UPKIT_LOGGER_HPP

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace upkit {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    // Receives every line that passes the level filter, already formatted.
    using Sink = std::function<void(LogLevel level, const std::string& line)>;

    static Logger& instance();

    void init(const std::filesystem::path& logPath, bool verbose);
    void log(LogLevel level, const std::string& message);

    void setLevel(LogLevel level);
    void setSink(Sink sink);

    // Forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::ofstream logFile_;
    bool verbose_ = false;
    LogLevel minLevel_ = LogLevel::DEBUG;
    Sink sink_;
    std::mutex mutex_;

    std::string getTimestamp();
    std::string getLevelString(LogLevel level);
};

// Convenience macros
#define LOG_DEBUG(msg) upkit::Logger::instance().log(upkit::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) upkit::Logger::instance().log(upkit::LogLevel::INFO, msg)
#define LOG_WARN(msg) upkit::Logger::instance().log(upkit::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) upkit::Logger::instance().log(upkit::LogLevel::ERROR, msg)

} // namespace upkit

#endif // UPKIT_LOGGER_HPP
