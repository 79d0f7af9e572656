#ifndef PMSIM_LOGGER_HPP
#define PMSIM_LOGGER_HPP

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <atomic>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace pmsim {

/**
 * @enum LogLevel
 * @brief Severity levels for log messages, ordered from least to most severe.
 */
enum class LogLevel {
    DEBUG,    ///< Per-day progress and capacity saturation.
    INFO,     ///< Run start, end and summary.
    WARNING,  ///< Ignored configuration keys and other recoverable oddities.
    ERROR,    ///< Failed operations (I/O, parsing).
    FATAL     ///< Invariant failures that abort a run.
};

/**
 * @class Logger
 * @brief Process-wide, thread-safe logger.
 *
 * Writes `timestamp [LEVEL] [source] message` lines to stdout and, when
 * enabled, appends them to a log file. Holds no simulation state, so several
 * simulations (or parallel province workers) may share it.
 */
class Logger {
public:
    /**
     * @brief Retrieves the singleton instance of the Logger.
     * @return Logger& Reference to the unique logger instance.
     */
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Sets the minimum severity level for messages to be written.
     * @param level [in] The minimum LogLevel to output.
     */
    void setLogLevel(LogLevel level) {
        logLevel_.store(level);
    }

    LogLevel getLogLevel() const {
        return logLevel_.load();
    }

    bool isEnabled(LogLevel level) const {
        return level >= logLevel_.load();
    }

    /**
     * @brief Parses a level name such as "debug" or "WARNING".
     * @param name [in] Case-insensitive level name.
     * @param fallback [in] Level returned when the name is not recognized.
     * @return LogLevel The parsed level.
     */
    static LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "info") return LogLevel::INFO;
        if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
        if (lower == "error") return LogLevel::ERROR;
        if (lower == "fatal") return LogLevel::FATAL;
        return fallback;
    }

    /**
     * @brief Enables or disables appending log lines to a file.
     *
     * @param enable   [in] True to open (append mode) the file, false to close it.
     * @param filename [in] Log file path, used only when enabling.
     * @return bool False if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "pmsim.log") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        if (!enable) {
            return true;
        }
        logFile_.open(filename, std::ios::app);
        if (!logFile_.is_open()) {
            std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
            return false;
        }
        return true;
    }

    /**
     * @brief Writes a message if its level meets the threshold. Thread-safe.
     *
     * @param level   [in] The severity level of the message.
     * @param source  [in] Identifier of the emitting component, e.g. "Simulation::step".
     * @param message [in] The content of the log message.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (!isEnabled(level)) return;

        const std::string line = formatLogMessage(level, source, message);

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& console = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
        console << line << std::endl;
        if (logFile_.is_open()) {
            logFile_ << line << '\n';
        }
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    Logger() : logLevel_(LogLevel::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local_tm{};
        localtime_r(&now, &local_tm);
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << " ";

        switch (level) {
            case LogLevel::DEBUG:   oss << "[DEBUG]  "; break;
            case LogLevel::INFO:    oss << "[INFO]   "; break;
            case LogLevel::WARNING: oss << "[WARNING]"; break;
            case LogLevel::ERROR:   oss << "[ERROR]  "; break;
            case LogLevel::FATAL:   oss << "[FATAL]  "; break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    std::atomic<LogLevel> logLevel_;
    std::ofstream logFile_;
    std::mutex mutex_;
};

} // namespace pmsim

#endif // PMSIM_LOGGER_HPP
