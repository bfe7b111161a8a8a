/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * All components of libquarry (the document handle, the MuPDF and
 * libpng callbacks, the batch executor) log through this class. It
 * forwards each message above the global threshold to every
 * registered ILogSink.
 */

#ifndef QUARRY_LOGGER_HPP
#define QUARRY_LOGGER_HPP

#include "log_sink.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for quarry.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of it.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Set the global threshold. Messages below it are dropped
     * before any sink sees them. Default: LogLevel::Debug.
     */
    static void set_min_level(LogLevel level) noexcept;

    /// @return The current global threshold.
    static LogLevel min_level() noexcept;

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional component tag (default: "quarry").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "quarry");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-insensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(std::string level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
    static std::atomic<LogLevel> min_level_;
};

#endif // QUARRY_LOGGER_HPP
