/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef QUARRY_LOG_SINK_HPP
#define QUARRY_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from the most verbose to the most severe, so a sink or the
 * Logger threshold can filter with a plain comparison.
 */
enum class LogLevel {
    Debug,   ///< Native diagnostics, per-object decisions during scans
    Info,    ///< Document opened, batch progress
    Warning, ///< Recoverable problems (broken image skipped, libpng warnings)
    Error,   ///< An operation failed
    None     ///< Threshold only: disables all output
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, a GUI
 * observer). The Logger delegates to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "mupdf").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // QUARRY_LOG_SINK_HPP
