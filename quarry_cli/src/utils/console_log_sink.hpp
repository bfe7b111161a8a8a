#ifndef QUARRY_CONSOLE_LOG_SINK_HPP
#define QUARRY_CONSOLE_LOG_SINK_HPP

#include "../../../libquarry/include/log_sink.hpp"
#include "../../../libquarry/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes colored log lines to stderr, filtered by its own level.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level || log_level == LogLevel::None) return;

        const char* color = GRAY;
        if (level == LogLevel::Error) color = RED;
        else if (level == LogLevel::Warning) color = YELLOW;
        else if (level == LogLevel::Info) color = RESET;

        std::lock_guard lock(mtx_);
        // leading newline keeps the line off the progress bar
        std::cerr << "\n" << color << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message << RESET << std::flush;
    }

private:
    std::mutex mtx_;
};

#endif // QUARRY_CONSOLE_LOG_SINK_HPP
