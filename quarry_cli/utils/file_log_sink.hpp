#ifndef QUARRY_FILE_LOG_SINK_HPP
#define QUARRY_FILE_LOG_SINK_HPP

#include "../../libquarry/include/log_sink.hpp"
#include "../../libquarry/include/logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <string>

/**
 * @brief Appends timestamped log lines to a file (--log-file).
 */
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &now);
#else
        localtime_r(&now, &tm);
#endif

        std::lock_guard lock(mtx_);
        out_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S ");
        out_ << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // QUARRY_FILE_LOG_SINK_HPP
