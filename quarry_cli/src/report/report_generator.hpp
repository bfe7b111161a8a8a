#ifndef QUARRY_REPORT_GENERATOR_HPP
#define QUARRY_REPORT_GENERATOR_HPP

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

enum class Outcome {
    Extracted,
    Failed,
    Skipped
};

/**
 * @brief One row of the final report, filled from the executor events.
 */
struct Result {
    std::filesystem::path path;
    std::string mime;
    Outcome outcome = Outcome::Skipped;
    int pages = 0;
    std::size_t text_pages = 0;
    std::size_t images = 0;
    std::size_t outline_entries = 0;
    bool has_outline = false;
    double seconds = 0.0;
    std::string error_code;
    std::string error_msg; ///< Error message, or the skip reason
};

/// @return Width of the attached terminal, 80 when unknown.
unsigned get_terminal_width();

/// @return @p data quoted for a CSV field when it contains a separator, quote or newline.
std::string csv_escape(const std::string& data);

/**
 * @brief Prints the summary table and totals on stdout.
 */
void print_console_report(const std::vector<Result>& results,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Writes the report as CSV to @p out.
 */
void write_csv_report(const std::vector<Result>& results, std::ostream& out, double total_seconds);

/**
 * @brief Writes the CSV report to a file (--report).
 * @return false if the file could not be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // QUARRY_REPORT_GENERATOR_HPP
