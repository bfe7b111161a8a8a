#include "report_generator.hpp"
#include "../utils/color.hpp"
#include "../../../libquarry/include/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

namespace {
bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

const char* outcome_label(const Outcome outcome) {
    switch (outcome) {
        case Outcome::Extracted: return "OK";
        case Outcome::Failed:    return "FAIL";
        case Outcome::Skipped:   return "SKIPPED";
    }
    return "";
}

const char* outcome_color(const Outcome outcome) {
    switch (outcome) {
        case Outcome::Extracted: return GREEN;
        case Outcome::Failed:    return RED;
        case Outcome::Skipped:   return YELLOW;
    }
    return "";
}

std::string fixed2(const double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string outline_cell(const Result& r) {
    if (r.outcome != Outcome::Extracted) return "-";
    return r.has_outline ? std::to_string(r.outline_entries) : "none";
}
} // namespace

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (const char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stdout_a_tty();

    constexpr size_t mime_w = 22;
    constexpr size_t num_w = 8;
    constexpr size_t outline_w = 9;
    constexpr size_t time_w = 9;
    constexpr size_t result_w = 9;
    constexpr size_t fixed_cols_width = mime_w + 3 * num_w + outline_w + time_w + result_w + 12;

    const size_t file_col_width = term_width > fixed_cols_width + 10
                                ? term_width - fixed_cols_width
                                : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len > 4 ? max_len - 4 : 0) + "...";
    };

    std::cout << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(mime_w)    << "MIME type"
              << std::setw(num_w)     << "Pages"
              << std::setw(num_w)     << "Text"
              << std::setw(num_w)     << "Images"
              << std::setw(outline_w) << "Outline"
              << std::setw(time_w)    << "Time(s)"
              << std::setw(result_w)  << "Result"
              << "Error"
              << "\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    size_t extracted = 0, failed = 0, skipped = 0, total_images = 0, total_pages = 0;
    for (const auto& r : sorted) {
        switch (r.outcome) {
            case Outcome::Extracted: ++extracted; break;
            case Outcome::Failed:    ++failed;    break;
            case Outcome::Skipped:   ++skipped;   break;
        }
        total_images += r.images;
        total_pages += r.text_pages;

        std::cout << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.path.filename().string(), file_col_width)
                  << std::setw(mime_w)    << (r.mime.empty() ? "-" : r.mime)
                  << std::setw(num_w)     << r.pages
                  << std::setw(num_w)     << r.text_pages
                  << std::setw(num_w)     << r.images
                  << std::setw(outline_w) << outline_cell(r)
                  << std::setw(time_w)    << fixed2(r.seconds);
        // pad before coloring so escape codes do not count toward the width
        std::ostringstream label;
        label << std::left << std::setw(result_w) << outcome_label(r.outcome);
        if (use_colors) {
            std::cout << outcome_color(r.outcome) << label.str() << RESET;
        } else {
            std::cout << label.str();
        }
        if (!r.error_code.empty()) std::cout << r.error_code << ": ";
        std::cout << r.error_msg << "\n";
    }

    std::cout << "\nDocuments: " << extracted << " extracted, " << failed << " failed, "
              << skipped << " skipped\n";
    std::cout << "Pages of text: " << total_pages << ", images: " << total_images << "\n";
    std::cout << "Total time: " << fixed2(total_seconds) << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

void write_csv_report(const std::vector<Result>& results, std::ostream& out, const double total_seconds) {
    out << "File,MIME,Pages,TextPages,Images,OutlineEntries,Time(s),Result,ErrorCode,Error\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.mime) << ","
            << r.pages << ","
            << r.text_pages << ","
            << r.images << ","
            << (r.has_outline ? std::to_string(r.outline_entries) : std::string()) << ","
            << fixed2(r.seconds) << ","
            << outcome_label(r.outcome) << ","
            << csv_escape(r.error_code) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << fixed2(total_seconds) << " seconds\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report: " + output_path.string(), "main");
        return false;
    }
    write_csv_report(results, out, total_seconds);
    return static_cast<bool>(out);
}
