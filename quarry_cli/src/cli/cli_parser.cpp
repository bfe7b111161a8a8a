#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <regex>
#include <thread>

namespace {
// rejects --include/--exclude patterns std::regex cannot compile
struct RegexValidator : CLI::Validator {
    RegexValidator() {
        name_ = "REGEX";
        func_ = [](const std::string& str) {
            try {
                std::regex re(str);
            } catch (const std::regex_error& e) {
                return "Invalid regex '" + str + "': " + e.what();
            }
            return std::string(); // ok
        };
    }
};
} // namespace

quarry::ExtractionSettings Settings::extraction_settings() const {
    const bool all = !text && !images && !outline && !metadata;
    quarry::ExtractionSettings out;
    out.text = all || text;
    out.images = all || images;
    out.outline = all || outline;
    out.metadata = all || metadata;
    out.output_dir = output_path;
    out.password = password;
    return out;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_flag("--text", settings.text, "Extract the text of every page.");
    app.add_flag("--images", settings.images, "Extract every image object as PNG.");
    app.add_flag("--outline", settings.outline, "Extract the outline (table of contents).");
    app.add_flag("--metadata", settings.metadata,
                 "Extract document metadata.\n(Without any of --text/--images/--outline/--metadata, all are extracted).");

    app.add_option("-o,--output", settings.output_path,
                   "Directory receiving one sub-directory per document.")
                   ->default_val("quarry-out");

    app.add_option("--password", settings.password,
                   "Password tried on encrypted documents.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Documents extracted in parallel.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("--include", settings.include_patterns,
                   "Process only files matching regex PATTERN. (Can be used multiple times).")
                   ->check(RegexValidator());

    app.add_option("--exclude", settings.exclude_patterns,
                   "Do not process files matching regex PATTERN. (Can be used multiple times).")
                   ->check(RegexValidator());

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more PDF/EPUB files or directories (use '-' for stdin)")
        ->required()
        ->check([](const std::string& str) {
            if (str == "-") return std::string();
            if (!std::filesystem::exists(str)) return "Input path '" + str + "' not found.";
            return std::string(); // ok
        });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        settings.is_pipe = std::ranges::any_of(settings.inputs,
                                               [](const std::filesystem::path& p) { return p == "-"; });

        if (settings.is_pipe && settings.inputs.size() > 1) {
            throw CLI::ValidationError("Cannot use stdin ('-') with other input files.");
        }

        if (std::filesystem::exists(settings.output_path) && !std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a directory.");
        }
    });
}
