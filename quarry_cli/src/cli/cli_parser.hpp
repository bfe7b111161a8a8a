#ifndef QUARRY_CLI_PARSER_HPP
#define QUARRY_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "../../../libquarry/include/extraction_executor.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;

    // extraction selectors; all four are enabled when none is given
    bool text = false;
    bool images = false;
    bool outline = false;
    bool metadata = false;

    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::string password;
    std::filesystem::path output_path = "quarry-out";
    std::filesystem::path report_path;
    std::filesystem::path log_file;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    std::vector<std::filesystem::path> inputs;

    bool is_pipe = false;

    /// @return The executor settings selected on the command line.
    [[nodiscard]] quarry::ExtractionSettings extraction_settings() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // QUARRY_CLI_PARSER_HPP
