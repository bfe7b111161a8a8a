#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libquarry/include/logger.hpp"
#include <algorithm>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;

namespace {
bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini" || name == "thumbs.db";
}

bool matches_any(const std::string& path_str, const std::vector<std::string>& patterns, const char* kind) {
    for (const auto& pattern : patterns) {
        try {
            if (std::regex_search(path_str, std::regex(pattern))) {
                return true;
            }
        } catch (const std::regex_error& e) {
            Logger::log(LogLevel::Warning, std::string("Invalid ") + kind + " regex: " + pattern + " (" + e.what() + ")", "scanner");
        }
    }
    return false;
}

bool accept(const fs::path& p, const Settings& settings) {
    return !is_junk(p) && !is_filtered(p, settings);
}
} // namespace

bool is_filtered(const fs::path& path, const Settings& settings) {
    const std::string path_str = path.generic_string();
    if (matches_any(path_str, settings.exclude_patterns, "exclude")) {
        return true;
    }
    return !settings.include_patterns.empty() && !matches_any(path_str, settings.include_patterns, "include");
}

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs, const Settings& settings) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        if (in == "-") {
            continue;
        }
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            const auto opts = fs::directory_options::skip_permission_denied;
            if (settings.recursive) {
                for (auto it = fs::recursive_directory_iterator(in, opts, ec);
                     !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                    if (it->is_regular_file() && accept(it->path(), settings))
                        result.push_back(it->path());
                }
            } else {
                for (auto it = fs::directory_iterator(in, opts, ec);
                     !ec && it != fs::directory_iterator(); it.increment(ec)) {
                    if (it->is_regular_file() && accept(it->path(), settings))
                        result.push_back(it->path());
                }
            }
            if (ec) {
                Logger::log(LogLevel::Warning, "Listing " + in.string() + " stopped: " + ec.message(), "scanner");
            }
        } else if (fs::is_regular_file(in, ec) && accept(in, settings)) {
            result.push_back(in);
        }
    }

    // directory iteration order is unspecified
    std::ranges::sort(result);
    result.erase(std::ranges::unique(result).begin(), result.end());

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
