#ifndef QUARRY_FILE_SCANNER_HPP
#define QUARRY_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

struct Settings;

/**
 * @brief Expands the command-line inputs into the list of files to extract.
 *
 * Directories are listed (recursively with -r); junk files and paths
 * rejected by the --include/--exclude filters are dropped. The stdin
 * marker "-" is not a file and is never returned.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings);

/// @return true if --exclude matches @p path, or --include is set and does not.
bool is_filtered(const std::filesystem::path& path, const Settings& settings);

#endif // QUARRY_FILE_SCANNER_HPP
