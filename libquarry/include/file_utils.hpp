#ifndef QUARRY_FILE_UTILS_HPP
#define QUARRY_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>

namespace quarry {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Drains a stream into memory.
     * @throws std::ios_base::failure if the stream reports a read error.
     */
    std::vector<unsigned char> read_all(std::istream &in);

    /**
     * @brief Writes a buffer to a file, replacing it.
     * @throws std::runtime_error if the file cannot be written.
     */
    void write_file(const std::filesystem::path &path, std::span<const unsigned char> data);

    /// @overload
    void write_file(const std::filesystem::path &path, std::string_view text);

} // namespace quarry

#endif // QUARRY_FILE_UTILS_HPP
