#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <istream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace quarry {

    namespace {
        struct FileCloser {
            void operator()(FILE *f) const { if (f) std::fclose(f); }
        };

        using unique_FILE = std::unique_ptr<FILE, FileCloser>;
    } // namespace

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_all(std::istream& in) {
        std::vector<unsigned char> data;
        char chunk[64 * 1024];
        while (in.read(chunk, sizeof(chunk)) || in.gcount() > 0) {
            data.insert(data.end(), chunk, chunk + in.gcount());
        }
        if (in.bad()) {
            Logger::log(LogLevel::Error, "Stream read failed after " + std::to_string(data.size()) + " bytes", "file_utils");
            throw std::ios_base::failure("quarry: stream read failed");
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::span<const unsigned char> data) {
        const unique_FILE fp(open_file(path, "wb"));
        if (!fp) {
            Logger::log(LogLevel::Error, "Cannot open output: " + path.string(), "file_utils");
            throw std::runtime_error("Cannot open output file: " + path.string());
        }
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), fp.get()) != data.size()) {
            Logger::log(LogLevel::Error, "Short write: " + path.string(), "file_utils");
            throw std::runtime_error("Cannot write output file: " + path.string());
        }
    }

    void write_file(const std::filesystem::path& path, const std::string_view text) {
        write_file(path, std::span<const unsigned char>(
            reinterpret_cast<const unsigned char*>(text.data()), text.size()));
    }

} // namespace quarry
