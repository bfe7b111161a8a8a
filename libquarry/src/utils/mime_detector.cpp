#include "../../include/mime_detector.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <memory>

namespace {

    constexpr std::array<unsigned char, 4> kPdfMagic = {0x25, 0x50, 0x44, 0x46};  // %PDF
    constexpr std::array<unsigned char, 4> kZipMagic = {0x50, 0x4B, 0x03, 0x04};  // PK\3\4
    constexpr std::string_view kEpubMimetypeEntry = "mimetypeapplication/epub+zip";
    constexpr std::size_t kEpubEntryOffset = 30; // size of the fixed ZIP local file header

    bool starts_with(const std::span<const unsigned char> bytes, const std::span<const unsigned char> magic) {
        return bytes.size() >= magic.size() && std::equal(magic.begin(), magic.end(), bytes.begin());
    }

    struct FileCloser {
        void operator()(FILE* f) const { if (f) std::fclose(f); }
    };

} // namespace

namespace quarry {

    std::string_view MimeDetector::detect(const std::span<const unsigned char> bytes) noexcept {
        if (starts_with(bytes, kPdfMagic)) {
            return kMimePdf;
        }
        if (bytes.size() >= kSniffLength && starts_with(bytes, kZipMagic)) {
            const auto entry = bytes.subspan(kEpubEntryOffset, kEpubMimetypeEntry.size());
            if (std::equal(entry.begin(), entry.end(), kEpubMimetypeEntry.begin(),
                           [](const unsigned char b, const char c) { return b == static_cast<unsigned char>(c); })) {
                return kMimeEpub;
            }
        }
        return {};
    }

    std::string MimeDetector::detect(const std::filesystem::path& path) {
        const std::unique_ptr<FILE, FileCloser> fp(open_file(path, "rb"));
        if (!fp) {
            Logger::log(LogLevel::Debug, "Cannot open for sniffing: " + path.string(), "mime_detector");
            return {};
        }
        std::array<unsigned char, kSniffLength> head{};
        const size_t n = std::fread(head.data(), 1, head.size(), fp.get());
        return std::string(detect(std::span<const unsigned char>(head.data(), n)));
    }

    bool MimeDetector::is_supported(const std::string_view mime) noexcept {
        return mime == kMimePdf || mime == kMimeEpub;
    }

} // namespace quarry
