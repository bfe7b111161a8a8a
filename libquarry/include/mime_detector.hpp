/**
 * @file mime_detector.hpp
 * @brief Magic-byte classification of PDF and EPUB content.
 */

#ifndef QUARRY_MIME_DETECTOR_HPP
#define QUARRY_MIME_DETECTOR_HPP

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace quarry {

    inline constexpr std::string_view kMimePdf = "application/pdf";
    inline constexpr std::string_view kMimeEpub = "application/epub+zip";

    /**
     * @brief Detects the two document formats quarry can open.
     *
     * Detection only looks at magic bytes; no Document and no native
     * library is involved.
     */
    class MimeDetector {
    public:
        /// Number of leading bytes the EPUB test needs.
        static constexpr std::size_t kSniffLength = 58;

        /**
         * @brief Classify a byte buffer.
         *
         * PDF: the buffer starts with "%PDF".
         * EPUB: the buffer starts with a ZIP local file header (50 4B 03 04)
         * whose first entry is the stored file "mimetype" holding
         * "application/epub+zip", i.e. bytes 30..57 spell
         * "mimetypeapplication/epub+zip".
         *
         * @param bytes The leading bytes of the content.
         * @return kMimePdf, kMimeEpub, or an empty view if neither matches.
         */
        [[nodiscard]] static std::string_view detect(std::span<const unsigned char> bytes) noexcept;

        /**
         * @brief Classify a file by reading its first kSniffLength bytes.
         * @param path The filesystem path to the file.
         * @return The MIME type, or an empty string if unknown or unreadable.
         */
        [[nodiscard]] static std::string detect(const std::filesystem::path& path);

        /// @return true for the MIME types returned by detect().
        [[nodiscard]] static bool is_supported(std::string_view mime) noexcept;
    };

} // namespace quarry

#endif // QUARRY_MIME_DETECTOR_HPP
