/**
 * @file errors.hpp
 * @brief Typed error surface of libquarry.
 */

#ifndef QUARRY_ERRORS_HPP
#define QUARRY_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace quarry {

    /**
     * @brief Every failure a Document operation can report.
     *
     * Native (MuPDF) errors never escape the library; they are mapped to
     * one of these codes at the boundary of each public operation.
     */
    enum class ErrorCode {
        NoSuchFile,          ///< The path does not exist
        CreateContextFailed, ///< The native context could not be allocated
        OpenDocumentFailed,  ///< Malformed or unsupported document
        OpenMemoryFailed,    ///< The in-memory stream could not be created
        NeedsPassword,       ///< Encrypted document and no valid password
        PageMissing,         ///< Page index outside [0, page_count)
        ObjectMissing,       ///< Object number outside [1, object_count)
        NotImage,            ///< Object exists but is not an image; callers scanning objects skip it
        LoadOutlineFailed,   ///< The document has no outline at all
        CreatePixmapFailed,  ///< The image object could not be decoded or encoded as PNG
        PixmapSamplesFailed, ///< PNG bytes could not be decoded to pixels
        ExtractTextFailed,   ///< The page content could not be run through the text device
        DocumentClosed       ///< The handle was closed or moved from
    };

    /**
     * @brief Stable, human-readable name of an error code (e.g. "NotImage").
     */
    [[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

    /**
     * @brief Exception thrown by Document operations.
     */
    class DocumentError final : public std::runtime_error {
    public:
        DocumentError(const ErrorCode code, const std::string& message)
            : std::runtime_error(message), code_(code) {}

        explicit DocumentError(const ErrorCode code)
            : DocumentError(code, std::string("quarry: ") + std::string(to_string(code))) {}

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace quarry

#endif // QUARRY_ERRORS_HPP
