/**
 * @file document.hpp
 * @brief Public API of libquarry: a handle on one opened PDF or EPUB.
 */

#ifndef QUARRY_DOCUMENT_HPP
#define QUARRY_DOCUMENT_HPP

#include "errors.hpp"
#include "image.hpp"
#include "metadata.hpp"
#include "outline.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace quarry {

    /**
     * @brief Options used when opening a document.
     */
    struct OpenOptions {
        /**
         * @brief Password tried when the document is encrypted.
         * Empty means "no password": encrypted documents then fail with
         * ErrorCode::NeedsPassword.
         */
        std::string password;

        /**
         * @brief Upper bound of the MuPDF resource store, in bytes.
         * 0 means unlimited.
         */
        std::size_t store_size = 0;

        /**
         * @brief Format hint for in-memory documents ("application/pdf",
         * "application/epub+zip"). When empty the bytes are sniffed with
         * MimeDetector, and PDF is assumed if that finds nothing.
         */
        std::string mime_hint;
    };

    /**
     * @brief A document opened through MuPDF.
     *
     * @details The handle exclusively owns one MuPDF context and one opened
     * document. MuPDF contexts are not reentrant, so every operation that
     * touches them (text, images, outline, metadata) runs while holding a
     * per-document mutex; a Document can be shared between threads, but
     * calls on it never overlap. Different Documents share nothing and can
     * be used in parallel.
     *
     * Native resources are released by close() or by the destructor, the
     * document first and then its context. Any operation after close()
     * throws DocumentError(ErrorCode::DocumentClosed).
     *
     * Uses PIMPL so that MuPDF headers stay out of the public API.
     */
    class Document {
    public:
        /**
         * @brief Opens a document from the filesystem.
         * @param path File to open; resolved to an absolute path first.
         * @param options Password and store configuration.
         * @throws DocumentError NoSuchFile, CreateContextFailed,
         * OpenDocumentFailed or NeedsPassword.
         */
        static Document open(const std::filesystem::path& path, const OpenOptions& options = {});

        /**
         * @brief Opens a document from an in-memory buffer.
         *
         * The Document keeps the buffer alive for as long as it is open.
         * @throws DocumentError CreateContextFailed, OpenMemoryFailed,
         * OpenDocumentFailed or NeedsPassword.
         */
        static Document open_from_bytes(std::vector<unsigned char> bytes, const OpenOptions& options = {});

        /**
         * @brief Reads the whole stream into memory, then opens it with
         * open_from_bytes().
         * @throws std::ios_base::failure if reading the stream fails.
         */
        static Document open_from_stream(std::istream& in, const OpenOptions& options = {});

        ~Document();

        Document(const Document&) = delete;
        Document& operator=(const Document&) = delete;
        Document(Document&&) noexcept;
        Document& operator=(Document&&) noexcept;

        /// @return Number of pages, fixed at open time and still reported after close().
        [[nodiscard]] int page_count() const noexcept;

        /// @return Size of the cross-reference table, fixed at open time.
        /// Always 0 for documents that are not PDFs.
        [[nodiscard]] int object_count() const noexcept;

        /**
         * @brief Extracts the plain text of one page, in MuPDF reading order.
         * @param page_index 0-based page index.
         * @return The page text, possibly empty.
         * @throws DocumentError PageMissing, ExtractTextFailed, DocumentClosed.
         */
        std::string extract_text(int page_index);

        /**
         * @brief Decodes the image stored in an indirect object as PNG.
         * @param object_number Object number in [1, object_count()).
         * @return PNG-encoded bytes.
         * @throws DocumentError ObjectMissing, NotImage, CreatePixmapFailed,
         * DocumentClosed.
         */
        std::vector<unsigned char> extract_image_bytes(int object_number);

        /**
         * @brief Like extract_image_bytes(), but decoded to RGBA pixels.
         * @throws DocumentError as extract_image_bytes(), plus PixmapSamplesFailed.
         */
        PixelBuffer extract_image(int object_number);

        /**
         * @brief Scans every object number and returns all images, in object
         * order. Objects that are not images are skipped; images that fail
         * to decode are logged and skipped.
         * @throws DocumentError DocumentClosed.
         */
        std::vector<ExtractedImage> extract_all_images();

        /**
         * @brief Loads the table of contents, flattened in depth-first pre-order.
         * @return The entries; empty if the outline exists but has no items.
         * @throws DocumentError LoadOutlineFailed if there is no outline,
         * DocumentClosed.
         */
        std::vector<OutlineEntry> load_outline();

        /**
         * @brief Reads the ten standard metadata fields.
         * Missing fields map to an empty string.
         * @throws DocumentError DocumentClosed.
         */
        Metadata read_metadata();

        /**
         * @brief Releases the document and then the context. Safe to call
         * more than once; waits for an in-flight operation to finish.
         */
        void close();

        /// @return true after close(), or for a moved-from handle.
        [[nodiscard]] bool is_closed() const noexcept;

    private:
        struct Impl;
        explicit Document(std::unique_ptr<Impl> impl);

        std::unique_ptr<Impl> impl_;
    };

} // namespace quarry

#endif // QUARRY_DOCUMENT_HPP
