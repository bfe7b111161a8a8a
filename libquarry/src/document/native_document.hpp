/**
 * @file native_document.hpp
 * @brief Private MuPDF side of quarry::Document.
 *
 * Only the files under src/document include MuPDF. Everything here runs
 * with the owning Document's mutex held.
 *
 * MuPDF reports errors with setjmp/longjmp (fz_try/fz_always/fz_catch).
 * Inside an fz_try block only raw MuPDF pointers are touched: no C++
 * object is constructed and no C++ exception is thrown there. Results
 * are turned into C++ values, and failures into DocumentError, after
 * the fz_catch block has run.
 */

#ifndef QUARRY_NATIVE_DOCUMENT_HPP
#define QUARRY_NATIVE_DOCUMENT_HPP

#include "../../include/document.hpp"

extern "C" {
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
}

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace quarry {

    /**
     * @brief Owns the MuPDF context and the opened document.
     */
    struct Document::Impl {
        fz_context* ctx = nullptr;
        fz_document* doc = nullptr;
        pdf_document* pdf = nullptr;      ///< Borrowed PDF view of doc, nullptr for EPUB
        std::vector<unsigned char> bytes; ///< Backing memory of open_from_bytes, must outlive doc
        int page_total = 0;
        int object_total = 0;
        std::atomic<bool> closed{false};
        std::mutex mtx;                   ///< Serializes every native call

        Impl() = default;
        Impl(const Impl&) = delete;
        Impl& operator=(const Impl&) = delete;
        ~Impl() { release(); }

        /**
         * @brief Creates the context, routes its diagnostics to the Logger
         * and registers the document handlers.
         * @throws DocumentError CreateContextFailed.
         */
        void create_context(std::size_t store_size);

        /// @throws DocumentError OpenDocumentFailed.
        void open_file(const std::filesystem::path& path);

        /// Opens `bytes` as a document of format `magic`.
        /// @throws DocumentError OpenMemoryFailed, OpenDocumentFailed.
        void open_memory(const std::string& magic);

        /// @throws DocumentError NeedsPassword.
        void unlock(const std::string& password);

        /// @throws DocumentError OpenDocumentFailed.
        void read_counts();

        /// Drops the document, then the context. Idempotent.
        void release() noexcept;
    };

    /**
     * @brief Scoped owner of a MuPDF object outside fz_try blocks.
     * MuPDF drop functions accept nullptr and never throw.
     */
    template <typename T, void (*Drop)(fz_context*, T*)>
    class NativeHandle {
    public:
        NativeHandle(fz_context* ctx, T* ptr) : ctx_(ctx), ptr_(ptr) {}
        ~NativeHandle() { Drop(ctx_, ptr_); }

        NativeHandle(const NativeHandle&) = delete;
        NativeHandle& operator=(const NativeHandle&) = delete;

        [[nodiscard]] T* get() const { return ptr_; }

    private:
        fz_context* ctx_;
        T* ptr_;
    };

    using BufferHandle = NativeHandle<fz_buffer, fz_drop_buffer>;
    using OutlineHandle = NativeHandle<fz_outline, fz_drop_outline>;

    namespace detail {

        /// Copies the contents of a MuPDF buffer.
        std::vector<unsigned char> buffer_bytes(fz_context* ctx, fz_buffer* buf);

        /**
         * @brief Runs one page through a structured-text device and flattens it.
         * @throws DocumentError ExtractTextFailed.
         */
        std::string extract_page_text(fz_context* ctx, fz_document* doc, int page_index);

        /**
         * @brief Loads an indirect object and, if it is an image, encodes it as PNG.
         * @throws DocumentError NotImage, CreatePixmapFailed.
         */
        std::vector<unsigned char> extract_object_image(fz_context* ctx, pdf_document* pdf, int object_number);

        /**
         * @brief Loads the outline and flattens it depth-first, pre-order.
         * @param pdf PDF view of doc, used to tell an empty outline from a
         * missing one; may be nullptr.
         * @throws DocumentError LoadOutlineFailed.
         */
        std::vector<OutlineEntry> walk_outline(fz_context* ctx, fz_document* doc, pdf_document* pdf);

        /// Looks up the ten metadata fields. Never throws DocumentError.
        Metadata lookup_metadata(fz_context* ctx, fz_document* doc);

    } // namespace detail

} // namespace quarry

#endif // QUARRY_NATIVE_DOCUMENT_HPP
