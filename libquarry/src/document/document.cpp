/**
 * @file document.cpp
 * @brief Lifecycle and locking of quarry::Document.
 */

#include "native_document.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"

#include <istream>
#include <span>
#include <stdexcept>
#include <system_error>

namespace quarry {

    namespace {

        constexpr std::string_view kTag = "document";

        // mupdf diagnostics: warnings are worth seeing, errors become DocumentError anyway.
        // Called from inside mupdf, so nothing may propagate; a message that
        // cannot be logged is dropped.
        void forward_message(const LogLevel level, const char* message) noexcept {
            try {
                Logger::log(level, message ? message : "", "mupdf");
            } catch (const std::exception&) {
                return;
            }
        }

        void forward_warning(void*, const char* message) noexcept {
            forward_message(LogLevel::Warning, message);
        }

        void forward_error(void*, const char* message) noexcept {
            forward_message(LogLevel::Debug, message);
        }

        // locks a live handle; Impl is only reachable from Document members, so
        // the type is deduced
        template <typename ImplT>
        std::unique_lock<std::mutex> lock_open(ImplT* impl) {
            if (!impl) {
                throw DocumentError(ErrorCode::DocumentClosed);
            }
            std::unique_lock lock(impl->mtx);
            if (impl->closed.load()) {
                throw DocumentError(ErrorCode::DocumentClosed);
            }
            return lock;
        }

    } // namespace

    void Document::Impl::create_context(const std::size_t store_size) {
        ctx = fz_new_context(nullptr, nullptr, store_size == 0 ? FZ_STORE_UNLIMITED : store_size);
        if (!ctx) {
            Logger::log(LogLevel::Error, "Cannot create MuPDF context", kTag);
            throw DocumentError(ErrorCode::CreateContextFailed, "quarry: cannot create context");
        }

        fz_set_warning_callback(ctx, forward_warning, nullptr);
        fz_set_error_callback(ctx, forward_error, nullptr);

        bool failed = false;
        fz_try(ctx) {
            fz_register_document_handlers(ctx);
        }
        fz_catch(ctx) {
            failed = true;
        }
        if (failed) {
            throw DocumentError(ErrorCode::CreateContextFailed,
                                "quarry: cannot register document handlers");
        }
    }

    void Document::Impl::open_file(const std::filesystem::path& path) {
        const std::string filename = path.string();
        fz_document* opened = nullptr;
        bool failed = false;
        std::string reason;

        fz_var(opened);
        fz_try(ctx) {
            opened = fz_open_document(ctx, filename.c_str());
        }
        fz_catch(ctx) {
            failed = true;
            reason = fz_caught_message(ctx);
        }
        if (failed || !opened) {
            Logger::log(LogLevel::Error, "Cannot open " + filename + ": " + reason, kTag);
            throw DocumentError(ErrorCode::OpenDocumentFailed, "quarry: cannot open document: " + reason);
        }
        doc = opened;
        pdf = pdf_specifics(ctx, doc);
    }

    void Document::Impl::open_memory(const std::string& magic) {
        fz_stream* stream = nullptr;
        bool failed = false;
        std::string reason;

        fz_var(stream);
        fz_try(ctx) {
            stream = fz_open_memory(ctx, bytes.data(), bytes.size());
        }
        fz_catch(ctx) {
            failed = true;
            reason = fz_caught_message(ctx);
        }
        if (failed || !stream) {
            Logger::log(LogLevel::Error, "Cannot open memory stream: " + reason, kTag);
            throw DocumentError(ErrorCode::OpenMemoryFailed, "quarry: cannot open memory: " + reason);
        }

        fz_document* opened = nullptr;
        fz_var(opened);
        fz_try(ctx) {
            opened = fz_open_document_with_stream(ctx, magic.c_str(), stream);
        }
        fz_always(ctx) {
            // the document keeps its own reference to the stream
            fz_drop_stream(ctx, stream);
        }
        fz_catch(ctx) {
            failed = true;
            reason = fz_caught_message(ctx);
        }
        if (failed || !opened) {
            Logger::log(LogLevel::Error, "Cannot open in-memory " + magic + " document: " + reason, kTag);
            throw DocumentError(ErrorCode::OpenDocumentFailed, "quarry: cannot open document: " + reason);
        }
        doc = opened;
        pdf = pdf_specifics(ctx, doc);
    }

    void Document::Impl::unlock(const std::string& password) {
        int needs = 0;
        bool failed = false;

        fz_var(needs);
        fz_try(ctx) {
            needs = fz_needs_password(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
        }
        if (failed) {
            throw DocumentError(ErrorCode::OpenDocumentFailed, "quarry: cannot read encryption state");
        }
        if (!needs) {
            return;
        }
        if (password.empty()) {
            Logger::log(LogLevel::Warning, "Document is encrypted and no password was given", kTag);
            throw DocumentError(ErrorCode::NeedsPassword, "quarry: document needs password");
        }

        int authenticated = 0;
        fz_var(authenticated);
        fz_try(ctx) {
            authenticated = fz_authenticate_password(ctx, doc, password.c_str());
        }
        fz_catch(ctx) {
            authenticated = 0;
        }
        if (!authenticated) {
            Logger::log(LogLevel::Warning, "Password rejected", kTag);
            throw DocumentError(ErrorCode::NeedsPassword, "quarry: document needs password (password rejected)");
        }
    }

    void Document::Impl::read_counts() {
        int pages = 0;
        int objects = 0;
        bool failed = false;
        std::string reason;

        fz_var(pages);
        fz_var(objects);
        fz_try(ctx) {
            pages = fz_count_pages(ctx, doc);
            if (pdf) {
                objects = pdf_count_objects(ctx, pdf);
            }
        }
        fz_catch(ctx) {
            failed = true;
            reason = fz_caught_message(ctx);
        }
        if (failed) {
            throw DocumentError(ErrorCode::OpenDocumentFailed, "quarry: cannot count pages: " + reason);
        }
        page_total = pages < 0 ? 0 : pages;
        object_total = objects < 0 ? 0 : objects;
    }

    void Document::Impl::release() noexcept {
        if (doc) {
            fz_drop_document(ctx, doc);
            doc = nullptr;
            pdf = nullptr;
        }
        if (ctx) {
            fz_drop_context(ctx);
            ctx = nullptr;
        }
    }

    Document::Document(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

    Document::~Document() = default;

    Document::Document(Document&&) noexcept = default;
    Document& Document::operator=(Document&&) noexcept = default;

    Document Document::open(const std::filesystem::path& path, const OpenOptions& options) {
        std::error_code ec;
        const auto absolute = std::filesystem::absolute(path, ec);
        if (ec || !std::filesystem::exists(absolute, ec)) {
            Logger::log(LogLevel::Error, "No such file: " + path.string(), kTag);
            throw DocumentError(ErrorCode::NoSuchFile, "quarry: no such file: " + path.string());
        }

        // on any throw below, ~Impl releases what was already acquired
        auto impl = std::make_unique<Impl>();
        impl->create_context(options.store_size);
        impl->open_file(absolute);
        impl->unlock(options.password);
        impl->read_counts();

        Logger::log(LogLevel::Info,
                    "Opened " + absolute.string() + " (" + std::to_string(impl->page_total) + " pages, " +
                    std::to_string(impl->object_total) + " objects)", kTag);
        return Document(std::move(impl));
    }

    Document Document::open_from_bytes(std::vector<unsigned char> bytes, const OpenOptions& options) {
        std::string magic = options.mime_hint;
        if (magic.empty()) {
            magic = std::string(MimeDetector::detect(std::span<const unsigned char>(bytes)));
        }
        if (magic.empty()) {
            magic = "application/pdf";
        }

        auto impl = std::make_unique<Impl>();
        impl->bytes = std::move(bytes);
        impl->create_context(options.store_size);
        impl->open_memory(magic);
        impl->unlock(options.password);
        impl->read_counts();

        Logger::log(LogLevel::Info,
                    "Opened in-memory " + magic + " (" + std::to_string(impl->bytes.size()) + " bytes, " +
                    std::to_string(impl->page_total) + " pages)", kTag);
        return Document(std::move(impl));
    }

    Document Document::open_from_stream(std::istream& in, const OpenOptions& options) {
        return open_from_bytes(read_all(in), options);
    }

    int Document::page_count() const noexcept {
        return impl_ ? impl_->page_total : 0;
    }

    int Document::object_count() const noexcept {
        return impl_ ? impl_->object_total : 0;
    }

    std::string Document::extract_text(const int page_index) {
        const auto lock = lock_open(impl_.get());
        if (page_index < 0 || page_index >= impl_->page_total) {
            throw DocumentError(ErrorCode::PageMissing,
                                "quarry: page missing: " + std::to_string(page_index));
        }
        return detail::extract_page_text(impl_->ctx, impl_->doc, page_index);
    }

    std::vector<unsigned char> Document::extract_image_bytes(const int object_number) {
        const auto lock = lock_open(impl_.get());
        if (object_number <= 0 || object_number >= impl_->object_total) {
            throw DocumentError(ErrorCode::ObjectMissing,
                                "quarry: obj missing: " + std::to_string(object_number));
        }
        return detail::extract_object_image(impl_->ctx, impl_->pdf, object_number);
    }

    PixelBuffer Document::extract_image(const int object_number) {
        const auto png = extract_image_bytes(object_number);
        try {
            return decode_png_rgba8(png);
        } catch (const std::runtime_error& e) {
            throw DocumentError(ErrorCode::PixmapSamplesFailed,
                                "quarry: cannot get pixmap samples of obj " +
                                std::to_string(object_number) + ": " + e.what());
        }
    }

    std::vector<ExtractedImage> Document::extract_all_images() {
        const auto lock = lock_open(impl_.get());
        std::vector<ExtractedImage> images;
        for (int n = 1; n < impl_->object_total; ++n) {
            try {
                images.push_back({n, detail::extract_object_image(impl_->ctx, impl_->pdf, n)});
            } catch (const DocumentError& e) {
                if (e.code() != ErrorCode::NotImage) {
                    Logger::log(LogLevel::Warning, "Skipping obj " + std::to_string(n) + ": " + e.what(), kTag);
                }
            }
        }
        Logger::log(LogLevel::Debug,
                    "Image scan found " + std::to_string(images.size()) + " images in " +
                    std::to_string(impl_->object_total) + " objects", kTag);
        return images;
    }

    std::vector<OutlineEntry> Document::load_outline() {
        const auto lock = lock_open(impl_.get());
        return detail::walk_outline(impl_->ctx, impl_->doc, impl_->pdf);
    }

    Metadata Document::read_metadata() {
        const auto lock = lock_open(impl_.get());
        return detail::lookup_metadata(impl_->ctx, impl_->doc);
    }

    void Document::close() {
        if (!impl_) {
            return;
        }
        std::lock_guard lock(impl_->mtx);
        if (impl_->closed.exchange(true)) {
            return;
        }
        impl_->release();
        Logger::log(LogLevel::Debug, "Document closed", kTag);
    }

    bool Document::is_closed() const noexcept {
        return !impl_ || impl_->closed.load();
    }

} // namespace quarry
