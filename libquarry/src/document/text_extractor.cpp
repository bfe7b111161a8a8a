#include "native_document.hpp"
#include "../../include/logger.hpp"

namespace quarry::detail {

    std::vector<unsigned char> buffer_bytes(fz_context* ctx, fz_buffer* buf) {
        unsigned char* data = nullptr;
        const size_t len = fz_buffer_storage(ctx, buf, &data);
        if (!data || len == 0) {
            return {};
        }
        return {data, data + len};
    }

    std::string extract_page_text(fz_context* ctx, fz_document* doc, const int page_index) {
        fz_page* page = nullptr;
        fz_stext_page* text = nullptr;
        fz_device* device = nullptr;
        fz_buffer* buf = nullptr;
        bool failed = false;
        std::string reason;

        fz_var(page);
        fz_var(text);
        fz_var(device);
        fz_var(buf);
        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_index);
            const fz_rect bounds = fz_bound_page(ctx, page);
            text = fz_new_stext_page(ctx, bounds);

            fz_stext_options opts{};
            opts.flags = 0;
            device = fz_new_stext_device(ctx, text, &opts);
            // one-shot extraction: don't fill the store with decoded resources
            fz_enable_device_hints(ctx, device, FZ_NO_CACHE);

            // identity transform, the page is not rendered
            fz_run_page(ctx, page, device, fz_identity, nullptr);
            fz_close_device(ctx, device);

            buf = fz_new_buffer_from_stext_page(ctx, text);
        }
        fz_always(ctx) {
            fz_drop_device(ctx, device);
            fz_drop_stext_page(ctx, text);
            fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            failed = true;
            reason = fz_caught_message(ctx);
        }

        const BufferHandle holder(ctx, buf);
        if (failed) {
            Logger::log(LogLevel::Error,
                        "Text extraction failed on page " + std::to_string(page_index) + ": " + reason,
                        "text_extractor");
            throw DocumentError(ErrorCode::ExtractTextFailed,
                                "quarry: cannot extract text of page " + std::to_string(page_index) + ": " + reason);
        }

        const auto bytes = buffer_bytes(ctx, buf);
        return {bytes.begin(), bytes.end()};
    }

} // namespace quarry::detail
