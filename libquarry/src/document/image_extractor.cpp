#include "native_document.hpp"
#include "../../include/logger.hpp"

namespace quarry::detail {

    namespace {

        constexpr std::string_view kTag = "image_extractor";

        /**
         * @brief Loads the object and checks its /Subtype.
         * @return true if the object is an image XObject. Objects that cannot
         * be loaded (free xref entries, broken objects) are reported as not images.
         */
        bool is_image_object(fz_context* ctx, pdf_document* pdf, const int object_number) {
            pdf_obj* obj = nullptr;
            bool image = false;
            bool failed = false;
            std::string reason;

            fz_var(obj);
            fz_var(image);
            fz_try(ctx) {
                obj = pdf_load_object(ctx, pdf, object_number);
                pdf_obj* subtype = pdf_dict_get(ctx, obj, PDF_NAME(Subtype));
                image = pdf_name_eq(ctx, subtype, PDF_NAME(Image)) != 0;
            }
            fz_always(ctx) {
                pdf_drop_obj(ctx, obj);
            }
            fz_catch(ctx) {
                failed = true;
                reason = fz_caught_message(ctx);
            }

            if (failed) {
                Logger::log(LogLevel::Debug,
                            "Cannot load obj " + std::to_string(object_number) + ": " + reason, kTag);
                return false;
            }
            return image;
        }

    } // namespace

    std::vector<unsigned char> extract_object_image(fz_context* ctx, pdf_document* pdf, const int object_number) {
        if (!pdf || !is_image_object(ctx, pdf, object_number)) {
            throw DocumentError(ErrorCode::NotImage,
                                "quarry: obj " + std::to_string(object_number) + " is not image, please ignore this obj");
        }

        pdf_obj* ref = nullptr;
        fz_image* image = nullptr;
        fz_buffer* buf = nullptr;
        bool failed = false;
        std::string reason;

        fz_var(ref);
        fz_var(image);
        fz_var(buf);
        fz_try(ctx) {
            ref = pdf_new_indirect(ctx, pdf, object_number, 0);
            image = pdf_load_image(ctx, pdf, ref);
            buf = fz_new_buffer_from_image_as_png(ctx, image, fz_default_color_params);
        }
        fz_always(ctx) {
            fz_drop_image(ctx, image);
            pdf_drop_obj(ctx, ref);
        }
        fz_catch(ctx) {
            failed = true;
            reason = fz_caught_message(ctx);
        }

        const BufferHandle holder(ctx, buf);
        if (failed) {
            Logger::log(LogLevel::Warning,
                        "Cannot decode image obj " + std::to_string(object_number) + ": " + reason, kTag);
            throw DocumentError(ErrorCode::CreatePixmapFailed,
                                "quarry: cannot create pixmap for obj " + std::to_string(object_number) + ": " + reason);
        }
        return buffer_bytes(ctx, buf);
    }

} // namespace quarry::detail
