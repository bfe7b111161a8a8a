#include "../../include/image.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstring>
#include <stdexcept>
#include <string>

namespace quarry {
    namespace {
        /**
         * @brief libpng error handler that throws a C++ exception.
         * @param msg The error message from libpng.
         */
        void png_error_fn(png_structp, const png_const_charp msg) {
            Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
            throw std::runtime_error(msg);
        }

        void png_warning_fn(png_structp, const png_const_charp msg) {
            Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
        }

        /**
         * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
         * Ensures png_destroy_read_struct is called even if exceptions occur.
         */
        struct PngRead {
            png_structp png = nullptr;
            png_infop info = nullptr;

            explicit PngRead() = default;

            ~PngRead() {
                if (png || info) png_destroy_read_struct(&png, &info, nullptr);
            }
        };

        /// Cursor over the in-memory PNG handed to libpng's read callback.
        struct MemorySource {
            std::span<const unsigned char> data;
            size_t offset = 0;
        };

        void read_from_memory(png_structp png, png_bytep out, const png_size_t length) {
            auto* src = static_cast<MemorySource*>(png_get_io_ptr(png));
            if (length > src->data.size() - src->offset) {
                png_error(png, "read past end of PNG data");
            }
            std::memcpy(out, src->data.data() + src->offset, length);
            src->offset += length;
        }
    } // namespace

    PixelBuffer decode_png_rgba8(const std::span<const unsigned char> png) {
        constexpr size_t kSignatureLength = 8;
        if (png.size() < kSignatureLength || png_sig_cmp(png.data(), 0, kSignatureLength) != 0) {
            Logger::log(LogLevel::Debug, "Buffer has no PNG signature (" + std::to_string(png.size()) + " bytes)", "libpng");
            throw std::runtime_error("not a PNG image");
        }

        PngRead rd;
        rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
        if (!rd.png) {
            throw std::runtime_error("png_create_read_struct failed");
        }
        rd.info = png_create_info_struct(rd.png);
        if (!rd.info) {
            throw std::runtime_error("png_create_info_struct failed");
        }

        MemorySource source{png, 0};
        png_set_read_fn(rd.png, &source, read_from_memory);
        png_read_info(rd.png, rd.info);

        PixelBuffer out;
        int bit_depth, color_type;
        png_get_IHDR(rd.png, rd.info, &out.width, &out.height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        // normalize every color type to 8-bit RGBA
        if (bit_depth == 16) png_set_strip_16(rd.png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
        if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(rd.png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(rd.png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
        if (png_get_interlace_type(rd.png, rd.info) != PNG_INTERLACE_NONE) png_set_interlace_handling(rd.png);

        png_read_update_info(rd.png, rd.info);

        const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
        if (rowbytes != static_cast<size_t>(out.width) * 4) {
            throw std::runtime_error("unexpected row size after RGBA8 conversion");
        }

        out.rgba.resize(rowbytes * out.height);
        std::vector<png_bytep> row_pointers(out.height);
        for (png_uint_32 y = 0; y < out.height; ++y) {
            row_pointers[y] = out.rgba.data() + y * rowbytes;
        }

        png_read_image(rd.png, row_pointers.data());
        png_read_end(rd.png, nullptr);

        return out;
    }
} // namespace quarry
