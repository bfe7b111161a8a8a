/**
 * @file image.hpp
 * @brief Image results returned by the image extractor, and the libpng
 * based decoder that turns PNG bytes into pixels.
 */

#ifndef QUARRY_IMAGE_HPP
#define QUARRY_IMAGE_HPP

#include <cstdint>
#include <span>
#include <vector>

namespace quarry {

    /**
     * @brief A decoded raster image, always 8-bit RGBA, rows top to bottom
     * with no padding (stride = width * 4).
     */
    struct PixelBuffer {
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        std::vector<unsigned char> rgba;

        /// @return Pointer to the 4 bytes of pixel (x, y).
        [[nodiscard]] const unsigned char* pixel(const std::uint32_t x, const std::uint32_t y) const {
            return rgba.data() + (static_cast<std::size_t>(y) * width + x) * 4;
        }
    };

    /**
     * @brief One image found by Document::extract_all_images().
     */
    struct ExtractedImage {
        int object_number = 0;          ///< Indirect object the image was read from
        std::vector<unsigned char> png; ///< PNG-encoded image bytes
    };

    /**
     * @brief Decodes a PNG held in memory into an RGBA8 PixelBuffer.
     *
     * Palette images are expanded, 16-bit channels stripped, gray widened
     * to RGB, tRNS turned into alpha and a 0xFF alpha added to opaque
     * images, so the result layout does not depend on the input color type.
     *
     * @param png The complete PNG file contents.
     * @return The decoded pixels.
     * @throws std::runtime_error if the bytes are not a valid PNG.
     */
    PixelBuffer decode_png_rgba8(std::span<const unsigned char> png);

} // namespace quarry

#endif // QUARRY_IMAGE_HPP
