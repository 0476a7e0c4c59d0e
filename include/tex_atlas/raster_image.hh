/**
 * @file raster_image.hh
 * @brief Owned pixel buffer used for source images and generated atlases.
 *
 * A raster_image is a row-major, top-left-origin buffer of 8-bit
 * channels. Decoded source images are always rgba8; the atlas can be
 * generated in any of the supported pixel formats.
 *
 * @section raster_image_usage Usage
 *
 * @code{.cpp}
 * raster_image atlas(256, 256, pixel_format::rgba8);
 *
 * // Copy a decoded sprite into the atlas at (32, 0)
 * atlas.draw(sprite, 32, 0);
 *
 * // Upload
 * glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8,
 *              atlas.width(), atlas.height(), 0,
 *              GL_RGBA, GL_UNSIGNED_BYTE, atlas.data());
 * @endcode
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tex_atlas {
    /**
     * @brief Channel layout of a raster_image.
     */
    enum class pixel_format {
        rgba8,  ///< Red, green, blue, alpha
        rgb8,   ///< Red, green, blue
        gray8   ///< Luminance
    };

    /**
     * @brief Number of bytes per pixel of a format.
     */
    [[nodiscard]] constexpr int channel_count(pixel_format format) noexcept {
        switch (format) {
            case pixel_format::rgba8: return 4;
            case pixel_format::rgb8: return 3;
            case pixel_format::gray8: return 1;
        }
        return 4;
    }

    class TEX_ATLAS_EXPORT raster_image {
    public:
        /**
         * @brief Create a zero-filled image.
         *
         * @param width Width in pixels
         * @param height Height in pixels
         * @param format Channel layout
         * @throws invalid_dimensions if width or height is negative
         */
        raster_image(int width, int height, pixel_format format = pixel_format::rgba8);

        /**
         * @brief Adopt existing pixel data.
         *
         * @param width Width in pixels
         * @param height Height in pixels
         * @param format Channel layout of `pixels`
         * @param pixels Row-major data, exactly width * height * channels bytes
         * @throws std::invalid_argument if the buffer size does not match
         */
        raster_image(int width, int height, pixel_format format, std::vector<uint8_t> pixels);

        [[nodiscard]] int width() const noexcept { return m_width; }
        [[nodiscard]] int height() const noexcept { return m_height; }
        [[nodiscard]] pixel_format format() const noexcept { return m_format; }
        [[nodiscard]] int channels() const noexcept { return channel_count(m_format); }

        /// Bytes per row
        [[nodiscard]] int stride() const noexcept { return m_width * channels(); }

        [[nodiscard]] bool empty() const noexcept { return m_width == 0 || m_height == 0; }

        [[nodiscard]] const uint8_t* data() const noexcept { return m_data.data(); }
        [[nodiscard]] uint8_t* data() noexcept { return m_data.data(); }

        /// Whole buffer, width * height * channels bytes
        [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return m_data; }

        /**
         * @brief Move the pixel buffer out, leaving the image empty.
         */
        [[nodiscard]] std::vector<uint8_t> release() noexcept;

        /**
         * @brief Read a pixel as RGBA.
         *
         * rgb8 pixels report alpha 255; gray8 pixels replicate the
         * luminance into r, g and b.
         *
         * @return Pixel value, or all zeros if out of bounds
         */
        [[nodiscard]] std::array<uint8_t, 4> pixel(int x, int y) const noexcept;

        /**
         * @brief Copy another image into this one.
         *
         * The source is written with its top-left corner at (x, y) and
         * clipped to this image. Pixels are replaced, not blended. When the
         * formats differ each pixel is converted: alpha is dropped for
         * rgb8, and gray8 uses L = (R*299 + G*587 + B*114) / 1000.
         */
        void draw(const raster_image& source, int x, int y);

        /**
         * @brief Fill the image with zeros.
         */
        void clear() noexcept;

    private:
        int m_width;
        int m_height;
        pixel_format m_format;
        std::vector<uint8_t> m_data;

        [[nodiscard]] std::size_t offset(int x, int y) const noexcept {
            return (static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) +
                    static_cast<std::size_t>(x)) * static_cast<std::size_t>(channels());
        }
    };
} // namespace tex_atlas
