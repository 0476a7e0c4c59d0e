//
// Created by igor on 17/10/2026.
//

#include <tex_atlas/raster_image.hh>
#include <tex_atlas/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cstring>
#include <utility>

namespace tex_atlas {
    namespace {
        uint8_t luminance(uint8_t r, uint8_t g, uint8_t b) {
            return static_cast<uint8_t>((r * 299u + g * 587u + b * 114u) / 1000u);
        }

        // Convert one pixel from `src` (in `from`) to `dst` (in `to`)
        void convert_pixel(const uint8_t* src, pixel_format from, uint8_t* dst, pixel_format to) {
            uint8_t rgba[4];
            switch (from) {
                case pixel_format::rgba8:
                    std::memcpy(rgba, src, 4);
                    break;
                case pixel_format::rgb8:
                    std::memcpy(rgba, src, 3);
                    rgba[3] = 255;
                    break;
                case pixel_format::gray8:
                    rgba[0] = rgba[1] = rgba[2] = src[0];
                    rgba[3] = 255;
                    break;
            }

            switch (to) {
                case pixel_format::rgba8:
                    std::memcpy(dst, rgba, 4);
                    break;
                case pixel_format::rgb8:
                    std::memcpy(dst, rgba, 3);
                    break;
                case pixel_format::gray8:
                    dst[0] = luminance(rgba[0], rgba[1], rgba[2]);
                    break;
            }
        }
    }

    raster_image::raster_image(int width, int height, pixel_format format)
        : m_width(width)
          , m_height(height)
          , m_format(format) {
        THROW_IF(width < 0 || height < 0, invalid_dimensions,
                 "Image cannot have negative size:", width, "x", height);
        m_data.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) *
                      static_cast<std::size_t>(channel_count(format)), 0);
    }

    raster_image::raster_image(int width, int height, pixel_format format, std::vector<uint8_t> pixels)
        : m_width(width)
          , m_height(height)
          , m_format(format)
          , m_data(std::move(pixels)) {
        THROW_IF(width < 0 || height < 0, invalid_dimensions,
                 "Image cannot have negative size:", width, "x", height);
        const std::size_t expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) *
                                     static_cast<std::size_t>(channel_count(format));
        THROW_IF(m_data.size() != expected, std::invalid_argument,
                 "Pixel buffer has", m_data.size(), "bytes, expected", expected);
    }

    std::vector<uint8_t> raster_image::release() noexcept {
        std::vector<uint8_t> out = std::move(m_data);
        m_data.clear();
        m_width = 0;
        m_height = 0;
        return out;
    }

    std::array<uint8_t, 4> raster_image::pixel(int x, int y) const noexcept {
        std::array<uint8_t, 4> out{0, 0, 0, 0};
        if (x < 0 || x >= m_width || y < 0 || y >= m_height) {
            return out;
        }
        convert_pixel(m_data.data() + offset(x, y), m_format, out.data(), pixel_format::rgba8);
        return out;
    }

    void raster_image::draw(const raster_image& source, int x, int y) {
        // Clip the source rectangle to this image
        const int x0 = std::max(0, x);
        const int y0 = std::max(0, y);
        const int x1 = std::min(m_width, x + source.width());
        const int y1 = std::min(m_height, y + source.height());
        if (x0 >= x1 || y0 >= y1) {
            return;
        }

        const int span = x1 - x0;
        for (int dst_y = y0; dst_y < y1; ++dst_y) {
            const uint8_t* src = source.data() + source.offset(x0 - x, dst_y - y);
            uint8_t* dst = m_data.data() + offset(x0, dst_y);

            if (source.format() == m_format) {
                std::memcpy(dst, src, static_cast<std::size_t>(span) * static_cast<std::size_t>(channels()));
                continue;
            }

            for (int i = 0; i < span; ++i) {
                convert_pixel(src, source.format(), dst, m_format);
                src += source.channels();
                dst += channels();
            }
        }
    }

    void raster_image::clear() noexcept {
        std::fill(m_data.begin(), m_data.end(), static_cast<uint8_t>(0));
    }
}
