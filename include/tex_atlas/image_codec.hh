/**
 * @file image_codec.hh
 * @brief Image decoding and PNG encoding.
 *
 * Thin wrapper around stb_image / stb_image_write. Decoding accepts
 * every format stb_image understands (PNG, JPEG, TGA, BMP, PSD, GIF,
 * HDR, PIC, PNM) and always produces an rgba8 raster_image.
 *
 * @code{.cpp}
 * auto sprite = load_image("textures/stone.png");
 * write_png("stone_copy.png", sprite);
 * @endcode
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <tex_atlas/raster_image.hh>
#include <cstdint>
#include <filesystem>
#include <span>

namespace tex_atlas {
    /**
     * @brief Decode an image file to rgba8.
     *
     * @throws decode_failure if the file cannot be read or decoded
     * @throws invalid_dimensions if the image has zero width or height
     */
    TEX_ATLAS_EXPORT raster_image load_image(const std::filesystem::path& path);

    /**
     * @brief Decode an in-memory encoded image to rgba8.
     *
     * @throws decode_failure if the data cannot be decoded
     * @throws invalid_dimensions if the image has zero width or height
     */
    TEX_ATLAS_EXPORT raster_image load_image(std::span<const uint8_t> data);

    /**
     * @brief Encode an image as PNG.
     *
     * @throws std::runtime_error if the file cannot be written
     */
    TEX_ATLAS_EXPORT void write_png(const std::filesystem::path& path, const raster_image& image);
} // namespace tex_atlas
