/**
 * @file atlas_builder.hh
 * @brief Build a complete texture atlas from a set of images.
 *
 * This is the main entry point of the library. Given a mapping from
 * caller keys to image files it decodes every image, packs all of them
 * into the smallest square atlas the packing heuristic finds, and
 * returns the RGBA pixels together with the UV bounds of every key.
 *
 * @section builder_algorithm Algorithm
 *
 * 1. Decode each distinct path once; each key becomes a single-frame
 *    texture (keys sharing a path share the decoded pixels but are packed
 *    independently).
 * 2. Sort textures by first-frame perimeter, largest first. Placing big
 *    items early fragments the guillotine tree less.
 * 3. Start at size = max(max frame height, max frame width,
 *    next_power_of_two(ceil(sqrt(total pixel area)))).
 * 4. Try to pack everything into a fresh size x size atlas. If a frame
 *    does not fit, discard the atlas, double the size and try again.
 *
 * The loop stops with size_limit_exceeded once the size would pass
 * atlas_config::max_size.
 *
 * @section builder_usage Usage
 *
 * @code{.cpp}
 * std::map<std::string, std::filesystem::path> sources{
 *     {"minecraft:stone", "assets/stone.png"},
 *     {"minecraft:dirt",  "assets/dirt.png"},
 * };
 *
 * auto result = create_atlas(sources);
 * upload_rgba(result.pixels.data(), result.width, result.height);
 *
 * uv_bounds stone = result.bounds.at("minecraft:stone");
 * @endcode
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <tex_atlas/texture.hh>
#include <tex_atlas/texture_atlas.hh>
#include <tex_atlas/types.hh>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tex_atlas {
    /**
     * @brief Configuration for atlas building.
     */
    struct TEX_ATLAS_EXPORT atlas_config {
        /**
         * @brief Largest atlas side the retry loop may try.
         *
         * 16384 is the maximum 2D texture size of most desktop GPUs.
         */
        int max_size = 16384;
    };

    /**
     * @brief Output of create_atlas().
     */
    struct TEX_ATLAS_EXPORT atlas_result {
        std::vector<uint8_t> pixels;               ///< width * height * 4 bytes, RGBA, row-major, top-left origin
        std::map<std::string, uv_bounds> bounds;   ///< One entry per input key
        uint32_t width = 0;
        uint32_t height = 0;
    };

    /**
     * @brief Smallest power of two that is >= value (1 for value <= 1).
     */
    [[nodiscard]] TEX_ATLAS_EXPORT std::int64_t next_power_of_two(std::int64_t value) noexcept;

    /**
     * @brief Smallest integer whose square is >= value.
     */
    [[nodiscard]] TEX_ATLAS_EXPORT std::int64_t ceil_sqrt(std::int64_t value) noexcept;

    /**
     * @brief Initial square size for a set of textures.
     *
     * max(tallest frame, widest frame, next_power_of_two(ceil(sqrt(area)))),
     * where area sums every frame of every texture.
     *
     * An empty list yields 1, not 2: next_power_of_two(0) is 1, so
     * create_atlas({}) produces a 1x1 transparent atlas.
     */
    [[nodiscard]] TEX_ATLAS_EXPORT std::int64_t estimate_atlas_size(const std::vector<texture>& textures);

    /**
     * @brief Sort textures and pack them, growing the atlas until they fit.
     *
     * Frames of the given textures must be unplaced. The returned atlas
     * holds placed copies of them.
     *
     * @throws size_limit_exceeded if no size up to config.max_size fits
     * @throws std::invalid_argument if config.max_size is not positive or
     *         two textures share a name
     */
    [[nodiscard]] TEX_ATLAS_EXPORT texture_atlas pack_textures(std::vector<texture> textures,
                                                               const atlas_config& config = {});

    /**
     * @brief Decode images, pack them and render the atlas.
     *
     * @param sources Caller key -> image file. Several keys may name the same file.
     * @param config Build configuration
     * @return RGBA pixels, UV bounds per key and atlas size
     *
     * @throws decode_failure if an image is missing or undecodable
     * @throws invalid_dimensions if an image has zero width or height
     * @throws size_limit_exceeded if the atlas would exceed config.max_size
     */
    [[nodiscard]] TEX_ATLAS_EXPORT atlas_result create_atlas(
        const std::map<std::string, std::filesystem::path>& sources,
        const atlas_config& config = {});
} // namespace tex_atlas
