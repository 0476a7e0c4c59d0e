/**
 * @file texture_atlas.hh
 * @brief One packing attempt at a fixed square size.
 *
 * A texture_atlas composes a pack_tree rooted at (0, 0) with the ordered
 * list of textures packed into it. It is a single attempt: if a texture
 * does not fit, pack() throws atlas_too_small and the atlas must be
 * thrown away. The build driver (see atlas_builder.hh) handles the
 * retry at a larger size.
 *
 * @section texture_atlas_usage Usage
 *
 * @code{.cpp}
 * texture_atlas atlas(256);
 * for (const auto& t : textures) {
 *     atlas.pack(t);                 // may throw atlas_too_small
 * }
 *
 * raster_image image = atlas.generate(pixel_format::rgba8);
 * auto uv = atlas.to_bounds();       // texture name -> uv_bounds
 * @endcode
 *
 * @section texture_atlas_uv UV bounds
 *
 * For a first frame placed at (x, y, w, h) in a W x H atlas the bounds
 * are (x/W, y/H, (x+w)/W, (y+min(h,w))/H). The bottom edge uses the
 * smaller of width and height; consumers of existing atlases rely on
 * that value, so it is kept as is.
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <tex_atlas/pack_tree.hh>
#include <tex_atlas/raster_image.hh>
#include <tex_atlas/texture.hh>
#include <tex_atlas/types.hh>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace tex_atlas {
    class TEX_ATLAS_EXPORT texture_atlas {
    public:
        /// Square atlas of size x size
        explicit texture_atlas(int size);

        texture_atlas(int width, int height);

        [[nodiscard]] int width() const noexcept { return m_tree.width(); }
        [[nodiscard]] int height() const noexcept { return m_tree.height(); }

        /**
         * @brief Pack every frame of a texture, in frame order.
         *
         * The atlas keeps its own copy of the texture. The texture is
         * recorded only when all of its frames were placed.
         *
         * @throws atlas_too_small if a frame does not fit
         * @throws std::invalid_argument if a texture with the same name is already packed
         * @throws std::logic_error if a frame of the texture is already placed
         */
        void pack(texture tex);

        /// Packed textures, in pack order
        [[nodiscard]] const std::vector<texture>& textures() const noexcept { return m_textures; }

        [[nodiscard]] const pack_tree& tree() const noexcept { return m_tree; }

        /**
         * @brief Render all packed frames into a new image.
         *
         * Frames are drawn in pack order onto a zero-filled image of the
         * atlas size.
         */
        [[nodiscard]] raster_image generate(pixel_format format = pixel_format::rgba8) const;

        /**
         * @brief UV bounds of each packed texture, keyed by texture name.
         */
        [[nodiscard]] std::map<std::string, uv_bounds> to_bounds() const;

        /**
         * @brief Generate the atlas and save it as PNG.
         * @throws std::runtime_error if the file cannot be written
         */
        void write(const std::filesystem::path& path, pixel_format format = pixel_format::rgba8) const;

    private:
        pack_tree m_tree;
        std::vector<texture> m_textures;
        std::set<std::string> m_names;
    };
} // namespace tex_atlas
