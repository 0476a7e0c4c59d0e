/**
 * @file frame.hh
 * @brief A decoded image that can be packed into an atlas.
 *
 * A frame pairs a decoded rgba8 image with a packable rectangle of the
 * same size. Frames share their pixels through a shared pointer, so
 * copying a frame is cheap and two frames built from the same file do
 * not duplicate the pixel data. Each copy has its own placement.
 *
 * @code{.cpp}
 * auto frame = frame::from_file("stone.png");
 * pack_tree tree(256, 256);
 * tree.pack(frame);
 *
 * raster_image out(256, 256);
 * frame.draw(out);
 * @endcode
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <tex_atlas/packable.hh>
#include <tex_atlas/raster_image.hh>
#include <filesystem>
#include <memory>
#include <string>

namespace tex_atlas {
    class TEX_ATLAS_EXPORT frame {
    public:
        /**
         * @brief Wrap an already decoded image.
         *
         * @param image Decoded pixels (must not be null)
         * @param source Label used in diagnostics, usually the file path
         * @throws std::invalid_argument if image is null
         * @throws invalid_dimensions if the image has zero width or height
         */
        explicit frame(std::shared_ptr<const raster_image> image, std::string source = {});

        /**
         * @brief Decode an image file into a frame.
         *
         * @throws decode_failure if the file cannot be decoded
         * @throws invalid_dimensions if the image has zero width or height
         */
        [[nodiscard]] static frame from_file(const std::filesystem::path& path);

        [[nodiscard]] int width() const noexcept { return m_rect.width(); }
        [[nodiscard]] int height() const noexcept { return m_rect.height(); }
        [[nodiscard]] int perimeter() const noexcept { return m_rect.perimeter(); }

        [[nodiscard]] bool is_placed() const noexcept { return m_rect.is_placed(); }
        [[nodiscard]] int x() const { return m_rect.x(); }
        [[nodiscard]] int y() const { return m_rect.y(); }
        void place(int x, int y) { m_rect.place(x, y); }

        /// Placed rectangle in atlas space
        [[nodiscard]] rect bounds() const { return m_rect.bounds(); }

        [[nodiscard]] const std::string& source() const noexcept { return m_source; }
        [[nodiscard]] const raster_image& image() const noexcept { return *m_image; }
        [[nodiscard]] const std::shared_ptr<const raster_image>& shared_image() const noexcept { return m_image; }

        /**
         * @brief Draw this frame into another image at its placed position.
         * @throws std::runtime_error if the frame is not placed
         */
        void draw(raster_image& target) const;

    private:
        std::shared_ptr<const raster_image> m_image;
        std::string m_source;
        packable m_rect;
    };

    static_assert(packable_item<frame>);
} // namespace tex_atlas
