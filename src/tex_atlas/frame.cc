//
// Created by igor on 17/10/2026.
//

#include <tex_atlas/frame.hh>
#include <tex_atlas/image_codec.hh>
#include <tex_atlas/errors.hh>
#include <failsafe/failsafe.hh>
#include <utility>

namespace tex_atlas {
    namespace {
        packable checked_rect(const std::shared_ptr<const raster_image>& image, const std::string& source) {
            THROW_IF(!image, std::invalid_argument, "Frame requires an image:", source);
            THROW_IF(image->empty(), invalid_dimensions,
                     "Frame image has zero size:", source, image->width(), "x", image->height());
            return {image->width(), image->height()};
        }
    }

    frame::frame(std::shared_ptr<const raster_image> image, std::string source)
        : m_image(std::move(image))
          , m_source(std::move(source))
          , m_rect(checked_rect(m_image, m_source)) {
    }

    frame frame::from_file(const std::filesystem::path& path) {
        auto image = std::make_shared<const raster_image>(load_image(path));
        return frame(std::move(image), path.string());
    }

    void frame::draw(raster_image& target) const {
        const rect r = m_rect.bounds();
        target.draw(*m_image, r.x, r.y);
    }
}
