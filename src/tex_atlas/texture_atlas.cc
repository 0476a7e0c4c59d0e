//
// Created by igor on 17/10/2026.
//

#include <tex_atlas/texture_atlas.hh>
#include <tex_atlas/image_codec.hh>
#include <tex_atlas/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <utility>

namespace tex_atlas {
    texture_atlas::texture_atlas(int size)
        : texture_atlas(size, size) {
    }

    texture_atlas::texture_atlas(int width, int height)
        : m_tree(0, 0, width, height) {
    }

    void texture_atlas::pack(texture tex) {
        THROW_IF(m_names.contains(tex.name()), std::invalid_argument,
                 "Texture already packed:", tex.name());

        for (auto& f : tex.frames()) {
            THROW_IF(!m_tree.pack(f), atlas_too_small,
                     "Failed to pack frame", f.source(), "of texture", tex.name(),
                     "into", width(), "x", height(), "atlas");
        }

        m_names.insert(tex.name());
        m_textures.push_back(std::move(tex));
    }

    raster_image texture_atlas::generate(pixel_format format) const {
        raster_image out(width(), height(), format);
        for (const auto& t : m_textures) {
            for (const auto& f : t.frames()) {
                f.draw(out);
            }
        }
        return out;
    }

    std::map<std::string, uv_bounds> texture_atlas::to_bounds() const {
        const double w = width();
        const double h = height();

        std::map<std::string, uv_bounds> out;
        for (const auto& t : m_textures) {
            const rect r = t.first_frame().bounds();
            out[t.name()] = uv_bounds{
                static_cast<float>(r.x / w),
                static_cast<float>(r.y / h),
                static_cast<float>((r.x + r.w) / w),
                static_cast<float>((r.y + std::min(r.h, r.w)) / h)
            };
        }
        return out;
    }

    void texture_atlas::write(const std::filesystem::path& path, pixel_format format) const {
        write_png(path, generate(format));
    }
}
