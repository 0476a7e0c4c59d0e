//
// Created by igor on 17/10/2026.
//

#include <tex_atlas/atlas_builder.hh>
#include <tex_atlas/image_codec.hh>
#include <tex_atlas/errors.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/enforce.hh>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

namespace tex_atlas {
    namespace {
        using image_cache = std::map<std::filesystem::path, std::shared_ptr<const raster_image>>;

        std::shared_ptr<const raster_image> decode_once(image_cache& cache, const std::filesystem::path& path) {
            auto it = cache.find(path);
            if (it != cache.end()) {
                return it->second;
            }
            spdlog::debug("Decoding texture {}", path.string());
            auto image = std::make_shared<const raster_image>(load_image(path));
            cache.emplace(path, image);
            return image;
        }
    }

    std::int64_t next_power_of_two(std::int64_t value) noexcept {
        std::int64_t result = 1;
        while (result < value) {
            result <<= 1;
        }
        return result;
    }

    std::int64_t ceil_sqrt(std::int64_t value) noexcept {
        if (value <= 0) {
            return 0;
        }
        auto root = static_cast<std::int64_t>(std::sqrt(static_cast<double>(value)));
        // Correct the floating point estimate in both directions
        while (root > 0 && (root - 1) * (root - 1) >= value) {
            --root;
        }
        while (root * root < value) {
            ++root;
        }
        return root;
    }

    std::int64_t estimate_atlas_size(const std::vector<texture>& textures) {
        std::int64_t max_height = 0;
        std::int64_t max_width = 0;
        std::int64_t pixels = 0;
        for (const auto& t : textures) {
            for (const auto& f : t.frames()) {
                max_height = std::max<std::int64_t>(max_height, f.height());
                max_width = std::max<std::int64_t>(max_width, f.width());
                pixels += static_cast<std::int64_t>(f.width()) * f.height();
            }
        }
        return std::max({max_height, max_width, next_power_of_two(ceil_sqrt(pixels))});
    }

    texture_atlas pack_textures(std::vector<texture> textures, const atlas_config& config) {
        THROW_IF(config.max_size <= 0, std::invalid_argument,
                 "Maximum atlas size must be positive, got", config.max_size);

        // Largest perimeter first; stable so equal perimeters keep input order
        std::stable_sort(textures.begin(), textures.end(),
                         [](const texture& a, const texture& b) {
                             return a.first_frame().perimeter() > b.first_frame().perimeter();
                         });

        std::int64_t size = estimate_atlas_size(textures);
        THROW_IF(size > config.max_size, size_limit_exceeded,
                 "Initial atlas size", size, "exceeds the limit of", config.max_size);

        while (true) {
            spdlog::info("Trying to pack textures into image of size {}x{}", size, size);
            try {
                texture_atlas atlas(static_cast<int>(size));
                for (const auto& t : textures) {
                    atlas.pack(t);
                }
                spdlog::info("Successfully packed textures into an image of size {}x{}", size, size);
                return atlas;
            } catch (const atlas_too_small& e) {
                spdlog::info("Image was too small. Trying with a larger area");
                spdlog::debug("{}", e.what());
            }

            THROW_IF(size * 2 > config.max_size, size_limit_exceeded,
                     "Textures do not fit into", size, "x", size,
                     "and the next size exceeds the limit of", config.max_size);
            size *= 2;
        }
    }

    atlas_result create_atlas(const std::map<std::string, std::filesystem::path>& sources,
                              const atlas_config& config) {
        spdlog::info("Creating texture atlas from {} textures", sources.size());

        image_cache cache;
        std::vector<texture> textures;
        textures.reserve(sources.size());
        for (const auto& [key, path] : sources) {
            textures.emplace_back(key, frame(decode_once(cache, path), path.string()));
        }

        texture_atlas atlas = pack_textures(std::move(textures), config);

        atlas_result result;
        result.width = static_cast<uint32_t>(atlas.width());
        result.height = static_cast<uint32_t>(atlas.height());
        result.pixels = atlas.generate(pixel_format::rgba8).release();

        // Textures are named after the caller keys
        auto by_name = atlas.to_bounds();
        for (const auto& [key, path] : sources) {
            auto it = by_name.find(key);
            ENFORCE(it != by_name.end());
            result.bounds.emplace(key, it->second);
        }

        spdlog::info("Finished creating texture atlas");
        return result;
    }
}
