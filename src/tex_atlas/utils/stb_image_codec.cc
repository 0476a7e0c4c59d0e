//
// Created by igor on 17/10/2026.
//

#include <tex_atlas/image_codec.hh>
#include <tex_atlas/errors.hh>
#include <failsafe/failsafe.hh>
#include <fstream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

// Disable warnings for stb_image (third-party headers)
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wdouble-promotion"
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#endif

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

namespace tex_atlas {
    namespace {
        struct stbi_deleter {
            void operator()(stbi_uc* p) const noexcept { stbi_image_free(p); }
        };

        using stbi_pixels = std::unique_ptr<stbi_uc, stbi_deleter>;

        std::vector<uint8_t> read_file(const std::filesystem::path& path) {
            std::ifstream file(path, std::ios::binary | std::ios::ate);
            THROW_IF(!file, decode_failure, "Cannot open image file:", path.string());

            auto size = file.tellg();
            THROW_IF(size < 0, decode_failure, "Cannot determine size of image file:", path.string());
            file.seekg(0, std::ios::beg);

            std::vector<uint8_t> data(static_cast<size_t>(size));
            THROW_IF(!file.read(reinterpret_cast<char*>(data.data()), size),
                     decode_failure, "Failed to read image file:", path.string());

            return data;
        }

        raster_image decode(std::span<const uint8_t> data, const std::string& origin) {
            THROW_IF(data.empty(), decode_failure, "Empty image data:", origin);
            THROW_IF(data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()),
                     decode_failure, "Image data too large:", origin);

            int width = 0;
            int height = 0;
            int source_channels = 0;
            stbi_pixels pixels(stbi_load_from_memory(data.data(), static_cast<int>(data.size()),
                                                     &width, &height, &source_channels, 4));
            THROW_IF(!pixels, decode_failure, "Cannot decode image", origin, ":", stbi_failure_reason());
            THROW_IF(width <= 0 || height <= 0, invalid_dimensions,
                     "Image", origin, "has zero size:", width, "x", height);

            const std::size_t bytes = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
            std::vector<uint8_t> rgba(pixels.get(), pixels.get() + bytes);
            return {width, height, pixel_format::rgba8, std::move(rgba)};
        }
    }

    raster_image load_image(const std::filesystem::path& path) {
        auto data = read_file(path);
        return decode(data, path.string());
    }

    raster_image load_image(std::span<const uint8_t> data) {
        return decode(data, "<memory>");
    }

    void write_png(const std::filesystem::path& path, const raster_image& image) {
        THROW_IF(image.empty(), invalid_dimensions, "Cannot write an empty image to", path.string());
        const int ok = stbi_write_png(path.string().c_str(), image.width(), image.height(),
                                      image.channels(), image.data(), image.stride());
        THROW_IF(ok == 0, std::runtime_error, "Failed to write PNG file:", path.string());
    }
}
