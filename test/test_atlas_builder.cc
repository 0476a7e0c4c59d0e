//
// Created by igor on 17/10/2026.
//
// End-to-end tests for create_atlas
//

#include <doctest/doctest.h>
#include <tex_atlas/atlas_builder.hh>
#include <tex_atlas/image_codec.hh>
#include <tex_atlas/errors.hh>
#include <array>
#include <cmath>
#include <string>
#include <vector>
#include "test_data.hh"

using namespace tex_atlas;
using namespace tex_atlas::test;

namespace {
    using source_map = std::map<std::string, std::filesystem::path>;

    std::array<uint8_t, 4> pixel_at(const atlas_result& r, int x, int y) {
        const std::size_t i = (static_cast<std::size_t>(y) * r.width + static_cast<std::size_t>(x)) * 4u;
        return {r.pixels[i], r.pixels[i + 1], r.pixels[i + 2], r.pixels[i + 3]};
    }

    // UV bounds back to pixel space; v1 is clamped by min(w, h) so only x, y, right are exact
    rect to_pixels(const uv_bounds& uv, const atlas_result& r) {
        const auto w = static_cast<float>(r.width);
        const auto h = static_cast<float>(r.height);
        const int x = static_cast<int>(std::lround(uv.u0 * w));
        const int y = static_cast<int>(std::lround(uv.v0 * h));
        return {x, y,
                static_cast<int>(std::lround(uv.u1 * w)) - x,
                static_cast<int>(std::lround(uv.v1 * h)) - y};
    }
}

TEST_SUITE("atlas_builder") {

    TEST_CASE("three squares pack without retry") {
        source_map sources{
            {"a", test_data::write("build_a.png", test_data::solid(64, 64, 255, 0, 0))},
            {"b", test_data::write("build_b.png", test_data::solid(32, 32, 0, 255, 0))},
            {"c", test_data::write("build_c.png", test_data::solid(16, 16, 0, 0, 255))},
        };

        auto result = create_atlas(sources);

        CHECK(result.width == 128);
        CHECK(result.height == 128);
        CHECK(result.pixels.size() == 128u * 128u * 4u);

        REQUIRE(result.bounds.size() == 3);
        CHECK(result.bounds.at("a") == uv_bounds{0.0f, 0.0f, 64.0f / 128.0f, 64.0f / 128.0f});
        CHECK(result.bounds.at("b") == uv_bounds{0.0f, 0.5f, 0.25f, 0.75f});
        CHECK(result.bounds.at("c") == uv_bounds{0.0f, 0.75f, 0.125f, 0.875f});

        CHECK(pixel_at(result, 0, 0) == std::array<uint8_t, 4>{255, 0, 0, 255});
        CHECK(pixel_at(result, 63, 63) == std::array<uint8_t, 4>{255, 0, 0, 255});
        CHECK(pixel_at(result, 0, 64) == std::array<uint8_t, 4>{0, 255, 0, 255});
        CHECK(pixel_at(result, 15, 111) == std::array<uint8_t, 4>{0, 0, 255, 255});
        CHECK(pixel_at(result, 127, 127) == std::array<uint8_t, 4>{0, 0, 0, 0});
    }

    TEST_CASE("pixels are copied from the right place") {
        source_map sources{
            {"grad", test_data::write("build_grad.png", test_data::gradient(20, 20, 7))},
            {"big", test_data::write("build_big.png", test_data::solid(40, 40, 1, 1, 1))},
        };

        auto result = create_atlas(sources);
        const rect g = to_pixels(result.bounds.at("grad"), result);

        for (int y = 0; y < 20; ++y) {
            for (int x = 0; x < 20; ++x) {
                CHECK(pixel_at(result, g.x + x, g.y + y) ==
                      std::array<uint8_t, 4>{static_cast<uint8_t>(x), static_cast<uint8_t>(y), 7, 255});
            }
        }
    }

    TEST_CASE("retry grows the atlas") {
        auto path = test_data::write("build_sq50.png", test_data::solid(50, 50, 9, 9, 9));
        source_map sources;
        for (int i = 0; i < 5; ++i) {
            sources.emplace("sq" + std::to_string(i), path);
        }

        auto result = create_atlas(sources);
        CHECK(result.width == 256);
        CHECK(result.height == 256);
        CHECK(result.bounds.size() == 5);
    }

    TEST_CASE("large frame sets the size floor") {
        source_map sources{
            {"strip", test_data::write("build_strip.png", test_data::solid(300, 10, 3, 3, 3))},
            {"dot", test_data::write("build_dot.png", test_data::solid(4, 4, 5, 5, 5))},
        };

        auto result = create_atlas(sources);
        CHECK(result.width == 300);
        const auto& strip = result.bounds.at("strip");
        CHECK(strip.u0 == 0.0f);
        CHECK(strip.v0 == 0.0f);
        CHECK(strip.u1 == 1.0f);
        CHECK(strip.v1 == doctest::Approx(10.0 / 300.0));
    }

    TEST_CASE("duplicate path under two keys") {
        auto path = test_data::write("build_dup.png", test_data::solid(16, 16, 8, 8, 8));
        source_map sources{
            {"first", path},
            {"second", path},
        };

        auto result = create_atlas(sources);
        REQUIRE(result.bounds.size() == 2);

        const auto a = to_pixels(result.bounds.at("first"), result);
        const auto b = to_pixels(result.bounds.at("second"), result);
        CHECK_FALSE(a == b);
        CHECK_FALSE(a.intersects(b));
        CHECK(pixel_at(result, a.x, a.y) == std::array<uint8_t, 4>{8, 8, 8, 255});
        CHECK(pixel_at(result, b.x, b.y) == std::array<uint8_t, 4>{8, 8, 8, 255});
    }

    TEST_CASE("every key is covered and nothing overlaps") {
        source_map sources;
        for (int i = 1; i <= 24; ++i) {
            const int w = (i * 11) % 29 + 4;
            const int h = (i * 5) % 23 + 4;
            auto name = "many_" + std::to_string(i);
            sources.emplace(name, test_data::write(name + ".png", test_data::solid(w, h, 1, 2, 3)));
        }

        auto result = create_atlas(sources);
        REQUIRE(result.bounds.size() == sources.size());

        std::vector<rect> placed;
        for (const auto& [key, path] : sources) {
            const auto& uv = result.bounds.at(key);
            CHECK(uv.u0 >= 0.0f);
            CHECK(uv.v0 >= 0.0f);
            CHECK(uv.u1 <= 1.0f);
            CHECK(uv.v1 <= 1.0f);

            // Recover the full rectangle from the file for the overlap check
            auto image = load_image(path);
            auto r = to_pixels(uv, result);
            r.h = image.height();
            CHECK(r.w == image.width());
            placed.push_back(r);
        }

        const rect bounds{0, 0, static_cast<int>(result.width), static_cast<int>(result.height)};
        for (std::size_t i = 0; i < placed.size(); ++i) {
            CHECK(placed[i].contained_in(bounds));
            for (std::size_t j = i + 1; j < placed.size(); ++j) {
                CHECK_FALSE(placed[i].intersects(placed[j]));
            }
        }
    }

    TEST_CASE("two runs give identical results") {
        source_map sources{
            {"x", test_data::write("det_x.png", test_data::gradient(30, 12, 1))},
            {"y", test_data::write("det_y.png", test_data::gradient(12, 30, 2))},
            {"z", test_data::write("det_z.png", test_data::gradient(18, 18, 3))},
        };

        auto first = create_atlas(sources);
        auto second = create_atlas(sources);
        CHECK(first.width == second.width);
        CHECK(first.height == second.height);
        CHECK(first.bounds == second.bounds);
        CHECK(first.pixels == second.pixels);
    }

    TEST_CASE("missing file fails the whole build") {
        source_map sources{
            {"ok", test_data::write("fail_ok.png", test_data::solid(8, 8, 1, 1, 1))},
            {"gone", test_data::missing("fail_gone.png")},
        };
        CHECK_THROWS_AS((void)create_atlas(sources), decode_failure);
    }

    TEST_CASE("size limit is reported") {
        auto path = test_data::write("limit_sq50.png", test_data::solid(50, 50, 1, 1, 1));
        source_map sources;
        for (int i = 0; i < 5; ++i) {
            sources.emplace("sq" + std::to_string(i), path);
        }

        atlas_config config;
        config.max_size = 128;
        CHECK_THROWS_AS((void)create_atlas(sources, config), size_limit_exceeded);
    }

    TEST_CASE("written atlas matches the generated pixels") {
        source_map sources{
            {"p", test_data::write("write_p.png", test_data::gradient(10, 10, 9))},
        };
        std::vector<texture> textures;
        textures.emplace_back("p", frame::from_file(sources.at("p")));
        auto atlas = pack_textures(std::move(textures));

        auto out = test_data::base_path() / "write_atlas.png";
        atlas.write(out);

        auto loaded = load_image(out);
        CHECK(loaded.width() == atlas.width());
        CHECK(loaded.bytes() == atlas.generate().bytes());
    }

    TEST_CASE("no sources") {
        auto result = create_atlas({});
        CHECK(result.bounds.empty());
        CHECK(result.width == 1);
        CHECK(result.pixels.size() == 4);
    }
}
