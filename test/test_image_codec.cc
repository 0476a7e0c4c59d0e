//
// Created by igor on 17/10/2026.
//
// Tests for image decoding and PNG encoding
//

#include <doctest/doctest.h>
#include <tex_atlas/image_codec.hh>
#include <tex_atlas/frame.hh>
#include <tex_atlas/errors.hh>
#include <array>
#include <span>
#include "test_data.hh"

using namespace tex_atlas;
using namespace tex_atlas::test;

TEST_SUITE("image_codec") {

    TEST_CASE("png survives write and load") {
        auto source = test_data::gradient(7, 5, 42);
        auto path = test_data::write("codec_gradient.png", source);

        auto loaded = load_image(path);
        CHECK(loaded.width() == 7);
        CHECK(loaded.height() == 5);
        CHECK(loaded.format() == pixel_format::rgba8);
        CHECK(loaded.bytes() == source.bytes());
    }

    TEST_CASE("rgb png is expanded to rgba") {
        raster_image rgb(2, 2, pixel_format::rgb8);
        rgb.draw(test_data::solid(2, 2, 10, 20, 30, 0), 0, 0);
        auto path = test_data::write("codec_rgb.png", rgb);

        auto loaded = load_image(path);
        CHECK(loaded.format() == pixel_format::rgba8);
        CHECK(loaded.pixel(1, 1) == std::array<uint8_t, 4>{10, 20, 30, 255});
    }

    TEST_CASE("load from memory") {
        auto path = test_data::write("codec_memory.png", test_data::solid(3, 3, 1, 2, 3, 4));
        auto bytes = test_data::load_file(path);

        auto loaded = load_image(std::span<const uint8_t>(bytes));
        CHECK(loaded.width() == 3);
        CHECK(loaded.pixel(2, 2) == std::array<uint8_t, 4>{1, 2, 3, 4});
    }

    TEST_CASE("missing file") {
        auto path = test_data::missing("codec_does_not_exist.png");
        CHECK_THROWS_AS((void)load_image(path), decode_failure);
    }

    TEST_CASE("not an image") {
        auto path = test_data::write_bytes("codec_garbage.png", {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'});
        CHECK_THROWS_AS((void)load_image(path), decode_failure);
    }

    TEST_CASE("empty file") {
        auto path = test_data::write_bytes("codec_empty.png", {});
        CHECK_THROWS_AS((void)load_image(path), decode_failure);
        CHECK_THROWS_AS((void)load_image(std::span<const uint8_t>()), decode_failure);
    }

    TEST_CASE("writing an empty image is rejected") {
        raster_image empty(0, 0);
        CHECK_THROWS_AS(write_png(test_data::base_path() / "codec_zero.png", empty), invalid_dimensions);
    }

    TEST_CASE("frame from file") {
        auto path = test_data::write("codec_frame.png", test_data::solid(12, 6, 0, 0, 0));
        auto f = frame::from_file(path);
        CHECK(f.width() == 12);
        CHECK(f.height() == 6);
        CHECK(f.source() == path.string());
    }
}
