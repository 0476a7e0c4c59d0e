/**
 * @file types.hh
 * @brief Core geometric types and capability concepts for atlas packing.
 *
 * This file defines the small value types shared by the packer, the
 * atlas and the build driver, together with the concepts that describe
 * what the packer needs from an item it places.
 *
 * @section types_overview Overview
 *
 * - **Geometric types**: point, rect
 * - **Output types**: uv_bounds
 * - **Capability concepts**: sized_2d, positioned_2d, packable_item
 *
 * @section types_usage Usage
 *
 * @code{.cpp}
 * rect r{16, 0, 32, 32};
 * rect other{0, 0, 16, 16};
 *
 * bool overlap = r.intersects(other);  // false, they only touch
 * @endcode
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <concepts>
#include <cstdint>

namespace tex_atlas {
    /**
     * @brief Integer position, origin at the top-left corner.
     */
    struct TEX_ATLAS_EXPORT point {
        int x = 0;  ///< Left edge X coordinate
        int y = 0;  ///< Top edge Y coordinate (grows downward)

        friend bool operator==(const point&, const point&) = default;
    };

    /**
     * @brief Axis-aligned rectangle in atlas pixel space.
     */
    struct TEX_ATLAS_EXPORT rect {
        int x = 0;  ///< Left edge X coordinate
        int y = 0;  ///< Top edge Y coordinate
        int w = 0;  ///< Width in pixels
        int h = 0;  ///< Height in pixels

        [[nodiscard]] constexpr int right() const noexcept { return x + w; }
        [[nodiscard]] constexpr int bottom() const noexcept { return y + h; }

        [[nodiscard]] constexpr std::int64_t area() const noexcept {
            return static_cast<std::int64_t>(w) * static_cast<std::int64_t>(h);
        }

        /**
         * @brief Check whether this rectangle fits inside a w x h area.
         */
        [[nodiscard]] constexpr bool fits_in(int width, int height) const noexcept {
            return w <= width && h <= height;
        }

        /**
         * @brief Check for overlap with another rectangle.
         *
         * Rectangles that only share an edge do not intersect.
         */
        [[nodiscard]] constexpr bool intersects(const rect& other) const noexcept {
            return x < other.right() && other.x < right() &&
                   y < other.bottom() && other.y < bottom();
        }

        /**
         * @brief Check that this rectangle lies fully within another.
         */
        [[nodiscard]] constexpr bool contained_in(const rect& outer) const noexcept {
            return x >= outer.x && y >= outer.y &&
                   right() <= outer.right() && bottom() <= outer.bottom();
        }

        friend bool operator==(const rect&, const rect&) = default;
    };

    /**
     * @brief Normalized texture coordinates of an atlas entry.
     *
     * All components are in [0, 1]. (u0, v0) is the top-left corner and
     * (u1, v1) the bottom-right corner of the entry.
     */
    struct TEX_ATLAS_EXPORT uv_bounds {
        float u0 = 0;  ///< Left edge
        float v0 = 0;  ///< Top edge
        float u1 = 0;  ///< Right edge
        float v1 = 0;  ///< Bottom edge

        friend bool operator==(const uv_bounds&, const uv_bounds&) = default;
    };

    /**
     * @brief Concept for objects with an immutable pixel size.
     */
    template<typename T>
    concept sized_2d = requires(const T& item)
    {
        { item.width() } -> std::convertible_to<int>;
        { item.height() } -> std::convertible_to<int>;
    };

    /**
     * @brief Concept for objects whose position is assigned exactly once.
     *
     * - `item.is_placed()` - true once a position was assigned
     * - `item.place(x, y)` - assign the position (second call must throw)
     * - `item.x()`, `item.y()` - the assigned position
     */
    template<typename T>
    concept positioned_2d = requires(T& item, const T& citem, int x, int y)
    {
        { citem.is_placed() } -> std::same_as<bool>;
        { item.place(x, y) } -> std::same_as<void>;
        { citem.x() } -> std::convertible_to<int>;
        { citem.y() } -> std::convertible_to<int>;
    };

    /**
     * @brief Anything the pack tree can place.
     */
    template<typename T>
    concept packable_item = sized_2d<T> && positioned_2d<T>;
} // namespace tex_atlas
