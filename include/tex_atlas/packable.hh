/**
 * @file packable.hh
 * @brief Sized rectangle with a set-once position.
 *
 * A packable is the unit the pack tree places. Its size is fixed at
 * construction; its position starts unset and is assigned exactly once
 * by a successful pack. Assigning it again is a logic error.
 *
 * @code{.cpp}
 * packable p(32, 16);
 * p.is_placed();   // false
 * p.place(64, 0);
 * p.x();           // 64
 * p.place(0, 0);   // throws std::logic_error
 * @endcode
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <tex_atlas/types.hh>
#include <optional>

namespace tex_atlas {
    class TEX_ATLAS_EXPORT packable {
    public:
        /**
         * @brief Create an unplaced rectangle.
         *
         * @param width Width in pixels
         * @param height Height in pixels
         * @throws invalid_dimensions if width or height is not positive
         */
        packable(int width, int height);

        [[nodiscard]] int width() const noexcept { return m_width; }
        [[nodiscard]] int height() const noexcept { return m_height; }

        /// 2 * (width + height), the key used to order textures before packing
        [[nodiscard]] int perimeter() const noexcept { return 2 * m_width + 2 * m_height; }

        [[nodiscard]] bool is_placed() const noexcept { return m_position.has_value(); }

        /**
         * @brief Assigned position.
         * @return Position, or std::nullopt while unplaced
         */
        [[nodiscard]] const std::optional<point>& position() const noexcept { return m_position; }

        /**
         * @brief X coordinate of the assigned position.
         * @throws std::runtime_error if the rectangle is not placed yet
         */
        [[nodiscard]] int x() const;

        /**
         * @brief Y coordinate of the assigned position.
         * @throws std::runtime_error if the rectangle is not placed yet
         */
        [[nodiscard]] int y() const;

        /**
         * @brief Assign the position.
         * @throws std::logic_error if a position was already assigned
         */
        void place(int x, int y);

        /**
         * @brief Placed rectangle in atlas space.
         * @throws std::runtime_error if the rectangle is not placed yet
         */
        [[nodiscard]] rect bounds() const;

    private:
        int m_width;
        int m_height;
        std::optional<point> m_position;
    };

    static_assert(packable_item<packable>);
} // namespace tex_atlas
