/**
 * @file pack_tree.hh
 * @brief Guillotine rectangle packer over a binary region tree.
 *
 * The pack tree partitions a rectangular area into regions. Each region
 * holds at most one rectangle. Placing a rectangle in an empty region
 * splits the rest of that region into two children with straight cuts:
 *
 * @code
 *   (x,y)
 *     +--------+----------------------+
 *     | placed |                      |
 *     |        |                      |
 *     +--------+        sub2          |
 *     |        |                      |
 *     |  sub1  |                      |
 *     |        |                      |
 *     +--------+----------------------+
 * @endcode
 *
 * - sub1 is the strip below the placed rectangle, as wide as it
 * - sub2 is everything to its right, at full region height
 *
 * A new rectangle is offered to sub1 before sub2, recursively. The
 * split favors filling downward and can waste area, so callers must be
 * ready to retry with a larger tree.
 *
 * @section pack_tree_storage Storage
 *
 * Regions are kept in a flat arena and refer to their children by
 * index. Region 0 is the root. Children are appended when a rectangle is
 * placed and are never removed or resized.
 *
 * @code{.cpp}
 * pack_tree tree(128, 128);
 * packable a(64, 64), b(32, 32);
 *
 * tree.pack(a);  // a at (0, 0)
 * tree.pack(b);  // b at (0, 64), in the strip below a
 * @endcode
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <tex_atlas/types.hh>
#include <failsafe/failsafe.hh>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tex_atlas {
    /// Index of a region inside a pack_tree arena
    using region_index = std::size_t;

    /**
     * @brief One node of the region tree.
     *
     * `area` is the free area this region was created with. `occupant`
     * is set once a rectangle lands here; from then on sub1 and sub2 are
     * both set.
     */
    struct TEX_ATLAS_EXPORT pack_region {
        rect area;
        std::optional<rect> occupant;
        std::optional<region_index> sub1;
        std::optional<region_index> sub2;

        [[nodiscard]] bool is_empty() const noexcept { return !occupant.has_value(); }
    };

    class TEX_ATLAS_EXPORT pack_tree {
    public:
        /**
         * @brief Create a tree whose root covers (x, y, width, height).
         * @throws invalid_dimensions if width or height is negative
         */
        pack_tree(int x, int y, int width, int height);

        /// Tree rooted at (0, 0)
        pack_tree(int width, int height);

        /**
         * @brief Place an item and assign its position.
         *
         * On failure the tree and the item are left untouched.
         *
         * @param item Unplaced item
         * @return true if the item was placed
         * @throws std::logic_error if the item is already placed
         */
        template<packable_item T>
        bool pack(T& item) {
            THROW_IF(item.is_placed(), std::logic_error,
                     "Cannot pack an item that is already placed");
            auto slot = insert(item.width(), item.height());
            if (!slot) {
                return false;
            }
            item.place(slot->x, slot->y);
            return true;
        }

        /**
         * @brief Reserve a w x h rectangle.
         *
         * Finds the first empty region, in sub1-before-sub2 pre-order,
         * that fits the rectangle, occupies it and splits it.
         *
         * @return Position of the reserved rectangle, or std::nullopt
         */
        [[nodiscard]] std::optional<point> insert(int w, int h);

        /**
         * @brief All placed rectangles, in pre-order (self, sub1, sub2).
         */
        [[nodiscard]] std::vector<rect> get_all_packables() const;

        [[nodiscard]] int x() const noexcept { return m_regions.front().area.x; }
        [[nodiscard]] int y() const noexcept { return m_regions.front().area.y; }
        [[nodiscard]] int width() const noexcept { return m_regions.front().area.w; }
        [[nodiscard]] int height() const noexcept { return m_regions.front().area.h; }

        /// Number of regions in the arena, including empty leaves
        [[nodiscard]] std::size_t region_count() const noexcept { return m_regions.size(); }

        /// Region by index; 0 is the root
        [[nodiscard]] const pack_region& region(region_index index) const;

        /// Sum of the areas of all placed rectangles
        [[nodiscard]] std::int64_t used_area() const noexcept { return m_used_area; }

    private:
        std::vector<pack_region> m_regions;
        std::int64_t m_used_area = 0;

        void split(region_index index, int w, int h);
    };
} // namespace tex_atlas
