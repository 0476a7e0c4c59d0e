//
// Created by igor on 17/10/2026.
//

#include <tex_atlas/pack_tree.hh>
#include <tex_atlas/errors.hh>
#include <failsafe/enforce.hh>

namespace tex_atlas {
    pack_tree::pack_tree(int x, int y, int width, int height) {
        THROW_IF(width < 0 || height < 0, invalid_dimensions,
                 "Pack region cannot have negative size:", width, "x", height);
        m_regions.push_back(pack_region{rect{x, y, width, height}, std::nullopt, std::nullopt, std::nullopt});
    }

    pack_tree::pack_tree(int width, int height)
        : pack_tree(0, 0, width, height) {
    }

    std::optional<point> pack_tree::insert(int w, int h) {
        // Explicit stack walk; pushing sub2 before sub1 keeps the visit
        // order identical to "sub1.pack(r) || sub2.pack(r)".
        std::vector<region_index> pending{0};
        while (!pending.empty()) {
            const region_index index = pending.back();
            pending.pop_back();

            const pack_region& region = m_regions[index];
            if (region.is_empty()) {
                if (w > region.area.w || h > region.area.h) {
                    continue;
                }
                const point at{region.area.x, region.area.y};
                split(index, w, h);
                return at;
            }

            pending.push_back(*region.sub2);
            pending.push_back(*region.sub1);
        }
        return std::nullopt;
    }

    void pack_tree::split(region_index index, int w, int h) {
        const rect area = m_regions[index].area;

        const auto sub1 = m_regions.size();
        m_regions.push_back(pack_region{
            rect{area.x, area.y + h, w, area.h - h},
            std::nullopt, std::nullopt, std::nullopt
        });

        const auto sub2 = m_regions.size();
        m_regions.push_back(pack_region{
            rect{area.x + w, area.y, area.w - w, area.h},
            std::nullopt, std::nullopt, std::nullopt
        });

        // m_regions may have reallocated; index again
        pack_region& region = m_regions[index];
        region.occupant = rect{area.x, area.y, w, h};
        region.sub1 = sub1;
        region.sub2 = sub2;

        m_used_area += static_cast<std::int64_t>(w) * static_cast<std::int64_t>(h);
    }

    std::vector<rect> pack_tree::get_all_packables() const {
        std::vector<rect> out;
        std::vector<region_index> pending{0};
        while (!pending.empty()) {
            const pack_region& region = m_regions[pending.back()];
            pending.pop_back();
            if (region.is_empty()) {
                continue;
            }
            out.push_back(*region.occupant);
            pending.push_back(*region.sub2);
            pending.push_back(*region.sub1);
        }
        return out;
    }

    const pack_region& pack_tree::region(region_index index) const {
        ENFORCE(index < m_regions.size());
        return m_regions[index];
    }
}
