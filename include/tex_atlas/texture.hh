/**
 * @file texture.hh
 * @brief Named group of frames packed as one unit.
 *
 * Most textures have a single frame. Animated textures carry one frame
 * per animation step; all of them are packed into the same atlas, and
 * the first frame defines the texture's UV bounds.
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <tex_atlas/frame.hh>
#include <string>
#include <vector>

namespace tex_atlas {
    class TEX_ATLAS_EXPORT texture {
    public:
        /**
         * @brief Create a texture.
         *
         * @param name Identifier, unique within one atlas
         * @param frames One or more frames, in animation order
         * @throws std::invalid_argument if frames is empty
         */
        texture(std::string name, std::vector<frame> frames);

        /// Single-frame texture
        texture(std::string name, frame single);

        [[nodiscard]] const std::string& name() const noexcept { return m_name; }

        [[nodiscard]] const std::vector<frame>& frames() const noexcept { return m_frames; }
        [[nodiscard]] std::vector<frame>& frames() noexcept { return m_frames; }

        /// The frame that defines the texture's size and UV bounds
        [[nodiscard]] const frame& first_frame() const noexcept { return m_frames.front(); }

    private:
        std::string m_name;
        std::vector<frame> m_frames;
    };
} // namespace tex_atlas
