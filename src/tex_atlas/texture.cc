//
// Created by igor on 17/10/2026.
//

#include <tex_atlas/texture.hh>
#include <failsafe/failsafe.hh>
#include <utility>

namespace tex_atlas {
    texture::texture(std::string name, std::vector<frame> frames)
        : m_name(std::move(name))
          , m_frames(std::move(frames)) {
        THROW_IF(m_frames.empty(), std::invalid_argument, "Texture has no frames:", m_name);
    }

    texture::texture(std::string name, frame single)
        : m_name(std::move(name)) {
        m_frames.push_back(std::move(single));
    }
}
