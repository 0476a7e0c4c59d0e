//
// Created by igor on 17/10/2026.
//

#include <tex_atlas/packable.hh>
#include <tex_atlas/errors.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/enforce.hh>

namespace tex_atlas {
    packable::packable(int width, int height)
        : m_width(width), m_height(height) {
        THROW_IF(width <= 0 || height <= 0, invalid_dimensions,
                 "Rectangle must have positive size, got", width, "x", height);
    }

    int packable::x() const {
        ENFORCE(m_position.has_value());
        return m_position->x;
    }

    int packable::y() const {
        ENFORCE(m_position.has_value());
        return m_position->y;
    }

    void packable::place(int x, int y) {
        THROW_IF(m_position.has_value(), std::logic_error,
                 "Rectangle", m_width, "x", m_height, "is already placed");
        m_position = point{x, y};
    }

    rect packable::bounds() const {
        ENFORCE(m_position.has_value());
        return {m_position->x, m_position->y, m_width, m_height};
    }
}
