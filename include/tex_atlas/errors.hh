/**
 * @file errors.hh
 * @brief Exception types raised by the atlas packer.
 *
 * All errors are reported as exceptions. Only atlas_too_small is
 * handled inside the library (the build driver retries with a larger
 * atlas); every other error reaches the caller and no partial atlas is
 * produced.
 *
 * @author Igor
 * @date 17/10/2026
 */

#pragma once

#include <tex_atlas/export.h>
#include <stdexcept>

namespace tex_atlas {
    /**
     * @brief A frame did not fit into the atlas being packed.
     *
     * Raised by texture_atlas::pack(). The atlas that raised it is left
     * partially packed and must be discarded.
     */
    class TEX_ATLAS_EXPORT atlas_too_small : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief A source image is missing or could not be decoded.
     */
    class TEX_ATLAS_EXPORT decode_failure : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief An image has zero (or negative) width or height.
     */
    class TEX_ATLAS_EXPORT invalid_dimensions : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief The retry loop reached atlas_config::max_size without success.
     */
    class TEX_ATLAS_EXPORT size_limit_exceeded : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
} // namespace tex_atlas
