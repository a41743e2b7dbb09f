#pragma once

#include <cstddef>
#include <raylib-cpp.hpp>

#include "Constants.hpp"

namespace gravsim {

// Color keyed by body index. Removing a body shifts the colors of later ones.
inline auto body_color(const std::size_t index) -> raylib::Color {
    if (index < constants::body_palette.size()) return constants::body_palette[index];
    // Knuth multiplicative hash; stable across frames.
    const auto h = static_cast<unsigned>(index * 2654435761U);
    const auto channel = [h](const unsigned shift) {
        return static_cast<unsigned char>(constants::derived_color_min +
                                          static_cast<int>((h >> shift) % constants::derived_color_span));
    };
    return {channel(0), channel(8), channel(16), constants::alpha_opaque};
}

}  // namespace gravsim
