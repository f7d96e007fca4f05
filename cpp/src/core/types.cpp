#include "poly_scatter/core/types.hpp"

#include <cctype>
#include <stdexcept>

namespace poly_scatter {

std::string_view to_string(Color color) {
    switch (color) {
        case Color::Red: return "red";
        case Color::Blue: return "blue";
        case Color::Green: return "green";
        case Color::Yellow: return "yellow";
        case Color::Purple: return "purple";
        case Color::Orange: return "orange";
        case Color::White: return "white";
    }
    return "white";
}

Rgb to_rgb(Color color) {
    switch (color) {
        case Color::Red: return Rgb{255, 0, 0};
        case Color::Blue: return Rgb{0, 0, 255};
        case Color::Green: return Rgb{0, 255, 0};
        case Color::Yellow: return Rgb{255, 255, 0};
        case Color::Purple: return Rgb{160, 32, 240};
        case Color::Orange: return Rgb{255, 165, 0};
        case Color::White: return Rgb{255, 255, 255};
    }
    return Rgb{255, 255, 255};
}

Color color_from_string(std::string_view name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (Color color : ALL_COLORS) {
        if (to_string(color) == lowered) {
            return color;
        }
    }
    throw std::invalid_argument("Unknown color: " + std::string(name));
}

}  // namespace poly_scatter
