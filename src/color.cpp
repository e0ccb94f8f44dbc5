#include "g2d/color.hpp"
#include <cmath>

namespace g2d {

f32 srgbToLinear(f32 c) {
    if (c <= 0.04045f) return c / 12.92f;
    return std::pow((c + 0.055f) / 1.055f, 2.4f);
}

f32 linearToSrgb(f32 c) {
    if (c <= 0.0031308f) return c * 12.92f;
    return 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
}

ColorF gammaSrgbToLinear(ColorF c) {
    return {srgbToLinear(c.r), srgbToLinear(c.g), srgbToLinear(c.b), c.a};
}

ColorF gammaLinearToSrgb(ColorF c) {
    return {linearToSrgb(c.r), linearToSrgb(c.g), linearToSrgb(c.b), c.a};
}

} // namespace g2d
