#pragma once

/**
 * @file color.hpp
 * @brief sRGB transfer function helpers.
 */

#include "g2d/types.hpp"

namespace g2d {

/// @brief Convert one sRGB-encoded component to linear space.
f32 srgbToLinear(f32 c);

/// @brief Convert one linear component to sRGB encoding.
f32 linearToSrgb(f32 c);

/// @brief Gamma-correct the RGB channels of an sRGB color. Alpha is kept as is.
ColorF gammaSrgbToLinear(ColorF c);

/// @brief Inverse of gammaSrgbToLinear(). Alpha is kept as is.
ColorF gammaLinearToSrgb(ColorF c);

} // namespace g2d
