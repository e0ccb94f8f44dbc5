#pragma once

/**
 * @file texture.hpp
 * @brief GPU-resident texture view and its surface format.
 */

#include "g2d/types.hpp"

namespace g2d {

/// @brief Channel layout of a texture surface.
enum class SurfaceFormat : u8 {
    R3_G3_B2,
    R4_G4,
    R4_G4_B4_A4,
    R5_G5_B5_A1,
    R5_G6_B5,
    R8,
    R8_G8,
    R8_G8_B8,
    R8_G8_B8_A8,
    R10_G10_B10_A2,
    R11_G11_B10,
    R16,
    R16_G16,
    R16_G16_B16,
    R16_G16_B16_A16,
    R32,
    R32_G32,
    R32_G32_B32,
    R32_G32_B32_A32,
    D16,
    D24,
    D24_S8,
    D32,
};

/// @brief True if the format stores a dedicated alpha channel.
bool hasAlphaChannel(SurfaceFormat format);

/**
 * Texture - A texture view supplied by the host.
 *
 * The view handle is opaque to g2d (e.g. a GL texture name for GLDevice).
 * The host keeps the underlying texture alive while it is drawn.
 */
struct Texture {
    u64 view = 0;
    SurfaceFormat format = SurfaceFormat::R8_G8_B8_A8;
    u32 width = 0;
    u32 height = 0;

    bool valid() const { return view != 0 && width > 0 && height > 0; }
};

} // namespace g2d
