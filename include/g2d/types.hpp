#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @file types.hpp
 * @brief Core type aliases and small value types for the g2d library.
 */

namespace g2d {

using i32 = int32_t;   ///< Signed 32-bit integer.
using i64 = int64_t;   ///< Signed 64-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u16 = uint16_t;  ///< Unsigned 16-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.
using f32 = float;     ///< 32-bit floating point.
using f64 = double;    ///< 64-bit floating point.

/// @brief An RGBA color with floating-point components in [0, 1].
struct ColorF {
    f32 r = 0;  ///< Red component.
    f32 g = 0;  ///< Green component.
    f32 b = 0;  ///< Blue component.
    f32 a = 1;  ///< Alpha component, default opaque.
};

/// @brief A pixel rectangle in the 16-bit range the device scissor accepts.
struct Rect16 {
    u16 x = 0;  ///< Left edge.
    u16 y = 0;  ///< Bottom edge (device origin).
    u16 w = 0;  ///< Width.
    u16 h = 0;  ///< Height.
};

inline bool operator==(const Rect16& a, const Rect16& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

inline bool operator!=(const Rect16& a, const Rect16& b) { return !(a == b); }

} // namespace g2d
