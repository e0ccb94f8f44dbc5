#pragma once

/**
 * @file draw_state.hpp
 * @brief Per-draw blend, stencil clip and scissor descriptor.
 */

#include "g2d/types.hpp"
#include "g2d/error.hpp"
#include <optional>

namespace g2d {

/// @brief Blend modes. An empty std::optional<Blend> means no blending.
enum class Blend : u8 {
    Alpha,     ///< src * srcAlpha + dst * (1 - srcAlpha).
    Add,       ///< src + dst.
    Multiply,  ///< src * dst.
    Invert,    ///< 1 - dst, using a white blend constant.
};

/// @brief Stencil clip descriptor. An empty std::optional<Stencil> means no stencil test.
struct Stencil {
    enum class Kind : u8 {
        Clip,     ///< Write value into the stencil buffer, draw no color.
        Inside,   ///< Draw where the stencil buffer equals value.
        Outside,  ///< Draw where the stencil buffer differs from value.
    };

    Kind kind = Kind::Clip;
    u8 value = 0;  ///< Stencil reference.

    static Stencil Clip(u8 v) { return {Kind::Clip, v}; }
    static Stencil Inside(u8 v) { return {Kind::Inside, v}; }
    static Stencil Outside(u8 v) { return {Kind::Outside, v}; }
};

inline bool operator==(const Stencil& a, const Stencil& b) {
    return a.kind == b.kind && a.value == b.value;
}

/// @brief Scissor rectangle in pixels as supplied by the caller.
struct ScissorRect {
    i64 x = 0;
    i64 y = 0;
    i64 w = 0;
    i64 h = 0;
};

/// @brief Graphics state carried by every draw call.
struct DrawState {
    std::optional<Blend> blend;
    std::optional<Stencil> stencil;
    std::optional<ScissorRect> scissor;

    /// @brief Default state with alpha blending, as used for most 2D drawing.
    static DrawState NewAlpha() {
        DrawState s;
        s.blend = Blend::Alpha;
        return s;
    }

    static DrawState NewClip() { return DrawState().withStencil(Stencil::Clip(255)); }
    static DrawState NewInside() { return DrawState::NewAlpha().withStencil(Stencil::Inside(255)); }
    static DrawState NewOutside() { return DrawState::NewAlpha().withStencil(Stencil::Outside(255)); }

    DrawState withBlend(std::optional<Blend> b) const { DrawState s = *this; s.blend = b; return s; }
    DrawState withStencil(std::optional<Stencil> st) const { DrawState s = *this; s.stencil = st; return s; }
    DrawState withScissor(std::optional<ScissorRect> r) const { DrawState s = *this; s.scissor = r; return s; }

    DrawState blendAlpha() const { return withBlend(Blend::Alpha); }
    DrawState blendAdd() const { return withBlend(Blend::Add); }
    DrawState blendMultiply() const { return withBlend(Blend::Multiply); }
    DrawState blendInvert() const { return withBlend(Blend::Invert); }
};

/// @brief Rectangle used when no scissor is set: the whole 16-bit extent.
constexpr Rect16 kFullScissor = {0, 0, 0xFFFF, 0xFFFF};

/// @brief Convert an optional caller scissor to the device rectangle.
///
/// Absent scissors map to kFullScissor. Every coordinate of a present
/// scissor must be in [0, 65535]; otherwise ScissorOutOfRange is returned
/// and out is left untouched.
DrawError resolveScissor(const std::optional<ScissorRect>& scissor, Rect16* out);

} // namespace g2d
