#pragma once

/**
 * @file viewport.hpp
 * @brief Viewport description and the drawing context handed to callers.
 */

#include "g2d/types.hpp"
#include "g2d/draw_state.hpp"
#include <array>

namespace g2d {

/// @brief Row-major 2x3 affine matrix.
using Matrix2d = std::array<std::array<f64, 3>, 2>;

/// @brief Identity matrix.
Matrix2d identity();

/// @brief Map window coordinates (origin top-left, y down) to NDC.
Matrix2d absTransform(f64 w, f64 h);

/// @brief Matrix product a * b.
Matrix2d multiply(const Matrix2d& a, const Matrix2d& b);

/// @brief Region of the render target to draw into.
struct Viewport {
    i32 rect[4] = {0, 0, 0, 0};  ///< x, y, w, h in framebuffer pixels.
    u32 drawSize[2] = {0, 0};    ///< Framebuffer size in pixels.
    f64 windowSize[2] = {0, 0};  ///< Window size in points.
};

/**
 * Context - Drawing context for one frame scope.
 *
 * `view` maps window coordinates to NDC; `transform` starts equal to it
 * and is what callers apply to their vertices before submitting.
 */
struct Context {
    std::optional<Viewport> viewport;
    Matrix2d view = identity();
    Matrix2d transform = identity();
    DrawState drawState = DrawState::NewAlpha();

    static Context NewViewport(const Viewport& viewport);
    static Context NewAbs(f64 w, f64 h);

    Context trans(f64 x, f64 y) const;
    Context scale(f64 sx, f64 sy) const;

    /// @brief Apply transform to a point and write the NDC pair to out.
    void transformPoint(f64 x, f64 y, f32 out[2]) const;
};

} // namespace g2d
