#pragma once

/**
 * g2d - Pipeline-based 2D triangle renderer
 *
 * Usage:
 *
 *   #include <g2d/g2d.hpp>
 *   auto device = g2d::GLDevice::Make();             // current GL context
 *   auto g2d = g2d::Gfx2d::Make(device->version(), *device);
 *   g2d->draw(*device, color, stencil, viewport,
 *             [](const g2d::Context& c, g2d::GfxGraphics& g) {
 *                 g.clearColor({0, 0, 0, 1});
 *             });
 */

// Version
#include "g2d/version.hpp"

// Core types
#include "g2d/types.hpp"
#include "g2d/error.hpp"
#include "g2d/color.hpp"

// Draw state and textures
#include "g2d/draw_state.hpp"
#include "g2d/texture.hpp"
#include "g2d/viewport.hpp"

// Device abstraction
#include "g2d/gpu/device.hpp"

// GL device (conditional - include <g2d/gpu/gl/gl_device.hpp> explicitly)
#if G2D_HAS_GL
#include "g2d/gpu/gl/gl_device.hpp"
#endif

// Shaders, pipelines and buffers
#include "g2d/shaders.hpp"
#include "g2d/pipeline_matrix.hpp"
#include "g2d/vertex_buffers.hpp"

// Renderer
#include "g2d/graphics.hpp"
#include "g2d/gfx2d.hpp"
