#pragma once

/**
 * @file gfx2d.hpp
 * @brief Renderer that owns the pipelines, vertex buffers and sampler.
 */

#include "g2d/types.hpp"
#include "g2d/error.hpp"
#include "g2d/shaders.hpp"
#include "g2d/pipeline_matrix.hpp"
#include "g2d/vertex_buffers.hpp"
#include "g2d/viewport.hpp"
#include "g2d/graphics.hpp"
#include "g2d/gpu/device.hpp"
#include <memory>

namespace g2d {

class FrameScope;

/**
 * Gfx2d - The data used for drawing 2D graphics.
 *
 * Links the colored and textured programs once, builds one PipelineMatrix
 * per program and allocates the dynamic vertex buffers and the sampler.
 * Everything is released on destruction, so the GpuDevice must outlive
 * the Gfx2d.
 *
 * Usage:
 *   InitError err;
 *   auto g2d = Gfx2d::Make(OpenGL::V3_2, device, &err);
 *   g2d->draw(encoder, color, stencil, viewport,
 *             [&](const Context& c, GfxGraphics& g) {
 *                 g.clearColor({1, 1, 1, 1});
 *                 g.triList(c.drawState, {1, 0, 0, 1}, [&](TriListBatch& b) {
 *                     b.submit(verts, 6);
 *                 });
 *             });
 */
class Gfx2d {
public:
    struct Config {
        u32 maxVertices = kMaxVertexCount;
        SamplerInfo sampler;
    };

    /**
     * Create a renderer for the negotiated OpenGL version.
     * Returns nullptr and fills *error if any shader, link, pipeline,
     * buffer or sampler step fails.
     */
    static std::unique_ptr<Gfx2d> Make(OpenGL version, GpuDevice& device,
                                       InitError* error = nullptr);
    static std::unique_ptr<Gfx2d> Make(OpenGL version, GpuDevice& device,
                                       const Config& config, InitError* error = nullptr);

    ~Gfx2d();

    Gfx2d(const Gfx2d&) = delete;
    Gfx2d& operator=(const Gfx2d&) = delete;

    /**
     * Render graphics into a target pair.
     *
     * Opens a FrameScope, calls body(const Context&, GfxGraphics&) and
     * closes the scope when body returns. Returns false without calling
     * body if a scope is already open on this renderer.
     */
    template <typename F>
    bool draw(CommandEncoder& encoder,
              const RenderTargetView& outputColor,
              const DepthStencilView& outputStencil,
              const Viewport& viewport,
              F&& body);

    const PipelineMatrix& colored() const { return colored_; }
    const PipelineMatrix& textured() const { return textured_; }
    const DynamicVertexBuffers& buffers() const { return buffers_; }
    SamplerHandle sampler() const { return sampler_; }
    bool inScope() const { return inScope_; }

    /// @brief True while the scope numbered `scope` is the open one.
    bool scopeOpen(u64 scope) const { return inScope_ && scope_ == scope; }
    u64 currentScope() const { return scope_; }

private:
    friend class GfxGraphics;
    friend class FrameScope;

    explicit Gfx2d(GpuDevice& device);

    bool init(OpenGL version, const Config& config, InitError* error);
    bool linkProgram(const ProgramSources& sources, Glsl glsl, const char* name,
                     ProgramHandle* out, InitError* error);
    void destroy();

    GpuDevice& device_;
    ProgramHandle coloredProgram_ = 0;
    ProgramHandle texturedProgram_ = 0;
    PipelineMatrix colored_;
    PipelineMatrix textured_;
    DynamicVertexBuffers buffers_;
    SamplerHandle sampler_ = 0;
    bool inScope_ = false;
    u64 scope_ = 0;  // bumped by every FrameScope that opens
};

/**
 * FrameScope - Exclusive access to a Gfx2d for one render pass.
 *
 * Begins the pass on construction and ends it on destruction. While a
 * scope is active no other scope can be opened on the same renderer.
 */
class FrameScope {
public:
    FrameScope(Gfx2d& g2d,
               CommandEncoder& encoder,
               const RenderTargetView& outputColor,
               const DepthStencilView& outputStencil,
               const Viewport& viewport);
    ~FrameScope();

    FrameScope(const FrameScope&) = delete;
    FrameScope& operator=(const FrameScope&) = delete;

    /// @brief False if the renderer was already in a scope.
    bool active() const { return active_; }

    const Context& context() const { return context_; }
    GfxGraphics& graphics() { return graphics_; }

private:
    Gfx2d& g2d_;
    CommandEncoder& encoder_;
    bool active_ = false;
    Context context_;
    GfxGraphics graphics_;
};

template <typename F>
bool Gfx2d::draw(CommandEncoder& encoder,
                 const RenderTargetView& outputColor,
                 const DepthStencilView& outputStencil,
                 const Viewport& viewport,
                 F&& body) {
    FrameScope scope(*this, encoder, outputColor, outputStencil, viewport);
    if (!scope.active()) return false;
    body(scope.context(), scope.graphics());
    return true;
}

} // namespace g2d
