#include "g2d/graphics.hpp"
#include "g2d/gfx2d.hpp"
#include "g2d/color.hpp"

namespace g2d {

// White blend constant so Blend::Invert computes 1 - src.
static constexpr ColorF kBlendRef = {1.0f, 1.0f, 1.0f, 1.0f};

// ============================================================
// TriListBatch
// ============================================================

TriListBatch::TriListBatch(const Gfx2d* g2d, CommandEncoder* encoder,
                           DynamicVertexBuffers* buffers,
                           PipelineHandle pipeline, const DrawBindings& bindings,
                           DrawError status)
    : g2d_(g2d),
      scope_(g2d->currentScope()),
      encoder_(encoder),
      buffers_(buffers),
      pipeline_(pipeline),
      bindings_(bindings),
      status_(status) {
}

DrawError TriListBatch::submit(const f32* vertices, size_t len) {
    if (status_ != DrawError::None) return status_;
    if (!g2d_->scopeOpen(scope_)) {
        if (firstError_ == DrawError::None) firstError_ = DrawError::ScopeClosed;
        return DrawError::ScopeClosed;
    }

    DrawError err = buffers_->uploadPositions(*encoder_, vertices, len);
    if (err != DrawError::None) {
        if (firstError_ == DrawError::None) firstError_ = err;
        return err;
    }

    DrawSlice slice;
    slice.start = 0;
    slice.end = u32(len / kPosComponents);
    encoder_->draw(slice, pipeline_, bindings_);
    return DrawError::None;
}

// ============================================================
// TriListUvBatch
// ============================================================

TriListUvBatch::TriListUvBatch(const Gfx2d* g2d, CommandEncoder* encoder,
                               DynamicVertexBuffers* buffers,
                               PipelineHandle pipeline, const DrawBindings& bindings,
                               DrawError status)
    : g2d_(g2d),
      scope_(g2d->currentScope()),
      encoder_(encoder),
      buffers_(buffers),
      pipeline_(pipeline),
      bindings_(bindings),
      status_(status) {
}

DrawError TriListUvBatch::submit(const f32* vertices, size_t len,
                                 const f32* uvs, size_t uvLen) {
    if (status_ != DrawError::None) return status_;
    if (!g2d_->scopeOpen(scope_)) {
        if (firstError_ == DrawError::None) firstError_ = DrawError::ScopeClosed;
        return DrawError::ScopeClosed;
    }

    DrawError err = DrawError::None;
    if (len * kUvComponents != uvLen * kPosComponents) {
        err = DrawError::VertexCountMismatch;
    }
    if (err == DrawError::None) err = buffers_->uploadPositions(*encoder_, vertices, len);
    if (err == DrawError::None) err = buffers_->uploadTexCoords(*encoder_, uvs, uvLen);
    if (err != DrawError::None) {
        if (firstError_ == DrawError::None) firstError_ = err;
        return err;
    }

    DrawSlice slice;
    slice.start = 0;
    slice.end = u32(len / kPosComponents);
    encoder_->draw(slice, pipeline_, bindings_);
    return DrawError::None;
}

// ============================================================
// GfxGraphics
// ============================================================

GfxGraphics::GfxGraphics(CommandEncoder& encoder,
                         const RenderTargetView& outputColor,
                         const DepthStencilView& outputStencil,
                         Gfx2d& g2d)
    : encoder_(encoder),
      outputColor_(outputColor),
      outputStencil_(outputStencil),
      g2d_(g2d) {
}

void GfxGraphics::clearColor(ColorF color) {
    ColorF c = gammaSrgbToLinear(color);
    encoder_.clearColor(outputColor_, c.r, c.g, c.b);
}

void GfxGraphics::clearStencil(u8 value) {
    encoder_.clearStencil(outputStencil_, value);
}

DrawBindings GfxGraphics::makeBindings(ColorF color, u8 stencilRef) const {
    DrawBindings b;
    b.positions = g2d_.buffers_.positions();
    b.color = gammaSrgbToLinear(color);
    b.colorTarget = outputColor_;
    b.stencilTarget = outputStencil_;
    b.stencilRefFront = stencilRef;
    b.stencilRefBack = stencilRef;
    b.blendRef = kBlendRef;
    return b;
}

TriListBatch GfxGraphics::beginTriList(const DrawState& drawState, ColorF color) {
    PipelineMatrix::Selection sel = g2d_.colored_.select(drawState.stencil, drawState.blend);

    DrawBindings bindings = makeBindings(color, sel.stencilRef);
    DrawError status = resolveScissor(drawState.scissor, &bindings.scissor);

    return TriListBatch(&g2d_, &encoder_, &g2d_.buffers_, sel.pipeline, bindings, status);
}

TriListUvBatch GfxGraphics::beginTriListUv(const DrawState& drawState, ColorF color,
                                           const Texture& texture) {
    PipelineMatrix::Selection sel = g2d_.textured_.select(drawState.stencil, drawState.blend);

    DrawBindings bindings = makeBindings(color, sel.stencilRef);
    bindings.texCoords = g2d_.buffers_.texCoords();
    bindings.textureView = texture.view;
    bindings.sampler = g2d_.sampler_;
    DrawError status = resolveScissor(drawState.scissor, &bindings.scissor);

    return TriListUvBatch(&g2d_, &encoder_, &g2d_.buffers_, sel.pipeline, bindings, status);
}

} // namespace g2d
