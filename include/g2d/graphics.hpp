#pragma once

/**
 * @file graphics.hpp
 * @brief Draw submission for one frame scope.
 */

#include "g2d/types.hpp"
#include "g2d/draw_state.hpp"
#include "g2d/error.hpp"
#include "g2d/texture.hpp"
#include "g2d/gpu/device.hpp"

namespace g2d {

class Gfx2d;
class DynamicVertexBuffers;

/**
 * TriListBatch - Stream of flat-colored triangle lists sharing one state.
 *
 * Every successful submit() records exactly one draw call with the
 * pipeline, stencil reference, color and scissor chosen when the batch
 * was opened. Once the frame scope that created it ends, submit()
 * returns DrawError::ScopeClosed and records nothing.
 */
class TriListBatch {
public:
    TriListBatch(TriListBatch&&) = default;
    TriListBatch(const TriListBatch&) = delete;
    TriListBatch& operator=(const TriListBatch&) = delete;

    /// @brief Error detected when the batch was opened (e.g. bad scissor).
    DrawError status() const { return status_; }

    /// @brief The opening error, else the first error any submit returned.
    DrawError error() const { return status_ != DrawError::None ? status_ : firstError_; }

    /// @brief Draw len / 2 vertices from interleaved x,y pairs.
    DrawError submit(const f32* vertices, size_t len);

private:
    friend class GfxGraphics;

    TriListBatch(const Gfx2d* g2d, CommandEncoder* encoder, DynamicVertexBuffers* buffers,
                 PipelineHandle pipeline, const DrawBindings& bindings, DrawError status);

    const Gfx2d* g2d_;
    u64 scope_;
    CommandEncoder* encoder_;
    DynamicVertexBuffers* buffers_;
    PipelineHandle pipeline_;
    DrawBindings bindings_;
    DrawError status_;
    DrawError firstError_ = DrawError::None;
};

/**
 * TriListUvBatch - Stream of textured triangle lists sharing one state.
 */
class TriListUvBatch {
public:
    TriListUvBatch(TriListUvBatch&&) = default;
    TriListUvBatch(const TriListUvBatch&) = delete;
    TriListUvBatch& operator=(const TriListUvBatch&) = delete;

    DrawError status() const { return status_; }
    DrawError error() const { return status_ != DrawError::None ? status_ : firstError_; }

    /**
     * Draw len / 2 vertices with matching texture coordinates.
     * Both arrays must describe the same number of vertices
     * (len * 2 == uvLen * 2), otherwise VertexCountMismatch is returned
     * and nothing is uploaded.
     */
    DrawError submit(const f32* vertices, size_t len, const f32* uvs, size_t uvLen);

private:
    friend class GfxGraphics;

    TriListUvBatch(const Gfx2d* g2d, CommandEncoder* encoder, DynamicVertexBuffers* buffers,
                   PipelineHandle pipeline, const DrawBindings& bindings, DrawError status);

    const Gfx2d* g2d_;
    u64 scope_;
    CommandEncoder* encoder_;
    DynamicVertexBuffers* buffers_;
    PipelineHandle pipeline_;
    DrawBindings bindings_;
    DrawError status_;
    DrawError firstError_ = DrawError::None;
};

/**
 * GfxGraphics - Draws 2D graphics into the targets of one frame scope.
 *
 * Created by Gfx2d::draw() (or FrameScope) and valid only for that scope.
 * Colors are given in sRGB and converted to linear before use.
 */
class GfxGraphics {
public:
    GfxGraphics(CommandEncoder& encoder,
                const RenderTargetView& outputColor,
                const DepthStencilView& outputStencil,
                Gfx2d& g2d);

    GfxGraphics(const GfxGraphics&) = delete;
    GfxGraphics& operator=(const GfxGraphics&) = delete;

    /// @brief Clear the color target. Alpha is ignored by the sRGB8 target.
    void clearColor(ColorF color);

    void clearStencil(u8 value);

    /// @brief Open a colored triangle-list stream for one draw state.
    TriListBatch beginTriList(const DrawState& drawState, ColorF color);

    /// @brief Open a textured triangle-list stream for one draw state.
    TriListUvBatch beginTriListUv(const DrawState& drawState, ColorF color,
                                  const Texture& texture);

    /**
     * Colored triangle lists. body(TriListBatch&) may submit any number of
     * batches. If the draw state is invalid body is not called.
     * @return The first error reported, or DrawError::None.
     */
    template <typename F>
    DrawError triList(const DrawState& drawState, ColorF color, F&& body) {
        TriListBatch batch = beginTriList(drawState, color);
        if (batch.status() != DrawError::None) return batch.status();
        body(batch);
        return batch.error();
    }

    /// @brief Textured triangle lists; see triList().
    template <typename F>
    DrawError triListUv(const DrawState& drawState, ColorF color,
                        const Texture& texture, F&& body) {
        TriListUvBatch batch = beginTriListUv(drawState, color, texture);
        if (batch.status() != DrawError::None) return batch.status();
        body(batch);
        return batch.error();
    }

    bool hasTextureAlpha(const Texture& texture) const {
        return hasAlphaChannel(texture.format);
    }

private:
    DrawBindings makeBindings(ColorF color, u8 stencilRef) const;

    CommandEncoder& encoder_;
    RenderTargetView outputColor_;
    DepthStencilView outputStencil_;
    Gfx2d& g2d_;
};

} // namespace g2d
