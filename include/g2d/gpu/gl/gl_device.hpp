#pragma once

#include "g2d/gpu/device.hpp"
#include "g2d/shaders.hpp"
#include <memory>

// This header is only usable when G2D_HAS_GL is defined.
// Including it without GL support will cause a compile error.

#if !G2D_HAS_GL
#error "GL device not available. Build with -DG2D_ENABLE_GL=ON"
#endif

namespace g2d {

/**
 * GLDevice - OpenGL implementation of GpuDevice and CommandEncoder.
 *
 * Host must have created and made current an OpenGL context (2.1, or 3.2+
 * core) before calling Make(). Commands are issued immediately on the
 * current context. Render target views are framebuffer object names;
 * handle 0 is the default framebuffer. The stencil view must be attached
 * to the framebuffer of the color view.
 *
 * Texture views passed through DrawBindings are GL texture names.
 */
class GLDevice : public GpuDevice, public CommandEncoder {
public:
    /**
     * Create a device bound to the currently active GL context.
     * Returns nullptr if no GL context is current or GLEW init fails.
     */
    static std::unique_ptr<GLDevice> Make();

    ~GLDevice() override;

    /// @brief API version of the current context, clamped to the known range.
    OpenGL version() const;

    // GpuDevice
    ProgramHandle linkProgram(const char* vertSrc, const char* fragSrc,
                              std::string* log) override;
    PipelineHandle createPipeline(const PipelineDesc& desc, std::string* log) override;
    BufferHandle createDynamicVertexBuffer(size_t bytes) override;
    SamplerHandle createSampler(const SamplerInfo& info) override;
    void destroyProgram(ProgramHandle program) override;
    void destroyPipeline(PipelineHandle pipeline) override;
    void destroyBuffer(BufferHandle buffer) override;
    void destroySampler(SamplerHandle sampler) override;

    // CommandEncoder
    void beginPass(const RenderTargetView& color,
                   const DepthStencilView& stencil,
                   const i32 viewport[4]) override;
    void endPass() override;
    void clearColor(const RenderTargetView& target, f32 r, f32 g, f32 b) override;
    void clearStencil(const DepthStencilView& target, u8 value) override;
    void updateBuffer(BufferHandle buffer, const void* data,
                      size_t bytes, size_t offset) override;
    void draw(const DrawSlice& slice, PipelineHandle pipeline,
              const DrawBindings& bindings) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    GLDevice();
};

/**
 * GLRenderTarget - Offscreen sRGB color texture + depth24/stencil8
 * renderbuffer attached to one framebuffer object.
 */
class GLRenderTarget {
public:
    /// @brief Returns nullptr if the framebuffer is incomplete.
    static std::unique_ptr<GLRenderTarget> Make(u16 w, u16 h);

    ~GLRenderTarget();

    GLRenderTarget(const GLRenderTarget&) = delete;
    GLRenderTarget& operator=(const GLRenderTarget&) = delete;

    RenderTargetView colorView() const { return {fbo_, width_, height_}; }
    DepthStencilView stencilView() const { return {fbo_, width_, height_}; }

    /// @brief GL texture name of the color attachment.
    unsigned int textureId() const { return texture_; }

    /**
     * Read pixels into a CPU buffer. Format is RGBA8, bottom-left origin.
     * Buffer must be at least width * height * 4 bytes.
     */
    void readPixels(void* dst) const;

    u16 width() const { return width_; }
    u16 height() const { return height_; }

private:
    GLRenderTarget() = default;

    unsigned int fbo_ = 0;
    unsigned int texture_ = 0;
    unsigned int depthStencil_ = 0;
    u16 width_ = 0;
    u16 height_ = 0;
};

} // namespace g2d
