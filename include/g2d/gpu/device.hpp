#pragma once

/**
 * @file device.hpp
 * @brief Abstract GPU device and command encoder used by the renderer.
 */

#include "g2d/types.hpp"
#include <string>

namespace g2d {

// Opaque backend handles. 0 is never a valid handle.
using ProgramHandle = u64;
using PipelineHandle = u64;
using BufferHandle = u64;
using SamplerHandle = u64;

// ============================================================
// Fixed-function state
// ============================================================

enum class Primitive : u8 { TriangleList };

enum class CullFace : u8 { Nothing, Front, Back };

/// @brief Rasterizer state. g2d always fills and never culls.
struct Rasterizer {
    CullFace cullFace = CullFace::Nothing;

    static Rasterizer NewFill(CullFace cull = CullFace::Nothing) { return {cull}; }
};

enum class Equation : u8 { Add, Sub, RevSub, Min, Max };

enum class Factor : u8 {
    Zero,
    One,
    SrcColor,
    OneMinusSrcColor,
    SrcAlpha,
    OneMinusSrcAlpha,
    DstColor,
    OneMinusDstColor,
    DstAlpha,
    OneMinusDstAlpha,
    ConstColor,
    OneMinusConstColor,
    ConstAlpha,
    OneMinusConstAlpha,
    SrcAlphaSaturated,
};

struct BlendChannel {
    Equation equation = Equation::Add;
    Factor source = Factor::One;
    Factor destination = Factor::Zero;
};

inline bool operator==(const BlendChannel& a, const BlendChannel& b) {
    return a.equation == b.equation && a.source == b.source &&
           a.destination == b.destination;
}

/// @brief Blend function applied separately to color and alpha.
struct BlendState {
    BlendChannel color;
    BlendChannel alpha;
};

inline bool operator==(const BlendState& a, const BlendState& b) {
    return a.color == b.color && a.alpha == b.alpha;
}

enum class Comparison : u8 {
    Never,
    Less,
    LessEqual,
    Equal,
    GreaterEqual,
    Greater,
    NotEqual,
    Always,
};

enum class StencilOp : u8 {
    Keep,
    Zero,
    Replace,
    IncrementClamp,
    IncrementWrap,
    DecrementClamp,
    DecrementWrap,
    Invert,
};

/// @brief Stencil test and operations. The reference value is bound per draw.
struct StencilState {
    Comparison fun = Comparison::Always;
    u8 maskRead = 0;
    u8 maskWrite = 0;
    StencilOp opFail = StencilOp::Keep;
    StencilOp opDepthFail = StencilOp::Keep;
    StencilOp opPass = StencilOp::Keep;

    /// @brief Same mask for read and write; ops are (fail, depth fail, pass).
    static StencilState Make(Comparison fun, u8 mask,
                             StencilOp fail, StencilOp depthFail, StencilOp pass) {
        return {fun, mask, mask, fail, depthFail, pass};
    }
};

inline bool operator==(const StencilState& a, const StencilState& b) {
    return a.fun == b.fun && a.maskRead == b.maskRead && a.maskWrite == b.maskWrite &&
           a.opFail == b.opFail && a.opDepthFail == b.opDepthFail && a.opPass == b.opPass;
}

/// @brief Color channel write mask bits.
enum ColorMask : u8 {
    kMaskNone = 0,
    kMaskRed = 1 << 0,
    kMaskGreen = 1 << 1,
    kMaskBlue = 1 << 2,
    kMaskAlpha = 1 << 3,
    kMaskAll = kMaskRed | kMaskGreen | kMaskBlue | kMaskAlpha,
};

/// @brief Texture filtering. Trilinear samples mip levels, so the host must
///        supply textures with a complete mipmap chain; a texture without
///        mipmaps is incomplete under Trilinear and samples as black.
enum class FilterMethod : u8 { Scale, Bilinear, Trilinear };

enum class WrapMode : u8 { Tile, Mirror, Clamp };

struct SamplerInfo {
    FilterMethod filter = FilterMethod::Bilinear;
    WrapMode wrap = WrapMode::Clamp;
};

// ============================================================
// Resource descriptions
// ============================================================

/// @brief Everything baked into one immutable pipeline object.
///
/// Names bind program inputs: vertex attributes (position, and texcoord for
/// textured pipelines), the color uniform, the optional sampler uniform and
/// the fragment output.
struct PipelineDesc {
    ProgramHandle program = 0;
    Primitive primitive = Primitive::TriangleList;
    Rasterizer rasterizer;
    BlendState blend;
    StencilState stencil;
    u8 colorMask = kMaskAll;

    const char* positionAttrib = "pos";
    const char* texCoordAttrib = nullptr;
    const char* colorUniform = "color";
    const char* textureUniform = nullptr;
    const char* colorOutput = "o_Color";
};

/// @brief Color render target view (sRGB8). Borrowed from the host.
struct RenderTargetView {
    u64 handle = 0;
    u16 width = 0;
    u16 height = 0;
};

/// @brief Combined depth24/stencil8 target view. Borrowed from the host.
struct DepthStencilView {
    u64 handle = 0;
    u16 width = 0;
    u16 height = 0;
};

/// @brief Range of vertices drawn by one call.
struct DrawSlice {
    u32 start = 0;
    u32 end = 0;

    u32 count() const { return end - start; }
};

/// @brief Per-draw bindings for a pipeline.
struct DrawBindings {
    BufferHandle positions = 0;
    BufferHandle texCoords = 0;  ///< 0 for colored pipelines.
    ColorF color;
    u64 textureView = 0;         ///< 0 for colored pipelines.
    SamplerHandle sampler = 0;
    RenderTargetView colorTarget;
    DepthStencilView stencilTarget;
    u8 stencilRefFront = 0;
    u8 stencilRefBack = 0;
    ColorF blendRef;
    Rect16 scissor;
};

// ============================================================
// Interfaces
// ============================================================

/**
 * GpuDevice - Resource factory for a graphics API.
 *
 * Creation calls return 0 on failure and, where a driver log exists, write
 * it to *log. Implementations own every resource they hand out until it is
 * destroyed or the device goes away.
 */
class GpuDevice {
public:
    virtual ~GpuDevice() = default;

    virtual ProgramHandle linkProgram(const char* vertSrc, const char* fragSrc,
                                      std::string* log) = 0;
    virtual PipelineHandle createPipeline(const PipelineDesc& desc, std::string* log) = 0;

    /// @brief Create a vertex buffer of the given byte size for frequent updates.
    virtual BufferHandle createDynamicVertexBuffer(size_t bytes) = 0;
    virtual SamplerHandle createSampler(const SamplerInfo& info) = 0;

    virtual void destroyProgram(ProgramHandle program) = 0;
    virtual void destroyPipeline(PipelineHandle pipeline) = 0;
    virtual void destroyBuffer(BufferHandle buffer) = 0;
    virtual void destroySampler(SamplerHandle sampler) = 0;
};

/**
 * CommandEncoder - Records commands against borrowed targets.
 *
 * Commands execute in the order they are recorded.
 */
class CommandEncoder {
public:
    virtual ~CommandEncoder() = default;

    /// @brief Start drawing into a target pair restricted to viewport
    ///        rect {x, y, w, h}.
    virtual void beginPass(const RenderTargetView& color,
                           const DepthStencilView& stencil,
                           const i32 viewport[4]) = 0;
    virtual void endPass() = 0;

    virtual void clearColor(const RenderTargetView& target, f32 r, f32 g, f32 b) = 0;
    virtual void clearStencil(const DepthStencilView& target, u8 value) = 0;

    /// @brief Overwrite bytes of a buffer starting at offset.
    virtual void updateBuffer(BufferHandle buffer, const void* data,
                              size_t bytes, size_t offset) = 0;

    virtual void draw(const DrawSlice& slice, PipelineHandle pipeline,
                      const DrawBindings& bindings) = 0;
};

} // namespace g2d
