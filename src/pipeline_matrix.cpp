#include "g2d/pipeline_matrix.hpp"
#include <cstdio>

namespace g2d {

ClipMode clipModeOf(const std::optional<Stencil>& stencil) {
    if (!stencil) return ClipMode::None;
    switch (stencil->kind) {
    case Stencil::Kind::Clip:    return ClipMode::Clip;
    case Stencil::Kind::Inside:  return ClipMode::Inside;
    case Stencil::Kind::Outside: return ClipMode::Outside;
    }
    return ClipMode::None;
}

BlendMode blendModeOf(const std::optional<Blend>& blend) {
    if (!blend) return BlendMode::None;
    switch (*blend) {
    case Blend::Alpha:    return BlendMode::Alpha;
    case Blend::Add:      return BlendMode::Add;
    case Blend::Multiply: return BlendMode::Multiply;
    case Blend::Invert:   return BlendMode::Invert;
    }
    return BlendMode::None;
}

BlendState blendStateFor(BlendMode mode) {
    switch (mode) {
    case BlendMode::Alpha:
        return {{Equation::Add, Factor::SrcAlpha, Factor::OneMinusSrcAlpha},
                {Equation::Add, Factor::One, Factor::One}};
    case BlendMode::Add:
        return {{Equation::Add, Factor::One, Factor::One},
                {Equation::Add, Factor::One, Factor::One}};
    case BlendMode::Multiply:
        return {{Equation::Add, Factor::Zero, Factor::SrcColor},
                {Equation::Add, Factor::Zero, Factor::SrcAlpha}};
    case BlendMode::Invert:
        // Needs a white blend constant to produce 1 - src.
        return {{Equation::Sub, Factor::ConstColor, Factor::SrcColor},
                {Equation::Add, Factor::Zero, Factor::One}};
    case BlendMode::None:
        break;
    }
    // Disabled blending expressed as a blend function, so every cell of
    // the matrix goes through the same pipeline creation.
    return {{Equation::Add, Factor::One, Factor::Zero},
            {Equation::Add, Factor::One, Factor::Zero}};
}

StencilState stencilStateFor(ClipMode mode) {
    switch (mode) {
    case ClipMode::Clip:
        return StencilState::Make(Comparison::Never, 255,
                                  StencilOp::Replace, StencilOp::Keep, StencilOp::Keep);
    case ClipMode::Inside:
        return StencilState::Make(Comparison::Equal, 255,
                                  StencilOp::Keep, StencilOp::Keep, StencilOp::Keep);
    case ClipMode::Outside:
        return StencilState::Make(Comparison::NotEqual, 255,
                                  StencilOp::Keep, StencilOp::Keep, StencilOp::Keep);
    case ClipMode::None:
        break;
    }
    return StencilState::Make(Comparison::Always, 0,
                              StencilOp::Keep, StencilOp::Keep, StencilOp::Keep);
}

u8 colorMaskFor(ClipMode mode) {
    return mode == ClipMode::Clip ? kMaskNone : kMaskAll;
}

bool PipelineMatrix::build(GpuDevice& device, const PipelineDesc& base, InitError* error) {
    destroy(device);

    for (size_t c = 0; c < kClipModeCount; ++c) {
        for (size_t b = 0; b < kBlendModeCount; ++b) {
            PipelineDesc desc = base;
            desc.primitive = Primitive::TriangleList;
            desc.rasterizer = Rasterizer::NewFill(CullFace::Nothing);
            desc.blend = blendStateFor(BlendMode(b));
            desc.stencil = stencilStateFor(ClipMode(c));
            desc.colorMask = colorMaskFor(ClipMode(c));

            std::string log;
            PipelineHandle pso = device.createPipeline(desc, &log);
            if (!pso) {
                std::fprintf(stderr, "g2d PipelineMatrix: pipeline %zu/%zu failed: %s\n",
                             c, b, log.c_str());
                if (error) {
                    error->stage = InitError::Stage::Pipeline;
                    error->message = log;
                }
                destroy(device);
                return false;
            }
            pipelines_[c][b] = pso;
        }
    }
    built_ = true;
    return true;
}

void PipelineMatrix::destroy(GpuDevice& device) {
    for (auto& row : pipelines_) {
        for (auto& pso : row) {
            if (pso) { device.destroyPipeline(pso); pso = 0; }
        }
    }
    built_ = false;
}

PipelineMatrix::Selection PipelineMatrix::select(const std::optional<Stencil>& stencil,
                                                 const std::optional<Blend>& blend) const {
    Selection sel;
    sel.pipeline = at(clipModeOf(stencil), blendModeOf(blend));
    sel.stencilRef = stencil ? stencil->value : 0;
    return sel;
}

bool PipelineMatrix::contains(PipelineHandle pipeline) const {
    if (!pipeline) return false;
    for (const auto& row : pipelines_) {
        for (PipelineHandle pso : row) {
            if (pso == pipeline) return true;
        }
    }
    return false;
}

} // namespace g2d
