#include <gtest/gtest.h>
#include <g2d/pipeline_matrix.hpp>
#include "recording_device.hpp"

#include <set>

using namespace g2d;
using g2d::test::RecordingDevice;

namespace {

const BlendMode kBlendModes[] = {
    BlendMode::None, BlendMode::Alpha, BlendMode::Add, BlendMode::Multiply, BlendMode::Invert,
};

const ClipMode kClipModes[] = {
    ClipMode::None, ClipMode::Clip, ClipMode::Inside, ClipMode::Outside,
};

std::optional<Blend> blendFor(BlendMode mode) {
    switch (mode) {
    case BlendMode::None:     return std::nullopt;
    case BlendMode::Alpha:    return Blend::Alpha;
    case BlendMode::Add:      return Blend::Add;
    case BlendMode::Multiply: return Blend::Multiply;
    case BlendMode::Invert:   return Blend::Invert;
    }
    return std::nullopt;
}

std::optional<Stencil> stencilFor(ClipMode mode, u8 value) {
    switch (mode) {
    case ClipMode::None:    return std::nullopt;
    case ClipMode::Clip:    return Stencil::Clip(value);
    case ClipMode::Inside:  return Stencil::Inside(value);
    case ClipMode::Outside: return Stencil::Outside(value);
    }
    return std::nullopt;
}

PipelineDesc baseDesc(ProgramHandle program) {
    PipelineDesc desc;
    desc.program = program;
    return desc;
}

} // namespace

// --- Build ---

TEST(PipelineMatrix, BuildCreatesTwentyPipelines) {
    RecordingDevice device;
    PipelineMatrix matrix;
    InitError err;
    ASSERT_TRUE(matrix.build(device, baseDesc(7), &err));
    EXPECT_TRUE(matrix.built());
    EXPECT_FALSE(err.failed());
    EXPECT_EQ(device.pipelines.size(), kClipModeCount * kBlendModeCount);

    std::set<PipelineHandle> unique;
    for (ClipMode c : kClipModes)
        for (BlendMode b : kBlendModes)
            unique.insert(matrix.at(c, b));
    EXPECT_EQ(unique.size(), 20u);
}

TEST(PipelineMatrix, AllCellsShareProgramAndFixedState) {
    RecordingDevice device;
    PipelineMatrix matrix;
    ASSERT_TRUE(matrix.build(device, baseDesc(42), nullptr));

    for (const auto& entry : device.pipelines) {
        const PipelineDesc& d = entry.second;
        EXPECT_EQ(d.program, 42u);
        EXPECT_EQ(d.primitive, Primitive::TriangleList);
        EXPECT_EQ(d.rasterizer.cullFace, CullFace::Nothing);
    }
}

TEST(PipelineMatrix, CellsCarryBlendStencilAndMaskOfTheirModes) {
    RecordingDevice device;
    PipelineMatrix matrix;
    ASSERT_TRUE(matrix.build(device, baseDesc(1), nullptr));

    for (ClipMode c : kClipModes) {
        for (BlendMode b : kBlendModes) {
            const PipelineDesc& d = device.pipelines.at(matrix.at(c, b));
            EXPECT_EQ(d.blend, blendStateFor(b));
            EXPECT_EQ(d.stencil, stencilStateFor(c));
            EXPECT_EQ(d.colorMask, colorMaskFor(c));
        }
    }
}

TEST(PipelineMatrix, BuildKeepsBaseBindingNames) {
    RecordingDevice device;
    PipelineMatrix matrix;
    PipelineDesc base = baseDesc(3);
    base.texCoordAttrib = "uv";
    base.textureUniform = "s_texture";
    ASSERT_TRUE(matrix.build(device, base, nullptr));

    const PipelineDesc& d = device.pipelines.at(matrix.at(ClipMode::Inside, BlendMode::Add));
    EXPECT_STREQ(d.texCoordAttrib, "uv");
    EXPECT_STREQ(d.textureUniform, "s_texture");
    EXPECT_STREQ(d.colorOutput, "o_Color");
}

TEST(PipelineMatrix, BuildFailureReleasesCreatedPipelines) {
    RecordingDevice device;
    device.failPipelineAt = 13;
    PipelineMatrix matrix;
    InitError err;
    EXPECT_FALSE(matrix.build(device, baseDesc(1), &err));
    EXPECT_FALSE(matrix.built());
    EXPECT_EQ(err.stage, InitError::Stage::Pipeline);
    EXPECT_EQ(err.message, "unsupported state");
    EXPECT_TRUE(device.pipelines.empty());
}

TEST(PipelineMatrix, DestroyReleasesEverything) {
    RecordingDevice device;
    PipelineMatrix matrix;
    ASSERT_TRUE(matrix.build(device, baseDesc(1), nullptr));
    matrix.destroy(device);
    EXPECT_TRUE(device.pipelines.empty());
    EXPECT_FALSE(matrix.contains(1));
    matrix.destroy(device);  // second destroy is a no-op
}

// --- Blend and stencil tables ---

TEST(PipelineMatrix, NoBlendIsOneZeroAdd) {
    BlendState s = blendStateFor(BlendMode::None);
    EXPECT_EQ(s.color.equation, Equation::Add);
    EXPECT_EQ(s.color.source, Factor::One);
    EXPECT_EQ(s.color.destination, Factor::Zero);
    EXPECT_EQ(s.alpha.equation, Equation::Add);
    EXPECT_EQ(s.alpha.source, Factor::One);
    EXPECT_EQ(s.alpha.destination, Factor::Zero);
}

TEST(PipelineMatrix, AlphaBlendFactors) {
    BlendState s = blendStateFor(BlendMode::Alpha);
    EXPECT_EQ(s.color.source, Factor::SrcAlpha);
    EXPECT_EQ(s.color.destination, Factor::OneMinusSrcAlpha);
    EXPECT_EQ(s.alpha.source, Factor::One);
    EXPECT_EQ(s.alpha.destination, Factor::One);
}

TEST(PipelineMatrix, InvertSubtractsSourceFromConstant) {
    BlendState s = blendStateFor(BlendMode::Invert);
    EXPECT_EQ(s.color.equation, Equation::Sub);
    EXPECT_EQ(s.color.source, Factor::ConstColor);
    EXPECT_EQ(s.color.destination, Factor::SrcColor);
}

TEST(PipelineMatrix, StencilTable) {
    StencilState none = stencilStateFor(ClipMode::None);
    EXPECT_EQ(none.fun, Comparison::Always);
    EXPECT_EQ(none.maskRead, 0);
    EXPECT_EQ(none.maskWrite, 0);

    StencilState clip = stencilStateFor(ClipMode::Clip);
    EXPECT_EQ(clip.fun, Comparison::Never);
    EXPECT_EQ(clip.maskWrite, 255);
    EXPECT_EQ(clip.opFail, StencilOp::Replace);
    EXPECT_EQ(clip.opDepthFail, StencilOp::Keep);
    EXPECT_EQ(clip.opPass, StencilOp::Keep);

    EXPECT_EQ(stencilStateFor(ClipMode::Inside).fun, Comparison::Equal);
    EXPECT_EQ(stencilStateFor(ClipMode::Outside).fun, Comparison::NotEqual);
    EXPECT_EQ(stencilStateFor(ClipMode::Inside).opFail, StencilOp::Keep);
}

TEST(PipelineMatrix, OnlyClipMasksColorWrites) {
    EXPECT_EQ(colorMaskFor(ClipMode::Clip), kMaskNone);
    EXPECT_EQ(colorMaskFor(ClipMode::None), kMaskAll);
    EXPECT_EQ(colorMaskFor(ClipMode::Inside), kMaskAll);
    EXPECT_EQ(colorMaskFor(ClipMode::Outside), kMaskAll);
}

// --- Select ---

TEST(PipelineMatrix, SelectReturnsMatrixCellAndStencilValue) {
    RecordingDevice device;
    PipelineMatrix matrix;
    ASSERT_TRUE(matrix.build(device, baseDesc(1), nullptr));

    for (ClipMode c : kClipModes) {
        for (BlendMode b : kBlendModes) {
            auto sel = matrix.select(stencilFor(c, 37), blendFor(b));
            EXPECT_TRUE(matrix.contains(sel.pipeline));
            EXPECT_EQ(sel.pipeline, matrix.at(c, b));
            EXPECT_EQ(sel.stencilRef, c == ClipMode::None ? 0 : 37);
        }
    }
}

TEST(PipelineMatrix, SelectNoneIsIdempotent) {
    RecordingDevice device;
    PipelineMatrix matrix;
    ASSERT_TRUE(matrix.build(device, baseDesc(1), nullptr));

    auto first = matrix.select(std::nullopt, std::nullopt);
    for (int i = 0; i < 10; ++i) {
        auto again = matrix.select(std::nullopt, std::nullopt);
        EXPECT_EQ(again.pipeline, first.pipeline);
        EXPECT_EQ(again.stencilRef, 0);
    }
    EXPECT_EQ(first.pipeline, matrix.at(ClipMode::None, BlendMode::None));
}

TEST(PipelineMatrix, ClipPicksOuterDimension) {
    RecordingDevice device;
    PipelineMatrix matrix;
    ASSERT_TRUE(matrix.build(device, baseDesc(1), nullptr));

    auto sel = matrix.select(Stencil::Outside(9), Blend::Multiply);
    EXPECT_EQ(sel.pipeline, matrix.at(ClipMode::Outside, BlendMode::Multiply));
    EXPECT_NE(sel.pipeline, matrix.at(ClipMode::Inside, BlendMode::Multiply));
    EXPECT_EQ(sel.stencilRef, 9);
}

TEST(PipelineMatrix, ContainsRejectsForeignHandles) {
    RecordingDevice device;
    PipelineMatrix a, b;
    ASSERT_TRUE(a.build(device, baseDesc(1), nullptr));
    ASSERT_TRUE(b.build(device, baseDesc(2), nullptr));
    EXPECT_FALSE(a.contains(b.at(ClipMode::None, BlendMode::None)));
    EXPECT_FALSE(a.contains(0));
}
