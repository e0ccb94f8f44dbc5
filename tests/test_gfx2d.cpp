#include <gtest/gtest.h>
#include <g2d/gfx2d.hpp>
#include "recording_device.hpp"

using namespace g2d;
using g2d::test::RecordingDevice;

namespace {

Viewport makeViewport(i32 w, i32 h) {
    Viewport vp;
    vp.rect[2] = w;
    vp.rect[3] = h;
    vp.drawSize[0] = u32(w);
    vp.drawSize[1] = u32(h);
    vp.windowSize[0] = w;
    vp.windowSize[1] = h;
    return vp;
}

} // namespace

// --- Construction ---

TEST(Gfx2d, MakeCreatesAllResources) {
    RecordingDevice device;
    InitError err;
    auto g2d = Gfx2d::Make(OpenGL::V3_2, device, &err);
    ASSERT_NE(g2d, nullptr);
    EXPECT_FALSE(err.failed());

    EXPECT_EQ(device.programs.size(), 2u);
    EXPECT_EQ(device.pipelines.size(), 40u);
    EXPECT_EQ(device.buffers.size(), 2u);
    EXPECT_EQ(device.samplers.size(), 1u);
    EXPECT_TRUE(g2d->colored().built());
    EXPECT_TRUE(g2d->textured().built());
    EXPECT_NE(g2d->sampler(), 0u);
}

TEST(Gfx2d, LinksNewestShaderTier) {
    RecordingDevice device;
    auto g2d = Gfx2d::Make(OpenGL::V4_5, device);
    ASSERT_NE(g2d, nullptr);
    for (const auto& p : device.programs) {
        EXPECT_NE(p.second.find("#version 150 core"), std::string::npos);
    }

    RecordingDevice legacy;
    auto g2dLegacy = Gfx2d::Make(OpenGL::V2_1, legacy);
    ASSERT_NE(g2dLegacy, nullptr);
    for (const auto& p : legacy.programs) {
        EXPECT_NE(p.second.find("#version 120"), std::string::npos);
    }
}

TEST(Gfx2d, TexturedPipelinesBindUvAndSampler) {
    RecordingDevice device;
    auto g2d = Gfx2d::Make(OpenGL::V3_3, device);
    ASSERT_NE(g2d, nullptr);

    const PipelineDesc& colored =
        device.pipelines.at(g2d->colored().at(ClipMode::None, BlendMode::Alpha));
    EXPECT_EQ(colored.texCoordAttrib, nullptr);
    EXPECT_EQ(colored.textureUniform, nullptr);

    const PipelineDesc& textured =
        device.pipelines.at(g2d->textured().at(ClipMode::None, BlendMode::Alpha));
    EXPECT_STREQ(textured.texCoordAttrib, "uv");
    EXPECT_STREQ(textured.textureUniform, "s_texture");
    EXPECT_NE(colored.program, textured.program);
}

TEST(Gfx2d, DefaultSamplerIsBilinearClamp) {
    RecordingDevice device;
    auto g2d = Gfx2d::Make(OpenGL::V3_2, device);
    ASSERT_NE(g2d, nullptr);
    const SamplerInfo& info = device.samplers.at(g2d->sampler());
    EXPECT_EQ(info.filter, FilterMethod::Bilinear);
    EXPECT_EQ(info.wrap, WrapMode::Clamp);
}

TEST(Gfx2d, ConfigControlsCapacityAndSampler) {
    RecordingDevice device;
    Gfx2d::Config config;
    config.maxVertices = 16;
    config.sampler.filter = FilterMethod::Scale;
    config.sampler.wrap = WrapMode::Tile;
    auto g2d = Gfx2d::Make(OpenGL::V3_2, device, config, nullptr);
    ASSERT_NE(g2d, nullptr);
    EXPECT_EQ(g2d->buffers().maxVertices(), 16u);
    EXPECT_EQ(device.samplers.at(g2d->sampler()).filter, FilterMethod::Scale);
    EXPECT_EQ(device.samplers.at(g2d->sampler()).wrap, WrapMode::Tile);
}

TEST(Gfx2d, DestructorReleasesEverything) {
    RecordingDevice device;
    {
        auto g2d = Gfx2d::Make(OpenGL::V3_2, device);
        ASSERT_NE(g2d, nullptr);
        EXPECT_GT(device.liveResources(), 0u);
    }
    EXPECT_EQ(device.liveResources(), 0u);
}

// --- Initialization failures ---

TEST(Gfx2d, NoShaderForGlsl110) {
    RecordingDevice device;
    InitError err;
    EXPECT_EQ(Gfx2d::Make(OpenGL::V2_0, device, &err), nullptr);
    EXPECT_EQ(err.stage, InitError::Stage::Shader);
    EXPECT_EQ(device.liveResources(), 0u);
}

TEST(Gfx2d, LinkFailure) {
    RecordingDevice device;
    device.failLink = true;
    InitError err;
    EXPECT_EQ(Gfx2d::Make(OpenGL::V3_2, device, &err), nullptr);
    EXPECT_EQ(err.stage, InitError::Stage::Link);
    EXPECT_NE(err.message.find("syntax error"), std::string::npos);
    EXPECT_EQ(device.liveResources(), 0u);
}

TEST(Gfx2d, PipelineFailureInTexturedMatrix) {
    RecordingDevice device;
    device.failPipelineAt = 25;
    InitError err;
    EXPECT_EQ(Gfx2d::Make(OpenGL::V3_2, device, &err), nullptr);
    EXPECT_EQ(err.stage, InitError::Stage::Pipeline);
    EXPECT_EQ(device.liveResources(), 0u);
}

TEST(Gfx2d, BufferFailure) {
    RecordingDevice device;
    device.failBuffer = true;
    InitError err;
    EXPECT_EQ(Gfx2d::Make(OpenGL::V3_2, device, &err), nullptr);
    EXPECT_EQ(err.stage, InitError::Stage::Buffer);
    EXPECT_EQ(device.liveResources(), 0u);
}

TEST(Gfx2d, SamplerFailure) {
    RecordingDevice device;
    device.failSampler = true;
    InitError err;
    EXPECT_EQ(Gfx2d::Make(OpenGL::V3_2, device, &err), nullptr);
    EXPECT_EQ(err.stage, InitError::Stage::Sampler);
    EXPECT_EQ(device.liveResources(), 0u);
}

TEST(Gfx2d, NullErrorIsAllowed) {
    RecordingDevice device;
    device.failSampler = true;
    EXPECT_EQ(Gfx2d::Make(OpenGL::V3_2, device, nullptr), nullptr);
}

// --- Frame scope ---

TEST(Gfx2d, DrawWrapsBodyInPass) {
    RecordingDevice device;
    auto g2d = Gfx2d::Make(OpenGL::V3_2, device);
    ASSERT_NE(g2d, nullptr);

    Viewport vp = makeViewport(320, 240);
    bool insideScope = false;
    bool ok = g2d->draw(device, {1, 320, 240}, {1, 320, 240}, vp,
                        [&](const Context& c, GfxGraphics& g) {
                            insideScope = g2d->inScope();
                            EXPECT_EQ(c.view, absTransform(320.0, 240.0));
                            g.clearStencil(0);
                        });
    EXPECT_TRUE(ok);
    EXPECT_TRUE(insideScope);
    EXPECT_FALSE(g2d->inScope());

    using Cmd = RecordingDevice::Cmd;
    std::vector<Cmd> expected = {Cmd::BeginPass, Cmd::ClearStencil, Cmd::EndPass};
    EXPECT_EQ(device.commands, expected);
    ASSERT_EQ(device.passViewports.size(), 1u);
    EXPECT_EQ(device.passViewports[0], (std::vector<i32>{0, 0, 320, 240}));
}

TEST(Gfx2d, NestedDrawIsRejected) {
    RecordingDevice device;
    auto g2d = Gfx2d::Make(OpenGL::V3_2, device);
    ASSERT_NE(g2d, nullptr);

    Viewport vp = makeViewport(8, 8);
    bool innerCalled = false;
    bool innerResult = true;
    g2d->draw(device, {1, 8, 8}, {1, 8, 8}, vp, [&](const Context&, GfxGraphics&) {
        innerResult = g2d->draw(device, {1, 8, 8}, {1, 8, 8}, vp,
                                [&](const Context&, GfxGraphics&) { innerCalled = true; });
        EXPECT_TRUE(g2d->inScope());
    });
    EXPECT_FALSE(innerResult);
    EXPECT_FALSE(innerCalled);
    EXPECT_FALSE(g2d->inScope());

    using Cmd = RecordingDevice::Cmd;
    std::vector<Cmd> expected = {Cmd::BeginPass, Cmd::EndPass};
    EXPECT_EQ(device.commands, expected);
}

TEST(Gfx2d, SequentialFramesAreAllowed) {
    RecordingDevice device;
    auto g2d = Gfx2d::Make(OpenGL::V3_2, device);
    ASSERT_NE(g2d, nullptr);

    Viewport vp = makeViewport(8, 8);
    auto noop = [](const Context&, GfxGraphics&) {};
    EXPECT_TRUE(g2d->draw(device, {1, 8, 8}, {1, 8, 8}, vp, noop));
    EXPECT_TRUE(g2d->draw(device, {1, 8, 8}, {1, 8, 8}, vp, noop));
    EXPECT_EQ(device.passViewports.size(), 2u);
}

TEST(Gfx2d, EndToEndAlphaTriangle) {
    RecordingDevice device;
    auto g2d = Gfx2d::Make(OpenGL::V3_2, device);
    ASSERT_NE(g2d, nullptr);

    const f32 tri[] = {0, 0, 1, 0, 0, 1};
    DrawError result = DrawError::IncompleteVertex;
    g2d->draw(device, {1, 16, 16}, {1, 16, 16}, makeViewport(16, 16),
              [&](const Context& c, GfxGraphics& g) {
                  g.clearColor({1, 1, 1, 1});
                  result = g.triList(c.drawState, {0, 0, 1, 1},
                                     [&](TriListBatch& b) { b.submit(tri, 6); });
              });

    EXPECT_EQ(result, DrawError::None);
    ASSERT_EQ(device.draws.size(), 1u);
    EXPECT_EQ(device.draws[0].pipeline, g2d->colored().at(ClipMode::None, BlendMode::Alpha));
    EXPECT_EQ(device.draws[0].bindings.stencilRefFront, 0);
    EXPECT_EQ(device.draws[0].slice.count(), 3u);
}
