#include <gtest/gtest.h>
#include <g2d/shaders.hpp>

#include <cstring>

using namespace g2d;

// --- Version mapping ---

TEST(ToGlsl, MapsApiVersions) {
    EXPECT_EQ(toGlsl(OpenGL::V2_0), Glsl::V1_10);
    EXPECT_EQ(toGlsl(OpenGL::V2_1), Glsl::V1_20);
    EXPECT_EQ(toGlsl(OpenGL::V3_0), Glsl::V1_30);
    EXPECT_EQ(toGlsl(OpenGL::V3_1), Glsl::V1_40);
    EXPECT_EQ(toGlsl(OpenGL::V3_2), Glsl::V1_50);
    EXPECT_EQ(toGlsl(OpenGL::V3_3), Glsl::V3_30);
    EXPECT_EQ(toGlsl(OpenGL::V4_0), Glsl::V4_00);
    EXPECT_EQ(toGlsl(OpenGL::V4_5), Glsl::V4_50);
}

TEST(GlslVersionNumber, Numbers) {
    EXPECT_EQ(glslVersionNumber(Glsl::V1_10), 110);
    EXPECT_EQ(glslVersionNumber(Glsl::V1_50), 150);
    EXPECT_EQ(glslVersionNumber(Glsl::V3_30), 330);
    EXPECT_EQ(glslVersionNumber(Glsl::V4_50), 450);
}

// --- ShaderSet ---

TEST(ShaderSet, EmptyReturnsNull) {
    ShaderSet set;
    EXPECT_EQ(set.get(Glsl::V4_50), nullptr);
}

TEST(ShaderSet, PicksNewestNotNewerThanRequested) {
    static const char* kOld = "old";
    static const char* kNew = "new";
    ShaderSet set;
    set.set(Glsl::V1_20, kOld).set(Glsl::V1_50, kNew);

    EXPECT_EQ(set.get(Glsl::V1_10), nullptr);
    EXPECT_EQ(set.get(Glsl::V1_20), kOld);
    EXPECT_EQ(set.get(Glsl::V1_40), kOld);
    EXPECT_EQ(set.get(Glsl::V1_50), kNew);
    EXPECT_EQ(set.get(Glsl::V4_50), kNew);
}

// --- Built-in programs ---

TEST(BuiltinShaders, ColoredTiers) {
    const ProgramSources& p = shaders::colored();
    ASSERT_NE(p.vertex.get(Glsl::V1_20), nullptr);
    ASSERT_NE(p.fragment.get(Glsl::V1_20), nullptr);
    EXPECT_NE(std::strstr(p.vertex.get(Glsl::V1_20), "#version 120"), nullptr);
    EXPECT_NE(std::strstr(p.vertex.get(Glsl::V3_30), "#version 150"), nullptr);
    EXPECT_EQ(p.vertex.get(Glsl::V1_10), nullptr);
}

TEST(BuiltinShaders, BindingNames) {
    const char* cv = shaders::colored().vertex.get(Glsl::V1_50);
    const char* cf = shaders::colored().fragment.get(Glsl::V1_50);
    EXPECT_NE(std::strstr(cv, "pos"), nullptr);
    EXPECT_NE(std::strstr(cf, "color"), nullptr);
    EXPECT_NE(std::strstr(cf, "o_Color"), nullptr);

    const char* tv = shaders::textured().vertex.get(Glsl::V1_20);
    const char* tf = shaders::textured().fragment.get(Glsl::V1_20);
    EXPECT_NE(std::strstr(tv, "uv"), nullptr);
    EXPECT_NE(std::strstr(tf, "s_texture"), nullptr);
}
