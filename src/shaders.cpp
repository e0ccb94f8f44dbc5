#include "g2d/shaders.hpp"

namespace g2d {

// ============================================================
// Colored
// ============================================================

static const char* kColoredVert120 = R"(
#version 120
uniform vec4 color;
attribute vec2 pos;
void main() {
    gl_Position = vec4(pos, 0.0, 1.0);
}
)";

static const char* kColoredFrag120 = R"(
#version 120
uniform vec4 color;
void main() {
    gl_FragColor = color;
}
)";

static const char* kColoredVert150 = R"(
#version 150 core
uniform vec4 color;
in vec2 pos;
void main() {
    gl_Position = vec4(pos, 0.0, 1.0);
}
)";

static const char* kColoredFrag150 = R"(
#version 150 core
uniform vec4 color;
out vec4 o_Color;
void main() {
    o_Color = color;
}
)";

// ============================================================
// Textured
// ============================================================

static const char* kTexturedVert120 = R"(
#version 120
uniform sampler2D s_texture;
uniform vec4 color;
attribute vec2 pos;
attribute vec2 uv;
varying vec2 v_UV;
void main() {
    v_UV = uv;
    gl_Position = vec4(pos, 0.0, 1.0);
}
)";

static const char* kTexturedFrag120 = R"(
#version 120
uniform sampler2D s_texture;
uniform vec4 color;
varying vec2 v_UV;
void main() {
    gl_FragColor = texture2D(s_texture, v_UV) * color;
}
)";

static const char* kTexturedVert150 = R"(
#version 150 core
uniform sampler2D s_texture;
uniform vec4 color;
in vec2 pos;
in vec2 uv;
out vec2 v_UV;
void main() {
    v_UV = uv;
    gl_Position = vec4(pos, 0.0, 1.0);
}
)";

static const char* kTexturedFrag150 = R"(
#version 150 core
uniform sampler2D s_texture;
uniform vec4 color;
in vec2 v_UV;
out vec4 o_Color;
void main() {
    o_Color = texture(s_texture, v_UV) * color;
}
)";

Glsl toGlsl(OpenGL version) {
    switch (version) {
    case OpenGL::V2_0: return Glsl::V1_10;
    case OpenGL::V2_1: return Glsl::V1_20;
    case OpenGL::V3_0: return Glsl::V1_30;
    case OpenGL::V3_1: return Glsl::V1_40;
    case OpenGL::V3_2: return Glsl::V1_50;
    case OpenGL::V3_3: return Glsl::V3_30;
    case OpenGL::V4_0: return Glsl::V4_00;
    case OpenGL::V4_1: return Glsl::V4_10;
    case OpenGL::V4_2: return Glsl::V4_20;
    case OpenGL::V4_3: return Glsl::V4_30;
    case OpenGL::V4_4: return Glsl::V4_40;
    case OpenGL::V4_5: return Glsl::V4_50;
    }
    return Glsl::V1_10;
}

int glslVersionNumber(Glsl glsl) {
    static const int kNumbers[kGlslVersionCount] = {
        110, 120, 130, 140, 150, 330, 400, 410, 420, 430, 440, 450,
    };
    return kNumbers[size_t(glsl)];
}

const char* ShaderSet::get(Glsl glsl) const {
    for (size_t i = size_t(glsl) + 1; i-- > 0;) {
        if (sources_[i]) return sources_[i];
    }
    return nullptr;
}

namespace shaders {

const ProgramSources& colored() {
    static const ProgramSources sources = [] {
        ProgramSources s;
        s.vertex.set(Glsl::V1_20, kColoredVert120).set(Glsl::V1_50, kColoredVert150);
        s.fragment.set(Glsl::V1_20, kColoredFrag120).set(Glsl::V1_50, kColoredFrag150);
        return s;
    }();
    return sources;
}

const ProgramSources& textured() {
    static const ProgramSources sources = [] {
        ProgramSources s;
        s.vertex.set(Glsl::V1_20, kTexturedVert120).set(Glsl::V1_50, kTexturedVert150);
        s.fragment.set(Glsl::V1_20, kTexturedFrag120).set(Glsl::V1_50, kTexturedFrag150);
        return s;
    }();
    return sources;
}

} // namespace shaders

} // namespace g2d
