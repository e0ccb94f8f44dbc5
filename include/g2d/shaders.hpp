#pragma once

/**
 * @file shaders.hpp
 * @brief OpenGL / GLSL versions and the built-in shader sources.
 */

#include "g2d/types.hpp"
#include <array>

namespace g2d {

/// @brief OpenGL API versions a context can be negotiated at.
enum class OpenGL : u8 {
    V2_0, V2_1,
    V3_0, V3_1, V3_2, V3_3,
    V4_0, V4_1, V4_2, V4_3, V4_4, V4_5,
};

/// @brief GLSL dialect versions, ordered oldest first.
enum class Glsl : u8 {
    V1_10, V1_20, V1_30, V1_40, V1_50,
    V3_30,
    V4_00, V4_10, V4_20, V4_30, V4_40, V4_50,
};

constexpr size_t kGlslVersionCount = size_t(Glsl::V4_50) + 1;

/// @brief GLSL version matching an OpenGL API version.
Glsl toGlsl(OpenGL version);

/// @brief "#version" number of a GLSL dialect (e.g. 150).
int glslVersionNumber(Glsl glsl);

/**
 * ShaderSet - Shader source text for one stage, per GLSL tier.
 *
 * get() returns the newest source that is not newer than the requested
 * version, or nullptr when every registered tier is newer.
 */
class ShaderSet {
public:
    ShaderSet() { sources_.fill(nullptr); }

    ShaderSet& set(Glsl glsl, const char* src) {
        sources_[size_t(glsl)] = src;
        return *this;
    }

    const char* get(Glsl glsl) const;

private:
    std::array<const char*, kGlslVersionCount> sources_;
};

/// @brief Vertex and fragment sources of one program.
struct ProgramSources {
    ShaderSet vertex;
    ShaderSet fragment;
};

namespace shaders {

/// @brief Flat-colored triangles. Uniform `color`, attribute `pos`.
const ProgramSources& colored();

/// @brief Textured triangles tinted by `color`. Adds attribute `uv` and
///        sampler `s_texture`.
const ProgramSources& textured();

} // namespace shaders

} // namespace g2d
