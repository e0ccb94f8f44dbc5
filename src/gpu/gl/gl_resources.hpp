#pragma once

// GL resource and state utilities.
// Internal implementation - not part of public API.

#if G2D_HAS_GL

#include "g2d/types.hpp"
#include "g2d/gpu/device.hpp"
#include <GL/glew.h>
#include <string>

namespace g2d {

// Shader program compile + link with driver logs
class GLShaderProgram {
public:
    static GLuint link(const char* vertSrc, const char* fragSrc, std::string* log) {
        GLuint vert = compileShader(GL_VERTEX_SHADER, vertSrc, log);
        GLuint frag = compileShader(GL_FRAGMENT_SHADER, fragSrc, log);
        if (!vert || !frag) {
            if (vert) glDeleteShader(vert);
            if (frag) glDeleteShader(frag);
            return 0;
        }
        GLuint prog = linkProgram(vert, frag, log);
        glDeleteShader(vert);
        glDeleteShader(frag);
        return prog;
    }

private:
    static GLuint compileShader(GLenum type, const char* src, std::string* log) {
        GLuint shader = glCreateShader(type);
        glShaderSource(shader, 1, &src, nullptr);
        glCompileShader(shader);
        GLint ok = 0;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
        if (!ok) {
            char buf[512];
            glGetShaderInfoLog(shader, sizeof(buf), nullptr, buf);
            if (log) *log = std::string("shader compile error: ") + buf;
            glDeleteShader(shader);
            return 0;
        }
        return shader;
    }

    static GLuint linkProgram(GLuint vert, GLuint frag, std::string* log) {
        GLuint prog = glCreateProgram();
        glAttachShader(prog, vert);
        glAttachShader(prog, frag);
        glLinkProgram(prog);
        GLint ok = 0;
        glGetProgramiv(prog, GL_LINK_STATUS, &ok);
        if (!ok) {
            char buf[512];
            glGetProgramInfoLog(prog, sizeof(buf), nullptr, buf);
            if (log) *log = std::string("program link error: ") + buf;
            glDeleteProgram(prog);
            return 0;
        }
        return prog;
    }
};

// ============================================================
// Enum conversion
// ============================================================

inline GLenum toGLEquation(Equation e) {
    switch (e) {
    case Equation::Add:    return GL_FUNC_ADD;
    case Equation::Sub:    return GL_FUNC_SUBTRACT;
    case Equation::RevSub: return GL_FUNC_REVERSE_SUBTRACT;
    case Equation::Min:    return GL_MIN;
    case Equation::Max:    return GL_MAX;
    }
    return GL_FUNC_ADD;
}

inline GLenum toGLFactor(Factor f) {
    switch (f) {
    case Factor::Zero:               return GL_ZERO;
    case Factor::One:                return GL_ONE;
    case Factor::SrcColor:           return GL_SRC_COLOR;
    case Factor::OneMinusSrcColor:   return GL_ONE_MINUS_SRC_COLOR;
    case Factor::SrcAlpha:           return GL_SRC_ALPHA;
    case Factor::OneMinusSrcAlpha:   return GL_ONE_MINUS_SRC_ALPHA;
    case Factor::DstColor:           return GL_DST_COLOR;
    case Factor::OneMinusDstColor:   return GL_ONE_MINUS_DST_COLOR;
    case Factor::DstAlpha:           return GL_DST_ALPHA;
    case Factor::OneMinusDstAlpha:   return GL_ONE_MINUS_DST_ALPHA;
    case Factor::ConstColor:         return GL_CONSTANT_COLOR;
    case Factor::OneMinusConstColor: return GL_ONE_MINUS_CONSTANT_COLOR;
    case Factor::ConstAlpha:         return GL_CONSTANT_ALPHA;
    case Factor::OneMinusConstAlpha: return GL_ONE_MINUS_CONSTANT_ALPHA;
    case Factor::SrcAlphaSaturated:  return GL_SRC_ALPHA_SATURATE;
    }
    return GL_ONE;
}

inline GLenum toGLComparison(Comparison c) {
    switch (c) {
    case Comparison::Never:        return GL_NEVER;
    case Comparison::Less:         return GL_LESS;
    case Comparison::LessEqual:    return GL_LEQUAL;
    case Comparison::Equal:        return GL_EQUAL;
    case Comparison::GreaterEqual: return GL_GEQUAL;
    case Comparison::Greater:      return GL_GREATER;
    case Comparison::NotEqual:     return GL_NOTEQUAL;
    case Comparison::Always:       return GL_ALWAYS;
    }
    return GL_ALWAYS;
}

inline GLenum toGLStencilOp(StencilOp op) {
    switch (op) {
    case StencilOp::Keep:           return GL_KEEP;
    case StencilOp::Zero:           return GL_ZERO;
    case StencilOp::Replace:        return GL_REPLACE;
    case StencilOp::IncrementClamp: return GL_INCR;
    case StencilOp::IncrementWrap:  return GL_INCR_WRAP;
    case StencilOp::DecrementClamp: return GL_DECR;
    case StencilOp::DecrementWrap:  return GL_DECR_WRAP;
    case StencilOp::Invert:         return GL_INVERT;
    }
    return GL_KEEP;
}

inline GLint toGLWrap(WrapMode w) {
    switch (w) {
    case WrapMode::Tile:   return GL_REPEAT;
    case WrapMode::Mirror: return GL_MIRRORED_REPEAT;
    case WrapMode::Clamp:  return GL_CLAMP_TO_EDGE;
    }
    return GL_CLAMP_TO_EDGE;
}

inline void toGLFilter(FilterMethod f, GLint* minFilter, GLint* magFilter) {
    switch (f) {
    case FilterMethod::Scale:
        *minFilter = GL_NEAREST;
        *magFilter = GL_NEAREST;
        return;
    case FilterMethod::Bilinear:
        *minFilter = GL_LINEAR;
        *magFilter = GL_LINEAR;
        return;
    case FilterMethod::Trilinear:
        *minFilter = GL_LINEAR_MIPMAP_LINEAR;
        *magFilter = GL_LINEAR;
        return;
    }
}

} // namespace g2d

#endif // G2D_HAS_GL
