// GLDevice - OpenGL device and immediate command encoder.
//
// Only compiled when G2D_HAS_GL is defined (via CMake).
// Pipelines are emulated: each one stores the fixed-function state that
// draw() applies before issuing glDrawArrays.

#include "g2d/gpu/gl/gl_device.hpp"
#include "gl_resources.hpp"

#include <GL/glew.h>
#include <unordered_map>
#include <vector>
#include <cstdio>

namespace g2d {

namespace {

struct GLPipeline {
    GLuint program = 0;
    GLint posLoc = -1;
    GLint uvLoc = -1;
    GLint colorLoc = -1;
    GLint samplerLoc = -1;
    CullFace cullFace = CullFace::Nothing;
    BlendState blend;
    StencilState stencil;
    u8 colorMask = kMaskAll;
};

struct GLSampler {
    GLuint object = 0;  // 0 when sampler objects are unavailable
    SamplerInfo info;
};

} // namespace

struct GLDevice::Impl {
    GLuint vao = 0;
    bool hasSamplerObjects = false;
    std::unordered_map<u64, GLPipeline> pipelines;
    std::unordered_map<u64, GLSampler> samplers;
    std::vector<GLint> enabledAttribs;
    u64 nextPipelineId = 1;
    u64 nextSamplerId = 1;

    ~Impl() {
        for (auto& entry : samplers) {
            if (entry.second.object) glDeleteSamplers(1, &entry.second.object);
        }
        samplers.clear();
        pipelines.clear();
        if (vao) { glDeleteVertexArrays(1, &vao); vao = 0; }
    }

    void enableAttrib(GLint loc, GLuint buffer, GLint components) {
        glBindBuffer(GL_ARRAY_BUFFER, buffer);
        glVertexAttribPointer(GLuint(loc), components, GL_FLOAT, GL_FALSE, 0, nullptr);
        glEnableVertexAttribArray(GLuint(loc));
        enabledAttribs.push_back(loc);
    }

    void disableAttribs() {
        for (GLint loc : enabledAttribs) glDisableVertexAttribArray(GLuint(loc));
        enabledAttribs.clear();
    }

    void applySampler(const GLSampler& sampler, GLuint texture) {
        if (sampler.object) {
            glBindSampler(0, sampler.object);
            return;
        }
        GLint minFilter = GL_LINEAR, magFilter = GL_LINEAR;
        toGLFilter(sampler.info.filter, &minFilter, &magFilter);
        const GLint wrap = toGLWrap(sampler.info.wrap);
        glBindTexture(GL_TEXTURE_2D, texture);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, minFilter);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, magFilter);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, wrap);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, wrap);
    }
};

GLDevice::GLDevice()
    : impl_(std::make_unique<Impl>()) {
}

GLDevice::~GLDevice() = default;

std::unique_ptr<GLDevice> GLDevice::Make() {
    // GLEW requires this for core profiles and EGL environments.
    glewExperimental = GL_TRUE;
    const GLenum err = glewInit();
    // Clear any sticky errors introduced by glewInit.
    while (glGetError() != GL_NO_ERROR) {
    }

    if (err != GLEW_OK) {
        // EGL setups can report non-fatal GLEW init errors; keep going if GL is alive.
        if (glGetString(GL_VERSION) == nullptr) {
            std::fprintf(stderr, "g2d GL: GLEW init failed: %s\n",
                         reinterpret_cast<const char*>(glewGetErrorString(err)));
            return nullptr;
        }
    }

    if (glGetString(GL_VERSION) == nullptr) {
        std::fprintf(stderr, "g2d GL: no current GL context\n");
        return nullptr;
    }

    std::unique_ptr<GLDevice> device(new GLDevice());
    if (GLEW_VERSION_3_0 || GLEW_ARB_vertex_array_object) {
        glGenVertexArrays(1, &device->impl_->vao);
    }
    device->impl_->hasSamplerObjects = GLEW_VERSION_3_3 || GLEW_ARB_sampler_objects;
    return device;
}

OpenGL GLDevice::version() const {
    GLint major = 0, minor = 0;
    const char* str = reinterpret_cast<const char*>(glGetString(GL_VERSION));
    if (!str || std::sscanf(str, "%d.%d", &major, &minor) != 2) return OpenGL::V2_0;

    if (major <= 1) return OpenGL::V2_0;
    if (major == 2) return minor >= 1 ? OpenGL::V2_1 : OpenGL::V2_0;
    if (major == 3) {
        static const OpenGL kV3[] = {OpenGL::V3_0, OpenGL::V3_1, OpenGL::V3_2, OpenGL::V3_3};
        return kV3[minor > 3 ? 3 : minor];
    }
    static const OpenGL kV4[] = {OpenGL::V4_0, OpenGL::V4_1, OpenGL::V4_2,
                                 OpenGL::V4_3, OpenGL::V4_4, OpenGL::V4_5};
    if (major == 4) return kV4[minor > 5 ? 5 : minor];
    return OpenGL::V4_5;
}

// ============================================================
// GpuDevice
// ============================================================

ProgramHandle GLDevice::linkProgram(const char* vertSrc, const char* fragSrc,
                                    std::string* log) {
    GLuint prog = GLShaderProgram::link(vertSrc, fragSrc, log);
    if (!prog && log) {
        std::fprintf(stderr, "g2d GL: %s\n", log->c_str());
    }
    return prog;
}

PipelineHandle GLDevice::createPipeline(const PipelineDesc& desc, std::string* log) {
    const GLuint program = GLuint(desc.program);
    if (!program || !glIsProgram(program)) {
        if (log) *log = "invalid program";
        return 0;
    }

    GLPipeline p;
    p.program = program;
    p.cullFace = desc.rasterizer.cullFace;
    p.blend = desc.blend;
    p.stencil = desc.stencil;
    p.colorMask = desc.colorMask;

    p.posLoc = glGetAttribLocation(program, desc.positionAttrib);
    if (p.posLoc < 0) {
        if (log) *log = std::string("missing vertex attribute ") + desc.positionAttrib;
        return 0;
    }
    if (desc.texCoordAttrib) {
        p.uvLoc = glGetAttribLocation(program, desc.texCoordAttrib);
        if (p.uvLoc < 0) {
            if (log) *log = std::string("missing vertex attribute ") + desc.texCoordAttrib;
            return 0;
        }
    }
    p.colorLoc = glGetUniformLocation(program, desc.colorUniform);
    if (p.colorLoc < 0) {
        if (log) *log = std::string("missing uniform ") + desc.colorUniform;
        return 0;
    }
    if (desc.textureUniform) {
        p.samplerLoc = glGetUniformLocation(program, desc.textureUniform);
        if (p.samplerLoc < 0) {
            if (log) *log = std::string("missing sampler ") + desc.textureUniform;
            return 0;
        }
    }
    // GLSL 1.20 writes gl_FragColor and has no named output (-1).
    if (desc.colorOutput && GLEW_VERSION_3_0 &&
        glGetFragDataLocation(program, desc.colorOutput) > 0) {
        if (log) *log = std::string("output ") + desc.colorOutput + " is not bound to target 0";
        return 0;
    }

    const u64 id = impl_->nextPipelineId++;
    impl_->pipelines.emplace(id, p);
    return id;
}

BufferHandle GLDevice::createDynamicVertexBuffer(size_t bytes) {
    GLuint vbo = 0;
    glGenBuffers(1, &vbo);
    if (!vbo) return 0;

    while (glGetError() != GL_NO_ERROR) {
    }
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, GLsizeiptr(bytes), nullptr, GL_DYNAMIC_DRAW);
    if (glGetError() == GL_OUT_OF_MEMORY) {
        std::fprintf(stderr, "g2d GL: out of memory allocating %zu byte buffer\n", bytes);
        glDeleteBuffers(1, &vbo);
        return 0;
    }
    return vbo;
}

SamplerHandle GLDevice::createSampler(const SamplerInfo& info) {
    GLSampler s;
    s.info = info;
    if (impl_->hasSamplerObjects) {
        glGenSamplers(1, &s.object);
        if (!s.object) return 0;
        GLint minFilter = GL_LINEAR, magFilter = GL_LINEAR;
        toGLFilter(info.filter, &minFilter, &magFilter);
        const GLint wrap = toGLWrap(info.wrap);
        glSamplerParameteri(s.object, GL_TEXTURE_MIN_FILTER, minFilter);
        glSamplerParameteri(s.object, GL_TEXTURE_MAG_FILTER, magFilter);
        glSamplerParameteri(s.object, GL_TEXTURE_WRAP_S, wrap);
        glSamplerParameteri(s.object, GL_TEXTURE_WRAP_T, wrap);
    }
    const u64 id = impl_->nextSamplerId++;
    impl_->samplers.emplace(id, s);
    return id;
}

void GLDevice::destroyProgram(ProgramHandle program) {
    if (program) glDeleteProgram(GLuint(program));
}

void GLDevice::destroyPipeline(PipelineHandle pipeline) {
    impl_->pipelines.erase(pipeline);
}

void GLDevice::destroyBuffer(BufferHandle buffer) {
    GLuint vbo = GLuint(buffer);
    if (vbo) glDeleteBuffers(1, &vbo);
}

void GLDevice::destroySampler(SamplerHandle sampler) {
    auto it = impl_->samplers.find(sampler);
    if (it == impl_->samplers.end()) return;
    if (it->second.object) glDeleteSamplers(1, &it->second.object);
    impl_->samplers.erase(it);
}

// ============================================================
// CommandEncoder
// ============================================================

void GLDevice::beginPass(const RenderTargetView& color,
                         const DepthStencilView&,
                         const i32 viewport[4]) {
    glBindFramebuffer(GL_FRAMEBUFFER, GLuint(color.handle));
    glViewport(viewport[0], viewport[1], viewport[2], viewport[3]);
    glDisable(GL_DEPTH_TEST);
    // Blending and clears happen in linear space; writes are encoded to sRGB.
    glEnable(GL_FRAMEBUFFER_SRGB);
    if (impl_->vao) glBindVertexArray(impl_->vao);
}

void GLDevice::endPass() {
    impl_->disableAttribs();
    if (impl_->vao) glBindVertexArray(0);
    glFlush();
}

void GLDevice::clearColor(const RenderTargetView& target, f32 r, f32 g, f32 b) {
    glBindFramebuffer(GL_FRAMEBUFFER, GLuint(target.handle));
    glDisable(GL_SCISSOR_TEST);
    glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
    glClearColor(r, g, b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void GLDevice::clearStencil(const DepthStencilView& target, u8 value) {
    glBindFramebuffer(GL_FRAMEBUFFER, GLuint(target.handle));
    glDisable(GL_SCISSOR_TEST);
    glStencilMask(0xFF);
    glClearStencil(GLint(value));
    glClear(GL_STENCIL_BUFFER_BIT);
}

void GLDevice::updateBuffer(BufferHandle buffer, const void* data,
                            size_t bytes, size_t offset) {
    glBindBuffer(GL_ARRAY_BUFFER, GLuint(buffer));
    glBufferSubData(GL_ARRAY_BUFFER, GLintptr(offset), GLsizeiptr(bytes), data);
}

void GLDevice::draw(const DrawSlice& slice, PipelineHandle pipeline,
                    const DrawBindings& b) {
    auto it = impl_->pipelines.find(pipeline);
    if (it == impl_->pipelines.end()) {
        std::fprintf(stderr, "g2d GL: draw with unknown pipeline %llu\n",
                     static_cast<unsigned long long>(pipeline));
        return;
    }
    const GLPipeline& p = it->second;

    glBindFramebuffer(GL_FRAMEBUFFER, GLuint(b.colorTarget.handle));
    glUseProgram(p.program);

    // Rasterizer
    if (p.cullFace == CullFace::Nothing) {
        glDisable(GL_CULL_FACE);
    } else {
        glEnable(GL_CULL_FACE);
        glCullFace(p.cullFace == CullFace::Front ? GL_FRONT : GL_BACK);
    }

    // Blend
    glEnable(GL_BLEND);
    glBlendEquationSeparate(toGLEquation(p.blend.color.equation),
                            toGLEquation(p.blend.alpha.equation));
    glBlendFuncSeparate(toGLFactor(p.blend.color.source),
                        toGLFactor(p.blend.color.destination),
                        toGLFactor(p.blend.alpha.source),
                        toGLFactor(p.blend.alpha.destination));
    glBlendColor(b.blendRef.r, b.blendRef.g, b.blendRef.b, b.blendRef.a);
    glColorMask((p.colorMask & kMaskRed) ? GL_TRUE : GL_FALSE,
                (p.colorMask & kMaskGreen) ? GL_TRUE : GL_FALSE,
                (p.colorMask & kMaskBlue) ? GL_TRUE : GL_FALSE,
                (p.colorMask & kMaskAlpha) ? GL_TRUE : GL_FALSE);

    // Stencil
    glEnable(GL_STENCIL_TEST);
    glStencilFuncSeparate(GL_FRONT, toGLComparison(p.stencil.fun),
                          GLint(b.stencilRefFront), p.stencil.maskRead);
    glStencilFuncSeparate(GL_BACK, toGLComparison(p.stencil.fun),
                          GLint(b.stencilRefBack), p.stencil.maskRead);
    glStencilMask(p.stencil.maskWrite);
    glStencilOp(toGLStencilOp(p.stencil.opFail),
                toGLStencilOp(p.stencil.opDepthFail),
                toGLStencilOp(p.stencil.opPass));

    // Scissor
    glEnable(GL_SCISSOR_TEST);
    glScissor(GLint(b.scissor.x), GLint(b.scissor.y),
              GLsizei(b.scissor.w), GLsizei(b.scissor.h));

    // Uniforms
    glUniform4f(p.colorLoc, b.color.r, b.color.g, b.color.b, b.color.a);
    if (p.samplerLoc >= 0) {
        auto sit = impl_->samplers.find(b.sampler);
        glActiveTexture(GL_TEXTURE0);
        glBindTexture(GL_TEXTURE_2D, GLuint(b.textureView));
        if (sit != impl_->samplers.end()) {
            impl_->applySampler(sit->second, GLuint(b.textureView));
        }
        glUniform1i(p.samplerLoc, 0);
    }

    // Vertex attributes
    impl_->disableAttribs();
    impl_->enableAttrib(p.posLoc, GLuint(b.positions), 2);
    if (p.uvLoc >= 0) {
        impl_->enableAttrib(p.uvLoc, GLuint(b.texCoords), 2);
    }

    glDrawArrays(GL_TRIANGLES, GLint(slice.start), GLsizei(slice.count()));
}

// ============================================================
// GLRenderTarget
// ============================================================

std::unique_ptr<GLRenderTarget> GLRenderTarget::Make(u16 w, u16 h) {
    std::unique_ptr<GLRenderTarget> target(new GLRenderTarget());
    target->width_ = w;
    target->height_ = h;

    glGenTextures(1, &target->texture_);
    glBindTexture(GL_TEXTURE_2D, target->texture_);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_SRGB8_ALPHA8, w, h, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

    glGenRenderbuffers(1, &target->depthStencil_);
    glBindRenderbuffer(GL_RENDERBUFFER, target->depthStencil_);
    glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH24_STENCIL8, w, h);

    glGenFramebuffers(1, &target->fbo_);
    glBindFramebuffer(GL_FRAMEBUFFER, target->fbo_);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0,
                           GL_TEXTURE_2D, target->texture_, 0);
    glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT,
                              GL_RENDERBUFFER, target->depthStencil_);

    GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (status != GL_FRAMEBUFFER_COMPLETE) {
        std::fprintf(stderr, "g2d GL: FBO incomplete: 0x%x\n", status);
        return nullptr;
    }

    return target;
}

GLRenderTarget::~GLRenderTarget() {
    if (fbo_) { glDeleteFramebuffers(1, &fbo_); fbo_ = 0; }
    if (depthStencil_) { glDeleteRenderbuffers(1, &depthStencil_); depthStencil_ = 0; }
    if (texture_) { glDeleteTextures(1, &texture_); texture_ = 0; }
}

void GLRenderTarget::readPixels(void* dst) const {
    glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
    glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, dst);
}

} // namespace g2d
