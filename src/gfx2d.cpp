#include "g2d/gfx2d.hpp"
#include <cstdio>

namespace g2d {

// ============================================================
// Gfx2d
// ============================================================

Gfx2d::Gfx2d(GpuDevice& device)
    : device_(device) {
}

Gfx2d::~Gfx2d() {
    destroy();
}

std::unique_ptr<Gfx2d> Gfx2d::Make(OpenGL version, GpuDevice& device, InitError* error) {
    return Make(version, device, Config(), error);
}

std::unique_ptr<Gfx2d> Gfx2d::Make(OpenGL version, GpuDevice& device,
                                   const Config& config, InitError* error) {
    std::unique_ptr<Gfx2d> g2d(new Gfx2d(device));
    if (!g2d->init(version, config, error)) return nullptr;
    return g2d;
}

bool Gfx2d::linkProgram(const ProgramSources& sources, Glsl glsl, const char* name,
                        ProgramHandle* out, InitError* error) {
    const char* vert = sources.vertex.get(glsl);
    const char* frag = sources.fragment.get(glsl);
    if (!vert || !frag) {
        std::fprintf(stderr, "g2d Gfx2d: no %s shader for GLSL %d\n",
                     name, glslVersionNumber(glsl));
        if (error) {
            error->stage = InitError::Stage::Shader;
            error->message = std::string("no ") + name + " shader for GLSL " +
                             std::to_string(glslVersionNumber(glsl));
        }
        return false;
    }

    std::string log;
    *out = device_.linkProgram(vert, frag, &log);
    if (!*out) {
        std::fprintf(stderr, "g2d Gfx2d: %s program link failed: %s\n", name, log.c_str());
        if (error) {
            error->stage = InitError::Stage::Link;
            error->message = log;
        }
        return false;
    }
    return true;
}

bool Gfx2d::init(OpenGL version, const Config& config, InitError* error) {
    const Glsl glsl = toGlsl(version);

    if (!linkProgram(shaders::colored(), glsl, "colored", &coloredProgram_, error)) return false;

    PipelineDesc coloredDesc;
    coloredDesc.program = coloredProgram_;
    if (!colored_.build(device_, coloredDesc, error)) return false;

    if (!linkProgram(shaders::textured(), glsl, "textured", &texturedProgram_, error)) return false;

    PipelineDesc texturedDesc;
    texturedDesc.program = texturedProgram_;
    texturedDesc.texCoordAttrib = "uv";
    texturedDesc.textureUniform = "s_texture";
    if (!textured_.build(device_, texturedDesc, error)) return false;

    if (!buffers_.init(device_, config.maxVertices, error)) return false;

    sampler_ = device_.createSampler(config.sampler);
    if (!sampler_) {
        std::fprintf(stderr, "g2d Gfx2d: sampler creation failed\n");
        if (error) {
            error->stage = InitError::Stage::Sampler;
            error->message = "sampler creation failed";
        }
        return false;
    }
    return true;
}

void Gfx2d::destroy() {
    if (sampler_) { device_.destroySampler(sampler_); sampler_ = 0; }
    buffers_.destroy(device_);
    textured_.destroy(device_);
    colored_.destroy(device_);
    if (texturedProgram_) { device_.destroyProgram(texturedProgram_); texturedProgram_ = 0; }
    if (coloredProgram_) { device_.destroyProgram(coloredProgram_); coloredProgram_ = 0; }
}

// ============================================================
// FrameScope
// ============================================================

FrameScope::FrameScope(Gfx2d& g2d,
                       CommandEncoder& encoder,
                       const RenderTargetView& outputColor,
                       const DepthStencilView& outputStencil,
                       const Viewport& viewport)
    : g2d_(g2d),
      encoder_(encoder),
      context_(Context::NewViewport(viewport)),
      graphics_(encoder, outputColor, outputStencil, g2d) {
    if (g2d_.inScope_) {
        std::fprintf(stderr, "g2d Gfx2d: draw() called while a frame scope is open\n");
        return;
    }
    g2d_.inScope_ = true;
    ++g2d_.scope_;
    active_ = true;
    encoder_.beginPass(outputColor, outputStencil, viewport.rect);
}

FrameScope::~FrameScope() {
    if (!active_) return;
    encoder_.endPass();
    g2d_.inScope_ = false;
}

} // namespace g2d
