/**
 * example_basic.cpp - Headless g2d rendering into a PPM file
 *
 * Demonstrates:
 *   - Binding a GLDevice to a headless EGL context
 *   - Creating an offscreen sRGB render target
 *   - Alpha, additive and multiply blending
 *   - Stencil clipping (write a clip shape, then draw inside / outside it)
 *   - Scissored drawing
 *
 * Build:
 *   cmake -B build -DG2D_BUILD_EXAMPLES=ON -DG2D_ENABLE_GL=ON && cmake --build build
 *   ./build/example_basic
 *
 * Output: basic.ppm
 */

#include <g2d/g2d.hpp>
#include <fstream>
#include <cstdio>
#include <vector>

#include <EGL/egl.h>

// Write RGBA raw buffer to PPM (GL readback is bottom-up)
static void writePPM_RGBA(const char* filename, const void* data, int w, int h) {
    std::ofstream f(filename, std::ios::binary);
    f << "P6\n" << w << " " << h << "\n255\n";
    const auto* bytes = static_cast<const g2d::u8*>(data);
    for (int y = h - 1; y >= 0; --y) {
        const auto* row = bytes + y * w * 4;
        for (int x = 0; x < w; ++x) {
            f.put(char(row[x * 4 + 0]));
            f.put(char(row[x * 4 + 1]));
            f.put(char(row[x * 4 + 2]));
        }
    }
    std::printf("Written: %s (%dx%d)\n", filename, w, h);
}

// Append an axis-aligned rectangle as two triangles in NDC.
static void pushRect(const g2d::Context& c, std::vector<g2d::f32>& out,
                     double x, double y, double w, double h) {
    const double xs[6] = {x, x + w, x + w, x, x + w, x};
    const double ys[6] = {y, y, y + h, y, y + h, y + h};
    for (int i = 0; i < 6; ++i) {
        g2d::f32 p[2];
        c.transformPoint(xs[i], ys[i], p);
        out.push_back(p[0]);
        out.push_back(p[1]);
    }
}

static void drawScene(const g2d::Context& c, g2d::GfxGraphics& g) {
    using namespace g2d;

    g.clearColor({0.16f, 0.16f, 0.2f, 1.0f});
    g.clearStencil(0);

    std::vector<f32> verts;

    // Overlapping rectangles with different blend modes
    pushRect(c, verts, 20, 20, 160, 100);
    g.triList(c.drawState, {0.86f, 0.24f, 0.24f, 1.0f},
              [&](TriListBatch& b) { b.submit(verts.data(), verts.size()); });

    verts.clear();
    pushRect(c, verts, 100, 60, 160, 100);
    g.triList(c.drawState, {0.24f, 0.7f, 0.24f, 0.7f},
              [&](TriListBatch& b) { b.submit(verts.data(), verts.size()); });

    verts.clear();
    pushRect(c, verts, 200, 100, 160, 100);
    g.triList(c.drawState.blendAdd(), {0.1f, 0.1f, 0.6f, 1.0f},
              [&](TriListBatch& b) { b.submit(verts.data(), verts.size()); });

    // Clip shape: a triangle written into the stencil buffer only
    const f32 clipTri[] = {-0.6f, -0.9f, 0.6f, -0.9f, 0.0f, -0.1f};
    g.triList(DrawState::NewClip().withStencil(Stencil::Clip(1)), {1, 1, 1, 1},
              [&](TriListBatch& b) { b.submit(clipTri, 6); });

    // A band drawn inside the clip, then the same band multiplied outside it
    verts.clear();
    pushRect(c, verts, 0, 200, 400, 80);
    g.triList(c.drawState.withStencil(Stencil::Inside(1)), {1.0f, 0.8f, 0.0f, 1.0f},
              [&](TriListBatch& b) { b.submit(verts.data(), verts.size()); });
    g.triList(c.drawState.withStencil(Stencil::Outside(1)).blendMultiply(),
              {0.5f, 0.5f, 1.0f, 1.0f},
              [&](TriListBatch& b) { b.submit(verts.data(), verts.size()); });

    // Scissor: only the top-right corner of a full-screen quad survives
    verts.clear();
    pushRect(c, verts, 0, 0, 400, 300);
    DrawError err = g.triList(c.drawState.withScissor(ScissorRect{300, 220, 90, 70}),
                              {1.0f, 1.0f, 1.0f, 0.3f},
                              [&](TriListBatch& b) { b.submit(verts.data(), verts.size()); });
    if (err != DrawError::None) {
        std::printf("draw failed: %s\n", drawErrorString(err));
    }
}

int main() {
    const int W = 400, H = 300;

    EGLDisplay display = eglGetDisplay(EGL_DEFAULT_DISPLAY);
    if (display == EGL_NO_DISPLAY) {
        std::printf("EGL display not available\n");
        return 0;
    }
    eglInitialize(display, nullptr, nullptr);

    EGLint configAttribs[] = {
        EGL_SURFACE_TYPE, EGL_PBUFFER_BIT,
        EGL_RENDERABLE_TYPE, EGL_OPENGL_BIT,
        EGL_RED_SIZE, 8, EGL_GREEN_SIZE, 8,
        EGL_BLUE_SIZE, 8, EGL_ALPHA_SIZE, 8,
        EGL_STENCIL_SIZE, 8,
        EGL_NONE
    };
    EGLConfig config;
    EGLint numConfigs;
    eglChooseConfig(display, configAttribs, &config, 1, &numConfigs);

    EGLint pbufAttribs[] = {EGL_WIDTH, W, EGL_HEIGHT, H, EGL_NONE};
    EGLSurface eglSurf = eglCreatePbufferSurface(display, config, pbufAttribs);

    eglBindAPI(EGL_OPENGL_API);
    EGLContext ctx = eglCreateContext(display, config, EGL_NO_CONTEXT, nullptr);
    eglMakeCurrent(display, eglSurf, eglSurf, ctx);

    {
        auto device = g2d::GLDevice::Make();
        auto target = device ? g2d::GLRenderTarget::Make(W, H) : nullptr;
        g2d::InitError err;
        auto renderer = target ? g2d::Gfx2d::Make(device->version(), *device, &err) : nullptr;

        if (!renderer) {
            std::printf("g2d init failed at %s: %s\n",
                        g2d::initStageString(err.stage), err.message.c_str());
        } else {
            g2d::Viewport vp;
            vp.rect[2] = W;
            vp.rect[3] = H;
            vp.drawSize[0] = W;
            vp.drawSize[1] = H;
            vp.windowSize[0] = W;
            vp.windowSize[1] = H;

            renderer->draw(*device, target->colorView(), target->stencilView(), vp, drawScene);

            std::vector<g2d::u8> pixels(W * H * 4);
            target->readPixels(pixels.data());
            writePPM_RGBA("basic.ppm", pixels.data(), W, H);
        }
    }

    eglMakeCurrent(display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
    eglDestroyContext(display, ctx);
    eglDestroySurface(display, eglSurf);
    eglTerminate(display);
    return 0;
}
