/**
 * example_gpu.cpp - Animated g2d rendering, displayed via SDL2
 *
 * Demonstrates:
 *   - Rendering every frame through Gfx2d::draw on an offscreen target
 *   - Textured triangles sampling the previous frame
 *   - Streaming several batches through one TriListBatch
 *   - Readback and display through an SDL streaming texture
 *
 * Build:
 *   cmake -B build -DG2D_BUILD_EXAMPLES=ON -DG2D_ENABLE_GL=ON && cmake --build build
 *   ./build/example_gpu
 */

#include <g2d/g2d.hpp>
#include <cstdio>
#include <cstring>
#include <cmath>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>

#include <EGL/egl.h>

static void pushQuad(const g2d::Context& c, std::vector<g2d::f32>& out,
                     float cx, float cy, float half) {
    const float xs[6] = {cx - half, cx + half, cx + half, cx - half, cx + half, cx - half};
    const float ys[6] = {cy - half, cy - half, cy + half, cy - half, cy + half, cy + half};
    for (int i = 0; i < 6; ++i) {
        g2d::f32 p[2];
        c.transformPoint(xs[i], ys[i], p);
        out.push_back(p[0]);
        out.push_back(p[1]);
    }
}

static void drawScene(const g2d::Context& c, g2d::GfxGraphics& g,
                      const g2d::Texture& previous, int W, int H, float t) {
    using namespace g2d;

    g.clearColor({0.08f, 0.1f, 0.14f, 1.0f});
    g.clearStencil(0);

    // Previous frame, scaled down into the top-left corner
    if (previous.valid()) {
        std::vector<f32> verts;
        pushQuad(c, verts, 80, 60, 50);
        const f32 uvs[] = {0, 1, 1, 1, 1, 0, 0, 1, 1, 0, 0, 0};
        g.triListUv(c.drawState, {1, 1, 1, 0.8f}, previous, [&](TriListUvBatch& b) {
            b.submit(verts.data(), verts.size(), uvs, 12);
        });
    }

    // Orbiting squares, one draw call per square
    float cx = float(W) / 2;
    float cy = float(H) / 2;
    g.triList(c.drawState.blendAdd(), {0.3f, 0.5f, 0.8f, 1.0f}, [&](TriListBatch& b) {
        for (int i = 0; i < 6; ++i) {
            float angle = t + i * 3.14159f / 3.0f;
            float r = 80 + std::sin(t * 2 + i) * 20;
            std::vector<f32> verts;
            pushQuad(c, verts, cx + std::cos(angle) * r, cy + std::sin(angle) * r,
                     15 + std::sin(t * 3 + i * 0.5f) * 5);
            b.submit(verts.data(), verts.size());
        }
    });

    // Moving clip circle approximated by a fan, then a stripe drawn through it
    std::vector<f32> fan;
    float fx = cx + std::cos(t * 0.7f) * 150;
    for (int i = 0; i < 32; ++i) {
        float a0 = i * 2 * 3.14159f / 32;
        float a1 = (i + 1) * 2 * 3.14159f / 32;
        f32 p[2];
        c.transformPoint(fx, cy, p);
        fan.push_back(p[0]); fan.push_back(p[1]);
        c.transformPoint(fx + std::cos(a0) * 60, cy + std::sin(a0) * 60, p);
        fan.push_back(p[0]); fan.push_back(p[1]);
        c.transformPoint(fx + std::cos(a1) * 60, cy + std::sin(a1) * 60, p);
        fan.push_back(p[0]); fan.push_back(p[1]);
    }
    g.triList(DrawState::NewClip().withStencil(Stencil::Clip(1)), {1, 1, 1, 1},
              [&](TriListBatch& b) { b.submit(fan.data(), fan.size()); });

    std::vector<f32> stripe;
    for (int i = 0; i < W; i += 40) pushQuad(c, stripe, float(i) + 20, cy, 18);
    g.triList(c.drawState.withStencil(Stencil::Inside(1)), {1.0f, 0.6f, 0.2f, 1.0f},
              [&](TriListBatch& b) { b.submit(stripe.data(), stripe.size()); });
    g.triList(c.drawState.withStencil(Stencil::Outside(1)), {0.2f, 0.2f, 0.25f, 0.6f},
              [&](TriListBatch& b) { b.submit(stripe.data(), stripe.size()); });
}

int main(int argc, char* argv[]) {
    const int W = 600, H = 400;

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::printf("SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "g2d - OpenGL",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        W, H,
        SDL_WINDOW_SHOWN
    );
    if (!window) {
        std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::printf("SDL_CreateRenderer failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    SDL_Texture* texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_ABGR8888,
        SDL_TEXTUREACCESS_STREAMING,
        W, H
    );

    // ---- Initialize EGL for headless GPU context ----
    EGLDisplay display = eglGetDisplay(EGL_DEFAULT_DISPLAY);
    if (display == EGL_NO_DISPLAY) {
        std::printf("EGL display not available\n");
        SDL_DestroyTexture(texture);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    eglInitialize(display, nullptr, nullptr);

    EGLint configAttribs[] = {
        EGL_SURFACE_TYPE, EGL_PBUFFER_BIT,
        EGL_RENDERABLE_TYPE, EGL_OPENGL_BIT,
        EGL_RED_SIZE, 8, EGL_GREEN_SIZE, 8,
        EGL_BLUE_SIZE, 8, EGL_ALPHA_SIZE, 8,
        EGL_NONE
    };
    EGLConfig config;
    EGLint numConfigs;
    eglChooseConfig(display, configAttribs, &config, 1, &numConfigs);

    EGLint pbufAttribs[] = {EGL_WIDTH, W, EGL_HEIGHT, H, EGL_NONE};
    EGLSurface eglSurf = eglCreatePbufferSurface(display, config, pbufAttribs);

    eglBindAPI(EGL_OPENGL_API);
    EGLContext eglCtx = eglCreateContext(display, config, EGL_NO_CONTEXT, nullptr);
    eglMakeCurrent(display, eglSurf, eglSurf, eglCtx);

    int status = 0;
    {
        auto device = g2d::GLDevice::Make();
        // Two targets: one is drawn while the other is sampled as last frame.
        auto targetA = device ? g2d::GLRenderTarget::Make(W, H) : nullptr;
        auto targetB = device ? g2d::GLRenderTarget::Make(W, H) : nullptr;
        g2d::InitError err;
        auto g2dRenderer = (targetA && targetB)
            ? g2d::Gfx2d::Make(device->version(), *device, &err) : nullptr;

        if (!g2dRenderer) {
            std::printf("g2d init failed at %s: %s\n",
                        g2d::initStageString(err.stage), err.message.c_str());
            status = 1;
        } else {
            std::printf("g2d rendering with OpenGL + SDL2 display\n");
            std::printf("Press ESC or close window to exit\n");

            g2d::Viewport vp;
            vp.rect[2] = W;
            vp.rect[3] = H;
            vp.drawSize[0] = W;
            vp.drawSize[1] = H;
            vp.windowSize[0] = W;
            vp.windowSize[1] = H;

            std::vector<g2d::u8> pixels(W * H * 4);
            std::vector<g2d::u8> flipped(W * H * 4);
            g2d::GLRenderTarget* front = targetA.get();
            g2d::GLRenderTarget* back = targetB.get();
            g2d::Texture previous;

            bool running = true;
            float t = 0.0f;
            while (running) {
                SDL_Event event;
                while (SDL_PollEvent(&event)) {
                    if (event.type == SDL_QUIT) running = false;
                    if (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE) running = false;
                }

                t += 0.02f;

                g2dRenderer->draw(*device, front->colorView(), front->stencilView(), vp,
                                  [&](const g2d::Context& c, g2d::GfxGraphics& g) {
                                      drawScene(c, g, previous, W, H, t);
                                  });

                front->readPixels(pixels.data());
                for (int y = 0; y < H; ++y) {
                    std::memcpy(flipped.data() + y * W * 4,
                                pixels.data() + (H - 1 - y) * W * 4,
                                W * 4);
                }

                SDL_UpdateTexture(texture, nullptr, flipped.data(), W * 4);
                SDL_RenderClear(renderer);
                SDL_RenderCopy(renderer, texture, nullptr, nullptr);
                SDL_RenderPresent(renderer);

                previous.view = front->textureId();
                previous.format = g2d::SurfaceFormat::R8_G8_B8_A8;
                previous.width = W;
                previous.height = H;
                std::swap(front, back);

                SDL_Delay(16);
            }
        }
    }

    eglMakeCurrent(display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
    eglDestroyContext(display, eglCtx);
    eglDestroySurface(display, eglSurf);
    eglTerminate(display);

    SDL_DestroyTexture(texture);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return status;
}
