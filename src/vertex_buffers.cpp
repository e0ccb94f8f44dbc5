#include "g2d/vertex_buffers.hpp"
#include <cstdio>

namespace g2d {

bool DynamicVertexBuffers::init(GpuDevice& device, u32 maxVertices, InitError* error) {
    destroy(device);

    positions_ = device.createDynamicVertexBuffer(size_t(kPosComponents) * maxVertices * sizeof(f32));
    texCoords_ = device.createDynamicVertexBuffer(size_t(kUvComponents) * maxVertices * sizeof(f32));
    if (!positions_ || !texCoords_) {
        std::fprintf(stderr, "g2d DynamicVertexBuffers: cannot allocate %u vertices\n",
                     maxVertices);
        if (error) {
            error->stage = InitError::Stage::Buffer;
            error->message = "dynamic vertex buffer allocation failed";
        }
        destroy(device);
        return false;
    }
    maxVertices_ = maxVertices;
    return true;
}

void DynamicVertexBuffers::destroy(GpuDevice& device) {
    if (positions_) { device.destroyBuffer(positions_); positions_ = 0; }
    if (texCoords_) { device.destroyBuffer(texCoords_); texCoords_ = 0; }
    maxVertices_ = 0;
}

DrawError DynamicVertexBuffers::uploadPositions(CommandEncoder& encoder,
                                                const f32* data, size_t len) {
    return upload(encoder, positions_, kPosComponents, data, len);
}

DrawError DynamicVertexBuffers::uploadTexCoords(CommandEncoder& encoder,
                                                const f32* data, size_t len) {
    return upload(encoder, texCoords_, kUvComponents, data, len);
}

DrawError DynamicVertexBuffers::upload(CommandEncoder& encoder, BufferHandle buffer,
                                       u32 components, const f32* data, size_t len) const {
    if (len % components != 0) return DrawError::IncompleteVertex;
    if (len / components > maxVertices_) return DrawError::BufferOverflow;
    if (len == 0) return DrawError::None;
    encoder.updateBuffer(buffer, data, len * sizeof(f32), 0);
    return DrawError::None;
}

} // namespace g2d
