#pragma once

/**
 * @file vertex_buffers.hpp
 * @brief Fixed-capacity position and texcoord buffers reused by every draw.
 */

#include "g2d/types.hpp"
#include "g2d/error.hpp"
#include "g2d/gpu/device.hpp"

namespace g2d {

constexpr u32 kPosComponents = 2;  ///< Floats per position vertex.
constexpr u32 kUvComponents = 2;   ///< Floats per texcoord vertex.

/// @brief Default vertex capacity of the dynamic buffers.
constexpr u32 kMaxVertexCount = 1024;

/**
 * DynamicVertexBuffers - The two vertex buffers shared by all draw calls.
 *
 * Uploads always overwrite from offset 0. Nothing is reallocated after
 * init(); an upload larger than the capacity is rejected.
 */
class DynamicVertexBuffers {
public:
    /// @brief Allocate both buffers. Fills *error (stage Buffer) on failure.
    bool init(GpuDevice& device, u32 maxVertices, InitError* error);

    void destroy(GpuDevice& device);

    /// @brief Upload len floats of interleaved x,y pairs.
    DrawError uploadPositions(CommandEncoder& encoder, const f32* data, size_t len);

    /// @brief Upload len floats of interleaved u,v pairs.
    DrawError uploadTexCoords(CommandEncoder& encoder, const f32* data, size_t len);

    BufferHandle positions() const { return positions_; }
    BufferHandle texCoords() const { return texCoords_; }
    u32 maxVertices() const { return maxVertices_; }

private:
    DrawError upload(CommandEncoder& encoder, BufferHandle buffer, u32 components,
                     const f32* data, size_t len) const;

    BufferHandle positions_ = 0;
    BufferHandle texCoords_ = 0;
    u32 maxVertices_ = 0;
};

} // namespace g2d
