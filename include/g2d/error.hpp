#pragma once

/**
 * @file error.hpp
 * @brief Error values reported by renderer construction and draw calls.
 */

#include "g2d/types.hpp"
#include <string>

namespace g2d {

/// @brief Caller contract violations detected while submitting a draw.
///
/// Only the offending draw is skipped; the renderer stays usable.
enum class DrawError : u8 {
    None,                 ///< The draw was recorded.
    VertexCountMismatch,  ///< Position and texcoord vertex counts differ.
    IncompleteVertex,     ///< Component count is not a multiple of 2.
    ScissorOutOfRange,    ///< Scissor coordinates do not fit in [0, 65535].
    BufferOverflow,       ///< More vertices than the dynamic buffers hold.
    ScopeClosed,          ///< The frame scope that opened the batch has ended.
};

/// @brief Human-readable name of a DrawError.
const char* drawErrorString(DrawError err);

/// @brief Failure description for renderer construction.
struct InitError {
    /// @brief Which initialization step failed.
    enum class Stage : u8 {
        None,      ///< No failure.
        Shader,    ///< No shader source for the negotiated GLSL version.
        Link,      ///< Program compile or link failed.
        Pipeline,  ///< Pipeline state creation failed.
        Buffer,    ///< Dynamic vertex buffer allocation failed.
        Sampler,   ///< Sampler creation failed.
    };

    Stage stage = Stage::None;
    std::string message;  ///< Driver log or description.

    bool failed() const { return stage != Stage::None; }
};

/// @brief Human-readable name of an InitError stage.
const char* initStageString(InitError::Stage stage);

} // namespace g2d
