#include "g2d/error.hpp"

namespace g2d {

const char* drawErrorString(DrawError err) {
    switch (err) {
    case DrawError::None:                return "none";
    case DrawError::VertexCountMismatch: return "vertex count mismatch";
    case DrawError::IncompleteVertex:    return "incomplete vertex";
    case DrawError::ScissorOutOfRange:   return "scissor out of range";
    case DrawError::BufferOverflow:      return "vertex buffer overflow";
    case DrawError::ScopeClosed:         return "frame scope closed";
    }
    return "unknown";
}

const char* initStageString(InitError::Stage stage) {
    switch (stage) {
    case InitError::Stage::None:     return "none";
    case InitError::Stage::Shader:   return "shader";
    case InitError::Stage::Link:     return "link";
    case InitError::Stage::Pipeline: return "pipeline";
    case InitError::Stage::Buffer:   return "buffer";
    case InitError::Stage::Sampler:  return "sampler";
    }
    return "unknown";
}

} // namespace g2d
