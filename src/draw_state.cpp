#include "g2d/draw_state.hpp"

namespace g2d {

namespace {

bool fitsU16(i64 v) {
    return v >= 0 && v <= 0xFFFF;
}

} // namespace

DrawError resolveScissor(const std::optional<ScissorRect>& scissor, Rect16* out) {
    if (!scissor) {
        *out = kFullScissor;
        return DrawError::None;
    }
    const ScissorRect& r = *scissor;
    if (!fitsU16(r.x) || !fitsU16(r.y) || !fitsU16(r.w) || !fitsU16(r.h)) {
        return DrawError::ScissorOutOfRange;
    }
    *out = {u16(r.x), u16(r.y), u16(r.w), u16(r.h)};
    return DrawError::None;
}

} // namespace g2d
