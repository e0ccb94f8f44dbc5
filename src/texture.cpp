#include "g2d/texture.hpp"

namespace g2d {

bool hasAlphaChannel(SurfaceFormat format) {
    switch (format) {
    case SurfaceFormat::R4_G4_B4_A4:
    case SurfaceFormat::R5_G5_B5_A1:
    case SurfaceFormat::R8_G8_B8_A8:
    case SurfaceFormat::R10_G10_B10_A2:
    case SurfaceFormat::R16_G16_B16_A16:
    case SurfaceFormat::R32_G32_B32_A32:
        return true;
    case SurfaceFormat::R3_G3_B2:
    case SurfaceFormat::R4_G4:
    case SurfaceFormat::R5_G6_B5:
    case SurfaceFormat::R8:
    case SurfaceFormat::R8_G8:
    case SurfaceFormat::R8_G8_B8:
    case SurfaceFormat::R11_G11_B10:
    case SurfaceFormat::R16:
    case SurfaceFormat::R16_G16:
    case SurfaceFormat::R16_G16_B16:
    case SurfaceFormat::R32:
    case SurfaceFormat::R32_G32:
    case SurfaceFormat::R32_G32_B32:
    case SurfaceFormat::D16:
    case SurfaceFormat::D24:
    case SurfaceFormat::D24_S8:
    case SurfaceFormat::D32:
        return false;
    }
    // Every enumerator is handled above; -Wswitch flags new ones.
    return false;
}

} // namespace g2d
