#pragma once

/**
 * @file pipeline_matrix.hpp
 * @brief Precompiled pipelines for every clip mode and blend mode pair.
 */

#include "g2d/types.hpp"
#include "g2d/draw_state.hpp"
#include "g2d/error.hpp"
#include "g2d/gpu/device.hpp"
#include <array>
#include <optional>

namespace g2d {

/// @brief Outer matrix dimension, derived from std::optional<Stencil>.
enum class ClipMode : u8 { None, Clip, Inside, Outside };

/// @brief Inner matrix dimension, derived from std::optional<Blend>.
enum class BlendMode : u8 { None, Alpha, Add, Multiply, Invert };

constexpr size_t kClipModeCount = 4;
constexpr size_t kBlendModeCount = 5;

ClipMode clipModeOf(const std::optional<Stencil>& stencil);
BlendMode blendModeOf(const std::optional<Blend>& blend);

/// @brief Blend function of a mode. BlendMode::None is One/Zero/Add.
BlendState blendStateFor(BlendMode mode);

/// @brief Stencil test and ops of a clip mode.
StencilState stencilStateFor(ClipMode mode);

/// @brief Color write mask of a clip mode. Clip writes no color.
u8 colorMaskFor(ClipMode mode);

/**
 * PipelineMatrix - 4 x 5 table of pipelines sharing one program.
 *
 * Built once from a base PipelineDesc whose program and binding names are
 * kept; blend, stencil and color mask are filled in per cell. Immutable
 * after build(). Selection is a plain array index.
 */
class PipelineMatrix {
public:
    struct Selection {
        PipelineHandle pipeline = 0;
        u8 stencilRef = 0;
    };

    /**
     * Create all 20 pipelines. On failure every pipeline created so far is
     * destroyed, *error is filled (stage Pipeline) and false is returned.
     */
    bool build(GpuDevice& device, const PipelineDesc& base, InitError* error);

    /// @brief Destroy all pipelines. Safe to call on an empty matrix.
    void destroy(GpuDevice& device);

    Selection select(const std::optional<Stencil>& stencil,
                     const std::optional<Blend>& blend) const;

    PipelineHandle at(ClipMode clip, BlendMode blend) const {
        return pipelines_[size_t(clip)][size_t(blend)];
    }

    /// @brief True if pipeline is one of this matrix's cells.
    bool contains(PipelineHandle pipeline) const;

    bool built() const { return built_; }

private:
    std::array<std::array<PipelineHandle, kBlendModeCount>, kClipModeCount> pipelines_{};
    bool built_ = false;
};

} // namespace g2d
