#pragma once

/// @file blend_math.hpp
/// @brief CPU mirror of the star_cloud shaders (blend, point size, disc discard).
///
/// Must stay in sync with shaders/star_cloud.vert and shaders/star_cloud.frag.

#include "core/types.hpp"

#include <glm/common.hpp>
#include <glm/geometric.hpp>

namespace latentsky::rendering
{
    /// @brief Perspective point-size constant (pixels at unit view distance).
    inline constexpr f32 kPointPerspectiveScale = 300.0f;

    /// @brief Point size every star converges to at progress 1.
    inline constexpr f32 kUniformPointSize = 1.0f;

    /// @brief Squared radius of the visible disc inside the point sprite.
    inline constexpr f32 kDiscRadiusSquared = 0.25f;

    /// @brief mix(galactic, latent, progress).
    [[nodiscard]] inline Vec3f blended_position(const Vec3f& galactic, const Vec3f& latent, f32 progress)
    {
        return glm::mix(galactic, latent, progress);
    }

    /// @brief mix(size, 1, progress) * (k / -view_z).
    [[nodiscard]] inline f32 blended_point_size(f32 size, f32 progress, f32 view_z,
                                                f32 perspective_scale = kPointPerspectiveScale)
    {
        const f32 final_size = glm::mix(size, kUniformPointSize, progress);
        return final_size * (perspective_scale / -view_z);
    }

    /// @brief False when the fragment at point_coord (in [0,1]^2) would be discarded.
    [[nodiscard]] inline bool disc_covers(const Vec2f& point_coord)
    {
        const Vec2f offset = point_coord - Vec2f{0.5f};
        return glm::dot(offset, offset) <= kDiscRadiusSquared;
    }

} // namespace latentsky::rendering
