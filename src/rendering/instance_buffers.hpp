#pragma once

/// @file instance_buffers.hpp
/// @brief Flat per-instance arrays (size, colour, both positions) for GPU upload.

#include "catalog/latent_star.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace latentsky::rendering
{
    /// @brief Latent coordinates are spread by this factor before upload.
    inline constexpr f32 kLatentScale = 5.0f;

    /// @brief GPU-facing per-star attributes, index-aligned by star index.
    ///
    /// sizes has N entries; colors, latent_positions and galactic_positions
    /// have 3N (x, y, z / r, g, b interleaved). Built once, then moved into
    /// the renderer.
    struct InstanceBufferSet
    {
        std::vector<f32> sizes;
        std::vector<f32> colors;
        std::vector<f32> latent_positions;
        std::vector<f32> galactic_positions;

        /// @brief Number of instances (N).
        [[nodiscard]] std::size_t star_count() const { return sizes.size(); }

        /// @brief True when all arrays agree on N.
        [[nodiscard]] bool is_consistent() const;

        /// @brief Radius of the origin-centred sphere containing both layouts.
        /// Non-finite coordinates are ignored.
        [[nodiscard]] f32 bounding_radius() const;
    };

    /// @brief Derive size and colour for every star and pack all four arrays.
    [[nodiscard]] InstanceBufferSet build_instance_buffers(std::span<const catalog::LatentStar> stars,
                                                         f32 latent_scale = kLatentScale);

} // namespace latentsky::rendering
