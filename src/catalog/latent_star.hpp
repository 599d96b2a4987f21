#pragma once

/// @file latent_star.hpp
/// @brief One parsed row of the latent-space star table.

#include "core/types.hpp"

#include <string>

namespace latentsky::catalog
{
    /// @brief A star placed in both its galactic frame and the learned latent frame.
    ///
    /// Unparsable numeric fields are stored as NaN (id as 0); the row is kept.
    struct LatentStar
    {
        i64 id = 0;                     ///< Source table identifier
        Vec3f latent_position{0.0f};    ///< Embedding coordinates (unscaled)
        Vec3f galactic_position{0.0f};  ///< True spatial coordinates
        f32 abs_magnitude = 0.0f;       ///< Absolute magnitude
        std::string spectral_type;      ///< e.g. "G2", may be empty

        /// @brief True when every position component and the magnitude are finite.
        [[nodiscard]] bool is_finite() const;
    };

} // namespace latentsky::catalog
