#pragma once

/// @file blend_controller.hpp
/// @brief Owner of the galactic → latent blend progress scalar.

#include "core/types.hpp"

#include <algorithm>

namespace latentsky::rendering
{
    /// @brief Holds the blend progress in [0, 1].
    ///
    /// Written by the progress tween, read by the renderer once per frame.
    /// Lives on the main thread; no synchronization.
    class BlendController
    {
    public:
        BlendController() = default;

        /// @brief Set progress; values outside [0, 1] are clamped.
        void set_progress(f32 value)
        {
            m_progress = std::clamp(value, 0.0f, 1.0f);
        }

        [[nodiscard]] f32 get_progress() const { return m_progress; }

    private:
        f32 m_progress = 0.0f;
    };

} // namespace latentsky::rendering
