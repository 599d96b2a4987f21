#pragma once

/// @file animation_driver.hpp
/// @brief Per-frame task: tween, camera controls, cosmetic spin, draw.

#include "animation/tween.hpp"
#include "core/types.hpp"
#include "rendering/blend_controller.hpp"
#include "rendering/visualization.hpp"

namespace latentsky::animation
{
    /// @brief Animation parameters.
    struct DriverConfig
    {
        Vec3f spin_per_frame{0.0005f, 0.001f, 0.0f};   ///< Euler increment per tick (radians)
        TweenConfig tween{};                           ///< Galactic → latent reveal
    };

    /// @brief Drives one visualization frame by frame.
    ///
    /// The reveal tween starts counting its delay at construction.
    class AnimationDriver
    {
    public:
        AnimationDriver(rendering::Visualization& visualization,
                        rendering::BlendController& blend,
                        const DriverConfig& config);

        /// @brief One frame: advance tween, update controls, spin, draw.
        void tick(f64 delta_sec);

        [[nodiscard]] u64 get_frame_count() const { return m_frame_count; }
        [[nodiscard]] const ProgressTween& get_tween() const { return m_tween; }

    private:
        rendering::Visualization& m_visualization;
        ProgressTween m_tween;
        Vec3f m_spin_per_frame;
        u64 m_frame_count = 0;
    };

} // namespace latentsky::animation
