#pragma once

/// @file tween.hpp
/// @brief One-shot delayed tween that drives a BlendController toward a target value.

#include "core/types.hpp"
#include "rendering/blend_controller.hpp"

#include <optional>
#include <string_view>

namespace latentsky::animation
{
    /// @brief Easing curves, named after their GSAP equivalents.
    enum class Easing
    {
        Linear,         ///< "none" / "linear"
        Power1InOut,    ///< "power1.inOut" (quadratic)
        Power2InOut,    ///< "power2.inOut" (cubic)
    };

    /// @brief Map normalized time t in [0, 1] through an easing curve.
    [[nodiscard]] f64 ease(Easing easing, f64 t);

    /// @brief Parse "linear", "none", "power1.inOut" or "power2.inOut".
    [[nodiscard]] std::optional<Easing> parse_easing(std::string_view name);

    /// @brief Tween parameters.
    struct TweenConfig
    {
        f32 to = 1.0f;
        f64 duration_sec = 5.0;
        f64 delay_sec = 5.0;
        Easing easing = Easing::Power2InOut;
    };

    /// @brief Fire-and-forget tween on a BlendController.
    ///
    /// The start value is sampled from the controller when the delay
    /// expires. After completion the tween stops writing.
    class ProgressTween
    {
    public:
        ProgressTween(rendering::BlendController& target, const TweenConfig& config);

        /// @brief Advance by wall-clock seconds and write the eased value.
        void advance(f64 delta_sec);

        [[nodiscard]] bool is_started() const { return m_start_value.has_value(); }
        [[nodiscard]] bool is_finished() const { return m_finished; }
        [[nodiscard]] f64 get_elapsed() const { return m_elapsed; }

    private:
        rendering::BlendController& m_target;
        TweenConfig m_config;
        f64 m_elapsed = 0.0;
        std::optional<f32> m_start_value;
        bool m_finished = false;
    };

} // namespace latentsky::animation
