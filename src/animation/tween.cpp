/// @file tween.cpp
/// @brief Easing curves and the progress tween.

#include "animation/tween.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace latentsky::animation
{

f64 ease(Easing easing, f64 t)
{
    t = std::clamp(t, 0.0, 1.0);

    switch (easing)
    {
        case Easing::Linear:
            return t;

        case Easing::Power1InOut:
            return t < 0.5 ? 2.0 * t * t
                           : 1.0 - std::pow(-2.0 * t + 2.0, 2.0) / 2.0;

        case Easing::Power2InOut:
            return t < 0.5 ? 4.0 * t * t * t
                           : 1.0 - std::pow(-2.0 * t + 2.0, 3.0) / 2.0;
    }

    return t;
}

std::optional<Easing> parse_easing(std::string_view name)
{
    if (name == "linear" || name == "none")
    {
        return Easing::Linear;
    }
    if (name == "power1.inOut")
    {
        return Easing::Power1InOut;
    }
    if (name == "power2.inOut")
    {
        return Easing::Power2InOut;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// ProgressTween
// -----------------------------------------------------------------

ProgressTween::ProgressTween(rendering::BlendController& target, const TweenConfig& config)
    : m_target{target}
    , m_config{config}
{
}

void ProgressTween::advance(f64 delta_sec)
{
    if (m_finished || delta_sec <= 0.0)
    {
        return;
    }

    m_elapsed += delta_sec;

    const f64 active_time = m_elapsed - m_config.delay_sec;
    if (active_time < 0.0)
    {
        return;
    }

    if (!m_start_value.has_value())
    {
        m_start_value = m_target.get_progress();
        LSKY_TRACE("Progress tween started ({:.2f} -> {:.2f} over {:.1f}s)",
                   *m_start_value, m_config.to, m_config.duration_sec);
    }

    const f64 t = m_config.duration_sec > 0.0 ? active_time / m_config.duration_sec : 1.0;
    const f64 eased = ease(m_config.easing, t);
    const f64 from = static_cast<f64>(*m_start_value);
    m_target.set_progress(static_cast<f32>(from + (static_cast<f64>(m_config.to) - from) * eased));

    if (t >= 1.0)
    {
        m_target.set_progress(m_config.to);
        m_finished = true;
        LSKY_TRACE("Progress tween finished");
    }
}

} // namespace latentsky::animation
