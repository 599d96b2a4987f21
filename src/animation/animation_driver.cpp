/// @file animation_driver.cpp
/// @brief Animation driver implementation.

#include "animation/animation_driver.hpp"

namespace latentsky::animation
{

AnimationDriver::AnimationDriver(rendering::Visualization& visualization,
                                 rendering::BlendController& blend,
                                 const DriverConfig& config)
    : m_visualization{visualization}
    , m_tween{blend, config.tween}
    , m_spin_per_frame{config.spin_per_frame}
{
}

void AnimationDriver::tick(f64 delta_sec)
{
    m_tween.advance(delta_sec);

    m_visualization.update_controls();
    m_visualization.get_scene().rotate_all(m_spin_per_frame);
    m_visualization.draw_frame();

    ++m_frame_count;
}

} // namespace latentsky::animation
