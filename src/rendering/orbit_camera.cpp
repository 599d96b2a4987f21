/// @file orbit_camera.cpp
/// @brief Perspective camera and damped orbit controls.

#include "rendering/orbit_camera.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>

namespace latentsky::rendering
{

// =================================================================
// PerspectiveCamera
// =================================================================

PerspectiveCamera::PerspectiveCamera() = default;

void PerspectiveCamera::set_position(const Vec3f& position)
{
    m_position = position;
}

void PerspectiveCamera::look_at(const Vec3f& target)
{
    m_target = target;
}

void PerspectiveCamera::set_viewport(u32 width, u32 height)
{
    if (height == 0)
    {
        return;
    }
    m_aspect = static_cast<f32>(width) / static_cast<f32>(height);
}

Mat4f PerspectiveCamera::view_matrix() const
{
    return glm::lookAt(m_position, m_target, m_up);
}

Mat4f PerspectiveCamera::projection_matrix() const
{
    Mat4f projection = glm::perspective(m_fov_rad, m_aspect, kNear, kFar);
    // Vulkan clip space has +Y pointing down
    projection[1][1] *= -1.0f;
    return projection;
}

// =================================================================
// OrbitControls
// =================================================================

OrbitControls::OrbitControls(PerspectiveCamera& camera)
    : m_camera{&camera}
{
}

void OrbitControls::rotate(f32 dx_pixels, f32 dy_pixels, u32 viewport_height)
{
    if (m_camera == nullptr || viewport_height == 0)
    {
        return;
    }

    const f32 height = static_cast<f32>(viewport_height);
    m_delta_theta -= 2.0f * glm::pi<f32>() * dx_pixels / height;
    m_delta_phi   -= 2.0f * glm::pi<f32>() * dy_pixels / height;
}

// -----------------------------------------------------------------
// pan: screen-space, scaled so the point under the cursor at the
// target distance follows the mouse
// -----------------------------------------------------------------

void OrbitControls::pan(f32 dx_pixels, f32 dy_pixels, u32 viewport_height)
{
    if (m_camera == nullptr || viewport_height == 0)
    {
        return;
    }

    const Vec3f offset = m_camera->get_position() - m_camera->get_target();
    const f32 target_distance = glm::length(offset) * std::tan(m_camera->get_fov_rad() * 0.5f);
    const f32 height = static_cast<f32>(viewport_height);

    // Camera basis vectors in world space (rows of the view rotation)
    const Mat4f view = m_camera->view_matrix();
    const Vec3f right{view[0][0], view[1][0], view[2][0]};
    const Vec3f up{view[0][1], view[1][1], view[2][1]};

    m_pan_offset -= right * (2.0f * dx_pixels * target_distance / height);
    m_pan_offset += up * (2.0f * dy_pixels * target_distance / height);
}

void OrbitControls::dolly(f32 scroll_steps)
{
    if (m_camera == nullptr || scroll_steps == 0.0f)
    {
        return;
    }
    m_scale *= std::pow(kZoomStep, scroll_steps);
}

// -----------------------------------------------------------------
// update: spherical coordinates around the target, damped
// -----------------------------------------------------------------

bool OrbitControls::update()
{
    if (m_camera == nullptr)
    {
        return false;
    }

    const Vec3f target_before = m_camera->get_target();
    const Vec3f offset = m_camera->get_position() - target_before;

    f32 radius = glm::length(offset);
    f32 theta = std::atan2(offset.x, offset.z);
    f32 phi = radius > 0.0f ? std::acos(std::clamp(offset.y / radius, -1.0f, 1.0f)) : 0.0f;

    theta += m_delta_theta * m_damping_factor;
    phi += m_delta_phi * m_damping_factor;
    phi = std::clamp(phi, kPhiEpsilon, glm::pi<f32>() - kPhiEpsilon);

    radius = std::clamp(radius * m_scale, kMinDistance, kMaxDistance);

    const Vec3f target = target_before + m_pan_offset * m_damping_factor;

    const f32 sin_phi = std::sin(phi);
    const Vec3f new_offset{
        radius * sin_phi * std::sin(theta),
        radius * std::cos(phi),
        radius * sin_phi * std::cos(theta),
    };

    const Vec3f position_before = m_camera->get_position();
    m_camera->look_at(target);
    m_camera->set_position(target + new_offset);

    // Decay pending motion; zoom is applied in one step
    m_delta_theta *= 1.0f - m_damping_factor;
    m_delta_phi *= 1.0f - m_damping_factor;
    m_pan_offset *= 1.0f - m_damping_factor;
    m_scale = 1.0f;

    const Vec3f moved = m_camera->get_position() - position_before;
    return glm::dot(moved, moved) > kMotionEpsilon
        || glm::dot(target - target_before, target - target_before) > kMotionEpsilon;
}

void OrbitControls::dispose()
{
    m_camera = nullptr;
    m_delta_theta = 0.0f;
    m_delta_phi = 0.0f;
    m_pan_offset = Vec3f{0.0f};
    m_scale = 1.0f;
}

} // namespace latentsky::rendering
