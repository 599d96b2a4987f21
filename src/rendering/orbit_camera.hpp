#pragma once

/// @file orbit_camera.hpp
/// @brief Perspective camera and damped orbit/pan/zoom controls around a target.

#include "core/types.hpp"

#include <glm/trigonometric.hpp>

namespace latentsky::rendering
{
    /// @brief Perspective camera defined by position, look-at target and vertical FOV.
    ///
    /// Projection matrices use Vulkan conventions (depth in [0, 1], +Y down in clip space).
    class PerspectiveCamera
    {
    public:
        /// @brief Default: 75° FOV, near 0.1, far 4444, at (0, 0, -250) looking at the origin.
        PerspectiveCamera();

        void set_position(const Vec3f& position);
        void look_at(const Vec3f& target);

        /// @brief Update aspect ratio from a viewport size. Zero height is ignored.
        void set_viewport(u32 width, u32 height);

        [[nodiscard]] const Vec3f& get_position() const { return m_position; }
        [[nodiscard]] const Vec3f& get_target() const { return m_target; }
        [[nodiscard]] f32 get_fov_rad() const { return m_fov_rad; }
        [[nodiscard]] f32 get_aspect() const { return m_aspect; }

        [[nodiscard]] Mat4f view_matrix() const;
        [[nodiscard]] Mat4f projection_matrix() const;

        static constexpr f32 kDefaultFovRad = 1.30899694f;   ///< 75 degrees
        static constexpr f32 kNear = 0.1f;
        static constexpr f32 kFar = 4444.0f;
        static inline const Vec3f kDefaultPosition{0.0f, 0.0f, -250.0f};

    private:
        Vec3f m_position{kDefaultPosition};
        Vec3f m_target{0.0f};
        Vec3f m_up{0.0f, 1.0f, 0.0f};
        f32 m_fov_rad = kDefaultFovRad;
        f32 m_aspect = 16.0f / 9.0f;
    };

    /// @brief Damped orbit controls: rotate around the target, pan in screen space, dolly.
    ///
    /// Input deltas accumulate until update(), which applies a fraction
    /// (damping_factor) of the pending motion and decays the remainder, so
    /// motion eases out over several frames.
    class OrbitControls
    {
    public:
        /// @brief Attach to a camera. The camera must outlive the controls or dispose() must be called.
        explicit OrbitControls(PerspectiveCamera& camera);

        /// @brief Mouse drag in pixels → orbit. Full viewport height = one full turn.
        void rotate(f32 dx_pixels, f32 dy_pixels, u32 viewport_height);

        /// @brief Mouse drag in pixels → pan parallel to the screen plane.
        void pan(f32 dx_pixels, f32 dy_pixels, u32 viewport_height);

        /// @brief Scroll steps → dolly. Positive = towards the target.
        void dolly(f32 scroll_steps);

        /// @brief Apply damped motion to the camera. Call once per frame.
        /// @return True if the camera moved.
        bool update();

        /// @brief Detach from the camera; later calls are no-ops.
        void dispose();

        [[nodiscard]] bool is_disposed() const { return m_camera == nullptr; }

        void set_damping_factor(f32 factor) { m_damping_factor = factor; }
        [[nodiscard]] f32 get_damping_factor() const { return m_damping_factor; }

        static constexpr f32 kDefaultDampingFactor = 0.25f;
        static constexpr f32 kZoomStep = 0.95f;
        static constexpr f32 kMinDistance = 1.0f;
        static constexpr f32 kMaxDistance = 4000.0f;

    private:
        PerspectiveCamera* m_camera = nullptr;

        f32 m_damping_factor = kDefaultDampingFactor;

        // Pending motion (consumed by update())
        f32 m_delta_theta = 0.0f;   ///< Azimuth around +Y (radians)
        f32 m_delta_phi = 0.0f;     ///< Polar angle from +Y (radians)
        f32 m_scale = 1.0f;         ///< Distance multiplier
        Vec3f m_pan_offset{0.0f};

        static constexpr f32 kPhiEpsilon = 1e-6f;
        static constexpr f32 kMotionEpsilon = 1e-6f;
    };

} // namespace latentsky::rendering
