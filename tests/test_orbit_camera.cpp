/// @file test_orbit_camera.cpp
/// @brief Unit tests for PerspectiveCamera and OrbitControls.

#include <doctest/doctest.h>

#include "rendering/orbit_camera.hpp"

#include <glm/geometric.hpp>

#include <cmath>

using namespace latentsky;
using namespace latentsky::rendering;

// =================================================================
// PerspectiveCamera
// =================================================================

TEST_CASE("Camera defaults")
{
    const PerspectiveCamera camera;
    CHECK(camera.get_position().z == doctest::Approx(-250.0f));
    CHECK(glm::length(camera.get_target()) == doctest::Approx(0.0f));
    CHECK(camera.get_fov_rad() == doctest::Approx(glm::radians(75.0f)));
}

TEST_CASE("Viewport updates the aspect ratio")
{
    PerspectiveCamera camera;
    camera.set_viewport(1600, 800);
    CHECK(camera.get_aspect() == doctest::Approx(2.0f));

    // Zero height is ignored
    camera.set_viewport(640, 0);
    CHECK(camera.get_aspect() == doctest::Approx(2.0f));
}

TEST_CASE("Projection uses Vulkan clip conventions")
{
    PerspectiveCamera camera;
    camera.set_viewport(1000, 1000);

    const Mat4f clip = camera.projection_matrix() * camera.view_matrix();

    SUBCASE("The target lands in the centre of the screen")
    {
        const Vec4f p = clip * Vec4f{0.0f, 0.0f, 0.0f, 1.0f};
        CHECK(p.x / p.w == doctest::Approx(0.0f));
        CHECK(p.y / p.w == doctest::Approx(0.0f));
        CHECK(p.z / p.w > 0.0f);
        CHECK(p.z / p.w < 1.0f);
    }

    SUBCASE("World +Y maps to clip -Y")
    {
        const Vec4f p = clip * Vec4f{0.0f, 10.0f, 0.0f, 1.0f};
        CHECK(p.y / p.w < 0.0f);
    }
}

// =================================================================
// OrbitControls
// =================================================================

TEST_CASE("Update without input leaves the camera in place")
{
    PerspectiveCamera camera;
    OrbitControls controls{camera};

    CHECK_FALSE(controls.update());
    CHECK(camera.get_position().z == doctest::Approx(-250.0f).epsilon(1e-4));
}

TEST_CASE("Dolly moves toward the target in one step")
{
    PerspectiveCamera camera;
    OrbitControls controls{camera};

    controls.dolly(1.0f);
    CHECK(controls.update());
    CHECK(glm::length(camera.get_position()) == doctest::Approx(250.0f * 0.95f));

    controls.dolly(-2.0f);
    controls.update();
    CHECK(glm::length(camera.get_position())
          == doctest::Approx(250.0f * 0.95f / (0.95f * 0.95f)));
}

TEST_CASE("Dolly respects the distance limits")
{
    PerspectiveCamera camera;
    OrbitControls controls{camera};

    controls.dolly(500.0f);
    controls.update();
    CHECK(glm::length(camera.get_position()) == doctest::Approx(OrbitControls::kMinDistance));
}

TEST_CASE("Rotation is damped over several frames")
{
    PerspectiveCamera camera;
    OrbitControls controls{camera};

    // A drag of half the viewport height is half a turn in total
    controls.rotate(400.0f, 0.0f, 800);

    CHECK(controls.update());
    const f32 first_step = std::atan2(camera.get_position().x, camera.get_position().z);

    controls.update();
    const f32 second_step = std::atan2(camera.get_position().x, camera.get_position().z);

    // Radius is preserved while orbiting
    CHECK(glm::length(camera.get_position()) == doctest::Approx(250.0f));

    // The first update applies a quarter of the pending angle, the next one less
    const f32 start = std::atan2(0.0f, -250.0f);
    const f32 delta1 = std::remainder(first_step - start, 2.0f * glm::pi<f32>());
    const f32 delta2 = std::remainder(second_step - first_step, 2.0f * glm::pi<f32>());
    CHECK(std::abs(delta1) == doctest::Approx(glm::pi<f32>() * 0.25f).epsilon(1e-3));
    CHECK(std::abs(delta2) == doctest::Approx(glm::pi<f32>() * 0.25f * 0.75f).epsilon(1e-3));

    for (int i = 0; i < 200; ++i)
    {
        controls.update();
    }
    CHECK_FALSE(controls.update());
}

TEST_CASE("Pan moves the target and the camera together")
{
    PerspectiveCamera camera;
    OrbitControls controls{camera};

    controls.pan(100.0f, 0.0f, 800);
    controls.update();

    CHECK(glm::length(camera.get_target()) > 0.0f);
    const Vec3f offset = camera.get_position() - camera.get_target();
    CHECK(glm::length(offset) == doctest::Approx(250.0f));
}

TEST_CASE("Disposed controls ignore input")
{
    PerspectiveCamera camera;
    OrbitControls controls{camera};

    controls.rotate(100.0f, 50.0f, 600);
    controls.dispose();
    CHECK(controls.is_disposed());

    controls.dolly(3.0f);
    CHECK_FALSE(controls.update());
    CHECK(camera.get_position().z == doctest::Approx(-250.0f));
}
