/// @file test_blend.cpp
/// @brief Unit tests for the blend controller and the CPU mirror of the star shaders.

#include <doctest/doctest.h>

#include "rendering/blend_controller.hpp"
#include "rendering/blend_math.hpp"

using namespace latentsky;
using namespace latentsky::rendering;

// =================================================================
// BlendController
// =================================================================

TEST_CASE("Blend progress starts at 0 and is clamped")
{
    BlendController blend;
    CHECK(blend.get_progress() == 0.0f);

    blend.set_progress(0.4f);
    CHECK(blend.get_progress() == doctest::Approx(0.4f));

    blend.set_progress(1.5f);
    CHECK(blend.get_progress() == 1.0f);

    blend.set_progress(-0.2f);
    CHECK(blend.get_progress() == 0.0f);
}

// =================================================================
// Position blend
// =================================================================

TEST_CASE("Blended position interpolates galactic → latent")
{
    const Vec3f galactic{10.0f, 0.0f, -10.0f};
    const Vec3f latent{0.0f, 5.0f, 10.0f};

    const Vec3f at_start = blended_position(galactic, latent, 0.0f);
    CHECK(at_start.x == doctest::Approx(10.0f));
    CHECK(at_start.z == doctest::Approx(-10.0f));

    const Vec3f halfway = blended_position(galactic, latent, 0.5f);
    CHECK(halfway.x == doctest::Approx(5.0f));
    CHECK(halfway.y == doctest::Approx(2.5f));
    CHECK(halfway.z == doctest::Approx(0.0f));

    const Vec3f at_end = blended_position(galactic, latent, 1.0f);
    CHECK(at_end.y == doctest::Approx(5.0f));
    CHECK(at_end.z == doctest::Approx(10.0f));
}

// =================================================================
// Point size
// =================================================================

TEST_CASE("Point size converges to 1 and shrinks with distance")
{
    SUBCASE("Physical size at progress 0")
    {
        CHECK(blended_point_size(3.0f, 0.0f, -300.0f) == doctest::Approx(3.0f));
    }

    SUBCASE("Uniform size at progress 1")
    {
        CHECK(blended_point_size(3.0f, 1.0f, -300.0f) == doctest::Approx(1.0f));
        CHECK(blended_point_size(0.1f, 1.0f, -300.0f) == doctest::Approx(1.0f));
    }

    SUBCASE("Inverse distance scaling")
    {
        const f32 near = blended_point_size(2.0f, 0.0f, -100.0f);
        const f32 far = blended_point_size(2.0f, 0.0f, -200.0f);
        CHECK(near == doctest::Approx(6.0f));
        CHECK(far == doctest::Approx(near * 0.5f));
    }
}

// =================================================================
// Disc discard
// =================================================================

TEST_CASE("Fragments outside the inscribed disc are discarded")
{
    CHECK(disc_covers(Vec2f{0.5f, 0.5f}));
    CHECK(disc_covers(Vec2f{1.0f, 0.5f}));
    CHECK(disc_covers(Vec2f{0.5f, 0.0f}));
    CHECK_FALSE(disc_covers(Vec2f{0.0f, 0.0f}));
    CHECK_FALSE(disc_covers(Vec2f{0.9f, 0.9f}));
}
