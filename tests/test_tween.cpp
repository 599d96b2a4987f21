/// @file test_tween.cpp
/// @brief Unit tests for easing curves and the delayed progress tween.

#include <doctest/doctest.h>

#include "animation/tween.hpp"
#include "rendering/blend_controller.hpp"

using namespace latentsky;
using namespace latentsky::animation;

// =================================================================
// Easing
// =================================================================

TEST_CASE("Easing curves hit their endpoints and midpoint")
{
    for (const Easing easing : {Easing::Linear, Easing::Power1InOut, Easing::Power2InOut})
    {
        CHECK(ease(easing, 0.0) == doctest::Approx(0.0));
        CHECK(ease(easing, 0.5) == doctest::Approx(0.5));
        CHECK(ease(easing, 1.0) == doctest::Approx(1.0));
    }
}

TEST_CASE("Power curves are slow at the edges")
{
    CHECK(ease(Easing::Power1InOut, 0.25) == doctest::Approx(0.125));
    CHECK(ease(Easing::Power2InOut, 0.25) == doctest::Approx(0.0625));
    CHECK(ease(Easing::Power2InOut, 0.75) == doctest::Approx(0.9375));
}

TEST_CASE("Easing input is clamped")
{
    CHECK(ease(Easing::Power2InOut, -1.0) == doctest::Approx(0.0));
    CHECK(ease(Easing::Linear, 2.0) == doctest::Approx(1.0));
}

TEST_CASE("parse_easing")
{
    CHECK(parse_easing("power2.inOut") == Easing::Power2InOut);
    CHECK(parse_easing("power1.inOut") == Easing::Power1InOut);
    CHECK(parse_easing("none") == Easing::Linear);
    CHECK(parse_easing("linear") == Easing::Linear);
    CHECK_FALSE(parse_easing("bounce").has_value());
}

// =================================================================
// ProgressTween
// =================================================================

TEST_CASE("Default tween: 5 s delay then 5 s power2 ramp to 1")
{
    rendering::BlendController blend;
    ProgressTween tween{blend, TweenConfig{}};

    SUBCASE("Nothing happens during the delay")
    {
        tween.advance(4.9);
        CHECK_FALSE(tween.is_started());
        CHECK(blend.get_progress() == 0.0f);
    }

    SUBCASE("Halfway through the ramp the value is 0.5")
    {
        tween.advance(5.0);
        tween.advance(2.5);
        CHECK(tween.is_started());
        CHECK(blend.get_progress() == doctest::Approx(0.5f));
    }

    SUBCASE("The tween snaps to the target and stops")
    {
        tween.advance(5.0);
        tween.advance(4.0);
        CHECK_FALSE(tween.is_finished());
        tween.advance(1.5);
        CHECK(tween.is_finished());
        CHECK(blend.get_progress() == 1.0f);

        blend.set_progress(0.3f);
        tween.advance(1.0);
        CHECK(blend.get_progress() == doctest::Approx(0.3f));
    }
}

TEST_CASE("Start value is sampled when the delay expires")
{
    rendering::BlendController blend;
    ProgressTween tween{blend, TweenConfig{.to = 1.0f, .duration_sec = 2.0, .delay_sec = 1.0,
                                           .easing = Easing::Linear}};

    tween.advance(0.5);
    blend.set_progress(0.5f);

    tween.advance(0.5);     // delay ends, start = 0.5
    CHECK(blend.get_progress() == doctest::Approx(0.5f));

    tween.advance(1.0);     // halfway
    CHECK(blend.get_progress() == doctest::Approx(0.75f));
}

TEST_CASE("Zero duration jumps straight to the target")
{
    rendering::BlendController blend;
    ProgressTween tween{blend, TweenConfig{.to = 0.8f, .duration_sec = 0.0, .delay_sec = 0.0}};

    tween.advance(0.016);
    CHECK(tween.is_finished());
    CHECK(blend.get_progress() == doctest::Approx(0.8f));
}

TEST_CASE("Non-positive time steps are ignored")
{
    rendering::BlendController blend;
    ProgressTween tween{blend, TweenConfig{.delay_sec = 0.0}};

    tween.advance(0.0);
    tween.advance(-1.0);
    CHECK(tween.get_elapsed() == 0.0);
    CHECK_FALSE(tween.is_started());
}
