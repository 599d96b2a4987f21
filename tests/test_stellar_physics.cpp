/// @file test_stellar_physics.cpp
/// @brief Unit tests for latentsky::astro stellar attribute functions.

#include <doctest/doctest.h>

#include "astro/stellar_physics.hpp"
#include "core/types.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace latentsky;
using namespace latentsky::astro;

namespace
{

void check_rgb(const Vec3f& actual, const Vec3f& expected)
{
    CHECK(actual.r == doctest::Approx(expected.r).epsilon(1e-5));
    CHECK(actual.g == doctest::Approx(expected.g).epsilon(1e-5));
    CHECK(actual.b == doctest::Approx(expected.b).epsilon(1e-5));
}

} // anonymous namespace

// =================================================================
// Class tables
// =================================================================

TEST_CASE("Spectral class ordering and lookup")
{
    const auto& classes = spectral_classes();
    CHECK(classes.front() == 'O');
    CHECK(classes.back() == 'W');

    CHECK(spectral_class_index('O') == 0u);
    CHECK(spectral_class_index('g') == 4u);
    CHECK(spectral_class_index('W') == 13u);
    CHECK_FALSE(spectral_class_index('X').has_value());
    CHECK_FALSE(temperature_range('Q').has_value());

    const auto m_range = temperature_range('M');
    REQUIRE(m_range.has_value());
    CHECK(m_range->min_k == doctest::Approx(2400.0));
    CHECK(m_range->max_k == doctest::Approx(3700.0));
}

// =================================================================
// Temperature
// =================================================================

TEST_CASE("Temperature interpolates across the class range")
{
    CHECK(temperature("G2") == doctest::Approx(6000.0 - 800.0 * 2.0 / 9.0));
    CHECK(temperature("O0") == doctest::Approx(50000.0));
    CHECK(temperature("M9") == doctest::Approx(2400.0));
}

TEST_CASE("Temperature defaults")
{
    SUBCASE("Empty type is solar")
    {
        CHECK(temperature("") == doctest::Approx(5778.0));
    }

    SUBCASE("Unknown class is solar")
    {
        CHECK(temperature("X5") == doctest::Approx(5778.0));
    }

    SUBCASE("Missing subtype uses 5")
    {
        CHECK(temperature("K") == doctest::Approx(5200.0 - 1500.0 * 5.0 / 9.0));
        CHECK(temperature("KIII") == doctest::Approx(temperature("K5")));
    }

    SUBCASE("Class letter is case-insensitive")
    {
        CHECK(temperature("g2") == doctest::Approx(temperature("G2")));
    }
}

// =================================================================
// Luminosity and radius
// =================================================================

TEST_CASE("Luminosity follows the magnitude scale")
{
    CHECK(luminosity(4.83) == doctest::Approx(astro_constants::kSolarLuminosity));
    CHECK(luminosity(4.83 - 5.0) == doctest::Approx(100.0 * astro_constants::kSolarLuminosity));
    CHECK(luminosity(4.83 + 2.5) == doctest::Approx(0.1 * astro_constants::kSolarLuminosity));
}

TEST_CASE("Radius from Stefan-Boltzmann")
{
    SUBCASE("The Sun is about one solar radius")
    {
        const f64 r = radius(astro_constants::kSolarLuminosity, 5778.0);
        CHECK(r == doctest::Approx(0.9979).epsilon(1e-3));
    }

    SUBCASE("Radius scales with sqrt(L)")
    {
        const f64 r1 = radius(astro_constants::kSolarLuminosity, 5778.0);
        const f64 r4 = radius(4.0 * astro_constants::kSolarLuminosity, 5778.0);
        CHECK(r4 == doctest::Approx(2.0 * r1));
    }

    SUBCASE("Zero temperature yields zero")
    {
        CHECK(radius(astro_constants::kSolarLuminosity, 0.0) == 0.0);
    }
}

// =================================================================
// Point size
// =================================================================

TEST_CASE("Point size is radius / 10 with a floor")
{
    CHECK(point_size(50.0) == doctest::Approx(5.0f));
    CHECK(point_size(0.5) == doctest::Approx(0.1f));
    CHECK(point_size(1.0) == doctest::Approx(0.1f));
    CHECK(point_size(std::numeric_limits<f64>::quiet_NaN()) == doctest::Approx(0.1f));
}

// =================================================================
// Colour
// =================================================================

TEST_CASE("Colour palette and subtype blending")
{
    SUBCASE("Empty type is white")
    {
        check_rgb(color(""), Vec3f{1.0f});
    }

    SUBCASE("No subtype returns the base colour")
    {
        check_rgb(color("G"), rgb_from_hex(0xffe9b5));
        check_rgb(color("O"), rgb_from_hex(0x8bd1ff));
    }

    SUBCASE("Subtype 0 is the base colour")
    {
        check_rgb(color("B0"), base_color('B'));
    }

    SUBCASE("Cool classes warm toward yellow")
    {
        check_rgb(color("M9"), rgb_from_hex(kYellowTarget));
    }

    SUBCASE("Hot classes fade toward white")
    {
        check_rgb(color("B9"), Vec3f{1.0f});
    }

    SUBCASE("Unknown class is white at any subtype")
    {
        check_rgb(color("Z3"), Vec3f{1.0f});
    }

    SUBCASE("Components stay in [0, 1]")
    {
        for (char c : spectral_classes())
        {
            const Vec3f rgb = color(std::string{c, '4'});
            CHECK(rgb.r >= 0.0f);
            CHECK(rgb.r <= 1.0f);
            CHECK(rgb.g >= 0.0f);
            CHECK(rgb.g <= 1.0f);
            CHECK(rgb.b >= 0.0f);
            CHECK(rgb.b <= 1.0f);
        }
    }
}

TEST_CASE("rgb_from_hex")
{
    check_rgb(rgb_from_hex(0xff0000), Vec3f{1.0f, 0.0f, 0.0f});
    check_rgb(rgb_from_hex(0x000000), Vec3f{0.0f});
    check_rgb(rgb_from_hex(0x808080), Vec3f{128.0f / 255.0f});
}

TEST_CASE("Mid subtype lies between the class extremes")
{
    for (char c : spectral_classes())
    {
        const f64 hot = temperature(std::string{c, '0'});
        const f64 mid = temperature(std::string{c, '5'});
        const f64 cool = temperature(std::string{c, '9'});
        CHECK(mid <= hot);
        CHECK(mid >= cool);

        const auto range = temperature_range(c);
        REQUIRE(range.has_value());
        CHECK(hot == doctest::Approx(range->max_k));
        CHECK(cool == doctest::Approx(range->min_k));
    }

    CHECK(temperature("Z9") == doctest::Approx(5778.0));
}

TEST_CASE("G2 sits 2/9 of the way from the G base colour to yellow")
{
    const Vec3f base = base_color('G');
    const Vec3f yellow = rgb_from_hex(kYellowTarget);
    const Vec3f expected = base + (yellow - base) * (2.0f / 9.0f);
    check_rgb(color("G2"), expected);
}
