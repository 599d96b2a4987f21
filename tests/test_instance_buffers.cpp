/// @file test_instance_buffers.cpp
/// @brief Unit tests for building the per-instance GPU arrays.

#include <doctest/doctest.h>

#include "astro/stellar_physics.hpp"
#include "catalog/catalog_loader.hpp"
#include "catalog/latent_star.hpp"
#include "rendering/instance_buffers.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace latentsky;
using namespace latentsky::rendering;

namespace
{

catalog::LatentStar make_star(Vec3f latent, Vec3f galactic, f32 abs_mag, std::string spect)
{
    catalog::LatentStar star;
    star.latent_position = latent;
    star.galactic_position = galactic;
    star.abs_magnitude = abs_mag;
    star.spectral_type = std::move(spect);
    return star;
}

} // anonymous namespace

// =================================================================
// Layout
// =================================================================

TEST_CASE("Empty input yields empty, consistent buffers")
{
    const auto buffers = build_instance_buffers({});
    CHECK(buffers.star_count() == 0);
    CHECK(buffers.colors.empty());
    CHECK(buffers.is_consistent());
    CHECK(buffers.bounding_radius() == 0.0f);
}

TEST_CASE("Arrays are index-aligned and interleaved by three")
{
    const std::vector<catalog::LatentStar> stars = {
        make_star({1.0f, 2.0f, 3.0f}, {10.0f, 20.0f, 30.0f}, 4.83f, "G2"),
        make_star({-1.0f, 0.0f, 0.5f}, {-4.0f, 5.0f, -6.0f}, 0.0f, "B0"),
        make_star({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, 10.0f, ""),
    };

    const auto buffers = build_instance_buffers(stars);

    REQUIRE(buffers.star_count() == 3);
    REQUIRE(buffers.is_consistent());

    SUBCASE("Latent positions are scaled by 5")
    {
        CHECK(buffers.latent_positions[0] == doctest::Approx(5.0f));
        CHECK(buffers.latent_positions[1] == doctest::Approx(10.0f));
        CHECK(buffers.latent_positions[2] == doctest::Approx(15.0f));
        CHECK(buffers.latent_positions[3] == doctest::Approx(-5.0f));
        CHECK(buffers.latent_positions[5] == doctest::Approx(2.5f));
    }

    SUBCASE("Galactic positions are copied unchanged")
    {
        CHECK(buffers.galactic_positions[3] == doctest::Approx(-4.0f));
        CHECK(buffers.galactic_positions[4] == doctest::Approx(5.0f));
        CHECK(buffers.galactic_positions[5] == doctest::Approx(-6.0f));
    }

    SUBCASE("Colours follow the spectral type")
    {
        const Vec3f b0 = astro::color("B0");
        CHECK(buffers.colors[3] == doctest::Approx(b0.r));
        CHECK(buffers.colors[4] == doctest::Approx(b0.g));
        CHECK(buffers.colors[5] == doctest::Approx(b0.b));

        // Empty type is white
        CHECK(buffers.colors[6] == doctest::Approx(1.0f));
        CHECK(buffers.colors[7] == doctest::Approx(1.0f));
        CHECK(buffers.colors[8] == doctest::Approx(1.0f));
    }

    SUBCASE("Sizes respect the 0.1 floor")
    {
        for (const f32 size : buffers.sizes)
        {
            CHECK(size >= 0.1f);
        }
        // A Sun-like star is about one solar radius
        CHECK(buffers.sizes[0] == doctest::Approx(0.1f));
    }
}

TEST_CASE("Latent scale is configurable")
{
    const std::vector<catalog::LatentStar> stars = {
        make_star({1.0f, -2.0f, 0.5f}, {0.0f, 0.0f, 0.0f}, 5.0f, "K0"),
    };

    const auto buffers = build_instance_buffers(stars, 2.0f);
    CHECK(buffers.latent_positions[0] == doctest::Approx(2.0f));
    CHECK(buffers.latent_positions[1] == doctest::Approx(-4.0f));
    CHECK(buffers.latent_positions[2] == doctest::Approx(1.0f));
}

TEST_CASE("Bright giants get large points")
{
    // M = -5 → L = 10^3.932 L_sun; at G2 temperature the radius is ~91 R_sun
    const std::vector<catalog::LatentStar> stars = {
        make_star({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, -5.0f, "G2"),
    };

    const auto buffers = build_instance_buffers(stars);
    const f64 expected_radius = astro::radius(astro::luminosity(-5.0), astro::temperature("G2"));
    CHECK(buffers.sizes[0] == doctest::Approx(static_cast<f32>(expected_radius) * 0.1f));
    CHECK(buffers.sizes[0] > 5.0f);
}

TEST_CASE("NaN rows flow through without breaking the layout")
{
    const f32 nan = std::numeric_limits<f32>::quiet_NaN();
    const std::vector<catalog::LatentStar> stars = {
        make_star({nan, 1.0f, 1.0f}, {2.0f, nan, 2.0f}, nan, "A0"),
        make_star({3.0f, 4.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, 5.0f, "A0"),
    };

    const auto buffers = build_instance_buffers(stars);

    REQUIRE(buffers.is_consistent());
    CHECK(std::isnan(buffers.latent_positions[0]));
    CHECK(buffers.sizes[0] == doctest::Approx(0.1f));
    // Latent (15, 20, 0) dominates; the NaN row is ignored
    CHECK(buffers.bounding_radius() == doctest::Approx(25.0f));
}

TEST_CASE("Two-row table from text to buffers")
{
    const auto stars = catalog::CatalogLoader::parse_latent_csv(
        "id,latent_x,latent_y,latent_z,x,y,z,absmag,spect\n"
        "1,0.2,0.4,0.6,100,0,0,4.83,G2\n"
        "2,-0.2,-0.4,-0.6,0,-100,0,-2,O5\n");

    REQUIRE(stars.size() == 2);

    const auto buffers = build_instance_buffers(stars);

    REQUIRE(buffers.star_count() == 2);
    CHECK(buffers.latent_positions[0] == doctest::Approx(1.0f));
    CHECK(buffers.latent_positions[4] == doctest::Approx(-2.0f));
    CHECK(buffers.galactic_positions[4] == doctest::Approx(-100.0f));
    CHECK(buffers.bounding_radius() == doctest::Approx(100.0f));

    const Vec3f o5 = astro::color("O5");
    CHECK(buffers.colors[3] == doctest::Approx(o5.r));
    CHECK(buffers.colors[5] == doctest::Approx(o5.b));
}
