/// @file test_catalog_loader.cpp
/// @brief Unit tests for latentsky::catalog::CatalogLoader.
///
/// Covers gzip decoding, CSV parsing, permissive numeric handling and
/// per-class centroids.

#include <doctest/doctest.h>

#include "catalog/catalog_loader.hpp"
#include "catalog/latent_star.hpp"
#include "core/types.hpp"

#include <zlib.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

using namespace latentsky;
using namespace latentsky::catalog;

// =================================================================
// Helper: temporary data files (plain or gzip-compressed)
// =================================================================

namespace
{

class TempDataFile
{
public:
    TempDataFile(const std::string& filename, const std::string& content, bool compress)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        if (compress)
        {
            gzFile file = gzopen(m_path.string().c_str(), "wb");
            REQUIRE(file != nullptr);
            const int written = gzwrite(file, content.data(), static_cast<unsigned>(content.size()));
            REQUIRE(written == static_cast<int>(content.size()));
            REQUIRE(gzclose(file) == Z_OK);
        }
        else
        {
            std::ofstream file(m_path, std::ios::binary);
            file << content;
        }
    }

    ~TempDataFile()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempDataFile(const TempDataFile&) = delete;
    TempDataFile& operator=(const TempDataFile&) = delete;

private:
    std::filesystem::path m_path;
};

const std::string kHeader = "id,latent_x,latent_y,latent_z,x,y,z,absmag,spect\n";

} // anonymous namespace

// =================================================================
// Loading from disk
// =================================================================

TEST_CASE("Load gzip-compressed table")
{
    const TempDataFile gz("lsky_test_stars.csv.gz",
        kHeader +
        "1,0.1,0.2,0.3,10,20,30,4.83,G2\n"
        "2,-1,0,1,-5,0,5,-0.17,B0\n",
        true);

    const auto result = CatalogLoader::load_latent_csv_gz(gz.path());

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);

    const auto& first = (*result)[0];
    CHECK(first.id == 1);
    CHECK(first.latent_position.x == doctest::Approx(0.1f));
    CHECK(first.latent_position.y == doctest::Approx(0.2f));
    CHECK(first.latent_position.z == doctest::Approx(0.3f));
    CHECK(first.galactic_position.x == doctest::Approx(10.0f));
    CHECK(first.galactic_position.z == doctest::Approx(30.0f));
    CHECK(first.abs_magnitude == doctest::Approx(4.83f));
    CHECK(first.spectral_type == "G2");

    const auto& second = (*result)[1];
    CHECK(second.id == 2);
    CHECK(second.latent_position.x == doctest::Approx(-1.0f));
    CHECK(second.spectral_type == "B0");
}

TEST_CASE("Uncompressed table is read transparently")
{
    const TempDataFile csv("lsky_test_plain.csv",
        kHeader + "7,1,2,3,4,5,6,1.5,K3\n",
        false);

    const auto result = CatalogLoader::load_latent_csv_gz(csv.path());

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    CHECK((*result)[0].id == 7);
    CHECK((*result)[0].spectral_type == "K3");
}

TEST_CASE("Missing file fails the load")
{
    const auto result = CatalogLoader::load_latent_csv_gz(
        std::filesystem::temp_directory_path() / "lsky_no_such_file.csv.gz");
    CHECK_FALSE(result.has_value());
}

TEST_CASE("Truncated gzip stream fails the load")
{
    std::string content = kHeader;
    for (int i = 0; i < 200; ++i)
    {
        content += std::to_string(i) + ",0.5,0.25,0.125,1,2,3,4.0,F" + std::to_string(i % 10) + "\n";
    }

    const TempDataFile gz("lsky_test_truncated.csv.gz", content, true);
    const auto full_size = std::filesystem::file_size(gz.path());
    REQUIRE(full_size > 32);
    std::filesystem::resize_file(gz.path(), full_size / 2);

    const auto result = CatalogLoader::load_latent_csv_gz(gz.path());
    CHECK_FALSE(result.has_value());
}

// =================================================================
// Parsing
// =================================================================

TEST_CASE("Header only or empty text yields no stars")
{
    CHECK(CatalogLoader::parse_latent_csv("").empty());
    CHECK(CatalogLoader::parse_latent_csv(kHeader).empty());
}

TEST_CASE("Blank lines and CRLF endings are tolerated")
{
    const auto stars = CatalogLoader::parse_latent_csv(
        "id,latent_x,latent_y,latent_z,x,y,z,absmag,spect\r\n"
        "1,0,0,0,1,1,1,5,M2\r\n"
        "\r\n"
        "2,0,0,0,2,2,2,6,M3\r\n");

    REQUIRE(stars.size() == 2);
    CHECK(stars[0].spectral_type == "M2");
    CHECK(stars[1].id == 2);
}

TEST_CASE("Unparsable numbers become NaN and the row is kept")
{
    const auto stars = CatalogLoader::parse_latent_csv(
        kHeader +
        "abc,nope,0.5,,1,2,3,bright,A0\n"
        "3,1,1,1,1,1,1,1,\n");

    REQUIRE(stars.size() == 2);

    const auto& bad = stars[0];
    CHECK(bad.id == 0);
    CHECK(std::isnan(bad.latent_position.x));
    CHECK(bad.latent_position.y == doctest::Approx(0.5f));
    CHECK(std::isnan(bad.latent_position.z));
    CHECK(std::isnan(bad.abs_magnitude));
    CHECK(bad.spectral_type == "A0");
    CHECK_FALSE(bad.is_finite());

    CHECK(stars[1].is_finite());
    CHECK(stars[1].spectral_type.empty());
}

TEST_CASE("Missing trailing fields are treated as unparsable")
{
    const LatentStar star = CatalogLoader::parse_line("9,1,2");
    CHECK(star.id == 9);
    CHECK(star.latent_position.y == doctest::Approx(2.0f));
    CHECK(std::isnan(star.latent_position.z));
    CHECK(std::isnan(star.galactic_position.x));
    CHECK(star.spectral_type.empty());
}

TEST_CASE("Leading numbers are accepted with trailing text")
{
    const LatentStar star = CatalogLoader::parse_line("12, 1.5 ,+2,3e1,4,5,6,7.25mag,G8V");
    CHECK(star.id == 12);
    CHECK(star.latent_position.x == doctest::Approx(1.5f));
    CHECK(star.latent_position.y == doctest::Approx(2.0f));
    CHECK(star.latent_position.z == doctest::Approx(30.0f));
    CHECK(star.abs_magnitude == doctest::Approx(7.25f));
    CHECK(star.spectral_type == "G8V");
}

// =================================================================
// Class centroids
// =================================================================

TEST_CASE("Class centroids average latent x/y per primary class")
{
    const auto stars = CatalogLoader::parse_latent_csv(
        kHeader +
        "1,1,2,9,0,0,0,5,G2\n"
        "2,3,4,9,0,0,0,5,g5\n"
        "3,-1,-1,0,0,0,0,5,M0\n"
        "4,nan,1,0,0,0,0,5,M1\n"
        "5,100,100,0,0,0,0,5,X1\n"
        "6,100,100,0,0,0,0,5,\n");

    const auto centroids = compute_class_centroids(stars);

    REQUIRE(centroids.size() == 2);
    REQUIRE(centroids.count('G') == 1);
    CHECK(centroids.at('G').x == doctest::Approx(1.0f));
    CHECK(centroids.at('G').y == doctest::Approx(2.0f));

    REQUIRE(centroids.count('M') == 1);
    CHECK(centroids.at('M').x == doctest::Approx(-1.0f));
    CHECK(centroids.at('M').y == doctest::Approx(-1.0f));
}

TEST_CASE("Class centroids match the class letter case-sensitively")
{
    const auto stars = CatalogLoader::parse_latent_csv(
        kHeader +
        "1,4,4,9,0,0,0,5,k3\n"
        "2,2,6,9,0,0,0,5,K0\n"
        "3,8,8,9,0,0,0,5,o9\n");

    const auto centroids = compute_class_centroids(stars);

    REQUIRE(centroids.size() == 1);
    CHECK(centroids.count('k') == 0);
    CHECK(centroids.count('O') == 0);
    REQUIRE(centroids.count('K') == 1);
    CHECK(centroids.at('K').x == doctest::Approx(2.0f));
    CHECK(centroids.at('K').y == doctest::Approx(6.0f));
}
