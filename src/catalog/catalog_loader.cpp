/// @file catalog_loader.cpp
/// @brief Implementation of the gzip CSV latent star loader.

#include "catalog/catalog_loader.hpp"

#include "astro/stellar_physics.hpp"
#include "core/logger.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>

namespace latentsky::catalog
{

namespace
{

constexpr std::size_t kFieldCount = 9;
constexpr std::size_t kReadChunkSize = 64 * 1024;

struct GzFileCloser
{
    void operator()(gzFile_s* file) const
    {
        if (file != nullptr)
        {
            gzclose(file);
        }
    }
};

using GzFilePtr = std::unique_ptr<gzFile_s, GzFileCloser>;

} // anonymous namespace

bool LatentStar::is_finite() const
{
    return std::isfinite(latent_position.x) && std::isfinite(latent_position.y)
        && std::isfinite(latent_position.z) && std::isfinite(galactic_position.x)
        && std::isfinite(galactic_position.y) && std::isfinite(galactic_position.z)
        && std::isfinite(abs_magnitude);
}

// -----------------------------------------------------------------
// Load: decompress, then parse
// -----------------------------------------------------------------

std::optional<std::vector<LatentStar>>
CatalogLoader::load_latent_csv_gz(const std::filesystem::path& path)
{
    const auto text = read_gzip_text(path);
    if (!text.has_value())
    {
        LSKY_CORE_ERROR("CatalogLoader: Could not load and decompress star data from {}", path.string());
        return std::nullopt;
    }

    auto stars = parse_latent_csv(*text);

    LSKY_CORE_INFO("CatalogLoader: Loaded {} stars from {} ({} bytes decoded)",
                   stars.size(), path.string(), text->size());

    return stars;
}

// -----------------------------------------------------------------
// zlib stream → std::string
// -----------------------------------------------------------------

std::optional<std::string> CatalogLoader::read_gzip_text(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        LSKY_CORE_ERROR("CatalogLoader: File not found: {}", path.string());
        return std::nullopt;
    }

    GzFilePtr file{gzopen(path.string().c_str(), "rb")};
    if (!file)
    {
        LSKY_CORE_ERROR("CatalogLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string text;
    std::array<char, kReadChunkSize> chunk{};

    while (true)
    {
        const int read = gzread(file.get(), chunk.data(), static_cast<unsigned>(chunk.size()));
        if (read < 0)
        {
            int errnum = Z_OK;
            const char* message = gzerror(file.get(), &errnum);
            LSKY_CORE_ERROR("CatalogLoader: Decompression failed for {}: {} (zlib {})",
                            path.string(), message, errnum);
            return std::nullopt;
        }
        if (read == 0)
        {
            break;
        }
        text.append(chunk.data(), static_cast<std::size_t>(read));
    }

    // A truncated gzip member reads as EOF but leaves Z_BUF_ERROR behind
    int errnum = Z_OK;
    const char* message = gzerror(file.get(), &errnum);
    if (errnum != Z_OK && errnum != Z_STREAM_END)
    {
        LSKY_CORE_ERROR("CatalogLoader: Corrupt gzip stream in {}: {} (zlib {})",
                        path.string(), message, errnum);
        return std::nullopt;
    }

    return text;
}

// -----------------------------------------------------------------
// CSV text → records
// -----------------------------------------------------------------

std::vector<LatentStar> CatalogLoader::parse_latent_csv(std::string_view text)
{
    std::vector<LatentStar> stars;

    text = trim(text);
    if (text.empty())
    {
        return stars;
    }

    // Skip header line
    std::size_t pos = text.find('\n');
    if (pos == std::string_view::npos)
    {
        return stars;
    }
    ++pos;

    u32 non_finite_rows = 0;

    while (pos < text.size())
    {
        std::size_t end = text.find('\n', pos);
        if (end == std::string_view::npos)
        {
            end = text.size();
        }

        const std::string_view line = trim(text.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty())
        {
            continue;
        }

        LatentStar star = parse_line(line);
        if (!star.is_finite())
        {
            ++non_finite_rows;
        }
        stars.push_back(std::move(star));
    }

    if (non_finite_rows > 0)
    {
        LSKY_CORE_WARN("CatalogLoader: {} of {} rows contain non-numeric fields (kept as NaN)",
                       non_finite_rows, stars.size());
    }

    return stars;
}

LatentStar CatalogLoader::parse_line(std::string_view line)
{
    std::array<std::string_view, kFieldCount> fields{};

    std::size_t field = 0;
    std::size_t start = 0;
    while (field < kFieldCount && start <= line.size())
    {
        std::size_t comma = line.find(',', start);
        if (comma == std::string_view::npos)
        {
            comma = line.size();
        }
        fields[field++] = line.substr(start, comma - start);
        start = comma + 1;
    }

    LatentStar star;
    star.id = parse_i64_or_zero(fields[0]);
    star.latent_position = Vec3f{
        parse_f32_or_nan(fields[1]),
        parse_f32_or_nan(fields[2]),
        parse_f32_or_nan(fields[3]),
    };
    star.galactic_position = Vec3f{
        parse_f32_or_nan(fields[4]),
        parse_f32_or_nan(fields[5]),
        parse_f32_or_nan(fields[6]),
    };
    star.abs_magnitude = parse_f32_or_nan(fields[7]);
    star.spectral_type = std::string{trim(fields[8])};
    return star;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view CatalogLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r' || sv.front() == '\n'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: permissive numeric parsing (leading number, rest ignored)
// -----------------------------------------------------------------

f32 CatalogLoader::parse_f32_or_nan(std::string_view sv)
{
    sv = trim(sv);
    if (!sv.empty() && sv.front() == '+')
    {
        sv.remove_prefix(1);
    }
    if (sv.empty())
    {
        return std::numeric_limits<f32>::quiet_NaN();
    }

    f32 value = 0.0f;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc::result_out_of_range)
    {
        // from_chars leaves value untouched here; strtof yields +-HUGE_VALF or 0
        const std::string copy{sv.substr(0, static_cast<std::size_t>(ptr - sv.data()))};
        return std::strtof(copy.c_str(), nullptr);
    }
    if (ec != std::errc{})
    {
        return std::numeric_limits<f32>::quiet_NaN();
    }

    return value;
}

i64 CatalogLoader::parse_i64_or_zero(std::string_view sv)
{
    sv = trim(sv);
    if (!sv.empty() && sv.front() == '+')
    {
        sv.remove_prefix(1);
    }

    i64 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{})
    {
        return 0;
    }

    return value;
}

// -----------------------------------------------------------------
// Per-class latent centroids
// -----------------------------------------------------------------

std::map<char, Vec2f> compute_class_centroids(std::span<const LatentStar> stars)
{
    struct Accumulator
    {
        f64 x = 0.0;
        f64 y = 0.0;
        u64 count = 0;
    };

    std::array<Accumulator, astro::kSpectralClassCount> sums{};
    const auto& classes = astro::spectral_classes();

    for (const auto& star : stars)
    {
        if (star.spectral_type.empty())
        {
            continue;
        }
        // Exact letter match: a lower-case "g5" is not a G star here
        const auto it = std::find(classes.begin(), classes.end(), star.spectral_type.front());
        if (it == classes.end())
        {
            continue;
        }
        if (!std::isfinite(star.latent_position.x) || !std::isfinite(star.latent_position.y))
        {
            continue;
        }

        auto& acc = sums[static_cast<std::size_t>(it - classes.begin())];
        acc.x += star.latent_position.x;
        acc.y += star.latent_position.y;
        ++acc.count;
    }

    std::map<char, Vec2f> centroids;
    for (std::size_t i = 0; i < classes.size(); ++i)
    {
        if (sums[i].count == 0)
        {
            continue;
        }
        const f64 n = static_cast<f64>(sums[i].count);
        centroids.emplace(classes[i], Vec2f{static_cast<f32>(sums[i].x / n),
                                            static_cast<f32>(sums[i].y / n)});
    }

    return centroids;
}

} // namespace latentsky::catalog
