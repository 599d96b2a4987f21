/// @file stellar_physics.cpp
/// @brief Stellar attribute model implementation.

#include "astro/stellar_physics.hpp"

#include <glm/common.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace latentsky::astro
{

namespace
{

constexpr std::array<char, kSpectralClassCount> kClasses = {
    'O', 'B', 'A', 'F', 'G', 'K', 'M', 'D', 'N', 'C', 'R', 'P', 'S', 'W',
};

// Indexed like kClasses
constexpr std::array<TemperatureRange, kSpectralClassCount> kTemperatureRanges = {{
    {30000.0,  50000.0},    // O
    {10000.0,  30000.0},    // B
    { 7500.0,  10000.0},    // A
    { 6000.0,   7500.0},    // F
    { 5200.0,   6000.0},    // G
    { 3700.0,   5200.0},    // K
    { 2400.0,   3700.0},    // M
    { 4000.0, 100000.0},    // D  white dwarf
    { 2400.0,   3200.0},    // N  cool carbon star
    { 1600.0,   5300.0},    // C  carbon star
    { 3700.0,   5000.0},    // R  hot carbon star
    { 8000.0,  20000.0},    // P  planetary nebula
    { 1800.0,   4000.0},    // S
    {20000.0, 210000.0},    // W  Wolf-Rayet
}};

constexpr std::array<u32, kSpectralClassCount> kPalette = {
    0x8bd1ff,   // O  blue
    0xa7caff,   // B  blue-white
    0xdae9ff,   // A  white
    0xfff7e8,   // F  white-yellow
    0xffe9b5,   // G  yellow
    0xffcd89,   // K  orange
    0xffa77d,   // M  red
    0x696969,   // D  dark gray
    0xa52a2a,   // N  auburn
    0x800000,   // C  maroon
    0xcd5c5c,   // R  indian red
    0x7fffd4,   // P  aquamarine
    0xdaa520,   // S  goldenrod
    0x87cefa,   // W  light sky blue
};

constexpr int kDefaultSubtype = 5;

std::optional<int> parse_subtype(std::string_view spectral_type)
{
    if (spectral_type.size() < 2)
    {
        return std::nullopt;
    }
    const char c = spectral_type[1];
    if (c < '0' || c > '9')
    {
        return std::nullopt;
    }
    return c - '0';
}

char primary_class(std::string_view spectral_type)
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(spectral_type.front())));
}

bool warms_toward_yellow(char spectral_class)
{
    return spectral_class == 'K' || spectral_class == 'M'
        || spectral_class == 'F' || spectral_class == 'G';
}

} // anonymous namespace

// -----------------------------------------------------------------
// Class tables
// -----------------------------------------------------------------

const std::array<char, kSpectralClassCount>& spectral_classes()
{
    return kClasses;
}

std::optional<std::size_t> spectral_class_index(char spectral_class)
{
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(spectral_class)));
    const auto it = std::find(kClasses.begin(), kClasses.end(), upper);
    if (it == kClasses.end())
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - kClasses.begin());
}

std::optional<TemperatureRange> temperature_range(char spectral_class)
{
    const auto index = spectral_class_index(spectral_class);
    if (!index)
    {
        return std::nullopt;
    }
    return kTemperatureRanges[*index];
}

// -----------------------------------------------------------------
// Temperature: linear interpolation across the class range
// -----------------------------------------------------------------

f64 temperature(std::string_view spectral_type)
{
    if (spectral_type.empty())
    {
        return astro_constants::kSolarTemperature;
    }

    const auto range = temperature_range(primary_class(spectral_type));
    if (!range)
    {
        return astro_constants::kSolarTemperature;
    }

    const int subtype = parse_subtype(spectral_type).value_or(kDefaultSubtype);
    const f64 normalized = static_cast<f64>(subtype) / 9.0;
    return range->max_k - (range->max_k - range->min_k) * normalized;
}

// -----------------------------------------------------------------
// Luminosity from absolute magnitude (Pogson)
// -----------------------------------------------------------------

f64 luminosity(f64 absolute_magnitude)
{
    return astro_constants::kSolarLuminosity
         * std::pow(10.0, (astro_constants::kSolarAbsoluteMagnitude - absolute_magnitude) / 2.5);
}

// -----------------------------------------------------------------
// Radius: Stefan-Boltzmann inversion
// -----------------------------------------------------------------

f64 radius(f64 luminosity_watts, f64 temperature_kelvin)
{
    if (temperature_kelvin == 0.0)
    {
        return 0.0;
    }

    const f64 t4 = std::pow(temperature_kelvin, 4.0);
    const f64 radius_m = std::sqrt(
        luminosity_watts / (4.0 * astro_constants::kPi * astro_constants::kStefanBoltzmann * t4));
    return radius_m / astro_constants::kSolarRadius;
}

// -----------------------------------------------------------------
// Colour: palette lookup + subtype blend toward yellow or white
// -----------------------------------------------------------------

Vec3f base_color(char spectral_class)
{
    const auto index = spectral_class_index(spectral_class);
    if (!index)
    {
        return rgb_from_hex(kWhite);
    }
    return rgb_from_hex(kPalette[*index]);
}

Vec3f color(std::string_view spectral_type)
{
    if (spectral_type.empty())
    {
        return rgb_from_hex(kWhite);
    }

    const char spectral_class = primary_class(spectral_type);
    const Vec3f base = base_color(spectral_class);

    const auto subtype = parse_subtype(spectral_type);
    if (!subtype)
    {
        return base;
    }

    const Vec3f target = warms_toward_yellow(spectral_class)
                       ? rgb_from_hex(kYellowTarget)
                       : rgb_from_hex(kWhite);
    const f32 factor = static_cast<f32>(*subtype) / 9.0f;
    return glm::mix(base, target, factor);
}

f32 point_size(f64 radius_solar)
{
    const f32 scaled = static_cast<f32>(radius_solar) * kPointSizeScale;
    // std::max keeps the first argument when the comparison is false, so NaN maps to the floor
    return std::max(kMinPointSize, scaled);
}

} // namespace latentsky::astro
