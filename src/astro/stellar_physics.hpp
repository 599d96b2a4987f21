#pragma once

/// @file stellar_physics.hpp
/// @brief Spectral type → temperature/colour, magnitude → luminosity, Stefan-Boltzmann radius.
///
/// All functions are pure and never fail: missing or unknown spectral types
/// fall back to solar temperature and white.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace latentsky::astro
{
    /// @brief Temperature range for one primary spectral class.
    struct TemperatureRange
    {
        f64 min_k;
        f64 max_k;
    };

    /// @brief Number of primary spectral classes in the lookup tables.
    inline constexpr std::size_t kSpectralClassCount = 14;

    /// @brief The fixed class ordering: O B A F G K M D N C R P S W.
    [[nodiscard]] const std::array<char, kSpectralClassCount>& spectral_classes();

    /// @brief Index of a primary class letter (case-insensitive) in spectral_classes().
    [[nodiscard]] std::optional<std::size_t> spectral_class_index(char spectral_class);

    /// @brief Temperature range for a known class, std::nullopt otherwise.
    [[nodiscard]] std::optional<TemperatureRange> temperature_range(char spectral_class);

    /// @brief Effective temperature estimate (Kelvin) from a spectral type like "G2".
    ///
    /// Subtype is the second character when it is a digit, otherwise 5.
    /// T = max - (max - min) * subtype / 9. Empty or unknown → 5778 K.
    [[nodiscard]] f64 temperature(std::string_view spectral_type);

    /// @brief Luminosity in watts: L = L_sun * 10^((M_sun - M) / 2.5).
    [[nodiscard]] f64 luminosity(f64 absolute_magnitude);

    /// @brief Radius in solar radii from L = 4 pi R^2 sigma T^4.
    ///
    /// Returns 0 when temperature is exactly 0. Other inputs are not
    /// validated; NaN and huge values propagate to the caller.
    [[nodiscard]] f64 radius(f64 luminosity_watts, f64 temperature_kelvin);

    /// @brief Display colour for a spectral type, RGB in [0, 1].
    [[nodiscard]] Vec3f color(std::string_view spectral_type);

    /// @brief Base palette colour for a primary class (white when unknown).
    [[nodiscard]] Vec3f base_color(char spectral_class);

    /// @brief Rendered point size for a radius: max(0.1, radius * 0.1).
    [[nodiscard]] f32 point_size(f64 radius_solar);

    /// @brief Convert 0xRRGGBB to normalized RGB.
    [[nodiscard]] inline Vec3f rgb_from_hex(u32 hex)
    {
        return Vec3f{
            static_cast<f32>((hex >> 16) & 0xFF) / 255.0f,
            static_cast<f32>((hex >> 8) & 0xFF) / 255.0f,
            static_cast<f32>(hex & 0xFF) / 255.0f,
        };
    }

    inline constexpr f32 kPointSizeScale = 0.1f;
    inline constexpr f32 kMinPointSize   = 0.1f;
    inline constexpr u32 kYellowTarget   = 0xffe9b5;
    inline constexpr u32 kWhite          = 0xffffff;

} // namespace latentsky::astro
