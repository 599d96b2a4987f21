#pragma once

/// @file catalog_loader.hpp
/// @brief Loads the latent-space star table from a gzip-compressed CSV file.

#include "catalog/latent_star.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace latentsky::catalog
{
    /// @brief Static utility class for loading the latent star table.
    ///
    /// Expected CSV columns (header row required, discarded):
    ///   id, latent_x, latent_y, latent_z, x, y, z, absmag, spect
    class CatalogLoader
    {
    public:
        CatalogLoader() = delete;

        /// @brief Read, decompress and parse a .csv.gz file.
        ///
        /// Uncompressed files are read transparently. Rows with bad numbers
        /// are kept with NaN fields; only an unreadable or corrupt stream
        /// fails the load.
        ///
        /// @param path Path to the (optionally gzip-compressed) CSV file.
        /// @return Parsed stars on success, std::nullopt on transport/decode failure.
        [[nodiscard]] static std::optional<std::vector<LatentStar>>
            load_latent_csv_gz(const std::filesystem::path& path);

        /// @brief Decompress a whole gzip file into text.
        /// @return The decoded text, or std::nullopt on open/read/stream errors.
        [[nodiscard]] static std::optional<std::string>
            read_gzip_text(const std::filesystem::path& path);

        /// @brief Parse already-decoded CSV text (header line discarded).
        [[nodiscard]] static std::vector<LatentStar> parse_latent_csv(std::string_view text);

        /// @brief Parse one data line. Missing fields are treated as unparsable.
        [[nodiscard]] static LatentStar parse_line(std::string_view line);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a float; NaN when the field does not start with a number.
        [[nodiscard]] static f32 parse_f32_or_nan(std::string_view sv);

        /// @brief Parse an integer id; 0 when the field does not start with a number.
        [[nodiscard]] static i64 parse_i64_or_zero(std::string_view sv);
    };

    /// @brief Mean (latent_x, latent_y) per primary spectral class.
    ///
    /// Only the 14 known classes are aggregated, matched case-sensitively on the
    /// first character of spectral_type; classes without stars are absent from
    /// the result. Non-finite latent coordinates are skipped.
    [[nodiscard]] std::map<char, Vec2f> compute_class_centroids(std::span<const LatentStar> stars);

} // namespace latentsky::catalog
