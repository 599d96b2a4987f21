/// @file instance_buffers.cpp
/// @brief Instance buffer builder: physical model → packed float arrays.

#include "rendering/instance_buffers.hpp"

#include "astro/stellar_physics.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace latentsky::rendering
{

bool InstanceBufferSet::is_consistent() const
{
    const std::size_t n = sizes.size();
    return colors.size() == 3 * n
        && latent_positions.size() == 3 * n
        && galactic_positions.size() == 3 * n;
}

f32 InstanceBufferSet::bounding_radius() const
{
    f32 max_length_sq = 0.0f;

    auto scan = [&max_length_sq](const std::vector<f32>& positions) {
        for (std::size_t i = 0; i + 2 < positions.size(); i += 3)
        {
            const Vec3f p{positions[i], positions[i + 1], positions[i + 2]};
            const f32 length_sq = glm::dot(p, p);
            if (std::isfinite(length_sq))
            {
                max_length_sq = std::max(max_length_sq, length_sq);
            }
        }
    };

    scan(galactic_positions);
    scan(latent_positions);

    return std::sqrt(max_length_sq);
}

InstanceBufferSet build_instance_buffers(std::span<const catalog::LatentStar> stars, f32 latent_scale)
{
    const std::size_t n = stars.size();

    InstanceBufferSet buffers;
    buffers.sizes.resize(n);
    buffers.colors.resize(3 * n);
    buffers.latent_positions.resize(3 * n);
    buffers.galactic_positions.resize(3 * n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const auto& star = stars[i];

        // Size: magnitude + spectral type → Stefan-Boltzmann radius → clamped point size
        const f64 luminosity = astro::luminosity(static_cast<f64>(star.abs_magnitude));
        const f64 temperature = astro::temperature(star.spectral_type);
        const f64 radius = astro::radius(luminosity, temperature);
        buffers.sizes[i] = astro::point_size(radius);

        const Vec3f color = astro::color(star.spectral_type);
        buffers.colors[i * 3]     = color.r;
        buffers.colors[i * 3 + 1] = color.g;
        buffers.colors[i * 3 + 2] = color.b;

        buffers.latent_positions[i * 3]     = star.latent_position.x * latent_scale;
        buffers.latent_positions[i * 3 + 1] = star.latent_position.y * latent_scale;
        buffers.latent_positions[i * 3 + 2] = star.latent_position.z * latent_scale;

        buffers.galactic_positions[i * 3]     = star.galactic_position.x;
        buffers.galactic_positions[i * 3 + 1] = star.galactic_position.y;
        buffers.galactic_positions[i * 3 + 2] = star.galactic_position.z;
    }

    LSKY_CORE_TRACE("Instance buffers built: {} stars ({} bytes)",
                    n, (n * 10) * sizeof(f32));

    return buffers;
}

} // namespace latentsky::rendering
