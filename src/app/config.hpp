#pragma once

/// @file config.hpp
/// @brief Top-level visualizer configuration.

#include "animation/animation_driver.hpp"
#include "core/types.hpp"
#include "rendering/instance_buffers.hpp"

#include <filesystem>
#include <string>

namespace latentsky::app
{
    /// @brief Everything the application needs to start.
    /// Use designated initializers: VisualizerConfig cfg{.dataset_path = argv[1]};
    struct VisualizerConfig
    {
        std::filesystem::path dataset_path = "assets/latent_stars_1.csv.gz";

        std::string window_title = "LatentSky";
        u32 window_width = 1280;
        u32 window_height = 720;

        f32 latent_scale = rendering::kLatentScale;
        animation::DriverConfig animation{};

        bool enable_validation = true;
    };

} // namespace latentsky::app
