/// @file main.cpp
/// @brief LatentSky entry point: galactic ↔ latent star cloud visualizer.
///
/// Usage: latentsky [dataset.csv.gz]

#include "app/application.hpp"
#include "app/config.hpp"
#include "core/logger.hpp"

int main(int argc, char* argv[])
{
    latentsky::core::Logger::init();

    latentsky::app::VisualizerConfig config{};
    if (argc > 1)
    {
        config.dataset_path = argv[1];
    }

    LSKY_INFO("LatentSky starting");

    {
        latentsky::app::Application app{config};
        app.run();
    }

    LSKY_INFO("LatentSky shut down cleanly");
    latentsky::core::Logger::shutdown();
    return 0;
}
