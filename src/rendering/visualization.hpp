#pragma once

/// @file visualization.hpp
/// @brief Interface the animation driver and lifecycle controller use to drive a renderer.

#include "core/types.hpp"
#include "rendering/blend_controller.hpp"
#include "rendering/instance_buffers.hpp"
#include "rendering/scene.hpp"

#include <functional>
#include <memory>

namespace latentsky::rendering
{
    /// @brief A constructed, running point-cloud visualization.
    class Visualization
    {
    public:
        virtual ~Visualization() = default;

        /// @brief Advance camera-control damping/state by one frame.
        virtual void update_controls() = 0;

        /// @brief Scene graph owned by this visualization.
        [[nodiscard]] virtual Scene& get_scene() = 0;

        /// @brief Render one frame, reading the blend progress once.
        virtual void draw_frame() = 0;

        /// @brief Host surface changed size; takes effect before the next frame.
        virtual void resize(u32 width, u32 height) = 0;

        /// @brief Release camera controls, GPU resources and the render surface; clear the scene.
        /// Safe to call more than once.
        virtual void dispose() = 0;
    };

    /// @brief Builds a visualization from packed buffers and the blend source it should read.
    using VisualizationFactory =
        std::function<std::unique_ptr<Visualization>(InstanceBufferSet buffers, const BlendController& blend)>;

} // namespace latentsky::rendering
