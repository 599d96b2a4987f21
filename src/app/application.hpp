#pragma once

/// @file application.hpp
/// @brief Top-level application: window, input, lifecycle controller and main loop.

#include "app/config.hpp"
#include "app/lifecycle_controller.hpp"
#include "core/input.hpp"
#include "core/window.hpp"

#include <chrono>
#include <filesystem>
#include <memory>

namespace latentsky::app
{
    /// @brief Owns the window and the lifecycle controller and drives the main loop.
    ///
    /// Lifecycle: init() in constructor → run() drives main_loop() → shutdown() in destructor.
    /// The controller is torn down before the window is destroyed.
    class Application
    {
    public:
        explicit Application(const VisualizerConfig& config);
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief Enter the main loop. Returns when the window is closed or Escape is pressed.
        void run();

    private:
        void init();
        void main_loop();
        void shutdown();

        VisualizerConfig m_config;
        std::filesystem::path m_shader_dir;

        std::unique_ptr<core::Window> m_window;
        std::unique_ptr<core::Input> m_input;
        std::unique_ptr<LifecycleController> m_controller;

        std::chrono::steady_clock::time_point m_last_frame_time;
    };

} // namespace latentsky::app
