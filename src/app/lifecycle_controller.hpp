#pragma once

/// @file lifecycle_controller.hpp
/// @brief Setup/teardown state machine joining dataset load, mount target and renderer.

#include "animation/animation_driver.hpp"
#include "app/config.hpp"
#include "catalog/latent_star.hpp"
#include "core/mount_target.hpp"
#include "core/types.hpp"
#include "rendering/blend_controller.hpp"
#include "rendering/visualization.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace latentsky::app
{
    enum class LifecycleState
    {
        Uninitialized,
        DataLoading,
        AwaitingMount,
        Ready,
        TornDown,
    };

    [[nodiscard]] std::string_view to_string(LifecycleState state);

    /// @brief Produces the dataset, or nullopt on failure. Runs on a background task.
    using DatasetLoader = std::function<std::optional<std::vector<catalog::LatentStar>>()>;

    /// @brief Owns the visualization for its whole life.
    ///
    /// Uninitialized → DataLoading → AwaitingMount → Ready → TornDown.
    /// Setup happens once, when both the dataset and a mount target exist.
    /// All methods must be called from the main thread.
    class LifecycleController
    {
    public:
        LifecycleController(const VisualizerConfig& config,
                            DatasetLoader loader,
                            rendering::VisualizationFactory factory);

        /// @brief Tears down if still running. Blocks on an in-flight load.
        ~LifecycleController();

        LifecycleController(const LifecycleController&) = delete;
        LifecycleController& operator=(const LifecycleController&) = delete;
        LifecycleController(LifecycleController&&) = delete;
        LifecycleController& operator=(LifecycleController&&) = delete;

        /// @brief Start the background load. No-op unless Uninitialized.
        void activate();

        /// @brief Collect a finished load without blocking, then try setup.
        void poll();

        /// @brief Block up to @p timeout for the load, then poll().
        /// @return True once the controller has left DataLoading.
        bool wait_for_data(std::chrono::milliseconds timeout);

        /// @brief Record the host surface and try setup.
        void attach_mount(core::MountTarget& mount);

        /// @brief Build buffers, visualization, resize listener and driver.
        /// Silent no-op unless AwaitingMount with both data and mount present.
        void try_setup();

        /// @brief Run one animation frame. Only acts in Ready.
        void tick(f64 delta_sec);

        /// @brief Release everything built by setup. Safe in any state, repeatable.
        void teardown();

        [[nodiscard]] LifecycleState get_state() const { return m_state; }
        [[nodiscard]] bool has_data() const { return m_stars.has_value(); }
        [[nodiscard]] bool is_ready() const { return m_state == LifecycleState::Ready; }

        /// @brief Ready and the mount has a non-zero area (false while minimized).
        [[nodiscard]] bool is_presentable() const;
        [[nodiscard]] const rendering::BlendController& get_blend() const { return m_blend; }

        /// @brief The live visualization, or nullptr outside Ready.
        [[nodiscard]] rendering::Visualization* get_visualization() { return m_visualization.get(); }

        /// @brief The animation driver, or nullptr outside Ready.
        [[nodiscard]] const animation::AnimationDriver* get_driver() const { return m_driver.get(); }

    private:
        void accept_load_result(std::optional<std::vector<catalog::LatentStar>> result);

        VisualizerConfig m_config;
        DatasetLoader m_loader;
        rendering::VisualizationFactory m_factory;

        LifecycleState m_state = LifecycleState::Uninitialized;

        std::future<std::optional<std::vector<catalog::LatentStar>>> m_pending_load;
        std::optional<std::vector<catalog::LatentStar>> m_stars;

        core::MountTarget* m_mount = nullptr;
        std::optional<core::ListenerId> m_resize_listener;

        rendering::BlendController m_blend;
        std::unique_ptr<rendering::Visualization> m_visualization;
        std::unique_ptr<animation::AnimationDriver> m_driver;
    };

} // namespace latentsky::app
