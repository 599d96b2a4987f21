#pragma once

/// @file renderer.hpp
/// @brief Vulkan visualization of the dual-frame star cloud on an SDL window.

#include "core/deletion_queue.hpp"
#include "core/input.hpp"
#include "core/types.hpp"
#include "core/window.hpp"
#include "rendering/blend_controller.hpp"
#include "rendering/instance_buffers.hpp"
#include "rendering/orbit_camera.hpp"
#include "rendering/scene.hpp"
#include "rendering/star_cloud.hpp"
#include "rendering/visualization.hpp"
#include "vulkan/context.hpp"
#include "vulkan/render_pass.hpp"
#include "vulkan/swapchain.hpp"

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace latentsky::rendering
{
    /// @brief Renderer construction options.
    struct RendererConfig
    {
        std::filesystem::path shader_dir;
        bool enable_validation = true;
        std::array<float, 4> clear_color{0.0f, 0.0f, 0.0f, 1.0f};
    };

    /// @brief Owns the render surface, camera, controls, scene and star cloud.
    ///
    /// Frame rendering uses 2 frames in flight with per-frame fences and
    /// semaphores. Render-finished semaphores are per swapchain image so the
    /// presentation engine never sees one reused early.
    class Renderer final : public Visualization
    {
    public:
        /// @param window Host window; provides the Vulkan surface and initial size.
        /// @param input Per-frame pointer/keyboard state driving the orbit controls.
        /// @param buffers Packed per-star attributes.
        /// @param blend Source of the blend progress, read once per frame.
        Renderer(core::Window& window,
                 const core::Input& input,
                 InstanceBufferSet buffers,
                 const BlendController& blend,
                 const RendererConfig& config);

        /// @brief Calls dispose().
        ~Renderer() override;

        Renderer(const Renderer&) = delete;
        Renderer& operator=(const Renderer&) = delete;
        Renderer(Renderer&&) = delete;
        Renderer& operator=(Renderer&&) = delete;

        void update_controls() override;
        [[nodiscard]] Scene& get_scene() override { return m_scene; }
        void draw_frame() override;
        void resize(u32 width, u32 height) override;
        void dispose() override;

    private:
        void create_command_pool();
        void create_command_buffers();
        void create_sync_objects();
        void destroy_sync_objects();
        void create_render_finished_semaphores();
        void destroy_render_finished_semaphores();

        void recreate_swapchain();
        void record_command_buffer(VkCommandBuffer cmd, uint32_t image_index, f32 progress);

        static constexpr uint32_t kMaxFramesInFlight = 2;

        core::Window& m_window;
        const core::Input& m_input;
        const BlendController& m_blend;

        // -----------------------------------------------------------------
        // Scene state (CPU)
        // -----------------------------------------------------------------
        PerspectiveCamera m_camera;
        OrbitControls m_controls;
        Scene m_scene;
        PointCloud* m_cloud_node = nullptr;

        // -----------------------------------------------------------------
        // GPU subsystems, released through m_deletion_queue
        // -----------------------------------------------------------------
        std::unique_ptr<vulkan::Context> m_context;
        std::unique_ptr<vulkan::Swapchain> m_swapchain;
        std::unique_ptr<vulkan::RenderPass> m_render_pass;
        std::unique_ptr<StarCloud> m_star_cloud;
        core::DeletionQueue m_deletion_queue;

        VkCommandPool m_command_pool = VK_NULL_HANDLE;
        std::vector<VkCommandBuffer> m_command_buffers;

        std::array<VkSemaphore, kMaxFramesInFlight> m_image_available_semaphores{};
        std::array<VkFence, kMaxFramesInFlight> m_in_flight_fences{};
        std::vector<VkSemaphore> m_render_finished_semaphores;

        uint32_t m_current_frame = 0;
        bool m_resize_pending = false;
        bool m_disposed = false;
    };

} // namespace latentsky::rendering
