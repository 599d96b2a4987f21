/// @file renderer.cpp
/// @brief Renderer implementation: setup, per-frame draw, swapchain recreation, disposal.

#include "rendering/renderer.hpp"

#include "core/logger.hpp"
#include "vulkan/vk_utils.hpp"

#include <cstdlib>
#include <limits>
#include <utility>

namespace latentsky::rendering
{

using vulkan::check_vk;

// =================================================================
// Construction / Destruction
// =================================================================

Renderer::Renderer(core::Window& window,
                   const core::Input& input,
                   InstanceBufferSet buffers,
                   const BlendController& blend,
                   const RendererConfig& config)
    : m_window{window}
    , m_input{input}
    , m_blend{blend}
    , m_controls{m_camera}
{
    // -----------------------------------------------------------------
    // Camera: 75° FOV, (0, 0, -250) looking at the origin, damped orbit
    // -----------------------------------------------------------------
    m_camera.set_position(PerspectiveCamera::kDefaultPosition);
    m_camera.look_at(Vec3f{0.0f});
    m_camera.set_viewport(window.get_width(), window.get_height());
    m_controls.set_damping_factor(OrbitControls::kDefaultDampingFactor);

    // -----------------------------------------------------------------
    // Render surface: context, swapchain, render pass + framebuffers
    // -----------------------------------------------------------------
    m_context = std::make_unique<vulkan::Context>(
        vulkan::ContextConfig{.app_name = "LatentSky", .enable_validation = config.enable_validation},
        window);
    m_deletion_queue.push("vulkan context", [this]() { m_context.reset(); });

    m_swapchain = std::make_unique<vulkan::Swapchain>(
        *m_context, window.get_width(), window.get_height());
    m_deletion_queue.push("swapchain", [this]() { m_swapchain.reset(); });

    m_render_pass = std::make_unique<vulkan::RenderPass>(*m_context, *m_swapchain, config.clear_color);
    m_deletion_queue.push("render pass", [this]() { m_render_pass.reset(); });

    create_command_pool();
    create_command_buffers();
    create_sync_objects();

    // -----------------------------------------------------------------
    // Star cloud: GPU buffers + pipeline, and its scene node
    // -----------------------------------------------------------------
    LSKY_CORE_INFO("Shader directory: {}", config.shader_dir.string());
    m_star_cloud = std::make_unique<StarCloud>(
        *m_context, m_render_pass->get_handle(), config.shader_dir, buffers, kMaxFramesInFlight);
    m_deletion_queue.push("star cloud", [this]() { m_star_cloud.reset(); });

    auto node = std::make_unique<PointCloud>();
    node->name = "stars";
    node->instance_count = m_star_cloud->get_instance_count();
    node->bounding_radius = buffers.bounding_radius();
    node->frustum_culled = false;
    m_cloud_node = &m_scene.add(std::move(node));

    const auto point_range = m_context->get_point_size_range();
    LSKY_CORE_INFO("Renderer ready: {} stars, bounding radius {:.1f}, {} GPU resources",
                   m_cloud_node->instance_count, m_cloud_node->bounding_radius,
                   m_star_cloud->get_live_resource_count());
    if (!m_context->supports_large_points())
    {
        LSKY_CORE_WARN("largePoints unsupported: point sizes are fixed at 1 px");
    }
    else
    {
        LSKY_CORE_TRACE("Point size range: [{:.1f}, {:.1f}] px", point_range[0], point_range[1]);
    }
}

Renderer::~Renderer()
{
    dispose();
}

// =================================================================
// Disposal
// =================================================================

void Renderer::dispose()
{
    if (m_disposed)
    {
        return;
    }
    m_disposed = true;

    m_controls.dispose();

    if (m_context)
    {
        m_context->wait_idle();
    }

    // Newest first: star cloud, sync objects, command pool, render pass,
    // swapchain, context (and with it the surface)
    m_deletion_queue.flush();

    m_cloud_node = nullptr;
    m_scene.clear();

    LSKY_CORE_INFO("Renderer disposed");
}

// =================================================================
// Per-frame: controls
// =================================================================

void Renderer::update_controls()
{
    if (m_disposed)
    {
        return;
    }

    const u32 height = m_window.get_height();

    const Vec2f rotate = m_input.get_rotate_delta();
    if (rotate.x != 0.0f || rotate.y != 0.0f)
    {
        m_controls.rotate(rotate.x, rotate.y, height);
    }

    const Vec2f pan = m_input.get_pan_delta();
    if (pan.x != 0.0f || pan.y != 0.0f)
    {
        m_controls.pan(pan.x, pan.y, height);
    }

    m_controls.dolly(m_input.get_scroll_delta());

    // Damping keeps the camera gliding after input stops
    m_controls.update();
}

void Renderer::resize(u32 width, u32 height)
{
    if (m_disposed)
    {
        return;
    }

    m_camera.set_viewport(width, height);
    m_resize_pending = true;
}

// =================================================================
// Per-frame: draw
// =================================================================

void Renderer::draw_frame()
{
    if (m_disposed)
    {
        return;
    }

    // Skip drawing when minimized (zero extent)
    if (m_window.get_width() == 0 || m_window.get_height() == 0)
    {
        return;
    }

    if (m_resize_pending)
    {
        m_resize_pending = false;
        recreate_swapchain();
    }

    VkDevice device = m_context->get_device();

    // -----------------------------------------------------------------
    // 1. Wait for this frame slot's fence
    // -----------------------------------------------------------------
    check_vk(
        vkWaitForFences(device, 1, &m_in_flight_fences[m_current_frame], VK_TRUE, std::numeric_limits<uint64_t>::max()),
        "vkWaitForFences");

    // -----------------------------------------------------------------
    // 2. Acquire next swapchain image
    // -----------------------------------------------------------------
    uint32_t image_index = 0;
    VkResult acquire_result = vkAcquireNextImageKHR(
        device,
        m_swapchain->get_handle(),
        std::numeric_limits<uint64_t>::max(),
        m_image_available_semaphores[m_current_frame],
        VK_NULL_HANDLE,
        &image_index);

    if (acquire_result == VK_ERROR_OUT_OF_DATE_KHR)
    {
        recreate_swapchain();
        return;
    }
    if (acquire_result != VK_SUCCESS && acquire_result != VK_SUBOPTIMAL_KHR)
    {
        LSKY_CORE_CRITICAL("Failed to acquire swapchain image: {}", static_cast<int>(acquire_result));
        std::abort();
    }

    check_vk(vkResetFences(device, 1, &m_in_flight_fences[m_current_frame]), "vkResetFences");

    // -----------------------------------------------------------------
    // 3. Uniforms + command buffer. Progress is sampled once per frame.
    // -----------------------------------------------------------------
    const f32 progress = m_blend.get_progress();

    if (m_cloud_node != nullptr)
    {
        m_star_cloud->update_uniforms(m_current_frame, CameraUniforms{
            .model_view = m_camera.view_matrix() * m_cloud_node->model_matrix(),
            .projection = m_camera.projection_matrix(),
        });
    }

    check_vk(vkResetCommandBuffer(m_command_buffers[m_current_frame], 0), "vkResetCommandBuffer");
    record_command_buffer(m_command_buffers[m_current_frame], image_index, progress);

    // -----------------------------------------------------------------
    // 4. Submit
    // -----------------------------------------------------------------
    VkSemaphore wait_semaphores[] = {m_image_available_semaphores[m_current_frame]};
    VkPipelineStageFlags wait_stages[] = {VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT};
    VkSemaphore signal_semaphores[] = {m_render_finished_semaphores[image_index]};

    VkSubmitInfo submit_info{};
    submit_info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit_info.waitSemaphoreCount = 1;
    submit_info.pWaitSemaphores = wait_semaphores;
    submit_info.pWaitDstStageMask = wait_stages;
    submit_info.commandBufferCount = 1;
    submit_info.pCommandBuffers = &m_command_buffers[m_current_frame];
    submit_info.signalSemaphoreCount = 1;
    submit_info.pSignalSemaphores = signal_semaphores;

    check_vk(
        vkQueueSubmit(m_context->get_queue(), 1, &submit_info, m_in_flight_fences[m_current_frame]),
        "vkQueueSubmit");

    // -----------------------------------------------------------------
    // 5. Present
    // -----------------------------------------------------------------
    VkSwapchainKHR swapchains[] = {m_swapchain->get_handle()};

    VkPresentInfoKHR present_info{};
    present_info.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present_info.waitSemaphoreCount = 1;
    present_info.pWaitSemaphores = signal_semaphores;
    present_info.swapchainCount = 1;
    present_info.pSwapchains = swapchains;
    present_info.pImageIndices = &image_index;

    VkResult present_result = vkQueuePresentKHR(m_context->get_queue(), &present_info);

    if (present_result == VK_ERROR_OUT_OF_DATE_KHR || present_result == VK_SUBOPTIMAL_KHR)
    {
        recreate_swapchain();
    }
    else if (present_result != VK_SUCCESS)
    {
        LSKY_CORE_CRITICAL("Failed to present swapchain image: {}", static_cast<int>(present_result));
        std::abort();
    }

    m_current_frame = (m_current_frame + 1) % kMaxFramesInFlight;
}

void Renderer::record_command_buffer(VkCommandBuffer cmd, uint32_t image_index, f32 progress)
{
    VkCommandBufferBeginInfo begin_info{};
    begin_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;

    check_vk(vkBeginCommandBuffer(cmd, &begin_info), "vkBeginCommandBuffer");

    m_render_pass->begin(cmd, image_index);

    const VkExtent2D extent = m_render_pass->get_extent();

    VkViewport viewport{};
    viewport.x = 0.0f;
    viewport.y = 0.0f;
    viewport.width = static_cast<float>(extent.width);
    viewport.height = static_cast<float>(extent.height);
    viewport.minDepth = 0.0f;
    viewport.maxDepth = 1.0f;
    vkCmdSetViewport(cmd, 0, 1, &viewport);

    VkRect2D scissor{};
    scissor.offset = {0, 0};
    scissor.extent = extent;
    vkCmdSetScissor(cmd, 0, 1, &scissor);

    // The star cloud is the only drawable; culling still goes through the scene
    const auto visible = m_scene.visible_nodes(m_camera.view_matrix(), m_camera.projection_matrix());
    for (const PointCloud* node : visible)
    {
        if (node == m_cloud_node)
        {
            m_star_cloud->draw(cmd, m_current_frame, progress);
        }
    }

    m_render_pass->end(cmd);

    check_vk(vkEndCommandBuffer(cmd), "vkEndCommandBuffer");
}

// =================================================================
// Swapchain recreation
// =================================================================

void Renderer::recreate_swapchain()
{
    m_context->wait_idle();

    const uint32_t w = m_window.get_width();
    const uint32_t h = m_window.get_height();

    if (w == 0 || h == 0)
    {
        return;
    }

    // Image count may change with the swapchain
    destroy_render_finished_semaphores();

    m_swapchain->recreate(w, h);
    m_render_pass->recreate_framebuffers(*m_swapchain);

    create_render_finished_semaphores();

    LSKY_CORE_INFO("Swapchain + framebuffers recreated: {}x{} ({} images)",
                   w, h, m_swapchain->get_image_count());
}

// =================================================================
// Command pool + buffers
// =================================================================

void Renderer::create_command_pool()
{
    VkCommandPoolCreateInfo pool_info{};
    pool_info.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pool_info.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    pool_info.queueFamilyIndex = m_context->get_queue_family();

    check_vk(
        vkCreateCommandPool(m_context->get_device(), &pool_info, nullptr, &m_command_pool),
        "vkCreateCommandPool");

    // Destroying the pool frees its command buffers
    m_deletion_queue.push("command pool", [this]()
    {
        vkDestroyCommandPool(m_context->get_device(), m_command_pool, nullptr);
        m_command_pool = VK_NULL_HANDLE;
        m_command_buffers.clear();
    });

    LSKY_CORE_TRACE("Command pool created");
}

void Renderer::create_command_buffers()
{
    m_command_buffers.resize(kMaxFramesInFlight);

    VkCommandBufferAllocateInfo alloc_info{};
    alloc_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    alloc_info.commandPool = m_command_pool;
    alloc_info.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    alloc_info.commandBufferCount = kMaxFramesInFlight;

    check_vk(
        vkAllocateCommandBuffers(m_context->get_device(), &alloc_info, m_command_buffers.data()),
        "vkAllocateCommandBuffers");

    LSKY_CORE_TRACE("Command buffers allocated: {}", kMaxFramesInFlight);
}

// =================================================================
// Synchronization objects
// =================================================================

void Renderer::create_sync_objects()
{
    VkDevice device = m_context->get_device();

    VkSemaphoreCreateInfo semaphore_info{};
    semaphore_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (uint32_t i = 0; i < kMaxFramesInFlight; ++i)
    {
        check_vk(
            vkCreateSemaphore(device, &semaphore_info, nullptr, &m_image_available_semaphores[i]),
            "vkCreateSemaphore (image available)");
        check_vk(
            vkCreateFence(device, &fence_info, nullptr, &m_in_flight_fences[i]),
            "vkCreateFence (in flight)");
    }

    create_render_finished_semaphores();

    m_deletion_queue.push("sync objects", [this]() { destroy_sync_objects(); });

    LSKY_CORE_TRACE("Sync objects created: {} frames in flight, {} image semaphores",
                    kMaxFramesInFlight, m_render_finished_semaphores.size());
}

void Renderer::destroy_sync_objects()
{
    VkDevice device = m_context->get_device();

    destroy_render_finished_semaphores();

    for (uint32_t i = 0; i < kMaxFramesInFlight; ++i)
    {
        if (m_image_available_semaphores[i] != VK_NULL_HANDLE)
        {
            vkDestroySemaphore(device, m_image_available_semaphores[i], nullptr);
            m_image_available_semaphores[i] = VK_NULL_HANDLE;
        }
        if (m_in_flight_fences[i] != VK_NULL_HANDLE)
        {
            vkDestroyFence(device, m_in_flight_fences[i], nullptr);
            m_in_flight_fences[i] = VK_NULL_HANDLE;
        }
    }
}

void Renderer::create_render_finished_semaphores()
{
    VkSemaphoreCreateInfo sem_info{};
    sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    const uint32_t image_count = m_swapchain->get_image_count();
    m_render_finished_semaphores.resize(image_count);

    for (uint32_t i = 0; i < image_count; ++i)
    {
        check_vk(
            vkCreateSemaphore(m_context->get_device(), &sem_info, nullptr, &m_render_finished_semaphores[i]),
            "vkCreateSemaphore (render finished)");
    }
}

void Renderer::destroy_render_finished_semaphores()
{
    for (auto sem : m_render_finished_semaphores)
    {
        if (sem != VK_NULL_HANDLE)
        {
            vkDestroySemaphore(m_context->get_device(), sem, nullptr);
        }
    }
    m_render_finished_semaphores.clear();
}

} // namespace latentsky::rendering
