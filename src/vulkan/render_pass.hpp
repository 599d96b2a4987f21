#pragma once

/// @file render_pass.hpp
/// @brief Colour-only render pass and per-swapchain-image framebuffers.

#include "vulkan/context.hpp"
#include "vulkan/swapchain.hpp"

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <vector>

namespace latentsky::vulkan
{
    /// @brief Single-subpass render pass that clears to a solid colour, plus its framebuffers.
    ///
    /// No depth attachment: the point cloud draws in submission order.
    class RenderPass
    {
    public:
        /// @param context The Vulkan context (device).
        /// @param swapchain The swapchain (format, extent, image views).
        /// @param clear_color RGBA clear value.
        RenderPass(const Context& context,
                   const Swapchain& swapchain,
                   const std::array<float, 4>& clear_color = {0.0f, 0.0f, 0.0f, 1.0f});

        /// @brief Destroy framebuffers and the render pass.
        ~RenderPass();

        RenderPass(const RenderPass&) = delete;
        RenderPass& operator=(const RenderPass&) = delete;
        RenderPass(RenderPass&&) = delete;
        RenderPass& operator=(RenderPass&&) = delete;

        /// @brief Recreate framebuffers after swapchain recreation.
        /// The render pass stays valid while the image format is unchanged.
        void recreate_framebuffers(const Swapchain& swapchain);

        /// @brief Begin the pass on @p cmd for swapchain image @p image_index, clearing it.
        void begin(VkCommandBuffer cmd, uint32_t image_index) const;

        /// @brief End the pass on @p cmd.
        void end(VkCommandBuffer cmd) const;

        [[nodiscard]] VkRenderPass get_handle() const { return m_render_pass; }
        [[nodiscard]] VkExtent2D get_extent() const { return m_extent; }

    private:
        void create_render_pass(VkFormat color_format);
        void create_framebuffers(const Swapchain& swapchain);
        void destroy_framebuffers();

        const Context& m_context;

        VkRenderPass m_render_pass = VK_NULL_HANDLE;
        std::vector<VkFramebuffer> m_framebuffers;

        VkExtent2D m_extent = {0, 0};
        VkClearValue m_clear_value{};
    };

} // namespace latentsky::vulkan
