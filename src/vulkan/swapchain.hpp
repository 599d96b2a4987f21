#pragma once

/// @file swapchain.hpp
/// @brief FIFO swapchain over an 8-bit UNORM surface format.

#include "vulkan/context.hpp"

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace latentsky::vulkan
{
    /// @brief Swapchain images and views for the window surface.
    ///
    /// Presents with FIFO, so frame pacing follows the display refresh. The
    /// image format is UNORM: star colours are already sRGB-encoded and must
    /// reach the display unchanged. One queue both draws and presents, so
    /// images are never shared across families.
    class Swapchain
    {
    public:
        Swapchain(const Context& context, uint32_t width, uint32_t height);
        ~Swapchain();

        Swapchain(const Swapchain&) = delete;
        Swapchain& operator=(const Swapchain&) = delete;
        Swapchain(Swapchain&&) = delete;
        Swapchain& operator=(Swapchain&&) = delete;

        /// @brief Wait for the device, then rebuild for a new drawable size.
        void recreate(uint32_t width, uint32_t height);

        [[nodiscard]] VkSwapchainKHR get_handle() const { return m_swapchain; }
        [[nodiscard]] VkFormat get_image_format() const { return m_image_format; }
        [[nodiscard]] VkExtent2D get_extent() const { return m_extent; }
        [[nodiscard]] const std::vector<VkImageView>& get_image_views() const { return m_image_views; }
        [[nodiscard]] uint32_t get_image_count() const { return static_cast<uint32_t>(m_image_views.size()); }

    private:
        void create(uint32_t width, uint32_t height);
        void destroy();

        const Context& m_context;

        VkSwapchainKHR m_swapchain = VK_NULL_HANDLE;
        VkFormat m_image_format = VK_FORMAT_UNDEFINED;
        VkExtent2D m_extent = {0, 0};
        std::vector<VkImageView> m_image_views;
    };

} // namespace latentsky::vulkan
