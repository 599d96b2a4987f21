#pragma once

/// @file context.hpp
/// @brief Vulkan instance, window surface, and a device able to draw the star cloud.

#include "core/deletion_queue.hpp"
#include "core/window.hpp"

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace latentsky::vulkan
{
    struct ContextConfig
    {
        std::string app_name = "LatentSky";
        bool enable_validation = true;
    };

    /// @brief What the surface currently offers to a swapchain.
    struct SurfaceSupport
    {
        VkSurfaceCapabilitiesKHR capabilities{};
        std::vector<VkSurfaceFormatKHR> formats;
        std::vector<VkPresentModeKHR> present_modes;
    };

    /// @brief Owns the instance, surface and logical device used by the renderer.
    ///
    /// The device is chosen for the star cloud: it must expose VK_KHR_swapchain
    /// and one queue family that both draws and presents to the window surface.
    /// Among those, devices with the largePoints feature win, then discrete GPUs.
    /// Any failure during construction is fatal.
    class Context
    {
    public:
        Context(const ContextConfig& config, core::Window& window);
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

        [[nodiscard]] VkPhysicalDevice get_physical_device() const { return m_physical_device; }
        [[nodiscard]] VkDevice get_device() const { return m_device; }
        [[nodiscard]] VkSurfaceKHR get_surface() const { return m_surface; }

        /// @brief The single queue used for both submission and presentation.
        [[nodiscard]] VkQueue get_queue() const { return m_queue; }
        [[nodiscard]] uint32_t get_queue_family() const { return m_queue_family; }

        /// @brief True when gl_PointSize above 1 px is honoured.
        [[nodiscard]] bool supports_large_points() const { return m_large_points; }

        /// @brief Device limits for gl_PointSize, in pixels.
        [[nodiscard]] std::array<float, 2> get_point_size_range() const { return m_point_size_range; }

        /// @brief Re-query the surface; sizes change with the window.
        [[nodiscard]] SurfaceSupport query_surface_support() const;

        void wait_idle() const;

    private:
        void create_instance(const ContextConfig& config, const std::vector<const char*>& window_extensions);
        void create_debug_messenger();
        void select_device();
        void create_device();

        core::DeletionQueue m_releases;

        VkInstance m_instance = VK_NULL_HANDLE;
        VkSurfaceKHR m_surface = VK_NULL_HANDLE;
        VkPhysicalDevice m_physical_device = VK_NULL_HANDLE;
        VkDevice m_device = VK_NULL_HANDLE;
        VkQueue m_queue = VK_NULL_HANDLE;
        uint32_t m_queue_family = 0;
        bool m_validation = false;
        bool m_large_points = false;
        std::array<float, 2> m_point_size_range{1.0f, 1.0f};
    };

} // namespace latentsky::vulkan
