/// @file swapchain.cpp
/// @brief FIFO/UNORM swapchain creation and rebuild.

#include "vulkan/swapchain.hpp"

#include "core/logger.hpp"
#include "vulkan/vk_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace latentsky::vulkan
{

namespace
{

/// @brief An 8-bit UNORM format in the sRGB colour space, else whatever comes first.
VkSurfaceFormatKHR pick_unorm_format(const std::vector<VkSurfaceFormatKHR>& formats)
{
    const auto it = std::find_if(formats.begin(), formats.end(), [](const VkSurfaceFormatKHR& f) {
        return (f.format == VK_FORMAT_B8G8R8A8_UNORM || f.format == VK_FORMAT_R8G8B8A8_UNORM)
            && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    });
    if (it != formats.end())
    {
        return *it;
    }

    LSKY_CORE_WARN("Surface has no 8-bit UNORM format; using format {} and colours may shift",
                   static_cast<int>(formats.front().format));
    return formats.front();
}

/// @brief The surface's fixed extent, or the requested size clamped to its limits.
VkExtent2D fit_extent(const VkSurfaceCapabilitiesKHR& caps, uint32_t width, uint32_t height)
{
    if (caps.currentExtent.width != std::numeric_limits<uint32_t>::max())
    {
        return caps.currentExtent;
    }
    return VkExtent2D{
        .width = std::clamp(width, caps.minImageExtent.width, caps.maxImageExtent.width),
        .height = std::clamp(height, caps.minImageExtent.height, caps.maxImageExtent.height),
    };
}

} // namespace

Swapchain::Swapchain(const Context& context, uint32_t width, uint32_t height)
    : m_context{context}
{
    create(width, height);
}

Swapchain::~Swapchain()
{
    destroy();
}

void Swapchain::recreate(uint32_t width, uint32_t height)
{
    m_context.wait_idle();
    destroy();
    create(width, height);
}

void Swapchain::create(uint32_t width, uint32_t height)
{
    const SurfaceSupport support = m_context.query_surface_support();
    if (support.formats.empty())
    {
        LSKY_CORE_CRITICAL("Window surface reports no formats");
        std::abort();
    }

    const VkSurfaceFormatKHR format = pick_unorm_format(support.formats);
    const VkSurfaceCapabilitiesKHR& caps = support.capabilities;
    m_image_format = format.format;
    m_extent = fit_extent(caps, width, height);

    // One spare image over the minimum so acquire rarely blocks
    uint32_t min_images = caps.minImageCount + 1;
    if (caps.maxImageCount > 0)
    {
        min_images = std::min(min_images, caps.maxImageCount);
    }

    const VkSwapchainCreateInfoKHR create_info{
        .sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR,
        .surface = m_context.get_surface(),
        .minImageCount = min_images,
        .imageFormat = format.format,
        .imageColorSpace = format.colorSpace,
        .imageExtent = m_extent,
        .imageArrayLayers = 1,
        .imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT,
        .imageSharingMode = VK_SHARING_MODE_EXCLUSIVE,
        .preTransform = caps.currentTransform,
        .compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR,
        .presentMode = VK_PRESENT_MODE_FIFO_KHR,
        .clipped = VK_TRUE,
    };

    VkDevice device = m_context.get_device();
    check_vk(vkCreateSwapchainKHR(device, &create_info, nullptr, &m_swapchain), "vkCreateSwapchainKHR");

    uint32_t count = 0;
    vkGetSwapchainImagesKHR(device, m_swapchain, &count, nullptr);
    std::vector<VkImage> images(count);
    vkGetSwapchainImagesKHR(device, m_swapchain, &count, images.data());

    m_image_views.resize(count, VK_NULL_HANDLE);
    for (uint32_t i = 0; i < count; ++i)
    {
        const VkImageViewCreateInfo view_info{
            .sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
            .image = images[i],
            .viewType = VK_IMAGE_VIEW_TYPE_2D,
            .format = m_image_format,
            .subresourceRange = {
                .aspectMask = VK_IMAGE_ASPECT_COLOR_BIT,
                .levelCount = 1,
                .layerCount = 1,
            },
        };
        check_vk(vkCreateImageView(device, &view_info, nullptr, &m_image_views[i]), "vkCreateImageView");
    }

    LSKY_CORE_INFO("Swapchain {}x{}: {} image(s), format {}, FIFO",
                   m_extent.width, m_extent.height, count, static_cast<int>(m_image_format));
}

void Swapchain::destroy()
{
    VkDevice device = m_context.get_device();
    for (VkImageView view : m_image_views)
    {
        vkDestroyImageView(device, view, nullptr);
    }
    m_image_views.clear();

    if (m_swapchain != VK_NULL_HANDLE)
    {
        vkDestroySwapchainKHR(device, m_swapchain, nullptr);
        m_swapchain = VK_NULL_HANDLE;
    }
}

} // namespace latentsky::vulkan
