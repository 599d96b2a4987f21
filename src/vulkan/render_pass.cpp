/// @file render_pass.cpp
/// @brief Render pass and framebuffer implementation.

#include "vulkan/render_pass.hpp"

#include "core/logger.hpp"
#include "vulkan/vk_utils.hpp"

namespace latentsky::vulkan
{

RenderPass::RenderPass(const Context& context,
                       const Swapchain& swapchain,
                       const std::array<float, 4>& clear_color)
    : m_context{context}
    , m_extent{swapchain.get_extent()}
{
    m_clear_value.color = {{clear_color[0], clear_color[1], clear_color[2], clear_color[3]}};

    create_render_pass(swapchain.get_image_format());
    create_framebuffers(swapchain);
}

RenderPass::~RenderPass()
{
    destroy_framebuffers();

    vkDestroyRenderPass(m_context.get_device(), m_render_pass, nullptr);
}

void RenderPass::recreate_framebuffers(const Swapchain& swapchain)
{
    destroy_framebuffers();
    m_extent = swapchain.get_extent();
    create_framebuffers(swapchain);
}

void RenderPass::begin(VkCommandBuffer cmd, uint32_t image_index) const
{
    const VkRenderPassBeginInfo info{
        .sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO,
        .renderPass = m_render_pass,
        .framebuffer = m_framebuffers[image_index],
        .renderArea = {.offset = {0, 0}, .extent = m_extent},
        .clearValueCount = 1,
        .pClearValues = &m_clear_value,
    };
    vkCmdBeginRenderPass(cmd, &info, VK_SUBPASS_CONTENTS_INLINE);
}

void RenderPass::end(VkCommandBuffer cmd) const
{
    vkCmdEndRenderPass(cmd);
}

void RenderPass::create_render_pass(VkFormat color_format)
{
    // Cleared every frame, handed straight to the presentation engine
    const VkAttachmentDescription target{
        .format = color_format,
        .samples = VK_SAMPLE_COUNT_1_BIT,
        .loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR,
        .storeOp = VK_ATTACHMENT_STORE_OP_STORE,
        .stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE,
        .stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE,
        .initialLayout = VK_IMAGE_LAYOUT_UNDEFINED,
        .finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
    };
    const VkAttachmentReference target_ref{.attachment = 0, .layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

    const VkSubpassDescription draw_points{
        .pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS,
        .colorAttachmentCount = 1,
        .pColorAttachments = &target_ref,
    };

    // The clear must not start before the acquired image is released by the display
    const VkSubpassDependency after_acquire{
        .srcSubpass = VK_SUBPASS_EXTERNAL,
        .dstSubpass = 0,
        .srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT,
        .dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT,
        .srcAccessMask = 0,
        .dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT,
    };

    const VkRenderPassCreateInfo info{
        .sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO,
        .attachmentCount = 1,
        .pAttachments = &target,
        .subpassCount = 1,
        .pSubpasses = &draw_points,
        .dependencyCount = 1,
        .pDependencies = &after_acquire,
    };
    check_vk(vkCreateRenderPass(m_context.get_device(), &info, nullptr, &m_render_pass), "vkCreateRenderPass");
}

void RenderPass::create_framebuffers(const Swapchain& swapchain)
{
    VkDevice device = m_context.get_device();
    m_framebuffers.clear();
    m_framebuffers.reserve(swapchain.get_image_count());

    for (VkImageView view : swapchain.get_image_views())
    {
        const VkFramebufferCreateInfo info{
            .sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO,
            .renderPass = m_render_pass,
            .attachmentCount = 1,
            .pAttachments = &view,
            .width = m_extent.width,
            .height = m_extent.height,
            .layers = 1,
        };
        VkFramebuffer framebuffer = VK_NULL_HANDLE;
        check_vk(vkCreateFramebuffer(device, &info, nullptr, &framebuffer), "vkCreateFramebuffer");
        m_framebuffers.push_back(framebuffer);
    }

    LSKY_CORE_TRACE("{} framebuffer(s) at {}x{}", m_framebuffers.size(), m_extent.width, m_extent.height);
}

void RenderPass::destroy_framebuffers()
{
    VkDevice device = m_context.get_device();
    for (VkFramebuffer framebuffer : m_framebuffers)
    {
        vkDestroyFramebuffer(device, framebuffer, nullptr);
    }
    m_framebuffers.clear();
}

} // namespace latentsky::vulkan
