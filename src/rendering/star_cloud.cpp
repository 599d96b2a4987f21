/// @file star_cloud.cpp
/// @brief Star cloud GPU primitive: buffer upload, descriptors, pipeline, instanced draw.

#include "rendering/star_cloud.hpp"

#include "core/logger.hpp"
#include "rendering/blend_math.hpp"
#include "vulkan/vk_utils.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace latentsky::rendering
{

using vulkan::check_vk;

// -----------------------------------------------------------------
// Construction / Destruction
// -----------------------------------------------------------------

StarCloud::StarCloud(const vulkan::Context& context,
                     VkRenderPass render_pass,
                     const std::filesystem::path& shader_dir,
                     const InstanceBufferSet& buffers,
                     u32 frames_in_flight)
    : m_context{context}
    , m_instance_count{static_cast<u32>(buffers.star_count())}
{
    if (!buffers.is_consistent())
    {
        LSKY_CORE_ERROR("Instance buffers disagree on star count; drawing none");
        m_instance_count = 0;
    }

    create_vertex_buffers(buffers);
    create_uniform_buffers(frames_in_flight);
    create_descriptors(frames_in_flight);
    create_pipeline(render_pass, shader_dir);

    LSKY_CORE_INFO("Star cloud created: {} instances, {} GPU resources",
                   m_instance_count, m_deletion_queue.size());
}

StarCloud::~StarCloud()
{
    dispose();
}

void StarCloud::dispose()
{
    if (m_disposed)
    {
        return;
    }

    const auto released = m_deletion_queue.size();
    m_deletion_queue.flush();

    m_vertex_buffers.clear();
    m_uniform_buffers.clear();
    m_descriptor_sets.clear();
    m_descriptor_set_layout = VK_NULL_HANDLE;
    m_descriptor_pool = VK_NULL_HANDLE;
    m_pipeline_layout = VK_NULL_HANDLE;
    m_pipeline = VK_NULL_HANDLE;
    m_disposed = true;

    LSKY_CORE_INFO("Star cloud disposed ({} GPU resources released)", released);
}

// -----------------------------------------------------------------
// Per-frame
// -----------------------------------------------------------------

void StarCloud::update_uniforms(u32 frame_index, const CameraUniforms& uniforms)
{
    if (m_disposed)
    {
        return;
    }
    std::memcpy(m_uniform_buffers[frame_index].mapped, &uniforms, sizeof(CameraUniforms));
}

void StarCloud::draw(VkCommandBuffer cmd, u32 frame_index, f32 progress) const
{
    if (m_disposed || m_instance_count == 0)
    {
        return;
    }

    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_pipeline);

    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS,
                            m_pipeline_layout, 0, 1,
                            &m_descriptor_sets[frame_index], 0, nullptr);

    const BlendPushConstants push{
        .progress    = progress,
        .point_scale = kPointPerspectiveScale,
    };
    vkCmdPushConstants(cmd, m_pipeline_layout,
                       VK_SHADER_STAGE_VERTEX_BIT,
                       0, sizeof(BlendPushConstants),
                       &push);

    const std::array<VkDeviceSize, 5> offsets{};
    vkCmdBindVertexBuffers(cmd, 0, static_cast<u32>(m_vertex_buffers.size()),
                           m_vertex_buffers.data(), offsets.data());

    // One shared vertex, one instance per star
    vkCmdDraw(cmd, 1, m_instance_count, 0, 0);
}

// -----------------------------------------------------------------
// Buffer helper: host-visible, coherent
// -----------------------------------------------------------------

StarCloud::MappedBuffer StarCloud::create_host_buffer(const std::string& label,
                                                      VkBufferUsageFlags usage,
                                                      VkDeviceSize size,
                                                      const void* data,
                                                      bool keep_mapped)
{
    VkDevice device = m_context.get_device();
    MappedBuffer result{};

    VkBufferCreateInfo buffer_info{};
    buffer_info.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    buffer_info.size = size;
    buffer_info.usage = usage;
    buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    check_vk(vkCreateBuffer(device, &buffer_info, nullptr, &result.buffer), "vkCreateBuffer");

    VkMemoryRequirements mem_requirements;
    vkGetBufferMemoryRequirements(device, result.buffer, &mem_requirements);

    VkMemoryAllocateInfo alloc_info{};
    alloc_info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    alloc_info.allocationSize = mem_requirements.size;
    alloc_info.memoryTypeIndex = vulkan::find_memory_type(
        m_context.get_physical_device(),
        mem_requirements.memoryTypeBits,
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);

    check_vk(vkAllocateMemory(device, &alloc_info, nullptr, &result.memory), "vkAllocateMemory");

    // Memory first so it is freed after the buffer
    m_deletion_queue.push(label + " memory",
                          [device, memory = result.memory]() { vkFreeMemory(device, memory, nullptr); });
    m_deletion_queue.push(label + " buffer",
                          [device, buffer = result.buffer]() { vkDestroyBuffer(device, buffer, nullptr); });

    check_vk(vkBindBufferMemory(device, result.buffer, result.memory, 0), "vkBindBufferMemory");

    void* mapped = nullptr;
    check_vk(vkMapMemory(device, result.memory, 0, size, 0, &mapped), "vkMapMemory");

    if (data != nullptr)
    {
        std::memcpy(mapped, data, static_cast<std::size_t>(size));
    }

    if (keep_mapped)
    {
        result.mapped = mapped;
    }
    else
    {
        vkUnmapMemory(device, result.memory);
    }

    LSKY_CORE_TRACE("Buffer created: {} ({} bytes)", label, size);
    return result;
}

// -----------------------------------------------------------------
// Vertex buffers: shared unit point + four per-instance streams
// -----------------------------------------------------------------

void StarCloud::create_vertex_buffers(const InstanceBufferSet& buffers)
{
    constexpr VkBufferUsageFlags kUsage = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;

    const std::array<f32, 3> unit_point{0.0f, 0.0f, 0.0f};
    m_vertex_buffers.push_back(
        create_host_buffer("unit point", kUsage, sizeof(unit_point), unit_point.data(), false).buffer);

    // Zero-sized buffers are invalid; an empty cloud still gets one element of storage
    auto upload = [&](const std::string& label, const std::vector<f32>& values, std::size_t components)
    {
        const std::size_t count = (m_instance_count == 0) ? components : values.size();
        const void* data = (m_instance_count == 0) ? nullptr : values.data();
        m_vertex_buffers.push_back(
            create_host_buffer(label, kUsage, count * sizeof(f32), data, false).buffer);
    };

    upload("galactic positions", buffers.galactic_positions, 3);
    upload("latent positions", buffers.latent_positions, 3);
    upload("colors", buffers.colors, 3);
    upload("sizes", buffers.sizes, 1);
}

// -----------------------------------------------------------------
// Uniform buffers: one per frame in flight, persistently mapped
// -----------------------------------------------------------------

void StarCloud::create_uniform_buffers(u32 frames_in_flight)
{
    m_uniform_buffers.reserve(frames_in_flight);
    for (u32 i = 0; i < frames_in_flight; ++i)
    {
        m_uniform_buffers.push_back(create_host_buffer("camera uniforms " + std::to_string(i),
                                                       VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
                                                       sizeof(CameraUniforms),
                                                       nullptr,
                                                       true));
    }
}

// -----------------------------------------------------------------
// Descriptors: one uniform buffer at binding 0, one set per frame
// -----------------------------------------------------------------

void StarCloud::create_descriptors(u32 frames_in_flight)
{
    VkDevice device = m_context.get_device();

    VkDescriptorSetLayoutBinding binding{};
    binding.binding = 0;
    binding.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    binding.descriptorCount = 1;
    binding.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;

    VkDescriptorSetLayoutCreateInfo layout_info{};
    layout_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layout_info.bindingCount = 1;
    layout_info.pBindings = &binding;

    check_vk(vkCreateDescriptorSetLayout(device, &layout_info, nullptr, &m_descriptor_set_layout),
             "vkCreateDescriptorSetLayout (star cloud)");
    m_deletion_queue.push("descriptor set layout",
                          [device, layout = m_descriptor_set_layout]()
                          { vkDestroyDescriptorSetLayout(device, layout, nullptr); });

    VkDescriptorPoolSize pool_size{};
    pool_size.type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    pool_size.descriptorCount = frames_in_flight;

    VkDescriptorPoolCreateInfo pool_info{};
    pool_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    pool_info.poolSizeCount = 1;
    pool_info.pPoolSizes = &pool_size;
    pool_info.maxSets = frames_in_flight;

    check_vk(vkCreateDescriptorPool(device, &pool_info, nullptr, &m_descriptor_pool),
             "vkCreateDescriptorPool (star cloud)");
    // Destroying the pool frees its sets
    m_deletion_queue.push("descriptor pool",
                          [device, pool = m_descriptor_pool]()
                          { vkDestroyDescriptorPool(device, pool, nullptr); });

    std::vector<VkDescriptorSetLayout> layouts(frames_in_flight, m_descriptor_set_layout);

    VkDescriptorSetAllocateInfo alloc_info{};
    alloc_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    alloc_info.descriptorPool = m_descriptor_pool;
    alloc_info.descriptorSetCount = frames_in_flight;
    alloc_info.pSetLayouts = layouts.data();

    m_descriptor_sets.resize(frames_in_flight);
    check_vk(vkAllocateDescriptorSets(device, &alloc_info, m_descriptor_sets.data()),
             "vkAllocateDescriptorSets (star cloud)");

    for (u32 i = 0; i < frames_in_flight; ++i)
    {
        VkDescriptorBufferInfo buffer_desc{};
        buffer_desc.buffer = m_uniform_buffers[i].buffer;
        buffer_desc.offset = 0;
        buffer_desc.range = sizeof(CameraUniforms);

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = m_descriptor_sets[i];
        write.dstBinding = 0;
        write.dstArrayElement = 0;
        write.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        write.descriptorCount = 1;
        write.pBufferInfo = &buffer_desc;

        vkUpdateDescriptorSets(device, 1, &write, 0, nullptr);
    }
}

// -----------------------------------------------------------------
// Graphics pipeline: POINT_LIST, instanced attributes, opaque, no depth
// -----------------------------------------------------------------

void StarCloud::create_pipeline(VkRenderPass render_pass, const std::filesystem::path& shader_dir)
{
    VkDevice device = m_context.get_device();

    VkShaderModule vert_module = vulkan::create_shader_module(device, shader_dir / "star_cloud.vert.spv");
    VkShaderModule frag_module = vulkan::create_shader_module(device, shader_dir / "star_cloud.frag.spv");

    VkPipelineShaderStageCreateInfo vert_stage{};
    vert_stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    vert_stage.stage = VK_SHADER_STAGE_VERTEX_BIT;
    vert_stage.module = vert_module;
    vert_stage.pName = "main";

    VkPipelineShaderStageCreateInfo frag_stage{};
    frag_stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    frag_stage.stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    frag_stage.module = frag_module;
    frag_stage.pName = "main";

    VkPipelineShaderStageCreateInfo shader_stages[] = {vert_stage, frag_stage};

    // -----------------------------------------------------------------
    // Vertex input: binding 0 per vertex, bindings 1..4 per instance
    // -----------------------------------------------------------------
    const std::array<VkVertexInputBindingDescription, 5> bindings{{
        {.binding = 0, .stride = 3 * sizeof(f32), .inputRate = VK_VERTEX_INPUT_RATE_VERTEX},
        {.binding = 1, .stride = 3 * sizeof(f32), .inputRate = VK_VERTEX_INPUT_RATE_INSTANCE},
        {.binding = 2, .stride = 3 * sizeof(f32), .inputRate = VK_VERTEX_INPUT_RATE_INSTANCE},
        {.binding = 3, .stride = 3 * sizeof(f32), .inputRate = VK_VERTEX_INPUT_RATE_INSTANCE},
        {.binding = 4, .stride = sizeof(f32),     .inputRate = VK_VERTEX_INPUT_RATE_INSTANCE},
    }};

    const std::array<VkVertexInputAttributeDescription, 5> attributes{{
        {.location = 0, .binding = 0, .format = VK_FORMAT_R32G32B32_SFLOAT, .offset = 0},
        {.location = 1, .binding = 1, .format = VK_FORMAT_R32G32B32_SFLOAT, .offset = 0},
        {.location = 2, .binding = 2, .format = VK_FORMAT_R32G32B32_SFLOAT, .offset = 0},
        {.location = 3, .binding = 3, .format = VK_FORMAT_R32G32B32_SFLOAT, .offset = 0},
        {.location = 4, .binding = 4, .format = VK_FORMAT_R32_SFLOAT,       .offset = 0},
    }};

    VkPipelineVertexInputStateCreateInfo vertex_input{};
    vertex_input.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertex_input.vertexBindingDescriptionCount = static_cast<u32>(bindings.size());
    vertex_input.pVertexBindingDescriptions = bindings.data();
    vertex_input.vertexAttributeDescriptionCount = static_cast<u32>(attributes.size());
    vertex_input.pVertexAttributeDescriptions = attributes.data();

    VkPipelineInputAssemblyStateCreateInfo input_assembly{};
    input_assembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    input_assembly.topology = VK_PRIMITIVE_TOPOLOGY_POINT_LIST;
    input_assembly.primitiveRestartEnable = VK_FALSE;

    VkDynamicState dynamic_states[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};

    VkPipelineDynamicStateCreateInfo dynamic_state{};
    dynamic_state.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamic_state.dynamicStateCount = 2;
    dynamic_state.pDynamicStates = dynamic_states;

    VkPipelineViewportStateCreateInfo viewport_state{};
    viewport_state.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewport_state.viewportCount = 1;
    viewport_state.scissorCount = 1;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.depthClampEnable = VK_FALSE;
    rasterizer.rasterizerDiscardEnable = VK_FALSE;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.lineWidth = 1.0f;
    rasterizer.cullMode = VK_CULL_MODE_NONE;
    rasterizer.frontFace = VK_FRONT_FACE_CLOCKWISE;
    rasterizer.depthBiasEnable = VK_FALSE;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.sampleShadingEnable = VK_FALSE;
    multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    // Opaque: surviving fragments overwrite, discarded ones leave the background
    VkPipelineColorBlendAttachmentState color_blend_attachment{};
    color_blend_attachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT
                                          | VK_COLOR_COMPONENT_G_BIT
                                          | VK_COLOR_COMPONENT_B_BIT
                                          | VK_COLOR_COMPONENT_A_BIT;
    color_blend_attachment.blendEnable = VK_FALSE;

    VkPipelineColorBlendStateCreateInfo color_blending{};
    color_blending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    color_blending.logicOpEnable = VK_FALSE;
    color_blending.attachmentCount = 1;
    color_blending.pAttachments = &color_blend_attachment;

    // -----------------------------------------------------------------
    // Pipeline layout: camera uniforms + blend push constants
    // -----------------------------------------------------------------
    VkPushConstantRange push_range{};
    push_range.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;
    push_range.offset = 0;
    push_range.size = sizeof(BlendPushConstants);

    VkPipelineLayoutCreateInfo layout_info{};
    layout_info.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layout_info.setLayoutCount = 1;
    layout_info.pSetLayouts = &m_descriptor_set_layout;
    layout_info.pushConstantRangeCount = 1;
    layout_info.pPushConstantRanges = &push_range;

    check_vk(vkCreatePipelineLayout(device, &layout_info, nullptr, &m_pipeline_layout),
             "vkCreatePipelineLayout (star cloud)");
    m_deletion_queue.push("pipeline layout",
                          [device, layout = m_pipeline_layout]()
                          { vkDestroyPipelineLayout(device, layout, nullptr); });

    VkGraphicsPipelineCreateInfo pipeline_info{};
    pipeline_info.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipeline_info.stageCount = 2;
    pipeline_info.pStages = shader_stages;
    pipeline_info.pVertexInputState = &vertex_input;
    pipeline_info.pInputAssemblyState = &input_assembly;
    pipeline_info.pViewportState = &viewport_state;
    pipeline_info.pRasterizationState = &rasterizer;
    pipeline_info.pMultisampleState = &multisampling;
    pipeline_info.pDepthStencilState = nullptr;
    pipeline_info.pColorBlendState = &color_blending;
    pipeline_info.pDynamicState = &dynamic_state;
    pipeline_info.layout = m_pipeline_layout;
    pipeline_info.renderPass = render_pass;
    pipeline_info.subpass = 0;

    check_vk(
        vkCreateGraphicsPipelines(device, VK_NULL_HANDLE, 1, &pipeline_info, nullptr, &m_pipeline),
        "vkCreateGraphicsPipelines (star cloud)");
    m_deletion_queue.push("graphics pipeline",
                          [device, pipeline = m_pipeline]() { vkDestroyPipeline(device, pipeline, nullptr); });

    LSKY_CORE_INFO("Star cloud pipeline created (POINT_LIST, 5 vertex bindings, opaque)");

    vkDestroyShaderModule(device, frag_module, nullptr);
    vkDestroyShaderModule(device, vert_module, nullptr);
}

} // namespace latentsky::rendering
