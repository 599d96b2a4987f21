#pragma once

/// @file star_cloud.hpp
/// @brief GPU primitive for the dual-frame point cloud: instanced unit point + four attribute streams.

#include "core/deletion_queue.hpp"
#include "core/types.hpp"
#include "rendering/instance_buffers.hpp"
#include "vulkan/context.hpp"

#include <vulkan/vulkan.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace latentsky::rendering
{
    /// @brief Per-frame uniform block. Matches `CameraUniforms` in star_cloud.vert.
    struct CameraUniforms
    {
        Mat4f model_view;
        Mat4f projection;
    };

    /// @brief Push constants. Matches `BlendParams` in star_cloud.vert.
    struct BlendPushConstants
    {
        f32 progress;       ///< 0 = galactic layout, 1 = latent layout
        f32 point_scale;    ///< Pixels per point-size unit at view distance 1
    };

    /// @brief Vertex/instance buffers, per-frame uniforms, descriptor sets and pipeline
    /// for drawing N stars as round point sprites.
    ///
    /// Every Vulkan object is registered in a DeletionQueue the moment it is
    /// created; dispose() releases exactly that list, newest first.
    class StarCloud
    {
    public:
        /// @param context The Vulkan context (device, physical device).
        /// @param render_pass The render pass the pipeline is used with.
        /// @param shader_dir Directory containing star_cloud.{vert,frag}.spv.
        /// @param buffers Packed per-star attributes; uploaded once.
        /// @param frames_in_flight Number of uniform buffers / descriptor sets to create.
        StarCloud(const vulkan::Context& context,
                  VkRenderPass render_pass,
                  const std::filesystem::path& shader_dir,
                  const InstanceBufferSet& buffers,
                  u32 frames_in_flight);

        /// @brief Calls dispose().
        ~StarCloud();

        StarCloud(const StarCloud&) = delete;
        StarCloud& operator=(const StarCloud&) = delete;
        StarCloud(StarCloud&&) = delete;
        StarCloud& operator=(StarCloud&&) = delete;

        /// @brief Write camera matrices into the uniform buffer of @p frame_index.
        void update_uniforms(u32 frame_index, const CameraUniforms& uniforms);

        /// @brief Record the instanced draw. Must be called inside an active render pass.
        void draw(VkCommandBuffer cmd, u32 frame_index, f32 progress) const;

        /// @brief Release every GPU resource. The device must be idle. Repeatable.
        void dispose();

        [[nodiscard]] u32 get_instance_count() const { return m_instance_count; }
        [[nodiscard]] bool is_disposed() const { return m_disposed; }

        /// @brief Number of GPU resources still awaiting release.
        [[nodiscard]] std::size_t get_live_resource_count() const { return m_deletion_queue.size(); }

    private:
        struct MappedBuffer
        {
            VkBuffer buffer = VK_NULL_HANDLE;
            VkDeviceMemory memory = VK_NULL_HANDLE;
            void* mapped = nullptr;
        };

        /// @brief Create a host-visible buffer, register it for deletion and optionally fill it.
        MappedBuffer create_host_buffer(const std::string& label,
                                        VkBufferUsageFlags usage,
                                        VkDeviceSize size,
                                        const void* data,
                                        bool keep_mapped);

        void create_vertex_buffers(const InstanceBufferSet& buffers);
        void create_uniform_buffers(u32 frames_in_flight);
        void create_descriptors(u32 frames_in_flight);
        void create_pipeline(VkRenderPass render_pass, const std::filesystem::path& shader_dir);

        const vulkan::Context& m_context;
        core::DeletionQueue m_deletion_queue;

        // Binding 0: unit point; bindings 1..4: galactic, latent, colour, size
        std::vector<VkBuffer> m_vertex_buffers;

        std::vector<MappedBuffer> m_uniform_buffers;

        VkDescriptorSetLayout m_descriptor_set_layout = VK_NULL_HANDLE;
        VkDescriptorPool m_descriptor_pool = VK_NULL_HANDLE;
        std::vector<VkDescriptorSet> m_descriptor_sets;

        VkPipelineLayout m_pipeline_layout = VK_NULL_HANDLE;
        VkPipeline m_pipeline = VK_NULL_HANDLE;

        u32 m_instance_count = 0;
        bool m_disposed = false;
    };

} // namespace latentsky::rendering
