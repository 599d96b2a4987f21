#pragma once

/// @file vk_utils.hpp
/// @brief Shared Vulkan helpers: fatal result checks, memory type lookup, SPIR-V loading.

#include <vulkan/vulkan.h>

#include <cstdint>
#include <filesystem>

namespace latentsky::vulkan
{
    /// @brief Log and abort when a Vulkan call did not return VK_SUCCESS.
    void check_vk(VkResult result, const char* operation);

    /// @brief Find a memory type matching @p type_filter with all @p properties. Aborts if none.
    [[nodiscard]] uint32_t find_memory_type(VkPhysicalDevice physical_device,
                                            uint32_t type_filter,
                                            VkMemoryPropertyFlags properties);

    /// @brief Load a SPIR-V file and create a VkShaderModule. Aborts on a missing or malformed file.
    [[nodiscard]] VkShaderModule create_shader_module(VkDevice device, const std::filesystem::path& path);

} // namespace latentsky::vulkan
