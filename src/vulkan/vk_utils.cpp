/// @file vk_utils.cpp
/// @brief Shared Vulkan helper implementation.

#include "vulkan/vk_utils.hpp"

#include "core/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <vector>

namespace latentsky::vulkan
{

void check_vk(VkResult result, const char* operation)
{
    if (result != VK_SUCCESS)
    {
        LSKY_CORE_CRITICAL("Vulkan error in {}: VkResult = {}", operation, static_cast<int>(result));
        std::abort();
    }
}

uint32_t find_memory_type(VkPhysicalDevice physical_device,
                          uint32_t type_filter,
                          VkMemoryPropertyFlags properties)
{
    VkPhysicalDeviceMemoryProperties mem_props;
    vkGetPhysicalDeviceMemoryProperties(physical_device, &mem_props);

    for (uint32_t i = 0; i < mem_props.memoryTypeCount; ++i)
    {
        if ((type_filter & (1u << i)) &&
            (mem_props.memoryTypes[i].propertyFlags & properties) == properties)
        {
            return i;
        }
    }

    LSKY_CORE_CRITICAL("Failed to find suitable memory type");
    std::abort();
}

VkShaderModule create_shader_module(VkDevice device, const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::ate | std::ios::binary);
    if (!file.is_open())
    {
        LSKY_CORE_CRITICAL("Failed to open shader file: {}", path.string());
        std::abort();
    }

    auto file_size = static_cast<std::size_t>(file.tellg());
    if (file_size == 0 || file_size % 4 != 0)
    {
        LSKY_CORE_CRITICAL("Invalid SPIR-V file (size {} not aligned to 4): {}",
                           file_size, path.string());
        std::abort();
    }

    std::vector<uint32_t> code(file_size / sizeof(uint32_t));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(code.data()), static_cast<std::streamsize>(file_size));
    file.close();

    VkShaderModuleCreateInfo create_info{};
    create_info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    create_info.codeSize = file_size;
    create_info.pCode = code.data();

    VkShaderModule module = VK_NULL_HANDLE;
    check_vk(vkCreateShaderModule(device, &create_info, nullptr, &module),
             "vkCreateShaderModule");

    LSKY_CORE_TRACE("Shader module loaded: {}", path.filename().string());
    return module;
}

} // namespace latentsky::vulkan
