/// @file context.cpp
/// @brief Instance, surface and device creation for the star cloud renderer.

#include "vulkan/context.hpp"

#include "core/logger.hpp"
#include "vulkan/vk_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

namespace latentsky::vulkan
{

namespace
{

constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";
constexpr std::array<const char*, 1> kDeviceExtensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

// Validation output goes to the core logger at the matching level
VKAPI_ATTR VkBool32 VKAPI_CALL on_validation_message(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    [[maybe_unused]] VkDebugUtilsMessageTypeFlagsEXT type,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    [[maybe_unused]] void* user_data)
{
    spdlog::level::level_enum level = spdlog::level::trace;
    if ((severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) != 0)
    {
        level = spdlog::level::err;
    }
    else if ((severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) != 0)
    {
        level = spdlog::level::warn;
    }

    core::Logger::get_core_logger()->log(level, "[validation] {}", data->pMessage);
    return VK_FALSE;
}

VkDebugUtilsMessengerCreateInfoEXT validation_messenger_info()
{
    return VkDebugUtilsMessengerCreateInfoEXT{
        .sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT,
        .messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT
                         | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT,
        .messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT
                     | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT,
        .pfnUserCallback = on_validation_message,
    };
}

bool has_validation_layer()
{
    uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> layers(count);
    vkEnumerateInstanceLayerProperties(&count, layers.data());

    return std::any_of(layers.begin(), layers.end(), [](const VkLayerProperties& layer) {
        return std::string_view{layer.layerName} == kValidationLayer;
    });
}

bool has_swapchain_extension(VkPhysicalDevice device)
{
    uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(device, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> extensions(count);
    vkEnumerateDeviceExtensionProperties(device, nullptr, &count, extensions.data());

    return std::any_of(extensions.begin(), extensions.end(), [](const VkExtensionProperties& ext) {
        return std::string_view{ext.extensionName} == VK_KHR_SWAPCHAIN_EXTENSION_NAME;
    });
}

/// @brief First queue family that can both draw and present to @p surface.
std::optional<uint32_t> find_draw_present_family(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, families.data());

    for (uint32_t i = 0; i < count; ++i)
    {
        VkBool32 presents = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &presents);
        if ((families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0 && presents == VK_TRUE)
        {
            return i;
        }
    }
    return std::nullopt;
}

struct DeviceCandidate
{
    VkPhysicalDevice device = VK_NULL_HANDLE;
    uint32_t queue_family = 0;
    bool large_points = false;
    bool discrete = false;
    std::array<float, 2> point_size_range{1.0f, 1.0f};
    std::string name;
};

/// @brief Describe @p device if it can render the star cloud to @p surface.
std::optional<DeviceCandidate> inspect_device(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    if (!has_swapchain_extension(device))
    {
        return std::nullopt;
    }

    const auto family = find_draw_present_family(device, surface);
    if (!family)
    {
        return std::nullopt;
    }

    VkPhysicalDeviceProperties props{};
    vkGetPhysicalDeviceProperties(device, &props);
    VkPhysicalDeviceFeatures features{};
    vkGetPhysicalDeviceFeatures(device, &features);

    return DeviceCandidate{
        .device = device,
        .queue_family = *family,
        .large_points = features.largePoints == VK_TRUE,
        .discrete = props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU,
        .point_size_range = {props.limits.pointSizeRange[0], props.limits.pointSizeRange[1]},
        .name = props.deviceName,
    };
}

/// @brief Strict ordering: largePoints first, then discrete.
bool preferred_over(const DeviceCandidate& a, const DeviceCandidate& b)
{
    if (a.large_points != b.large_points)
    {
        return a.large_points;
    }
    return a.discrete && !b.discrete;
}

} // namespace

Context::Context(const ContextConfig& config, core::Window& window)
{
    create_instance(config, window.get_required_vulkan_extensions());

    if (m_validation)
    {
        create_debug_messenger();
    }

    m_surface = window.create_vulkan_surface(m_instance);
    if (m_surface == VK_NULL_HANDLE)
    {
        LSKY_CORE_CRITICAL("No Vulkan surface for the window");
        std::abort();
    }
    m_releases.push("window surface", [this]() { vkDestroySurfaceKHR(m_instance, m_surface, nullptr); });

    select_device();
    create_device();
}

Context::~Context()
{
    m_releases.flush();
}

// -----------------------------------------------------------------
// Instance
// -----------------------------------------------------------------
void Context::create_instance(const ContextConfig& config, const std::vector<const char*>& window_extensions)
{
    m_validation = config.enable_validation && has_validation_layer();
    if (config.enable_validation && !m_validation)
    {
        LSKY_CORE_WARN("{} not installed; continuing without validation", kValidationLayer);
    }

    std::vector<const char*> extensions = window_extensions;
    std::vector<const char*> layers;
    if (m_validation)
    {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        layers.push_back(kValidationLayer);
    }

    const VkApplicationInfo app_info{
        .sType = VK_STRUCTURE_TYPE_APPLICATION_INFO,
        .pApplicationName = config.app_name.c_str(),
        .applicationVersion = VK_MAKE_API_VERSION(0, 0, 1, 0),
        .pEngineName = "LatentSky",
        .engineVersion = VK_MAKE_API_VERSION(0, 0, 1, 0),
        .apiVersion = VK_API_VERSION_1_3,
    };

    // Chained so instance creation itself is validated
    const VkDebugUtilsMessengerCreateInfoEXT messenger_info = validation_messenger_info();

    const VkInstanceCreateInfo create_info{
        .sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO,
        .pNext = m_validation ? &messenger_info : nullptr,
        .pApplicationInfo = &app_info,
        .enabledLayerCount = static_cast<uint32_t>(layers.size()),
        .ppEnabledLayerNames = layers.data(),
        .enabledExtensionCount = static_cast<uint32_t>(extensions.size()),
        .ppEnabledExtensionNames = extensions.data(),
    };

    check_vk(vkCreateInstance(&create_info, nullptr, &m_instance), "vkCreateInstance");
    m_releases.push("vulkan instance", [this]() { vkDestroyInstance(m_instance, nullptr); });

    LSKY_CORE_INFO("Vulkan 1.3 instance ready ({} extension(s){})",
                   extensions.size(), m_validation ? ", validation on" : "");
}

void Context::create_debug_messenger()
{
    auto create = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(m_instance, "vkCreateDebugUtilsMessengerEXT"));
    auto destroy = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(m_instance, "vkDestroyDebugUtilsMessengerEXT"));
    if (create == nullptr || destroy == nullptr)
    {
        LSKY_CORE_WARN("Debug utils entry points missing; validation messages stay on stderr");
        return;
    }

    const VkDebugUtilsMessengerCreateInfoEXT info = validation_messenger_info();
    VkDebugUtilsMessengerEXT messenger = VK_NULL_HANDLE;
    check_vk(create(m_instance, &info, nullptr, &messenger), "vkCreateDebugUtilsMessengerEXT");
    m_releases.push("debug messenger", [this, destroy, messenger]() { destroy(m_instance, messenger, nullptr); });
}

// -----------------------------------------------------------------
// Device
// -----------------------------------------------------------------
void Context::select_device()
{
    uint32_t count = 0;
    vkEnumeratePhysicalDevices(m_instance, &count, nullptr);
    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(m_instance, &count, devices.data());

    std::optional<DeviceCandidate> chosen;
    for (VkPhysicalDevice device : devices)
    {
        auto candidate = inspect_device(device, m_surface);
        if (candidate && (!chosen || preferred_over(*candidate, *chosen)))
        {
            chosen = std::move(candidate);
        }
    }

    if (!chosen)
    {
        LSKY_CORE_CRITICAL("None of {} GPU(s) can draw and present to the window with one queue", count);
        std::abort();
    }

    m_physical_device = chosen->device;
    m_queue_family = chosen->queue_family;
    m_large_points = chosen->large_points;
    m_point_size_range = chosen->point_size_range;

    LSKY_CORE_INFO("GPU: {} (queue family {}, largePoints {})",
                   chosen->name, m_queue_family, m_large_points ? "yes" : "no");
}

void Context::create_device()
{
    constexpr float kPriority = 1.0f;
    const VkDeviceQueueCreateInfo queue_info{
        .sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO,
        .queueFamilyIndex = m_queue_family,
        .queueCount = 1,
        .pQueuePriorities = &kPriority,
    };

    // Without largePoints every gl_PointSize is clamped to 1 px
    const VkPhysicalDeviceFeatures features{.largePoints = m_large_points ? VK_TRUE : VK_FALSE};

    const VkDeviceCreateInfo create_info{
        .sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO,
        .queueCreateInfoCount = 1,
        .pQueueCreateInfos = &queue_info,
        .enabledExtensionCount = static_cast<uint32_t>(kDeviceExtensions.size()),
        .ppEnabledExtensionNames = kDeviceExtensions.data(),
        .pEnabledFeatures = &features,
    };

    check_vk(vkCreateDevice(m_physical_device, &create_info, nullptr, &m_device), "vkCreateDevice");
    m_releases.push("logical device", [this]() { vkDestroyDevice(m_device, nullptr); });

    vkGetDeviceQueue(m_device, m_queue_family, 0, &m_queue);
}

SurfaceSupport Context::query_surface_support() const
{
    SurfaceSupport support;
    check_vk(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_physical_device, m_surface, &support.capabilities),
             "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");

    uint32_t count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(m_physical_device, m_surface, &count, nullptr);
    support.formats.resize(count);
    vkGetPhysicalDeviceSurfaceFormatsKHR(m_physical_device, m_surface, &count, support.formats.data());

    count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(m_physical_device, m_surface, &count, nullptr);
    support.present_modes.resize(count);
    vkGetPhysicalDeviceSurfacePresentModesKHR(m_physical_device, m_surface, &count, support.present_modes.data());

    return support;
}

void Context::wait_idle() const
{
    if (m_device != VK_NULL_HANDLE)
    {
        check_vk(vkDeviceWaitIdle(m_device), "vkDeviceWaitIdle");
    }
}

} // namespace latentsky::vulkan
