/// @file window.cpp
/// @brief SDL2 mount target implementation.

#include "core/window.hpp"

#include "core/logger.hpp"

#include <SDL2/SDL_vulkan.h>

#include <cstdlib>
#include <utility>

namespace latentsky::core
{

Window::Window(const WindowConfig& config)
{
    // We own main(); SDL must not substitute its own entry point
    SDL_SetMainReady();

    if (SDL_Init(SDL_INIT_VIDEO) != 0)
    {
        LSKY_CORE_CRITICAL("SDL video init failed: {}", SDL_GetError());
        std::abort();
    }

    const u32 flags = SDL_WINDOW_VULKAN | SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI
                    | (config.resizable ? SDL_WINDOW_RESIZABLE : 0u);

    m_window.reset(SDL_CreateWindow(config.title.c_str(),
                                    SDL_WINDOWPOS_CENTERED,
                                    SDL_WINDOWPOS_CENTERED,
                                    static_cast<int>(config.width),
                                    static_cast<int>(config.height),
                                    flags));
    if (!m_window)
    {
        LSKY_CORE_CRITICAL("Could not open a Vulkan window: {}", SDL_GetError());
        SDL_Quit();
        std::abort();
    }

    // On HiDPI displays the drawable is larger than the requested logical size
    int drawable_w = 0;
    int drawable_h = 0;
    SDL_Vulkan_GetDrawableSize(m_window.get(), &drawable_w, &drawable_h);
    m_width = static_cast<u32>(drawable_w);
    m_height = static_cast<u32>(drawable_h);

    LSKY_CORE_INFO("Mount target \"{}\" open: {}x{} px", config.title, m_width, m_height);
}

Window::~Window()
{
    if (m_listeners.size() > 0)
    {
        LSKY_CORE_WARN("Window closing with {} resize listener(s) still attached", m_listeners.size());
    }

    m_window.reset();
    SDL_Quit();
    LSKY_CORE_TRACE("Mount target closed");
}

// -----------------------------------------------------------------
// Resize listeners
// -----------------------------------------------------------------

ListenerId Window::add_resize_listener(ResizeListener listener)
{
    const ListenerId id = m_listeners.add(std::move(listener));
    LSKY_CORE_TRACE("Resize listener {} attached", id);
    return id;
}

void Window::remove_resize_listener(ListenerId id)
{
    if (m_listeners.remove(id))
    {
        LSKY_CORE_TRACE("Resize listener {} detached", id);
    }
}

void Window::set_extent(u32 width, u32 height)
{
    if (width == m_width && height == m_height)
    {
        return;
    }

    m_width = width;
    m_height = height;
    LSKY_CORE_TRACE("Mount target size: {}x{}", m_width, m_height);
    m_listeners.notify(m_width, m_height);
}

void Window::refresh_extent()
{
    if (m_minimized)
    {
        set_extent(0, 0);
        return;
    }

    int w = 0;
    int h = 0;
    SDL_Vulkan_GetDrawableSize(m_window.get(), &w, &h);
    set_extent(static_cast<u32>(w), static_cast<u32>(h));
}

// -----------------------------------------------------------------
// Event pump
// -----------------------------------------------------------------

void Window::poll_events()
{
    SDL_Event event{};
    while (SDL_PollEvent(&event) != 0)
    {
        if (m_event_callback)
        {
            m_event_callback(event);
        }

        if (event.type == SDL_QUIT)
        {
            m_should_close = true;
        }
        else if (event.type == SDL_WINDOWEVENT)
        {
            handle_window_event(event.window);
        }
    }
}

void Window::handle_window_event(const SDL_WindowEvent& event)
{
    switch (event.event)
    {
        case SDL_WINDOWEVENT_CLOSE:
            m_should_close = true;
            break;

        case SDL_WINDOWEVENT_MINIMIZED:
            m_minimized = true;
            refresh_extent();
            break;

        case SDL_WINDOWEVENT_RESTORED:
        case SDL_WINDOWEVENT_MAXIMIZED:
            m_minimized = false;
            refresh_extent();
            break;

        // SIZE_CHANGED covers both user drags and programmatic resizes
        case SDL_WINDOWEVENT_SIZE_CHANGED:
            refresh_extent();
            break;

        default:
            break;
    }
}

void Window::set_event_callback(EventCallback callback)
{
    m_event_callback = std::move(callback);
}

// -----------------------------------------------------------------
// Vulkan surface
// -----------------------------------------------------------------

std::vector<const char*> Window::get_required_vulkan_extensions() const
{
    unsigned int count = 0;
    std::vector<const char*> names;

    if (SDL_Vulkan_GetInstanceExtensions(m_window.get(), &count, nullptr) == SDL_TRUE)
    {
        names.resize(count);
        if (SDL_Vulkan_GetInstanceExtensions(m_window.get(), &count, names.data()) == SDL_TRUE)
        {
            return names;
        }
    }

    LSKY_CORE_ERROR("SDL could not list Vulkan surface extensions: {}", SDL_GetError());
    return {};
}

VkSurfaceKHR Window::create_vulkan_surface(VkInstance instance) const
{
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    if (SDL_Vulkan_CreateSurface(m_window.get(), instance, &surface) == SDL_FALSE)
    {
        LSKY_CORE_CRITICAL("SDL_Vulkan_CreateSurface failed: {}", SDL_GetError());
        return VK_NULL_HANDLE;
    }
    return surface;
}

} // namespace latentsky::core
