#pragma once

/// @file window.hpp
/// @brief SDL2 window acting as the visualization's mount target.

#include "core/mount_target.hpp"
#include "core/resize_listeners.hpp"
#include "core/types.hpp"

#include <SDL2/SDL.h>
#include <vulkan/vulkan.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace latentsky::core
{
    /// @brief Window creation options.
    /// Use designated initializers: Window w({.title = "LatentSky", .width = 1920});
    struct WindowConfig
    {
        std::string title = "LatentSky";
        u32 width = 1280;
        u32 height = 720;
        bool resizable = true;
    };

    /// @brief Receives every SDL event seen by poll_events().
    using EventCallback = std::function<void(const SDL_Event&)>;

    /// @brief A MountTarget backed by an SDL2 Vulkan window.
    ///
    /// The reported size is the drawable size in pixels. It drops to 0x0
    /// while minimized, and every change is forwarded to the resize
    /// listeners. Exactly one Window may exist (it owns SDL's video subsystem).
    class Window final : public MountTarget
    {
    public:
        /// @brief Initialize SDL video and open the window. Failure is fatal.
        explicit Window(const WindowConfig& config);
        ~Window() override;

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;
        Window(Window&&) = delete;
        Window& operator=(Window&&) = delete;

        // -----------------------------------------------------------------
        // MountTarget
        // -----------------------------------------------------------------
        [[nodiscard]] u32 get_width() const override { return m_width; }
        [[nodiscard]] u32 get_height() const override { return m_height; }
        [[nodiscard]] ListenerId add_resize_listener(ResizeListener listener) override;
        void remove_resize_listener(ListenerId id) override;
        [[nodiscard]] std::size_t get_resize_listener_count() const override { return m_listeners.size(); }

        // -----------------------------------------------------------------
        // Event pump
        // -----------------------------------------------------------------

        /// @brief Drain SDL's queue: forward to the callback, track close and size.
        void poll_events();

        void set_event_callback(EventCallback callback);
        [[nodiscard]] bool should_close() const { return m_should_close; }
        void request_close() { m_should_close = true; }

        // -----------------------------------------------------------------
        // Vulkan surface
        // -----------------------------------------------------------------

        /// @brief Instance extensions SDL needs to create a surface for this window.
        [[nodiscard]] std::vector<const char*> get_required_vulkan_extensions() const;

        /// @brief Create a surface; the caller destroys it. VK_NULL_HANDLE on failure.
        [[nodiscard]] VkSurfaceKHR create_vulkan_surface(VkInstance instance) const;

    private:
        struct SdlWindowDeleter
        {
            void operator()(SDL_Window* window) const { SDL_DestroyWindow(window); }
        };

        void handle_window_event(const SDL_WindowEvent& event);

        /// @brief Store a new size and notify listeners if it changed.
        void set_extent(u32 width, u32 height);

        /// @brief Current drawable size from SDL (0x0 while minimized).
        void refresh_extent();

        std::unique_ptr<SDL_Window, SdlWindowDeleter> m_window;
        u32 m_width = 0;
        u32 m_height = 0;
        bool m_minimized = false;
        bool m_should_close = false;
        EventCallback m_event_callback;
        ResizeListenerRegistry m_listeners;
    };

} // namespace latentsky::core
