#pragma once

/// @file mount_target.hpp
/// @brief Interface for the surface host a visualization is mounted on.

#include "core/types.hpp"

#include <functional>

namespace latentsky::core
{
    /// @brief Callback receiving the new size in pixels.
    using ResizeListener = std::function<void(u32 width, u32 height)>;

    /// @brief Handle returned by add_resize_listener().
    using ListenerId = u64;

    /// @brief A rectangular host surface with size-change notifications.
    class MountTarget
    {
    public:
        virtual ~MountTarget() = default;

        [[nodiscard]] virtual u32 get_width() const = 0;
        [[nodiscard]] virtual u32 get_height() const = 0;

        /// @brief Register a listener called on every size change.
        [[nodiscard]] virtual ListenerId add_resize_listener(ResizeListener listener) = 0;

        /// @brief Unregister a listener. Unknown ids are ignored.
        virtual void remove_resize_listener(ListenerId id) = 0;

        /// @brief Number of currently registered resize listeners.
        [[nodiscard]] virtual std::size_t get_resize_listener_count() const = 0;
    };

} // namespace latentsky::core
