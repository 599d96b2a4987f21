#pragma once

/// @file resize_listeners.hpp
/// @brief Id-keyed resize listener list shared by MountTarget implementations.

#include "core/mount_target.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <map>
#include <utility>

namespace latentsky::core
{
    /// @brief Stores resize listeners under increasing ids and fans out size changes.
    ///
    /// notify() iterates over a snapshot, so a listener may remove itself
    /// (or another listener) while being called.
    class ResizeListenerRegistry
    {
    public:
        [[nodiscard]] ListenerId add(ResizeListener listener)
        {
            const ListenerId id = m_next_id++;
            m_listeners.emplace(id, std::move(listener));
            return id;
        }

        /// @return True if a listener with this id was registered.
        bool remove(ListenerId id) { return m_listeners.erase(id) > 0; }

        void notify(u32 width, u32 height) const
        {
            const auto snapshot = m_listeners;
            for (const auto& [id, listener] : snapshot)
            {
                if (m_listeners.contains(id))
                {
                    listener(width, height);
                }
            }
        }

        [[nodiscard]] std::size_t size() const { return m_listeners.size(); }

    private:
        std::map<ListenerId, ResizeListener> m_listeners;
        ListenerId m_next_id = 1;
    };

} // namespace latentsky::core
