#pragma once

/// @file deletion_queue.hpp
/// @brief Explicit list of resource releases, run in reverse registration order.

#include "core/logger.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace latentsky::core
{
    /// @brief Records how to release every resource an owner created.
    ///
    /// push() right after a successful create; flush() destroys the whole
    /// list newest-first and empties it, so a second flush() is a no-op.
    class DeletionQueue
    {
    public:
        DeletionQueue() = default;
        ~DeletionQueue() { flush(); }

        DeletionQueue(const DeletionQueue&) = delete;
        DeletionQueue& operator=(const DeletionQueue&) = delete;
        DeletionQueue(DeletionQueue&&) = delete;
        DeletionQueue& operator=(DeletionQueue&&) = delete;

        /// @brief Register a release function with a label used in trace logs.
        void push(std::string label, std::function<void()> release)
        {
            m_entries.push_back(Entry{std::move(label), std::move(release)});
        }

        /// @brief Run every release function, newest first.
        void flush()
        {
            while (!m_entries.empty())
            {
                Entry entry = std::move(m_entries.back());
                m_entries.pop_back();
                entry.release();
                if (Logger::is_initialized())
                {
                    LSKY_CORE_TRACE("Released {}", entry.label);
                }
            }
        }

        [[nodiscard]] std::size_t size() const { return m_entries.size(); }
        [[nodiscard]] bool empty() const { return m_entries.empty(); }

    private:
        struct Entry
        {
            std::string label;
            std::function<void()> release;
        };

        std::vector<Entry> m_entries;
    };

} // namespace latentsky::core
