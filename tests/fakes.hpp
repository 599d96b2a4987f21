#pragma once

/// @file fakes.hpp
/// @brief In-memory stand-ins for the GPU visualization and the window, for lifecycle tests.

#include "core/mount_target.hpp"
#include "core/resize_listeners.hpp"
#include "rendering/blend_controller.hpp"
#include "rendering/instance_buffers.hpp"
#include "rendering/scene.hpp"
#include "rendering/visualization.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace latentsky::testing
{
    /// @brief Outlives a FakeVisualization so tests can inspect its disposal.
    struct DisposeRecord
    {
        int dispose_count = 0;
        std::size_t children_after_dispose = 0;
    };

    /// @brief Records every call; holds one "stars" node like the real renderer.
    class FakeVisualization final : public rendering::Visualization
    {
    public:
        FakeVisualization(rendering::InstanceBufferSet buffers, const rendering::BlendController& blend)
            : m_buffers{std::move(buffers)}
            , m_blend{blend}
        {
            auto node = std::make_unique<rendering::PointCloud>();
            node->name = "stars";
            node->instance_count = static_cast<u32>(m_buffers.star_count());
            node->frustum_culled = false;
            m_scene.add(std::move(node));
        }

        void update_controls() override { calls.emplace_back("update_controls"); }

        rendering::Scene& get_scene() override
        {
            calls.emplace_back("get_scene");
            return m_scene;
        }

        void draw_frame() override
        {
            calls.emplace_back("draw_frame");
            drawn_progress.push_back(m_blend.get_progress());
        }

        void resize(u32 width, u32 height) override
        {
            resizes.emplace_back(width, height);
        }

        void dispose() override
        {
            ++dispose_count;
            m_scene.clear();
            if (record != nullptr)
            {
                ++record->dispose_count;
                record->children_after_dispose = m_scene.child_count();
            }
        }

        [[nodiscard]] const rendering::InstanceBufferSet& buffers() const { return m_buffers; }
        [[nodiscard]] const rendering::Scene& scene() const { return m_scene; }

        std::vector<std::string> calls;
        std::vector<f32> drawn_progress;
        std::vector<std::pair<u32, u32>> resizes;
        int dispose_count = 0;
        DisposeRecord* record = nullptr;

    private:
        rendering::InstanceBufferSet m_buffers;
        const rendering::BlendController& m_blend;
        rendering::Scene m_scene;
    };

    /// @brief Host surface with a manually triggered resize.
    class FakeMount final : public core::MountTarget
    {
    public:
        FakeMount(u32 width, u32 height)
            : m_width{width}
            , m_height{height}
        {
        }

        [[nodiscard]] u32 get_width() const override { return m_width; }
        [[nodiscard]] u32 get_height() const override { return m_height; }

        [[nodiscard]] core::ListenerId add_resize_listener(core::ResizeListener listener) override
        {
            return m_listeners.add(std::move(listener));
        }

        void remove_resize_listener(core::ListenerId id) override { m_listeners.remove(id); }

        [[nodiscard]] std::size_t get_resize_listener_count() const override { return m_listeners.size(); }

        void resize(u32 width, u32 height)
        {
            m_width = width;
            m_height = height;
            m_listeners.notify(width, height);
        }

    private:
        u32 m_width;
        u32 m_height;
        core::ResizeListenerRegistry m_listeners;
    };

} // namespace latentsky::testing
