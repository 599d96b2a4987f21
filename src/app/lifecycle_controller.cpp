/// @file lifecycle_controller.cpp
/// @brief Lifecycle controller implementation.

#include "app/lifecycle_controller.hpp"

#include "catalog/catalog_loader.hpp"
#include "core/logger.hpp"
#include "rendering/instance_buffers.hpp"

#include <utility>

namespace latentsky::app
{

std::string_view to_string(LifecycleState state)
{
    switch (state)
    {
        case LifecycleState::Uninitialized: return "Uninitialized";
        case LifecycleState::DataLoading:   return "DataLoading";
        case LifecycleState::AwaitingMount: return "AwaitingMount";
        case LifecycleState::Ready:         return "Ready";
        case LifecycleState::TornDown:      return "TornDown";
    }
    return "Unknown";
}

LifecycleController::LifecycleController(const VisualizerConfig& config,
                                         DatasetLoader loader,
                                         rendering::VisualizationFactory factory)
    : m_config{config}
    , m_loader{std::move(loader)}
    , m_factory{std::move(factory)}
{
}

LifecycleController::~LifecycleController()
{
    teardown();
}

void LifecycleController::activate()
{
    if (m_state != LifecycleState::Uninitialized)
    {
        LSKY_TRACE("activate() ignored in state {}", to_string(m_state));
        return;
    }

    m_state = LifecycleState::DataLoading;
    m_pending_load = std::async(std::launch::async, m_loader);
    LSKY_INFO("Dataset load started");
}

void LifecycleController::poll()
{
    if (m_state != LifecycleState::DataLoading || !m_pending_load.valid())
    {
        return;
    }

    if (m_pending_load.wait_for(std::chrono::seconds{0}) != std::future_status::ready)
    {
        return;
    }

    accept_load_result(m_pending_load.get());
    try_setup();
}

bool LifecycleController::wait_for_data(std::chrono::milliseconds timeout)
{
    if (m_state == LifecycleState::DataLoading && m_pending_load.valid())
    {
        m_pending_load.wait_for(timeout);
        poll();
    }
    return m_state != LifecycleState::DataLoading;
}

void LifecycleController::attach_mount(core::MountTarget& mount)
{
    if (m_state == LifecycleState::TornDown)
    {
        LSKY_TRACE("attach_mount() ignored after teardown");
        return;
    }
    if (m_state == LifecycleState::Ready)
    {
        // The resize listener is bound to the current mount
        LSKY_TRACE("attach_mount() ignored: already mounted");
        return;
    }

    m_mount = &mount;
    LSKY_TRACE("Mount target attached ({}x{})", mount.get_width(), mount.get_height());
    try_setup();
}

void LifecycleController::try_setup()
{
    if (m_state != LifecycleState::AwaitingMount || !m_stars.has_value() || m_mount == nullptr)
    {
        LSKY_TRACE("try_setup() skipped (state {}, data {}, mount {})",
                   to_string(m_state),
                   m_stars.has_value(),
                   m_mount != nullptr);
        return;
    }

    // -----------------------------------------------------------------
    // Pack the GPU-facing arrays and hand them to the renderer
    // -----------------------------------------------------------------
    auto buffers = rendering::build_instance_buffers(*m_stars, m_config.latent_scale);
    const auto star_count = buffers.star_count();

    m_blend.set_progress(0.0f);
    m_visualization = m_factory(std::move(buffers), m_blend);
    if (!m_visualization)
    {
        LSKY_ERROR("Visualization factory returned nothing; staying in {}", to_string(m_state));
        return;
    }

    // -----------------------------------------------------------------
    // Exactly one resize listener per setup
    // -----------------------------------------------------------------
    m_resize_listener = m_mount->add_resize_listener(
        [this](u32 width, u32 height)
        {
            if (m_visualization)
            {
                m_visualization->resize(width, height);
            }
        });

    m_driver = std::make_unique<animation::AnimationDriver>(*m_visualization, m_blend, m_config.animation);

    m_state = LifecycleState::Ready;
    LSKY_INFO("Visualization ready: {} stars on a {}x{} surface",
              star_count,
              m_mount->get_width(),
              m_mount->get_height());
}

bool LifecycleController::is_presentable() const
{
    return is_ready() && m_mount->get_width() > 0 && m_mount->get_height() > 0;
}

void LifecycleController::tick(f64 delta_sec)
{
    if (m_state != LifecycleState::Ready || !m_driver)
    {
        return;
    }

    m_driver->tick(delta_sec);
}

void LifecycleController::teardown()
{
    if (m_state == LifecycleState::TornDown)
    {
        return;
    }

    if (m_state != LifecycleState::Ready)
    {
        LSKY_TRACE("teardown() from {}: nothing was set up", to_string(m_state));
    }

    m_driver.reset();

    if (m_mount != nullptr && m_resize_listener.has_value())
    {
        m_mount->remove_resize_listener(*m_resize_listener);
        m_resize_listener.reset();
    }

    if (m_visualization)
    {
        m_visualization->dispose();
        m_visualization.reset();
        LSKY_INFO("Visualization torn down");
    }

    m_mount = nullptr;
    m_state = LifecycleState::TornDown;
}

void LifecycleController::accept_load_result(std::optional<std::vector<catalog::LatentStar>> result)
{
    m_state = LifecycleState::AwaitingMount;

    if (!result.has_value())
    {
        LSKY_ERROR("Dataset load failed; the visualization will not start");
        return;
    }

    LSKY_INFO("Dataset loaded: {} stars", result->size());

    for (const auto& [spectral_class, centroid] : catalog::compute_class_centroids(*result))
    {
        LSKY_TRACE("  class {} latent centroid: ({:.3f}, {:.3f})", spectral_class, centroid.x, centroid.y);
    }

    m_stars = std::move(result);
}

} // namespace latentsky::app
