/// @file application.cpp
/// @brief Application implementation: init, main loop, shutdown.

#include "app/application.hpp"

#include "catalog/catalog_loader.hpp"
#include "core/logger.hpp"
#include "rendering/renderer.hpp"

#include <utility>

namespace latentsky::app
{

Application::Application(const VisualizerConfig& config)
    : m_config{config}
    , m_shader_dir{LSKY_SHADER_DIR}
{
    init();
}

Application::~Application()
{
    shutdown();
}

void Application::run()
{
    LSKY_INFO("Entering main loop...");
    main_loop();
    LSKY_INFO("Main loop exited");
}

// =================================================================
// Initialization
// =================================================================

void Application::init()
{
    // 1. Window (the mount target)
    m_window = std::make_unique<core::Window>(core::WindowConfig{
        .title = m_config.window_title,
        .width = m_config.window_width,
        .height = m_config.window_height,
    });

    // 2. Input, wired to SDL events
    m_input = std::make_unique<core::Input>();
    m_window->set_event_callback([this](const SDL_Event& event) {
        m_input->process_event(event);
    });

    // 3. Lifecycle controller: background loader + Vulkan renderer factory
    const auto dataset_path = m_config.dataset_path;
    auto loader = [dataset_path]() { return catalog::CatalogLoader::load_latent_csv_gz(dataset_path); };

    const rendering::RendererConfig renderer_config{
        .shader_dir = m_shader_dir,
        .enable_validation = m_config.enable_validation,
    };
    auto factory = [this, renderer_config](rendering::InstanceBufferSet buffers,
                                           const rendering::BlendController& blend)
        -> std::unique_ptr<rendering::Visualization>
    {
        return std::make_unique<rendering::Renderer>(
            *m_window, *m_input, std::move(buffers), blend, renderer_config);
    };

    m_controller = std::make_unique<LifecycleController>(m_config, std::move(loader), std::move(factory));

    LSKY_INFO("Dataset: {}", m_config.dataset_path.string());

    // 4. Start loading, then mount; setup runs once both are present
    m_controller->activate();
    m_controller->attach_mount(*m_window);

    m_last_frame_time = std::chrono::steady_clock::now();

    LSKY_INFO("Application initialized, waiting for data");
}

// =================================================================
// Shutdown
// =================================================================

void Application::shutdown()
{
    // Controller first: it removes its resize listener and releases the
    // render surface, both of which reference the window
    if (m_controller)
    {
        m_controller->teardown();
        m_controller.reset();
    }

    // The event callback captures `this` and references m_input
    if (m_window)
    {
        m_window->set_event_callback(nullptr);
    }
    m_input.reset();
    m_window.reset();
}

// =================================================================
// Main loop
// =================================================================

void Application::main_loop()
{
    while (!m_window->should_close())
    {
        m_input->new_frame();
        m_window->poll_events();

        if (m_input->is_key_pressed(SDL_SCANCODE_ESCAPE))
        {
            m_window->request_close();
            break;
        }

        auto now = std::chrono::steady_clock::now();
        const f64 delta_time_sec = std::chrono::duration<f64>(now - m_last_frame_time).count();
        m_last_frame_time = now;

        // Unclamped: the blend tween runs on wall-clock time
        m_controller->poll();
        m_controller->tick(delta_time_sec);

        // Nothing to draw before the data arrives or while minimized; avoid spinning a core
        if (!m_controller->is_presentable())
        {
            SDL_Delay(16);
        }
    }
}

} // namespace latentsky::app
