#include <tri/TriangleApp.hpp>
#include <tri/Logger.hpp>
#include <chrono>

namespace tri {

TriangleApp::TriangleApp(const AppConfig& config)
    : m_config(config)
{}

TriangleApp::~TriangleApp() {
    // The renderer drains the queue on destruction
    m_renderer.reset();
    m_window.reset();
}

std::expected<std::unique_ptr<TriangleApp>, std::string> TriangleApp::create(const AppConfig& config) {
    auto app = std::unique_ptr<TriangleApp>(new TriangleApp(config));

    if (auto result = app->initialize(); !result) {
        return std::unexpected(result.error());
    }

    return app;
}

std::expected<void, std::string> TriangleApp::initialize() {
    Logger::instance().info("Initializing TriangleFrame...");

    try {
        Window::ensure_glfw_initialized();
        m_context = std::make_unique<VulkanContext>(m_config.window_title, ContextMode::Windowed);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to create Vulkan context: {}", e.what()));
    }

    auto queue = GraphicsQueue::create(*m_context);
    if (!queue) {
        return std::unexpected(std::format("Failed to create graphics queue: {}", queue.error()));
    }
    m_queue = std::move(*queue);

    m_allocator = std::make_unique<DeviceAllocator>(*m_context);

    auto window = Window::create(*m_context, *m_queue, WindowConfig{
        .width = m_config.window_width,
        .height = m_config.window_height,
        .title = m_config.window_title,
        .resizable = m_config.resizable,
        .preferred_present_mode = m_config.present_mode,
    });
    if (!window) {
        return std::unexpected(std::format("Failed to create window: {}", window.error()));
    }
    m_window = std::move(*window);

    auto renderer = FrameRenderer::create(*m_context, *m_allocator, *m_queue, RenderPassConfig{
        .color_format = m_window->color_format(),
        .final_layout = vk::ImageLayout::ePresentSrcKHR,
    });
    if (!renderer) {
        return std::unexpected(std::format("Failed to create frame renderer: {}", renderer.error()));
    }
    m_renderer = std::move(*renderer);

    Logger::instance().info("TriangleFrame initialized successfully");
    return {};
}

std::expected<void, std::string> TriangleApp::run() {
    Logger::instance().info("Entering main loop");

    FrameLoop loop(*m_queue);
    uint64_t skipped = 0;
    auto last_report = std::chrono::steady_clock::now();
    uint64_t presented_at_last_report = 0;

    while (!m_window->should_close()) {
        m_window->poll_events();

        auto outcome = loop.run_frame(*m_window, *m_renderer);
        if (outcome != FrameOutcome::Presented) {
            ++skipped;
            Logger::instance().trace("Frame outcome: {}", to_string(outcome));
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= std::chrono::seconds(5)) {
            auto seconds = std::chrono::duration<double>(now - last_report).count();
            Logger::instance().debug("{:.1f} fps, {} frames skipped so far",
                static_cast<double>(loop.frames_presented() - presented_at_last_report) / seconds, skipped);
            last_report = now;
            presented_at_last_report = loop.frames_presented();
        }

        if (m_config.frame_limit != 0 && loop.frames_presented() >= m_config.frame_limit) {
            Logger::instance().info("Frame limit of {} reached", m_config.frame_limit);
            break;
        }
    }

    if (auto result = loop.finish(); !result) {
        return std::unexpected(std::format("Failed to wait for the last frame: {}", result.error()));
    }
    if (auto result = m_queue->drain(); !result) {
        return std::unexpected(std::format("Failed to drain graphics queue: {}", result.error()));
    }

    Logger::instance().info("Shutdown complete ({} frames presented, {} skipped)", loop.frames_presented(), skipped);
    return {};
}

} // namespace tri
