#pragma once

#include "DeviceAllocator.hpp"
#include "FrameLoop.hpp"
#include "FrameRenderer.hpp"
#include "GraphicsQueue.hpp"
#include "VulkanContext.hpp"
#include "Window.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace tri {

/**
 * @brief Configuration for the triangle application
 */
struct AppConfig {
    int window_width = 1920;
    int window_height = 1080;
    std::string window_title = "TriangleFrame";
    bool resizable = true;
    vk::PresentModeKHR present_mode = vk::PresentModeKHR::eFifo;
    uint64_t frame_limit = 0; // 0 runs until the window closes
};

/**
 * @brief Owns the whole stack (context, queue, window, renderer) and runs the frame loop
 */
class TriangleApp {
public:
    /**
     * @brief Create the application
     *
     * @param config Application configuration
     * @return App instance or error message
     */
    static std::expected<std::unique_ptr<TriangleApp>, std::string> create(const AppConfig& config = {});

    ~TriangleApp();

    TriangleApp(const TriangleApp&) = delete;
    TriangleApp& operator=(const TriangleApp&) = delete;

    /**
     * @brief Run the main loop until the window closes or the frame limit is hit
     */
    std::expected<void, std::string> run();

private:
    explicit TriangleApp(const AppConfig& config);

    std::expected<void, std::string> initialize();

    AppConfig m_config;

    // Destroyed bottom-up: renderer, window, allocator, queue, context
    std::unique_ptr<VulkanContext> m_context;
    std::unique_ptr<GraphicsQueue> m_queue;
    std::unique_ptr<DeviceAllocator> m_allocator;
    std::unique_ptr<Window> m_window;
    std::unique_ptr<FrameRenderer> m_renderer;
};

} // namespace tri
