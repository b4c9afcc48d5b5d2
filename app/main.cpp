// TriangleFrame: draws a static red triangle into a GLFW window every frame

#include <tri/TriangleApp.hpp>
#include <tri/Logger.hpp>
#include <spdlog/spdlog.h>

int main() {
#ifndef NDEBUG
    Logger::instance().set_level(spdlog::level::trace);
#endif
    Logger::instance().info("Starting TriangleFrame...");

    try {
        tri::AppConfig config{
            .window_width = 1920,
            .window_height = 1080,
            .window_title = "TriangleFrame"
        };

        auto app = tri::TriangleApp::create(config);
        if (!app) {
            Logger::instance().error("Failed to create application: {}", app.error());
            return 1;
        }

        // Blocks until the window closes
        if (auto result = (*app)->run(); !result) {
            Logger::instance().error("Runtime error: {}", result.error());
            return 1;
        }

        Logger::instance().info("Application exited successfully");
        return 0;

    } catch (const std::exception& e) {
        Logger::instance().error("Unhandled exception: {}", e.what());
        return 1;
    }
}
