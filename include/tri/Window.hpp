#pragma once

#include <tri/Common.hpp>
#include <tri/FrameLoop.hpp>
#include <tri/VulkanContext.hpp>
#include <GLFW/glfw3.h>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tri {

class GraphicsQueue;

struct WindowConfig {
    int width = 1920;
    int height = 1080;
    std::string title = "TriangleFrame";
    bool resizable = true;
    vk::PresentModeKHR preferred_present_mode = vk::PresentModeKHR::eFifo;
};

/**
 * @brief GLFW window presenting through a Vulkan swapchain
 *
 * Swapchain images are handed out as render targets and presented once the
 * frame's GpuFuture completed. A resize or an out-of-date swapchain rebuilds
 * it and skips the frame that noticed.
 *
 * Call ensure_glfw_initialized() before creating the VulkanContext.
 */
class Window final : public SwapchainSource {
public:
    /**
     * @param context Windowed Vulkan context
     * @param queue Queue rendering and presentation go through
     * @param config Size, title and present mode
     */
    static std::expected<std::unique_ptr<Window>, std::string> create(
        const VulkanContext& context,
        GraphicsQueue& queue,
        const WindowConfig& config
    );

    /// Runs glfwInit once per process; throws when GLFW is unusable.
    static void ensure_glfw_initialized();

    ~Window() override;

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    [[nodiscard]] bool should_close() const;
    void poll_events() const;

    [[nodiscard]] GLFWwindow* get_window_handle() const { return m_handle; }
    [[nodiscard]] vk::Format color_format() const { return m_swapchain.format.format; }
    [[nodiscard]] vk::Extent2D extent() const { return m_swapchain.extent; }
    [[nodiscard]] vk::PresentModeKHR present_mode() const { return m_swapchain.present_mode; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(m_swapchain.images.size()); }

    /**
     * @brief Acquire the next swapchain image
     *
     * Errors when the swapchain had to be rebuilt first; the caller skips the
     * frame. A suboptimal image is still returned and the rebuild happens on
     * the next call.
     */
    std::expected<AcquiredFrame, std::string> acquire_frame() override;

    /// Signals the image's present semaphore after rendered, then queues the present.
    std::expected<void, std::string> present_frame(GpuFuture rendered, uint32_t image_index) override;

    /// The acquired image is only returned by retiring the swapchain, so the next acquire rebuilds.
    void abandon_frame(uint32_t image_index) override;

    void mark_resize_needed() { m_needs_resize = true; }

private:
    struct Swapchain {
        vk::SwapchainKHR handle;
        vk::SurfaceFormatKHR format;
        vk::PresentModeKHR present_mode = vk::PresentModeKHR::eFifo;
        vk::Extent2D extent;
        std::vector<vk::Image> images;
        std::vector<vk::ImageView> views;
        std::vector<vk::Semaphore> render_finished; // one per image
    };

    // An acquire semaphore may be reused once the queue timeline passed the
    // value of the last submission that waited on it.
    struct AcquireSlot {
        vk::Semaphore semaphore;
        uint64_t reusable_after = 0;
    };

    Window(GLFWwindow* handle, const VulkanContext& context, GraphicsQueue& queue, vk::PresentModeKHR preferred);

    std::expected<void, std::string> create_surface();
    std::expected<void, std::string> build_swapchain();
    std::expected<void, std::string> build_acquire_ring();
    std::expected<void, std::string> rebuild();
    void destroy_swapchain(Swapchain& swapchain);
    void destroy_acquire_ring();

    GLFWwindow* m_handle;
    const VulkanContext* m_context;
    GraphicsQueue* m_queue;
    vk::Device m_device;
    vk::PresentModeKHR m_preferred_present_mode;

    vk::SurfaceKHR m_surface;
    Swapchain m_swapchain;

    // image_count + 1 slots
    std::vector<AcquireSlot> m_acquire_ring;
    uint32_t m_next_slot = 0;
    std::optional<uint32_t> m_in_flight_slot;

    bool m_needs_resize = false;
};

} // namespace tri
