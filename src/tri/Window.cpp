#include <tri/Window.hpp>
#include <tri/GraphicsQueue.hpp>
#include <tri/Logger.hpp>
#include <algorithm>
#include <stdexcept>

namespace tri {

namespace {

vk::SurfaceFormatKHR pick_surface_format(const std::vector<vk::SurfaceFormatKHR>& offered) {
    auto srgb = std::ranges::find_if(offered, [](const vk::SurfaceFormatKHR& candidate) {
        return candidate.format == vk::Format::eB8G8R8A8Srgb
            && candidate.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear;
    });
    return srgb != offered.end() ? *srgb : offered.front();
}

vk::PresentModeKHR pick_present_mode(const std::vector<vk::PresentModeKHR>& offered, vk::PresentModeKHR preferred) {
    if (std::ranges::contains(offered, preferred)) {
        return preferred;
    }
    // FIFO support is mandatory
    Logger::instance().warn("{} is not offered by the surface, presenting with FIFO", vk::to_string(preferred));
    return vk::PresentModeKHR::eFifo;
}

vk::Extent2D pick_extent(const vk::SurfaceCapabilitiesKHR& caps, int framebuffer_width, int framebuffer_height) {
    if (caps.currentExtent.width != UINT32_MAX) {
        return caps.currentExtent;
    }
    return vk::Extent2D{
        std::clamp(static_cast<uint32_t>(framebuffer_width), caps.minImageExtent.width, caps.maxImageExtent.width),
        std::clamp(static_cast<uint32_t>(framebuffer_height), caps.minImageExtent.height, caps.maxImageExtent.height),
    };
}

std::expected<vk::Semaphore, std::string> make_binary_semaphore(vk::Device device) {
    auto semaphore_res = device.createSemaphore(vk::SemaphoreCreateInfo{});
    CHECK_VK_RESULT(semaphore_res, "vkCreateSemaphore: {}");
    return semaphore_res.value;
}

} // namespace

void Window::ensure_glfw_initialized() {
    static const bool ready = glfwInit() == GLFW_TRUE;
    if (!ready) {
        throw std::runtime_error("glfwInit failed");
    }
}

std::expected<std::unique_ptr<Window>, std::string> Window::create(
    const VulkanContext& context,
    GraphicsQueue& queue,
    const WindowConfig& config
) {
    if (context.mode() != ContextMode::Windowed) {
        return std::unexpected("A Window requires a VulkanContext created with ContextMode::Windowed");
    }

    try {
        ensure_glfw_initialized();
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Window creation failed: ") + e.what());
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, config.resizable ? GLFW_TRUE : GLFW_FALSE);
    GLFWwindow* handle = glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
    if (!handle) {
        return std::unexpected(std::format("glfwCreateWindow failed for {}x{}", config.width, config.height));
    }

    // From here on the destructor releases whatever was created
    std::unique_ptr<Window> window{new Window(handle, context, queue, config.preferred_present_mode)};
    if (auto surface = window->create_surface(); !surface) {
        return std::unexpected(surface.error());
    }
    if (auto swapchain = window->build_swapchain(); !swapchain) {
        return std::unexpected(swapchain.error());
    }
    if (auto ring = window->build_acquire_ring(); !ring) {
        return std::unexpected(ring.error());
    }

    glfwSetWindowUserPointer(handle, window.get());
    glfwSetKeyCallback(handle, [](GLFWwindow* w, int key, int, int action, int) {
        if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) {
            glfwSetWindowShouldClose(w, GLFW_TRUE);
        }
    });
    glfwSetFramebufferSizeCallback(handle, [](GLFWwindow* w, int, int) {
        if (auto* self = static_cast<Window*>(glfwGetWindowUserPointer(w))) {
            self->mark_resize_needed();
        }
    });

    Logger::instance().info("Window '{}' {}x{}: {} images of {}, {}",
        config.title, window->extent().width, window->extent().height, window->image_count(),
        vk::to_string(window->color_format()), vk::to_string(window->present_mode()));
    return window;
}

Window::Window(GLFWwindow* handle, const VulkanContext& context, GraphicsQueue& queue, vk::PresentModeKHR preferred)
    : m_handle(handle)
    , m_context(&context)
    , m_queue(&queue)
    , m_device(context.device())
    , m_preferred_present_mode(preferred)
{
}

Window::~Window() {
    if (auto idle_res = m_device.waitIdle(); idle_res != vk::Result::eSuccess) {
        Logger::instance().error("Device did not go idle before window teardown: {}", vk::to_string(idle_res));
    }
    destroy_acquire_ring();
    destroy_swapchain(m_swapchain);
    if (m_surface) {
        m_context->instance().destroySurfaceKHR(m_surface);
    }
    glfwDestroyWindow(m_handle);
}

bool Window::should_close() const {
    return glfwWindowShouldClose(m_handle) == GLFW_TRUE;
}

void Window::poll_events() const {
    glfwPollEvents();
}

std::expected<void, std::string> Window::create_surface() {
    VkSurfaceKHR raw_surface = VK_NULL_HANDLE;
    const VkResult created = glfwCreateWindowSurface(
        static_cast<VkInstance>(m_context->instance()), m_handle, nullptr, &raw_surface);
    if (created != VK_SUCCESS) {
        return std::unexpected(std::format("glfwCreateWindowSurface: {}", vk::to_string(static_cast<vk::Result>(created))));
    }
    m_surface = vk::SurfaceKHR{raw_surface};

    auto presentable_res = m_context->physical_device().getSurfaceSupportKHR(m_queue->family_index(), m_surface);
    CHECK_VK_RESULT(presentable_res, "Surface support query failed: {}");
    if (!presentable_res.value) {
        return std::unexpected("The graphics queue family cannot present to this window");
    }
    return {};
}

std::expected<void, std::string> Window::build_swapchain() {
    const auto gpu = m_context->physical_device();
    auto caps_res = gpu.getSurfaceCapabilitiesKHR(m_surface);
    CHECK_VK_RESULT(caps_res, "Surface capabilities query failed: {}");
    auto formats_res = gpu.getSurfaceFormatsKHR(m_surface);
    CHECK_VK_RESULT(formats_res, "Surface format query failed: {}");
    auto modes_res = gpu.getSurfacePresentModesKHR(m_surface);
    CHECK_VK_RESULT(modes_res, "Present mode query failed: {}");
    if (formats_res.value.empty()) {
        return std::unexpected("Surface offers no formats");
    }

    const auto& caps = caps_res.value;
    int framebuffer_width = 0;
    int framebuffer_height = 0;
    glfwGetFramebufferSize(m_handle, &framebuffer_width, &framebuffer_height);

    Swapchain next;
    next.format = pick_surface_format(formats_res.value);
    next.present_mode = pick_present_mode(modes_res.value, m_preferred_present_mode);
    next.extent = pick_extent(caps, framebuffer_width, framebuffer_height);

    // One image more than the minimum; maxImageCount 0 means unbounded
    uint32_t min_images = caps.minImageCount + 1;
    if (caps.maxImageCount != 0) {
        min_images = std::min(min_images, caps.maxImageCount);
    }

    vk::SwapchainCreateInfoKHR info{};
    info.surface = m_surface;
    info.minImageCount = min_images;
    info.imageFormat = next.format.format;
    info.imageColorSpace = next.format.colorSpace;
    info.imageExtent = next.extent;
    info.imageArrayLayers = 1;
    info.imageUsage = vk::ImageUsageFlagBits::eColorAttachment;
    info.imageSharingMode = vk::SharingMode::eExclusive;
    info.preTransform = caps.currentTransform;
    info.compositeAlpha = vk::CompositeAlphaFlagBitsKHR::eOpaque;
    info.presentMode = next.present_mode;
    info.clipped = vk::True;
    info.oldSwapchain = m_swapchain.handle;

    auto handle_res = m_device.createSwapchainKHR(info);
    CHECK_VK_RESULT(handle_res, "vkCreateSwapchainKHR: {}");
    next.handle = handle_res.value;

    // The retired swapchain may only go once its replacement exists
    destroy_swapchain(m_swapchain);
    m_swapchain = std::move(next);

    auto images_res = m_device.getSwapchainImagesKHR(m_swapchain.handle);
    CHECK_VK_RESULT(images_res, "vkGetSwapchainImagesKHR: {}");
    m_swapchain.images = std::move(images_res.value);

    for (vk::Image image : m_swapchain.images) {
        const vk::ImageViewCreateInfo view_info{
            {}, image, vk::ImageViewType::e2D, m_swapchain.format.format, {},
            vk::ImageSubresourceRange{vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1},
        };
        auto view_res = m_device.createImageView(view_info);
        CHECK_VK_RESULT(view_res, "Swapchain image view: {}");
        m_swapchain.views.push_back(view_res.value);

        auto semaphore = make_binary_semaphore(m_device);
        if (!semaphore) {
            return std::unexpected(semaphore.error());
        }
        m_swapchain.render_finished.push_back(*semaphore);
    }
    return {};
}

std::expected<void, std::string> Window::build_acquire_ring() {
    const uint32_t slots = image_count() + 1;
    for (uint32_t i = 0; i < slots; ++i) {
        auto semaphore = make_binary_semaphore(m_device);
        if (!semaphore) {
            return std::unexpected(semaphore.error());
        }
        m_acquire_ring.push_back(AcquireSlot{.semaphore = *semaphore});
    }
    m_next_slot = 0;
    m_in_flight_slot.reset();
    Logger::instance().debug("Acquire ring of {} semaphores over {} images", slots, image_count());
    return {};
}

std::expected<void, std::string> Window::rebuild() {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_handle, &width, &height);
    // A minimized window has a zero sized framebuffer
    while ((width == 0 || height == 0) && !should_close()) {
        glfwWaitEvents();
        glfwGetFramebufferSize(m_handle, &width, &height);
    }
    if (should_close()) {
        return std::unexpected("Window closed while minimized");
    }

    // Presentation still holds the binary semaphores, the timeline alone does not cover them
    auto idle_res = m_device.waitIdle();
    CHECK_VK_RESULT_VOID(idle_res, "vkDeviceWaitIdle before swapchain rebuild: {}");

    const vk::Format previous_format = color_format();
    destroy_acquire_ring();
    if (auto built = build_swapchain(); !built) {
        return built;
    }
    if (auto ring = build_acquire_ring(); !ring) {
        return ring;
    }
    if (color_format() != previous_format) {
        Logger::instance().warn("Swapchain format went from {} to {}, frames will be skipped",
            vk::to_string(previous_format), vk::to_string(color_format()));
    }
    Logger::instance().info("Swapchain rebuilt at {}x{}", extent().width, extent().height);
    return {};
}

std::expected<AcquiredFrame, std::string> Window::acquire_frame() {
    if (m_needs_resize) {
        if (auto rebuilt = rebuild(); !rebuilt) {
            return std::unexpected(std::format("Swapchain rebuild failed: {}", rebuilt.error()));
        }
        m_needs_resize = false;
        return std::unexpected("Swapchain rebuilt, frame skipped");
    }

    // The previous frame's submissions all lie at or below the queue's last value
    if (m_in_flight_slot) {
        m_acquire_ring[*m_in_flight_slot].reusable_after = m_queue->last_signalled();
        m_in_flight_slot.reset();
    }

    const uint32_t slot_index = m_next_slot;
    const AcquireSlot& slot = m_acquire_ring[slot_index];
    if (auto waited = m_queue->wait_for(slot.reusable_after, UINT64_MAX); !waited) {
        return std::unexpected(waited.error());
    }

    auto [result, image_index] = m_device.acquireNextImageKHR(m_swapchain.handle, UINT64_MAX, slot.semaphore, nullptr);
    switch (result) {
    case vk::Result::eSuccess:
        break;
    case vk::Result::eSuboptimalKHR:
        m_needs_resize = true;
        break;
    case vk::Result::eErrorOutOfDateKHR:
        // Nothing was signalled, the slot stays usable
        if (auto rebuilt = rebuild(); !rebuilt) {
            return std::unexpected(std::format("Swapchain rebuild failed: {}", rebuilt.error()));
        }
        return std::unexpected("Swapchain out of date, frame skipped");
    default:
        Logger::instance().error("vkAcquireNextImageKHR: {}", vk::to_string(result));
        return std::unexpected(std::format("Could not acquire a swapchain image: {}", vk::to_string(result)));
    }

    m_in_flight_slot = slot_index;
    m_next_slot = (slot_index + 1) % static_cast<uint32_t>(m_acquire_ring.size());

    return AcquiredFrame{
        .image_index = image_index,
        .target = TargetImage{
            .view = m_swapchain.views[image_index],
            .format = color_format(),
            .extent = extent(),
            .usage = vk::ImageUsageFlagBits::eColorAttachment,
        },
        .ready = GpuFuture::after_semaphore(slot.semaphore, vk::PipelineStageFlagBits::eColorAttachmentOutput),
    };
}

std::expected<void, std::string> Window::present_frame(GpuFuture rendered, uint32_t image_index) {
    if (image_index >= m_swapchain.render_finished.size()) {
        return std::unexpected(std::format("No swapchain image {} (have {})", image_index, image_count()));
    }

    const vk::Semaphore render_finished = m_swapchain.render_finished[image_index];
    if (auto signalled = std::move(rendered).then_signal_semaphore(*m_queue, render_finished); !signalled) {
        return std::unexpected(signalled.error());
    }

    const auto present_info = vk::PresentInfoKHR{}
        .setWaitSemaphores(render_finished)
        .setSwapchains(m_swapchain.handle)
        .setImageIndices(image_index);

    // VULKAN_HPP_ASSERT_ON_RESULT is a no-op, so out-of-date comes back as a plain result
    const vk::Result result = m_queue->queue().presentKHR(present_info);
    switch (result) {
    case vk::Result::eSuccess:
        return {};
    case vk::Result::eSuboptimalKHR:
        m_needs_resize = true;
        return {};
    case vk::Result::eErrorOutOfDateKHR:
        m_needs_resize = true;
        return std::unexpected("Swapchain out of date on present");
    default:
        Logger::instance().error("vkQueuePresentKHR: {}", vk::to_string(result));
        return std::unexpected(std::format("Present failed: {}", vk::to_string(result)));
    }
}

void Window::abandon_frame(uint32_t image_index) {
    Logger::instance().debug("Swapchain image {} abandoned, rebuilding before the next frame", image_index);
    m_needs_resize = true;
}

void Window::destroy_swapchain(Swapchain& swapchain) {
    for (vk::ImageView view : swapchain.views) {
        m_device.destroyImageView(view);
    }
    for (vk::Semaphore semaphore : swapchain.render_finished) {
        m_device.destroySemaphore(semaphore);
    }
    if (swapchain.handle) {
        m_device.destroySwapchainKHR(swapchain.handle);
    }
    swapchain = Swapchain{};
}

void Window::destroy_acquire_ring() {
    for (const AcquireSlot& slot : m_acquire_ring) {
        m_device.destroySemaphore(slot.semaphore);
    }
    m_acquire_ring.clear();
    m_in_flight_slot.reset();
}

} // namespace tri
