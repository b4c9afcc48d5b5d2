#include <catch2/catch_test_macros.hpp>

#include <tri/CommandAllocator.hpp>
#include <tri/DeviceAllocator.hpp>
#include <tri/FrameRenderer.hpp>
#include <tri/GraphicsQueue.hpp>
#include <tri/Logger.hpp>
#include <tri/VulkanContext.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

using namespace tri;

namespace {

constexpr vk::Format OFFSCREEN_FORMAT = vk::Format::eR8G8B8A8Unorm;
constexpr uint32_t SIZE = 100;

// Colour attachment that can be copied out after rendering
struct OffscreenImage {
    vk::Device device;
    DeviceAllocation memory;
    vk::Image image;
    vk::ImageView view;

    OffscreenImage(const DeviceAllocator& allocator, vk::Extent2D extent)
        : device(allocator.device())
    {
        auto image_info = vk::ImageCreateInfo()
            .setImageType(vk::ImageType::e2D)
            .setFormat(OFFSCREEN_FORMAT)
            .setExtent(vk::Extent3D{extent.width, extent.height, 1})
            .setMipLevels(1)
            .setArrayLayers(1)
            .setSamples(vk::SampleCountFlagBits::e1)
            .setTiling(vk::ImageTiling::eOptimal)
            .setUsage(vk::ImageUsageFlagBits::eColorAttachment | vk::ImageUsageFlagBits::eTransferSrc)
            .setSharingMode(vk::SharingMode::eExclusive)
            .setInitialLayout(vk::ImageLayout::eUndefined);

        auto image_res = device.createImage(image_info);
        REQUIRE(image_res.result == vk::Result::eSuccess);
        image = image_res.value;

        auto allocation = allocator.allocate(device.getImageMemoryRequirements(image), memory_preference::DEVICE_ONLY);
        REQUIRE(allocation.has_value());
        memory = std::move(*allocation);
        REQUIRE(device.bindImageMemory(image, memory.memory(), 0) == vk::Result::eSuccess);

        auto view_info = vk::ImageViewCreateInfo()
            .setImage(image)
            .setViewType(vk::ImageViewType::e2D)
            .setFormat(OFFSCREEN_FORMAT)
            .setSubresourceRange(vk::ImageSubresourceRange(vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1));
        auto view_res = device.createImageView(view_info);
        REQUIRE(view_res.result == vk::Result::eSuccess);
        view = view_res.value;
    }

    ~OffscreenImage()
    {
        device.destroyImageView(view);
        device.destroyImage(image);
    }

    OffscreenImage(const OffscreenImage&) = delete;
    OffscreenImage& operator=(const OffscreenImage&) = delete;

    [[nodiscard]] TargetImage target(vk::Extent2D extent) const
    {
        return TargetImage{
            .view = view,
            .format = OFFSCREEN_FORMAT,
            .extent = extent,
            .usage = vk::ImageUsageFlagBits::eColorAttachment | vk::ImageUsageFlagBits::eTransferSrc,
        };
    }
};

struct HeadlessRenderer {
    VulkanContext context{"FrameRenderer Test", ContextMode::Headless};
    std::unique_ptr<GraphicsQueue> queue;
    std::unique_ptr<DeviceAllocator> allocator;
    std::unique_ptr<FrameRenderer> renderer;

    HeadlessRenderer()
    {
        auto queue_result = GraphicsQueue::create(context);
        REQUIRE(queue_result.has_value());
        queue = std::move(*queue_result);

        allocator = std::make_unique<DeviceAllocator>(context);

        auto renderer_result = FrameRenderer::create(context, *allocator, *queue, RenderPassConfig{
            .color_format = OFFSCREEN_FORMAT,
            .final_layout = vk::ImageLayout::eTransferSrcOptimal,
        });
        REQUIRE(renderer_result.has_value());
        renderer = std::move(*renderer_result);
    }

    ~HeadlessRenderer()
    {
        renderer.reset();
    }
};

// Record image -> buffer copy of a rendered (eTransferSrcOptimal) image
void record_readback(vk::CommandBuffer cmd, vk::Image image, vk::Buffer buffer, vk::Extent2D extent)
{
    auto begin_res = cmd.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    REQUIRE(begin_res == vk::Result::eSuccess);

    auto to_transfer = vk::ImageMemoryBarrier()
        .setSrcAccessMask(vk::AccessFlagBits::eColorAttachmentWrite)
        .setDstAccessMask(vk::AccessFlagBits::eTransferRead)
        .setOldLayout(vk::ImageLayout::eTransferSrcOptimal)
        .setNewLayout(vk::ImageLayout::eTransferSrcOptimal)
        .setSrcQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
        .setDstQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
        .setImage(image)
        .setSubresourceRange(vk::ImageSubresourceRange(vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1));
    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eColorAttachmentOutput,
        vk::PipelineStageFlagBits::eTransfer,
        {}, nullptr, nullptr, to_transfer);

    auto region = vk::BufferImageCopy()
        .setBufferOffset(0)
        .setBufferRowLength(0)
        .setBufferImageHeight(0)
        .setImageSubresource(vk::ImageSubresourceLayers(vk::ImageAspectFlagBits::eColor, 0, 0, 1))
        .setImageOffset({0, 0, 0})
        .setImageExtent({extent.width, extent.height, 1});
    cmd.copyImageToBuffer(image, vk::ImageLayout::eTransferSrcOptimal, buffer, region);

    auto to_host = vk::BufferMemoryBarrier()
        .setSrcAccessMask(vk::AccessFlagBits::eTransferWrite)
        .setDstAccessMask(vk::AccessFlagBits::eHostRead)
        .setSrcQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
        .setDstQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
        .setBuffer(buffer)
        .setOffset(0)
        .setSize(VK_WHOLE_SIZE);
    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eTransfer,
        vk::PipelineStageFlagBits::eHost,
        {}, nullptr, to_host, nullptr);

    REQUIRE(cmd.end() == vk::Result::eSuccess);
}

std::array<uint8_t, 4> pixel_at(const std::vector<std::byte>& pixels, uint32_t x, uint32_t y)
{
    auto base = (static_cast<std::size_t>(y) * SIZE + x) * 4;
    return {
        static_cast<uint8_t>(pixels[base + 0]),
        static_cast<uint8_t>(pixels[base + 1]),
        static_cast<uint8_t>(pixels[base + 2]),
        static_cast<uint8_t>(pixels[base + 3]),
    };
}

constexpr std::array<uint8_t, 4> CLEAR = {0, 0, 0, 0};
constexpr std::array<uint8_t, 4> RED = {255, 0, 0, 255};

} // namespace

TEST_CASE("Rendering a 100x100 frame draws a red triangle on a transparent background", "[renderer][vulkan]")
{
    Logger::instance().set_level(spdlog::level::debug);
    HeadlessRenderer gpu;
    const vk::Extent2D extent{SIZE, SIZE};
    OffscreenImage image(*gpu.allocator, extent);

    auto readback = DeviceBuffer::create(
        *gpu.allocator,
        static_cast<vk::DeviceSize>(SIZE) * SIZE * 4,
        vk::BufferUsageFlagBits::eTransferDst,
        memory_preference::READBACK);
    REQUIRE(readback.has_value());

    auto copy_commands = CommandAllocator::create(gpu.context.device(), gpu.queue->family_index());
    REQUIRE(copy_commands.has_value());
    auto copy_cmd = (*copy_commands)->allocate(vk::CommandBufferLevel::ePrimary);
    REQUIRE(copy_cmd.has_value());
    record_readback(copy_cmd->handle(), image.image, readback->buffer(), extent);

    auto rendered = gpu.renderer->render(GpuFuture::now(), image.target(extent));
    REQUIRE(rendered.has_value());
    REQUIRE(gpu.renderer->retired_count() == 1);

    auto copied = std::move(*rendered).then_execute(*gpu.queue, copy_cmd->handle());
    REQUIRE(copied.has_value());
    REQUIRE(std::move(*copied).wait(*gpu.queue).has_value());

    std::vector<std::byte> pixels(readback->size());
    REQUIRE(readback->allocation().read(pixels).has_value());

    SECTION("background keeps the clear colour")
    {
        REQUIRE(pixel_at(pixels, 5, 5) == CLEAR);
        REQUIRE(pixel_at(pixels, 90, 10) == CLEAR);
        REQUIRE(pixel_at(pixels, 95, 95) == CLEAR);
    }

    SECTION("triangle interior is opaque red")
    {
        REQUIRE(pixel_at(pixels, 50, 60) == RED);
        REQUIRE(pixel_at(pixels, 50, 35) == RED);
        REQUIRE(pixel_at(pixels, 30, 72) == RED);
    }
}

TEST_CASE("Target with a different format is rejected", "[renderer][vulkan][error]")
{
    Logger::instance().set_level(spdlog::level::off);
    HeadlessRenderer gpu;
    const vk::Extent2D extent{SIZE, SIZE};
    OffscreenImage image(*gpu.allocator, extent);

    auto target = image.target(extent);
    target.format = vk::Format::eB8G8R8A8Unorm;

    const auto submitted_before = gpu.queue->last_signalled();
    auto rendered = gpu.renderer->render(GpuFuture::now(), target);

    REQUIRE(!rendered.has_value());
    REQUIRE(rendered.error().kind == RenderError::Kind::IncompatibleTarget);
    REQUIRE(rendered.error().recoverable());
    REQUIRE(gpu.queue->last_signalled() == submitted_before);
    REQUIRE(gpu.renderer->retired_count() == 0);

    SECTION("the failure is deterministic")
    {
        auto again = gpu.renderer->render(GpuFuture::now(), target);
        REQUIRE(!again.has_value());
        REQUIRE(again.error().kind == RenderError::Kind::IncompatibleTarget);
        REQUIRE(again.error().message == rendered.error().message);
    }

    SECTION("a matching target still renders afterwards")
    {
        auto ok = gpu.renderer->render(GpuFuture::now(), image.target(extent));
        REQUIRE(ok.has_value());
        REQUIRE(std::move(*ok).wait(*gpu.queue).has_value());
    }
}

TEST_CASE("Target beyond the framebuffer limit is skipped", "[renderer][vulkan][error]")
{
    Logger::instance().set_level(spdlog::level::off);
    HeadlessRenderer gpu;
    const vk::Extent2D extent{SIZE, SIZE};
    OffscreenImage image(*gpu.allocator, extent);

    const uint32_t limit = gpu.context.physical_device().getProperties().limits.maxFramebufferWidth;
    REQUIRE(limit < UINT32_MAX);

    const auto submitted_before = gpu.queue->last_signalled();
    auto rendered = gpu.renderer->render(GpuFuture::now(), image.target(vk::Extent2D{limit + 1, SIZE}));

    REQUIRE(!rendered.has_value());
    REQUIRE(rendered.error().kind == RenderError::Kind::IncompatibleTarget);
    REQUIRE(rendered.error().recoverable());
    REQUIRE(gpu.queue->last_signalled() == submitted_before);
    REQUIRE(gpu.renderer->retired_count() == 0);

    auto ok = gpu.renderer->render(GpuFuture::now(), image.target(extent));
    REQUIRE(ok.has_value());
    REQUIRE(std::move(*ok).wait(*gpu.queue).has_value());
}

namespace {

// Timeline semaphore the host signals by hand. Released up to final_value on
// destruction so nothing queued behind it stays blocked.
struct HostGate {
    vk::Device device;
    vk::Semaphore semaphore;
    uint64_t final_value;

    HostGate(vk::Device device, uint64_t final_value)
        : device(device)
        , final_value(final_value)
    {
        auto type_info = vk::SemaphoreTypeCreateInfo(vk::SemaphoreType::eTimeline, 0);
        auto semaphore_res = device.createSemaphore(vk::SemaphoreCreateInfo().setPNext(&type_info));
        REQUIRE(semaphore_res.result == vk::Result::eSuccess);
        semaphore = semaphore_res.value;
    }

    ~HostGate()
    {
        auto counter = device.getSemaphoreCounterValue(semaphore);
        if (counter.result == vk::Result::eSuccess && counter.value < final_value) {
            (void)device.signalSemaphore(vk::SemaphoreSignalInfo(semaphore, final_value));
        }
        (void)device.waitIdle();
        device.destroySemaphore(semaphore);
    }

    HostGate(const HostGate&) = delete;
    HostGate& operator=(const HostGate&) = delete;

    void open(uint64_t value) const
    {
        REQUIRE(device.signalSemaphore(vk::SemaphoreSignalInfo(semaphore, value)) == vk::Result::eSuccess);
    }
};

} // namespace

TEST_CASE("Render waits for the future it was given", "[renderer][vulkan]")
{
    Logger::instance().set_level(spdlog::level::info);
    HeadlessRenderer gpu;
    const vk::Extent2D extent{SIZE, SIZE};
    OffscreenImage image(*gpu.allocator, extent);

    constexpr uint64_t FRAMES = 3;
    constexpr uint64_t BLOCKED_TIMEOUT_NS = 20'000'000;
    HostGate gate(gpu.context.device(), FRAMES);

    // Frame i runs after frame i - 1 and after the gate reached i + 1
    std::vector<uint64_t> values;
    std::optional<GpuFuture> previous;
    for (uint64_t frame = 0; frame < FRAMES; ++frame) {
        GpuFuture gated = GpuFuture::after_timeline(gate.semaphore, frame + 1);
        GpuFuture before = previous ? std::move(*previous).join(std::move(gated)) : std::move(gated);
        auto rendered = gpu.renderer->render(std::move(before), image.target(extent));
        REQUIRE(rendered.has_value());

        auto value = rendered->timeline_value(gpu.queue->timeline());
        REQUIRE(value.has_value());
        values.push_back(*value);
        previous.emplace(std::move(*rendered));
    }
    REQUIRE(values[0] < values[1]);
    REQUIRE(values[1] < values[2]);

    for (uint64_t frame = 0; frame < FRAMES; ++frame) {
        INFO("frame " << frame);
        REQUIRE(!gpu.queue->wait_for(values[frame], BLOCKED_TIMEOUT_NS).has_value());
        auto completed = gpu.queue->completed_value();
        REQUIRE(completed.has_value());
        REQUIRE(*completed < values[frame]);

        gate.open(frame + 1);
        REQUIRE(gpu.queue->wait_for(values[frame], UINT64_MAX).has_value());
    }
    REQUIRE(std::move(*previous).wait(*gpu.queue).has_value());
}

TEST_CASE("Chained frames retire their resources", "[renderer][vulkan]")
{
    Logger::instance().set_level(spdlog::level::info);
    HeadlessRenderer gpu;
    const vk::Extent2D extent{SIZE, SIZE};
    OffscreenImage image(*gpu.allocator, extent);

    std::optional<GpuFuture> previous;
    for (int frame = 0; frame < 3; ++frame) {
        GpuFuture before = previous ? std::move(*previous) : GpuFuture::now();
        auto rendered = gpu.renderer->render(std::move(before), image.target(extent));
        REQUIRE(rendered.has_value());
        previous.emplace(std::move(*rendered));
    }
    REQUIRE(gpu.renderer->retired_count() == 3);

    SECTION("each frame signals a later timeline value")
    {
        REQUIRE(previous->timeline_value(gpu.queue->timeline()) == gpu.queue->last_signalled());
        REQUIRE(gpu.queue->drain().has_value());
    }

    SECTION("completed frames are reclaimed by the next render")
    {
        REQUIRE(std::move(*previous).wait(*gpu.queue).has_value());
        auto next = gpu.renderer->render(GpuFuture::now(), image.target(extent));
        REQUIRE(next.has_value());
        REQUIRE(gpu.renderer->retired_count() == 1);
        REQUIRE(std::move(*next).wait(*gpu.queue).has_value());
    }
}

TEST_CASE("A consumed wait future is refused", "[renderer][vulkan][error]")
{
    Logger::instance().set_level(spdlog::level::off);
    HeadlessRenderer gpu;
    const vk::Extent2D extent{SIZE, SIZE};
    OffscreenImage image(*gpu.allocator, extent);

    auto before = GpuFuture::now();
    GpuFuture taken = std::move(before);
    REQUIRE(before.is_consumed());

    auto rendered = gpu.renderer->render(std::move(before), image.target(extent));
    REQUIRE(!rendered.has_value());
    REQUIRE(rendered.error().kind == RenderError::Kind::Submission);
    REQUIRE(!rendered.error().recoverable());
}
