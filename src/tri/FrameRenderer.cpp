#include <tri/FrameRenderer.hpp>
#include <tri/GraphicsQueue.hpp>
#include <tri/Logger.hpp>
#include <tri/VulkanContext.hpp>
#include <algorithm>

namespace tri {

std::string_view to_string(RenderError::Kind kind) {
    switch (kind) {
        case RenderError::Kind::IncompatibleTarget: return "IncompatibleTarget";
        case RenderError::Kind::Recording: return "Recording";
        case RenderError::Kind::Submission: return "Submission";
    }
    return "Unknown";
}

FrameRenderer::FrameRenderer(
    vk::Device device,
    GraphicsQueue& queue,
    std::unique_ptr<RenderPass> render_pass,
    std::unique_ptr<PipelineBuilder> pipeline,
    std::unique_ptr<CommandAllocator> commands
)
    : m_device(device)
    , m_queue(&queue)
    , m_render_pass(std::move(render_pass))
    , m_pipeline(std::move(pipeline))
    , m_commands(std::move(commands))
{}

std::expected<std::unique_ptr<FrameRenderer>, std::string> FrameRenderer::create(
    const VulkanContext& context,
    const DeviceAllocator& allocator,
    GraphicsQueue& queue,
    const RenderPassConfig& config
) {
    const auto limits = context.physical_device().getProperties().limits;
    RenderPassConfig pass_config = config;
    pass_config.max_extent = vk::Extent2D{
        std::min(config.max_extent.width, limits.maxFramebufferWidth),
        std::min(config.max_extent.height, limits.maxFramebufferHeight),
    };

    auto render_pass = RenderPass::create(context.device(), pass_config);
    if (!render_pass) {
        return std::unexpected(render_pass.error());
    }

    auto pipeline = PipelineBuilder::create(context, allocator, queue, Subpass{
        .render_pass = (*render_pass)->handle(),
        .index = 0,
    });
    if (!pipeline) {
        return std::unexpected(pipeline.error());
    }

    auto commands = CommandAllocator::create(context.device(), queue.family_index());
    if (!commands) {
        return std::unexpected(commands.error());
    }

    Logger::instance().info("Created frame renderer for {}", vk::to_string(config.color_format));
    return std::unique_ptr<FrameRenderer>(new FrameRenderer(
        context.device(),
        queue,
        std::move(*render_pass),
        std::move(*pipeline),
        std::move(*commands)
    ));
}

FrameRenderer::~FrameRenderer() {
    if (auto result = m_queue->drain(); !result) {
        Logger::instance().error("Failed to drain queue before destroying frame renderer: {}", result.error());
    }
    m_retired.clear();
}

std::expected<GpuFuture, RenderError> FrameRenderer::fail(GpuFuture before, RenderError error) {
    Logger::instance().error("Frame failed ({}): {}", to_string(error.kind), error.message);
    if (!before.is_consumed()) {
        auto flushed = std::move(before).flush(*m_queue);
        if (!flushed) {
            Logger::instance().error("Failed to flush wait of failed frame: {}", flushed.error());
        }
    }
    return std::unexpected(std::move(error));
}

void FrameRenderer::collect_retired() {
    if (m_retired.empty()) {
        return;
    }
    auto completed = m_queue->completed_value();
    if (!completed) {
        Logger::instance().warn("Could not poll timeline: {}", completed.error());
        return;
    }
    while (!m_retired.empty() && m_retired.front().timeline_value <= *completed) {
        m_retired.pop_front();
    }
}

std::expected<GpuFuture, RenderError> FrameRenderer::render(GpuFuture before, const TargetImage& target) {
    collect_retired();

    if (before.is_consumed()) {
        return std::unexpected(RenderError{RenderError::Kind::Submission, "Wait future was already consumed"});
    }

    // 1. Framebuffer. Both failures are about this target, the next one may work
    const RenderPassConfig& config = m_render_pass->config();
    if (auto compatible = check_target_compatibility(config.color_format, target, config.max_extent); !compatible) {
        return fail(std::move(before), RenderError{RenderError::Kind::IncompatibleTarget, compatible.error()});
    }
    auto framebuffer = Framebuffer::create(m_device, *m_render_pass, target);
    if (!framebuffer) {
        return fail(std::move(before), RenderError{RenderError::Kind::IncompatibleTarget, framebuffer.error()});
    }

    // 2. Primary command buffer
    auto primary = m_commands->allocate(vk::CommandBufferLevel::ePrimary);
    if (!primary) {
        return fail(std::move(before), RenderError{RenderError::Kind::Recording, primary.error()});
    }
    auto cmd = primary->handle();

    auto begin_res = cmd.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    if (begin_res != vk::Result::eSuccess) {
        return fail(std::move(before), RenderError{RenderError::Kind::Recording,
            std::format("Failed to begin primary command buffer: {}", vk::to_string(begin_res))});
    }

    // 3. Render pass, cleared to transparent black
    vk::ClearValue clear_value;
    clear_value.color = vk::ClearColorValue(std::array<float, 4>{0.0f, 0.0f, 0.0f, 0.0f});

    auto render_pass_info = vk::RenderPassBeginInfo()
        .setRenderPass(m_render_pass->handle())
        .setFramebuffer(framebuffer->handle())
        .setRenderArea(vk::Rect2D({0, 0}, target.extent))
        .setClearValues(clear_value);

    cmd.beginRenderPass(render_pass_info, vk::SubpassContents::eSecondaryCommandBuffers);

    // 4. Draw
    auto secondary = m_pipeline->draw(target.extent);
    if (!secondary) {
        // The half-recorded primary goes back to the allocator and is reset on reuse
        return fail(std::move(before), RenderError{RenderError::Kind::Recording, secondary.error()});
    }
    cmd.executeCommands(secondary->buffer.handle());

    // 5. End render pass
    cmd.endRenderPass();

    // 6. Seal
    auto end_res = cmd.end();
    if (end_res != vk::Result::eSuccess) {
        return fail(std::move(before), RenderError{RenderError::Kind::Recording,
            std::format("Failed to end primary command buffer: {}", vk::to_string(end_res))});
    }

    // 7. Submit after before
    auto after = std::move(before).then_execute(*m_queue, cmd);
    if (!after) {
        // A failed submit hands the waits back; fail() flushes them
        return fail(std::move(before), RenderError{RenderError::Kind::Submission, after.error()});
    }

    auto value = after->timeline_value(m_queue->timeline()).value_or(m_queue->last_signalled());
    m_retired.push_back(RetiredFrame{
        .timeline_value = value,
        .framebuffer = std::move(*framebuffer),
        .primary = std::move(*primary),
        .secondary = std::move(secondary->buffer),
    });

    Logger::instance().trace("Rendered frame {}x{} -> timeline {}", target.extent.width, target.extent.height, value);

    return after;
}

} // namespace tri
