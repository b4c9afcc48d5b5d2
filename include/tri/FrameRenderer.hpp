#pragma once

#include <tri/CommandAllocator.hpp>
#include <tri/GpuFuture.hpp>
#include <tri/PipelineBuilder.hpp>
#include <tri/RenderTarget.hpp>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace tri {

class GraphicsQueue;
class VulkanContext;

struct RenderError {
    enum class Kind {
        IncompatibleTarget, // nothing submitted, retry with another target
        Recording,
        Submission
    };

    Kind kind;
    std::string message;

    [[nodiscard]] bool recoverable() const { return kind == Kind::IncompatibleTarget; }
};

[[nodiscard]] std::string_view to_string(RenderError::Kind kind);

/**
 * @brief Something that turns "GPU ready" into "frame rendered" for one target
 */
class FrameStage {
public:
    virtual ~FrameStage() = default;

    virtual std::expected<GpuFuture, RenderError> render(GpuFuture before, const TargetImage& target) = 0;
};

/**
 * @brief Renders the triangle into one target per call
 *
 * Owns the render pass and the pipeline compiled against it. Per-frame
 * resources are kept alive until the timeline value of their frame completed.
 */
class FrameRenderer final : public FrameStage {
public:
    static std::expected<std::unique_ptr<FrameRenderer>, std::string> create(
        const VulkanContext& context,
        const DeviceAllocator& allocator,
        GraphicsQueue& queue,
        const RenderPassConfig& config
    );

    ~FrameRenderer() override;

    FrameRenderer(const FrameRenderer&) = delete;
    FrameRenderer& operator=(const FrameRenderer&) = delete;

    /**
     * @brief Record and submit one frame after before
     *
     * On failure before is still consumed: pending binary waits it carried are
     * flushed with a wait-only submission.
     */
    std::expected<GpuFuture, RenderError> render(GpuFuture before, const TargetImage& target) override;

    [[nodiscard]] const PipelineBuilder& pipeline() const { return *m_pipeline; }
    [[nodiscard]] std::size_t retired_count() const { return m_retired.size(); }

private:
    struct RetiredFrame {
        uint64_t timeline_value;
        Framebuffer framebuffer;
        CommandBuffer primary;
        CommandBuffer secondary;
    };

    FrameRenderer(
        vk::Device device,
        GraphicsQueue& queue,
        std::unique_ptr<RenderPass> render_pass,
        std::unique_ptr<PipelineBuilder> pipeline,
        std::unique_ptr<CommandAllocator> commands
    );

    std::expected<GpuFuture, RenderError> fail(GpuFuture before, RenderError error);
    void collect_retired();

    vk::Device m_device;
    GraphicsQueue* m_queue;
    std::unique_ptr<RenderPass> m_render_pass;
    std::unique_ptr<PipelineBuilder> m_pipeline;
    std::unique_ptr<CommandAllocator> m_commands;
    std::deque<RetiredFrame> m_retired;
};

} // namespace tri
