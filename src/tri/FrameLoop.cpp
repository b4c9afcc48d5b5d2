#include <tri/FrameLoop.hpp>
#include <tri/Logger.hpp>

namespace tri {

std::string_view to_string(FrameOutcome outcome) {
    switch (outcome) {
        case FrameOutcome::Presented: return "Presented";
        case FrameOutcome::AcquireFailed: return "AcquireFailed";
        case FrameOutcome::RenderFailed: return "RenderFailed";
        case FrameOutcome::PresentFailed: return "PresentFailed";
    }
    return "Unknown";
}

FrameLoop::FrameLoop(SubmitQueue& queue)
    : m_queue(&queue)
{}

FrameOutcome FrameLoop::run_frame(SwapchainSource& source, FrameStage& stage) {
    auto frame = source.acquire_frame();
    if (!frame) {
        Logger::instance().debug("Skipping frame: {}", frame.error());
        return FrameOutcome::AcquireFailed;
    }

    GpuFuture before = m_previous
        ? std::move(*m_previous).join(std::move(frame->ready))
        : std::move(frame->ready);
    m_previous.reset();

    auto rendered = stage.render(std::move(before), frame->target);
    if (!rendered) {
        if (rendered.error().recoverable()) {
            Logger::instance().warn("Frame skipped: {}", rendered.error().message);
        } else {
            Logger::instance().error("Frame failed ({}): {}", to_string(rendered.error().kind), rendered.error().message);
        }
        source.abandon_frame(frame->image_index);
        return FrameOutcome::RenderFailed;
    }

    // Timeline points can be waited on more than once: keep one for the next frame
    if (auto value = rendered->timeline_value(m_queue->timeline())) {
        m_previous.emplace(GpuFuture::after_timeline(m_queue->timeline(), *value));
    }

    if (auto presented = source.present_frame(std::move(*rendered), frame->image_index); !presented) {
        Logger::instance().warn("Present failed: {}", presented.error());
        return FrameOutcome::PresentFailed;
    }

    ++m_frames_presented;
    return FrameOutcome::Presented;
}

std::expected<void, std::string> FrameLoop::finish() {
    if (!m_previous) {
        return {};
    }
    auto result = std::move(*m_previous).wait(*m_queue);
    m_previous.reset();
    return result;
}

} // namespace tri
