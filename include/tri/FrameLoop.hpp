#pragma once

#include <tri/FrameRenderer.hpp>
#include <tri/GpuFuture.hpp>
#include <tri/RenderTarget.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace tri {

struct AcquiredFrame {
    uint32_t image_index;
    TargetImage target;
    GpuFuture ready; // signalled when the image may be written
};

/**
 * @brief Source of presentable images, normally a swapchain
 */
class SwapchainSource {
public:
    virtual ~SwapchainSource() = default;

    /**
     * @brief Acquire the next image; an error means the frame is skipped
     */
    virtual std::expected<AcquiredFrame, std::string> acquire_frame() = 0;

    /**
     * @brief Present image_index once rendered completes
     */
    virtual std::expected<void, std::string> present_frame(GpuFuture rendered, uint32_t image_index) = 0;

    /**
     * @brief image_index was acquired but will never be presented
     *
     * The source has to get the image back before it runs out of images to hand out.
     */
    virtual void abandon_frame(uint32_t image_index) = 0;
};

enum class FrameOutcome {
    Presented,
    AcquireFailed,
    RenderFailed,
    PresentFailed
};

[[nodiscard]] std::string_view to_string(FrameOutcome outcome);

/**
 * @brief Drives acquire -> render -> present and carries the previous frame's future
 */
class FrameLoop {
public:
    explicit FrameLoop(SubmitQueue& queue);

    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    FrameOutcome run_frame(SwapchainSource& source, FrameStage& stage);

    /**
     * @brief Block until the last submitted frame completed
     */
    std::expected<void, std::string> finish();

    [[nodiscard]] bool has_previous() const { return m_previous.has_value(); }
    [[nodiscard]] uint64_t frames_presented() const { return m_frames_presented; }

private:
    SubmitQueue* m_queue;
    std::optional<GpuFuture> m_previous;
    uint64_t m_frames_presented = 0;
};

} // namespace tri
