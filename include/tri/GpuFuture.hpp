#pragma once

#include <tri/Common.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tri {

/**
 * @brief One semaphore a queue submission has to wait on
 *
 * A value of 0 marks a binary semaphore, which can be waited on exactly once.
 * Any other value is a point on a timeline semaphore and can be waited on any
 * number of times.
 */
struct WaitPoint {
    vk::Semaphore semaphore;
    uint64_t value = 0;
    vk::PipelineStageFlags stage = vk::PipelineStageFlagBits::eAllCommands;

    [[nodiscard]] bool is_binary() const { return value == 0; }

    bool operator==(const WaitPoint&) const = default;
};

/**
 * @brief Queue that GpuFuture chains submit into
 *
 * Every submission signals the queue's timeline semaphore with a strictly
 * increasing value and also waits on the previously signalled value, so the
 * timeline is a total order over everything submitted through the queue.
 */
class SubmitQueue {
public:
    virtual ~SubmitQueue() = default;

    /**
     * @brief Submit one batch
     *
     * @param waits Semaphores the batch waits on before executing
     * @param command_buffers Command buffers to execute, may be empty
     * @param signal_binary Optional binary semaphore signalled alongside the timeline
     * @return Timeline value signalled when the batch completes
     */
    virtual std::expected<uint64_t, std::string> submit(
        std::span<const WaitPoint> waits,
        std::span<const vk::CommandBuffer> command_buffers,
        vk::Semaphore signal_binary
    ) = 0;

    [[nodiscard]] virtual vk::Semaphore timeline() const = 0;

    /**
     * @brief Highest timeline value the GPU has completed. Never blocks.
     */
    virtual std::expected<uint64_t, std::string> completed_value() = 0;

    /**
     * @brief Block until the timeline reaches value (shutdown and tests only)
     */
    virtual std::expected<void, std::string> wait_for(uint64_t value, uint64_t timeout) = 0;
};

/**
 * @brief Move-only token for "GPU work up to here"
 *
 * A future is consumed by exactly one chaining call, which returns the future
 * for the extended chain. Moved-from and consumed futures refuse to chain.
 * A call whose submission fails leaves the future unconsumed with its waits.
 */
class GpuFuture {
public:
    /**
     * @brief Future with nothing to wait for
     */
    static GpuFuture now();

    /**
     * @brief Future signalled by a binary semaphore (e.g. swapchain acquire)
     */
    static GpuFuture after_semaphore(vk::Semaphore semaphore, vk::PipelineStageFlags stage);

    /**
     * @brief Future signalled when a timeline semaphore reaches value
     */
    static GpuFuture after_timeline(vk::Semaphore timeline, uint64_t value);

    ~GpuFuture();

    GpuFuture(const GpuFuture&) = delete;
    GpuFuture& operator=(const GpuFuture&) = delete;
    GpuFuture(GpuFuture&& other) noexcept;
    GpuFuture& operator=(GpuFuture&& other) noexcept;

    /**
     * @brief Merge two futures; the result is signalled when both are
     */
    [[nodiscard]] GpuFuture join(GpuFuture other) &&;

    /**
     * @brief Submit cmd ordered after this future
     *
     * The GPU waits on this future's semaphores; the CPU does not.
     */
    [[nodiscard]] std::expected<GpuFuture, std::string> then_execute(SubmitQueue& queue, vk::CommandBuffer cmd) &&;

    /**
     * @brief Submit a wait-only batch that signals a binary semaphore
     *
     * Presentation cannot wait on timeline semaphores, so this is how a chain
     * is handed to vkQueuePresentKHR.
     */
    [[nodiscard]] std::expected<GpuFuture, std::string> then_signal_semaphore(SubmitQueue& queue, vk::Semaphore semaphore) &&;

    /**
     * @brief Make sure every binary semaphore of this future has been waited on
     *
     * Submits a wait-only batch if there is a pending binary wait; otherwise
     * returns the chain unchanged.
     */
    [[nodiscard]] std::expected<GpuFuture, std::string> flush(SubmitQueue& queue) &&;

    /**
     * @brief Block the CPU until the chain completed
     */
    std::expected<void, std::string> wait(SubmitQueue& queue, uint64_t timeout = UINT64_MAX) &&;

    [[nodiscard]] bool is_consumed() const { return m_consumed; }
    [[nodiscard]] std::span<const WaitPoint> waits() const { return m_waits; }
    [[nodiscard]] bool has_pending_binary() const;

    /**
     * @brief Highest value on timeline this future waits for, if any
     */
    [[nodiscard]] std::optional<uint64_t> timeline_value(vk::Semaphore timeline) const;

private:
    explicit GpuFuture(std::vector<WaitPoint> waits);

    std::expected<std::vector<WaitPoint>, std::string> take();
    void restore(std::vector<WaitPoint> waits);
    void add_wait(const WaitPoint& point);

    std::vector<WaitPoint> m_waits;
    bool m_consumed = false;
};

} // namespace tri
