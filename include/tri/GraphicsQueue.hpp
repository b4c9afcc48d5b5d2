#pragma once

#include <tri/GpuFuture.hpp>
#include <tri/VulkanContext.hpp>
#include <expected>
#include <memory>
#include <string>

namespace tri {

/**
 * @brief Graphics-capable vk::Queue with a timeline semaphore
 *
 * Not thread safe; owned by the render thread.
 */
class GraphicsQueue final : public SubmitQueue {
public:
    static std::expected<std::unique_ptr<GraphicsQueue>, std::string> create(const VulkanContext& context);

    ~GraphicsQueue() override;

    GraphicsQueue(const GraphicsQueue&) = delete;
    GraphicsQueue& operator=(const GraphicsQueue&) = delete;

    std::expected<uint64_t, std::string> submit(
        std::span<const WaitPoint> waits,
        std::span<const vk::CommandBuffer> command_buffers,
        vk::Semaphore signal_binary
    ) override;

    [[nodiscard]] vk::Semaphore timeline() const override { return m_timeline; }
    std::expected<uint64_t, std::string> completed_value() override;
    std::expected<void, std::string> wait_for(uint64_t value, uint64_t timeout) override;

    /**
     * @brief Block until everything submitted so far completed
     */
    std::expected<void, std::string> drain();

    [[nodiscard]] vk::Device device() const { return m_device; }
    [[nodiscard]] vk::Queue queue() const { return m_queue; }
    [[nodiscard]] uint32_t family_index() const { return m_family_index; }
    [[nodiscard]] uint64_t last_signalled() const { return m_last_signalled; }

private:
    GraphicsQueue(vk::Device device, vk::Queue queue, uint32_t family_index, vk::Semaphore timeline);

    vk::Device m_device;
    vk::Queue m_queue;
    uint32_t m_family_index;
    vk::Semaphore m_timeline;
    uint64_t m_last_signalled = 0;
};

} // namespace tri
