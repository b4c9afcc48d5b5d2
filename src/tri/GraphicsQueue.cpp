#include <tri/GraphicsQueue.hpp>
#include <tri/Logger.hpp>
#include <algorithm>

namespace tri {

GraphicsQueue::GraphicsQueue(vk::Device device, vk::Queue queue, uint32_t family_index, vk::Semaphore timeline)
    : m_device(device)
    , m_queue(queue)
    , m_family_index(family_index)
    , m_timeline(timeline)
{}

std::expected<std::unique_ptr<GraphicsQueue>, std::string> GraphicsQueue::create(const VulkanContext& context) {
    auto type_info = vk::SemaphoreTypeCreateInfo()
        .setSemaphoreType(vk::SemaphoreType::eTimeline)
        .setInitialValue(0);
    auto semaphore_info = vk::SemaphoreCreateInfo().setPNext(&type_info);

    auto timeline_res = context.device().createSemaphore(semaphore_info);
    CHECK_VK_RESULT(timeline_res, "Could not create timeline semaphore {}");

    Logger::instance().debug("Created graphics queue wrapper (family {})", context.queue_indices().graphics);
    return std::unique_ptr<GraphicsQueue>(new GraphicsQueue(
        context.device(),
        context.graphics_queue(),
        context.queue_indices().graphics,
        timeline_res.value
    ));
}

GraphicsQueue::~GraphicsQueue() {
    if (!m_timeline) {
        return;
    }
    if (auto result = drain(); !result) {
        Logger::instance().error("Failed to drain graphics queue: {}", result.error());
    }
    m_device.destroySemaphore(m_timeline);
    Logger::instance().trace("Destroyed timeline semaphore");
}

std::expected<uint64_t, std::string> GraphicsQueue::submit(
    std::span<const WaitPoint> waits,
    std::span<const vk::CommandBuffer> command_buffers,
    vk::Semaphore signal_binary
) {
    std::vector<vk::Semaphore> wait_semaphores;
    std::vector<uint64_t> wait_values;
    std::vector<vk::PipelineStageFlags> wait_stages;

    bool waits_on_last = m_last_signalled == 0;
    for (const auto& w : waits) {
        wait_semaphores.push_back(w.semaphore);
        wait_values.push_back(w.value);
        wait_stages.push_back(w.stage);
        if (w.semaphore == m_timeline && w.value >= m_last_signalled) {
            waits_on_last = true;
        }
    }

    // Keep the timeline a total order over every submission on this queue
    if (!waits_on_last) {
        wait_semaphores.push_back(m_timeline);
        wait_values.push_back(m_last_signalled);
        wait_stages.push_back(vk::PipelineStageFlagBits::eAllCommands);
    }

    const uint64_t signal_value = m_last_signalled + 1;
    std::vector<vk::Semaphore> signal_semaphores = {m_timeline};
    std::vector<uint64_t> signal_values = {signal_value};
    if (signal_binary) {
        signal_semaphores.push_back(signal_binary);
        signal_values.push_back(0);
    }

    auto timeline_info = vk::TimelineSemaphoreSubmitInfo()
        .setWaitSemaphoreValues(wait_values)
        .setSignalSemaphoreValues(signal_values);

    auto submit_info = vk::SubmitInfo()
        .setWaitSemaphores(wait_semaphores)
        .setWaitDstStageMask(wait_stages)
        .setCommandBuffers(command_buffers)
        .setSignalSemaphores(signal_semaphores)
        .setPNext(&timeline_info);

    auto submit_res = m_queue.submit(submit_info);
    CHECK_VK_RESULT_VOID(submit_res, "Queue submission failed: {}");

    m_last_signalled = signal_value;
    return signal_value;
}

std::expected<uint64_t, std::string> GraphicsQueue::completed_value() {
    auto value_res = m_device.getSemaphoreCounterValue(m_timeline);
    CHECK_VK_RESULT(value_res, "Could not read timeline value: {}");
    return value_res.value;
}

std::expected<void, std::string> GraphicsQueue::wait_for(uint64_t value, uint64_t timeout) {
    if (value == 0) {
        return {};
    }
    auto wait_info = vk::SemaphoreWaitInfo()
        .setSemaphores(m_timeline)
        .setValues(value);

    auto wait_res = m_device.waitSemaphores(wait_info, timeout);
    if (wait_res == vk::Result::eTimeout) {
        return std::unexpected(std::format("Timed out waiting for timeline value {}", value));
    }
    CHECK_VK_RESULT_VOID(wait_res, "Waiting on timeline failed: {}");
    return {};
}

std::expected<void, std::string> GraphicsQueue::drain() {
    return wait_for(m_last_signalled, UINT64_MAX);
}

} // namespace tri
