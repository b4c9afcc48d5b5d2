#include <tri/CommandAllocator.hpp>
#include <tri/Logger.hpp>

namespace tri {

// --- CommandBuffer ---

CommandBuffer::CommandBuffer(CommandAllocator* owner, vk::CommandBuffer handle, vk::CommandBufferLevel level)
    : m_owner(owner)
    , m_handle(handle)
    , m_level(level)
{}

CommandBuffer::~CommandBuffer() {
    release();
}

CommandBuffer::CommandBuffer(CommandBuffer&& other) noexcept
    : m_owner(std::exchange(other.m_owner, nullptr))
    , m_handle(std::exchange(other.m_handle, nullptr))
    , m_level(other.m_level)
{}

CommandBuffer& CommandBuffer::operator=(CommandBuffer&& other) noexcept {
    if (this != &other) {
        release();
        m_owner = std::exchange(other.m_owner, nullptr);
        m_handle = std::exchange(other.m_handle, nullptr);
        m_level = other.m_level;
    }
    return *this;
}

void CommandBuffer::release() {
    if (m_owner && m_handle) {
        m_owner->recycle(m_handle, m_level);
    }
    m_owner = nullptr;
    m_handle = nullptr;
}

// --- CommandAllocator ---

CommandAllocator::CommandAllocator(vk::Device device, vk::CommandPool pool, uint32_t queue_family)
    : m_device(device)
    , m_pool(pool)
    , m_queue_family(queue_family)
{}

std::expected<std::unique_ptr<CommandAllocator>, std::string> CommandAllocator::create(
    vk::Device device,
    uint32_t queue_family,
    const CommandAllocatorConfig& config
) {
    auto pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(queue_family)
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer);

    auto pool_res = device.createCommandPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create command pool: {}");

    auto allocator = std::unique_ptr<CommandAllocator>(new CommandAllocator(device, pool_res.value, queue_family));

    if (auto result = allocator->grow(vk::CommandBufferLevel::ePrimary, config.primary_reserve); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = allocator->grow(vk::CommandBufferLevel::eSecondary, config.secondary_reserve); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().debug("Created command allocator (family {}, {} primary, {} secondary reserved)",
        queue_family, config.primary_reserve, config.secondary_reserve);
    return allocator;
}

CommandAllocator::~CommandAllocator() {
    // Freeing the pool frees every buffer allocated from it
    if (m_pool) {
        m_device.destroyCommandPool(m_pool);
    }
}

std::expected<void, std::string> CommandAllocator::grow(vk::CommandBufferLevel level, uint32_t count) {
    if (count == 0) {
        return {};
    }
    auto alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(m_pool)
        .setLevel(level)
        .setCommandBufferCount(count);

    auto buffers_res = m_device.allocateCommandBuffers(alloc_info);
    CHECK_VK_RESULT_VOID(buffers_res.result, "Failed to allocate command buffers: {}");

    auto& list = free_list(level);
    list.insert(list.end(), buffers_res.value.begin(), buffers_res.value.end());
    Logger::instance().trace("Allocated {} {} command buffer(s)", count, vk::to_string(level));
    return {};
}

std::expected<CommandBuffer, std::string> CommandAllocator::allocate(vk::CommandBufferLevel level) {
    auto& list = free_list(level);
    if (list.empty()) {
        if (auto result = grow(level, 1); !result) {
            return std::unexpected(result.error());
        }
    }

    auto handle = list.back();
    list.pop_back();

    auto reset_res = handle.reset();
    if (reset_res != vk::Result::eSuccess) {
        list.push_back(handle);
        return std::unexpected(std::format("Failed to reset command buffer: {}", vk::to_string(reset_res)));
    }
    return CommandBuffer{this, handle, level};
}

std::size_t CommandAllocator::free_count(vk::CommandBufferLevel level) const {
    return level == vk::CommandBufferLevel::ePrimary ? m_free_primary.size() : m_free_secondary.size();
}

std::vector<vk::CommandBuffer>& CommandAllocator::free_list(vk::CommandBufferLevel level) {
    return level == vk::CommandBufferLevel::ePrimary ? m_free_primary : m_free_secondary;
}

void CommandAllocator::recycle(vk::CommandBuffer handle, vk::CommandBufferLevel level) {
    free_list(level).push_back(handle);
}

} // namespace tri
