#pragma once

#include <tri/Common.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace tri {

struct CommandAllocatorConfig {
    uint32_t primary_reserve = 0;
    uint32_t secondary_reserve = 0;
};

class CommandAllocator;

/**
 * @brief Move-only command buffer that goes back to its allocator on destruction
 *
 * The allocator must outlive every CommandBuffer it handed out.
 */
class CommandBuffer {
public:
    CommandBuffer() = default;
    ~CommandBuffer();

    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;
    CommandBuffer(CommandBuffer&& other) noexcept;
    CommandBuffer& operator=(CommandBuffer&& other) noexcept;

    [[nodiscard]] vk::CommandBuffer handle() const { return m_handle; }
    [[nodiscard]] vk::CommandBufferLevel level() const { return m_level; }
    [[nodiscard]] bool valid() const { return m_handle != nullptr; }

private:
    friend class CommandAllocator;
    CommandBuffer(CommandAllocator* owner, vk::CommandBuffer handle, vk::CommandBufferLevel level);

    void release();

    CommandAllocator* m_owner = nullptr;
    vk::CommandBuffer m_handle;
    vk::CommandBufferLevel m_level = vk::CommandBufferLevel::ePrimary;
};

/**
 * @brief Single-threaded command pool with free lists per level
 *
 * Returned buffers are reset lazily, right before they are handed out again.
 */
class CommandAllocator {
public:
    static std::expected<std::unique_ptr<CommandAllocator>, std::string> create(
        vk::Device device,
        uint32_t queue_family,
        const CommandAllocatorConfig& config = {}
    );

    ~CommandAllocator();

    CommandAllocator(const CommandAllocator&) = delete;
    CommandAllocator& operator=(const CommandAllocator&) = delete;

    /**
     * @brief Hand out a reset command buffer, allocating more if the free list is empty
     */
    [[nodiscard]] std::expected<CommandBuffer, std::string> allocate(vk::CommandBufferLevel level);

    [[nodiscard]] std::size_t free_count(vk::CommandBufferLevel level) const;
    [[nodiscard]] uint32_t queue_family() const { return m_queue_family; }

private:
    friend class CommandBuffer;
    CommandAllocator(vk::Device device, vk::CommandPool pool, uint32_t queue_family);

    std::expected<void, std::string> grow(vk::CommandBufferLevel level, uint32_t count);
    std::vector<vk::CommandBuffer>& free_list(vk::CommandBufferLevel level);
    void recycle(vk::CommandBuffer handle, vk::CommandBufferLevel level);

    vk::Device m_device;
    vk::CommandPool m_pool;
    uint32_t m_queue_family;
    std::vector<vk::CommandBuffer> m_free_primary;
    std::vector<vk::CommandBuffer> m_free_secondary;
};

} // namespace tri
