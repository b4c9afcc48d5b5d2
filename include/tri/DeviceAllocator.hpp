#pragma once

#include <tri/Common.hpp>
#include <tri/VulkanContext.hpp>
#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace tri {

/**
 * @brief Memory property preferences, most preferred first
 */
namespace memory_preference {

// Written once by the host, then only read by the GPU
inline constexpr std::array<vk::MemoryPropertyFlags, 2> UPLOAD_ONCE = {
    vk::MemoryPropertyFlagBits::eDeviceLocal | vk::MemoryPropertyFlagBits::eHostVisible,
    vk::MemoryPropertyFlags{vk::MemoryPropertyFlagBits::eHostVisible}
};

// Written by the GPU, read back by the host
inline constexpr std::array<vk::MemoryPropertyFlags, 2> READBACK = {
    vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCached,
    vk::MemoryPropertyFlags{vk::MemoryPropertyFlagBits::eHostVisible}
};

inline constexpr std::array<vk::MemoryPropertyFlags, 1> DEVICE_ONLY = {
    vk::MemoryPropertyFlags{vk::MemoryPropertyFlagBits::eDeviceLocal}
};

} // namespace memory_preference

/**
 * @brief Find a memory type allowed by type_filter that has all required flags
 */
[[nodiscard]] std::optional<uint32_t> find_memory_type(
    const vk::PhysicalDeviceMemoryProperties& properties,
    uint32_t type_filter,
    vk::MemoryPropertyFlags required
);

/**
 * @brief RAII owner of one vk::DeviceMemory allocation
 */
class DeviceAllocation {
public:
    DeviceAllocation() = default;
    DeviceAllocation(vk::Device device, vk::DeviceMemory memory, vk::DeviceSize size, vk::MemoryPropertyFlags flags);
    ~DeviceAllocation();

    DeviceAllocation(const DeviceAllocation&) = delete;
    DeviceAllocation& operator=(const DeviceAllocation&) = delete;
    DeviceAllocation(DeviceAllocation&& other) noexcept;
    DeviceAllocation& operator=(DeviceAllocation&& other) noexcept;

    /**
     * @brief Copy bytes into host-visible memory, flushing if not coherent
     */
    std::expected<void, std::string> write(std::span<const std::byte> bytes, vk::DeviceSize offset = 0);

    /**
     * @brief Copy host-visible memory into out, invalidating if not coherent
     */
    std::expected<void, std::string> read(std::span<std::byte> out, vk::DeviceSize offset = 0) const;

    [[nodiscard]] vk::DeviceMemory memory() const { return m_memory; }
    [[nodiscard]] vk::DeviceSize size() const { return m_size; }
    [[nodiscard]] vk::MemoryPropertyFlags flags() const { return m_flags; }

private:
    void release();

    vk::Device m_device;
    vk::DeviceMemory m_memory;
    vk::DeviceSize m_size = 0;
    vk::MemoryPropertyFlags m_flags;
};

/**
 * @brief Picks memory types and allocates device memory for buffers/images
 */
class DeviceAllocator {
public:
    explicit DeviceAllocator(const VulkanContext& context);

    /**
     * @brief Allocate memory for requirements using the first satisfiable preference
     */
    [[nodiscard]] std::expected<DeviceAllocation, std::string> allocate(
        const vk::MemoryRequirements& requirements,
        std::span<const vk::MemoryPropertyFlags> preferences
    ) const;

    [[nodiscard]] vk::Device device() const { return m_device; }
    [[nodiscard]] const vk::PhysicalDeviceMemoryProperties& memory_properties() const { return m_memory_properties; }

private:
    vk::Device m_device;
    vk::PhysicalDeviceMemoryProperties m_memory_properties;
};

/**
 * @brief vk::Buffer bound to its own DeviceAllocation
 */
class DeviceBuffer {
public:
    static std::expected<DeviceBuffer, std::string> create(
        const DeviceAllocator& allocator,
        vk::DeviceSize size,
        vk::BufferUsageFlags usage,
        std::span<const vk::MemoryPropertyFlags> preferences
    );

    /**
     * @brief Create a host-visible buffer holding a copy of data
     */
    template<class T>
    static std::expected<DeviceBuffer, std::string> create_with_data(
        const DeviceAllocator& allocator,
        std::span<const T> data,
        vk::BufferUsageFlags usage,
        std::span<const vk::MemoryPropertyFlags> preferences = memory_preference::UPLOAD_ONCE
    ) {
        auto buffer = create(allocator, data.size_bytes(), usage, preferences);
        if (!buffer) {
            return std::unexpected(buffer.error());
        }
        if (auto result = buffer->m_allocation.write(std::as_bytes(data)); !result) {
            return std::unexpected(result.error());
        }
        return buffer;
    }

    ~DeviceBuffer();

    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;
    DeviceBuffer(DeviceBuffer&& other) noexcept;
    DeviceBuffer& operator=(DeviceBuffer&& other) noexcept;

    [[nodiscard]] vk::Buffer buffer() const { return m_buffer; }
    [[nodiscard]] vk::DeviceSize size() const { return m_size; }
    [[nodiscard]] const DeviceAllocation& allocation() const { return m_allocation; }

private:
    DeviceBuffer(vk::Device device, vk::Buffer buffer, vk::DeviceSize size, DeviceAllocation allocation);

    vk::Device m_device;
    vk::Buffer m_buffer;
    vk::DeviceSize m_size;
    DeviceAllocation m_allocation;
};

} // namespace tri
