#include <tri/DeviceAllocator.hpp>
#include <tri/Logger.hpp>
#include <cstring>

namespace tri {

std::optional<uint32_t> find_memory_type(
    const vk::PhysicalDeviceMemoryProperties& properties,
    uint32_t type_filter,
    vk::MemoryPropertyFlags required
) {
    for (uint32_t i = 0; i < properties.memoryTypeCount; i++) {
        if ((type_filter & (1u << i)) &&
            (properties.memoryTypes[i].propertyFlags & required) == required) {
            return i;
        }
    }
    return std::nullopt;
}

// --- DeviceAllocation ---

DeviceAllocation::DeviceAllocation(vk::Device device, vk::DeviceMemory memory, vk::DeviceSize size, vk::MemoryPropertyFlags flags)
    : m_device(device)
    , m_memory(memory)
    , m_size(size)
    , m_flags(flags)
{}

DeviceAllocation::~DeviceAllocation() {
    release();
}

DeviceAllocation::DeviceAllocation(DeviceAllocation&& other) noexcept
    : m_device(other.m_device)
    , m_memory(std::exchange(other.m_memory, nullptr))
    , m_size(std::exchange(other.m_size, 0))
    , m_flags(other.m_flags)
{}

DeviceAllocation& DeviceAllocation::operator=(DeviceAllocation&& other) noexcept {
    if (this != &other) {
        release();
        m_device = other.m_device;
        m_memory = std::exchange(other.m_memory, nullptr);
        m_size = std::exchange(other.m_size, 0);
        m_flags = other.m_flags;
    }
    return *this;
}

void DeviceAllocation::release() {
    if (m_memory) {
        m_device.freeMemory(m_memory);
        m_memory = nullptr;
    }
}

std::expected<void, std::string> DeviceAllocation::write(std::span<const std::byte> bytes, vk::DeviceSize offset) {
    if (!(m_flags & vk::MemoryPropertyFlagBits::eHostVisible)) {
        return std::unexpected("Memory is not host visible");
    }
    if (offset + bytes.size() > m_size) {
        return std::unexpected(std::format("Write of {} bytes at {} exceeds allocation of {} bytes", bytes.size(), offset, m_size));
    }

    auto map_res = m_device.mapMemory(m_memory, 0, VK_WHOLE_SIZE);
    CHECK_VK_RESULT(map_res, "Failed to map memory: {}");
    std::memcpy(static_cast<std::byte*>(map_res.value) + offset, bytes.data(), bytes.size());

    if (!(m_flags & vk::MemoryPropertyFlagBits::eHostCoherent)) {
        auto range = vk::MappedMemoryRange()
            .setMemory(m_memory)
            .setOffset(0)
            .setSize(VK_WHOLE_SIZE);
        auto flush_res = m_device.flushMappedMemoryRanges(range);
        if (flush_res != vk::Result::eSuccess) {
            m_device.unmapMemory(m_memory);
            return std::unexpected(std::format("Failed to flush mapped memory: {}", vk::to_string(flush_res)));
        }
    }

    m_device.unmapMemory(m_memory);
    return {};
}

std::expected<void, std::string> DeviceAllocation::read(std::span<std::byte> out, vk::DeviceSize offset) const {
    if (!(m_flags & vk::MemoryPropertyFlagBits::eHostVisible)) {
        return std::unexpected("Memory is not host visible");
    }
    if (offset + out.size() > m_size) {
        return std::unexpected(std::format("Read of {} bytes at {} exceeds allocation of {} bytes", out.size(), offset, m_size));
    }

    auto map_res = m_device.mapMemory(m_memory, 0, VK_WHOLE_SIZE);
    CHECK_VK_RESULT(map_res, "Failed to map memory: {}");

    if (!(m_flags & vk::MemoryPropertyFlagBits::eHostCoherent)) {
        auto range = vk::MappedMemoryRange()
            .setMemory(m_memory)
            .setOffset(0)
            .setSize(VK_WHOLE_SIZE);
        auto invalidate_res = m_device.invalidateMappedMemoryRanges(range);
        if (invalidate_res != vk::Result::eSuccess) {
            m_device.unmapMemory(m_memory);
            return std::unexpected(std::format("Failed to invalidate mapped memory: {}", vk::to_string(invalidate_res)));
        }
    }

    std::memcpy(out.data(), static_cast<const std::byte*>(map_res.value) + offset, out.size());
    m_device.unmapMemory(m_memory);
    return {};
}

// --- DeviceAllocator ---

DeviceAllocator::DeviceAllocator(const VulkanContext& context)
    : m_device(context.device())
    , m_memory_properties(context.physical_device().getMemoryProperties())
{
    Logger::instance().debug("DeviceAllocator: {} memory types, {} heaps",
        m_memory_properties.memoryTypeCount, m_memory_properties.memoryHeapCount);
}

std::expected<DeviceAllocation, std::string> DeviceAllocator::allocate(
    const vk::MemoryRequirements& requirements,
    std::span<const vk::MemoryPropertyFlags> preferences
) const {
    for (const auto& preferred : preferences) {
        auto type_index = find_memory_type(m_memory_properties, requirements.memoryTypeBits, preferred);
        if (!type_index) {
            continue;
        }

        auto alloc_info = vk::MemoryAllocateInfo()
            .setAllocationSize(requirements.size)
            .setMemoryTypeIndex(*type_index);

        auto memory_res = m_device.allocateMemory(alloc_info);
        CHECK_VK_RESULT(memory_res, "Failed to allocate device memory: {}");

        auto flags = m_memory_properties.memoryTypes[*type_index].propertyFlags;
        Logger::instance().trace("Allocated {} bytes from memory type {} ({})",
            requirements.size, *type_index, vk::to_string(flags));
        return DeviceAllocation{m_device, memory_res.value, requirements.size, flags};
    }

    return std::unexpected("Failed to find suitable memory type");
}

// --- DeviceBuffer ---

DeviceBuffer::DeviceBuffer(vk::Device device, vk::Buffer buffer, vk::DeviceSize size, DeviceAllocation allocation)
    : m_device(device)
    , m_buffer(buffer)
    , m_size(size)
    , m_allocation(std::move(allocation))
{}

std::expected<DeviceBuffer, std::string> DeviceBuffer::create(
    const DeviceAllocator& allocator,
    vk::DeviceSize size,
    vk::BufferUsageFlags usage,
    std::span<const vk::MemoryPropertyFlags> preferences
) {
    auto device = allocator.device();
    auto buffer_info = vk::BufferCreateInfo()
        .setSize(size)
        .setUsage(usage)
        .setSharingMode(vk::SharingMode::eExclusive);

    auto buffer_res = device.createBuffer(buffer_info);
    CHECK_VK_RESULT(buffer_res, "Failed to create buffer: {}");
    auto buffer = buffer_res.value;

    auto allocation = allocator.allocate(device.getBufferMemoryRequirements(buffer), preferences);
    if (!allocation) {
        device.destroyBuffer(buffer);
        return std::unexpected(allocation.error());
    }

    auto bind_res = device.bindBufferMemory(buffer, allocation->memory(), 0);
    if (bind_res != vk::Result::eSuccess) {
        device.destroyBuffer(buffer);
        return std::unexpected(std::format("Failed to bind buffer memory: {}", vk::to_string(bind_res)));
    }

    return DeviceBuffer{device, buffer, size, std::move(*allocation)};
}

DeviceBuffer::~DeviceBuffer() {
    if (m_buffer) {
        m_device.destroyBuffer(m_buffer);
    }
}

DeviceBuffer::DeviceBuffer(DeviceBuffer&& other) noexcept
    : m_device(other.m_device)
    , m_buffer(std::exchange(other.m_buffer, nullptr))
    , m_size(other.m_size)
    , m_allocation(std::move(other.m_allocation))
{}

DeviceBuffer& DeviceBuffer::operator=(DeviceBuffer&& other) noexcept {
    if (this != &other) {
        if (m_buffer) {
            m_device.destroyBuffer(m_buffer);
        }
        m_device = other.m_device;
        m_buffer = std::exchange(other.m_buffer, nullptr);
        m_size = other.m_size;
        m_allocation = std::move(other.m_allocation);
    }
    return *this;
}

} // namespace tri
