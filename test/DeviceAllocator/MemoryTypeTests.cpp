#include <catch2/catch_test_macros.hpp>

#include <tri/DeviceAllocator.hpp>

using namespace tri;

namespace {

using Flags = vk::MemoryPropertyFlagBits;

// A typical discrete GPU: device local, host visible + coherent, host cached, BAR
vk::PhysicalDeviceMemoryProperties discrete_gpu_memory()
{
    vk::PhysicalDeviceMemoryProperties props;
    props.memoryTypeCount = 4;
    props.memoryTypes[0].propertyFlags = Flags::eDeviceLocal;
    props.memoryTypes[1].propertyFlags = Flags::eHostVisible | Flags::eHostCoherent;
    props.memoryTypes[2].propertyFlags = Flags::eHostVisible | Flags::eHostCoherent | Flags::eHostCached;
    props.memoryTypes[3].propertyFlags = Flags::eDeviceLocal | Flags::eHostVisible | Flags::eHostCoherent;
    props.memoryHeapCount = 2;
    props.memoryTypes[0].heapIndex = 0;
    props.memoryTypes[1].heapIndex = 1;
    props.memoryTypes[2].heapIndex = 1;
    props.memoryTypes[3].heapIndex = 0;
    return props;
}

} // namespace

TEST_CASE("find_memory_type picks the first allowed type with all flags", "[memory]")
{
    const auto props = discrete_gpu_memory();

    SECTION("device local")
    {
        REQUIRE(find_memory_type(props, 0b1111, Flags::eDeviceLocal) == 0u);
    }

    SECTION("host visible")
    {
        REQUIRE(find_memory_type(props, 0b1111, Flags::eHostVisible) == 1u);
    }

    SECTION("host cached")
    {
        REQUIRE(find_memory_type(props, 0b1111, Flags::eHostVisible | Flags::eHostCached) == 2u);
    }

    SECTION("device local and host visible")
    {
        REQUIRE(find_memory_type(props, 0b1111, Flags::eDeviceLocal | Flags::eHostVisible) == 3u);
    }

    SECTION("type filter excludes candidates")
    {
        REQUIRE(find_memory_type(props, 0b1110, Flags::eDeviceLocal) == 3u);
        REQUIRE(find_memory_type(props, 0b0100, Flags::eHostVisible) == 2u);
    }

    SECTION("no match")
    {
        REQUIRE(!find_memory_type(props, 0b0001, Flags::eHostVisible).has_value());
        REQUIRE(!find_memory_type(props, 0b1111, Flags::eProtected).has_value());
        REQUIRE(!find_memory_type(props, 0, Flags::eDeviceLocal).has_value());
    }

    SECTION("bits beyond memoryTypeCount are ignored")
    {
        REQUIRE(!find_memory_type(props, 0b110000, vk::MemoryPropertyFlags{}).has_value());
    }
}

TEST_CASE("Memory preferences are ordered most preferred first", "[memory]")
{
    REQUIRE(memory_preference::UPLOAD_ONCE.front() == (Flags::eDeviceLocal | Flags::eHostVisible));
    REQUIRE(memory_preference::UPLOAD_ONCE.back() == vk::MemoryPropertyFlags{Flags::eHostVisible});
    REQUIRE(memory_preference::READBACK.front() == (Flags::eHostVisible | Flags::eHostCached));
    REQUIRE(memory_preference::DEVICE_ONLY.front() == vk::MemoryPropertyFlags{Flags::eDeviceLocal});
}
