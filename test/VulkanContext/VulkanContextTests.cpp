#include <catch2/catch_test_macros.hpp>
#include <tri/GraphicsQueue.hpp>
#include <tri/Logger.hpp>
#include <tri/VulkanContext.hpp>
#include <stdexcept>
#include <string>

using namespace tri;

TEST_CASE("Headless context comes up without a window system", "[vulkan][context]")
{
	Logger::instance().set_level(spdlog::level::debug);
	VulkanContext ctx("Context Test", ContextMode::Headless);

	CHECK(ctx.mode() == ContextMode::Headless);
	CHECK(ctx.instance());
	CHECK(ctx.physical_device());
	CHECK(ctx.device());
	CHECK(ctx.graphics_queue());

	SECTION("chosen family can record draws")
	{
		const auto families = ctx.physical_device().getQueueFamilyProperties();
		const uint32_t family = ctx.queue_indices().graphics;
		REQUIRE(family < families.size());
		REQUIRE(static_cast<bool>(families[family].queueFlags & vk::QueueFlagBits::eGraphics));
	}

	SECTION("device speaks Vulkan 1.3 and has timeline semaphores")
	{
		const auto props = ctx.physical_device().getProperties();
		INFO("Running on " << props.deviceName.data());
		REQUIRE(props.apiVersion >= VK_API_VERSION_1_3);

		auto features = ctx.physical_device()
			.getFeatures2<vk::PhysicalDeviceFeatures2, vk::PhysicalDeviceVulkan12Features>();
		REQUIRE(features.get<vk::PhysicalDeviceVulkan12Features>().timelineSemaphore == vk::True);
	}
}

TEST_CASE("GraphicsQueue timeline", "[vulkan][queue]")
{
	VulkanContext ctx("Queue Test", ContextMode::Headless);
	auto queue = GraphicsQueue::create(ctx);
	REQUIRE(queue.has_value());
	auto& q = **queue;

	REQUIRE(q.timeline());
	REQUIRE(q.family_index() == ctx.queue_indices().graphics);
	REQUIRE(q.last_signalled() == 0);

	SECTION("an empty submission advances the timeline")
	{
		auto value = q.submit({}, {}, nullptr);
		REQUIRE(value.has_value());
		REQUIRE(*value == 1);
		REQUIRE(q.wait_for(*value, UINT64_MAX).has_value());

		auto completed = q.completed_value();
		REQUIRE(completed.has_value());
		REQUIRE(*completed >= 1);
	}

	SECTION("submitted values are strictly increasing")
	{
		auto first = q.submit({}, {}, nullptr);
		auto second = q.submit({}, {}, nullptr);
		REQUIRE(first.has_value());
		REQUIRE(second.has_value());
		REQUIRE(*second > *first);
		REQUIRE(q.drain().has_value());
	}
}

TEST_CASE("A failed device choice releases the instance", "[vulkan][context]")
{
	REQUIRE_THROWS_AS(VulkanContext("Context Test", ContextMode::Headless, "no such device 7f3e"), std::runtime_error);

	SECTION("a context still comes up afterwards")
	{
		VulkanContext ctx("Context Test", ContextMode::Headless);
		REQUIRE(ctx.device());
	}

	SECTION("the filter accepts the device it names")
	{
		std::string name;
		{
			VulkanContext first("Context Test", ContextMode::Headless);
			name = first.physical_device().getProperties().deviceName.data();
		}
		VulkanContext ctx("Context Test", ContextMode::Headless, name);
		REQUIRE(std::string{ctx.physical_device().getProperties().deviceName.data()} == name);
	}
}
