#ifndef TRIANGLEFRAME_VULKANCONTEXT_HPP
#define TRIANGLEFRAME_VULKANCONTEXT_HPP

#include "Common.hpp"
#include <string_view>

namespace tri {

enum class ContextMode
{
	Windowed, // GLFW surface extensions + swapchain
	Headless  // offscreen rendering only
};

struct QueueFamilyIndices
{
	uint32_t graphics;
};

/**
 * Instance, physical device and logical device with one graphics queue.
 * Throws std::runtime_error when any of them cannot be created. Timeline
 * semaphores are always enabled.
 *
 * A non-empty device_name restricts the choice to devices whose name
 * contains it.
 */
class VulkanContext
{
public:
	explicit VulkanContext(std::string_view title, ContextMode mode = ContextMode::Windowed,
		std::string_view device_name = {});
	~VulkanContext();

	VulkanContext(const VulkanContext&) = delete;
	VulkanContext& operator=(const VulkanContext&) = delete;
	VulkanContext(VulkanContext&&) = delete;
	VulkanContext& operator=(VulkanContext&&) = delete;

	[[nodiscard]] vk::Instance instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device device() const { return m_device; }
	[[nodiscard]] const QueueFamilyIndices& queue_indices() const { return m_queue_indices; }
	[[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }
	[[nodiscard]] ContextMode mode() const { return m_mode; }

private:
	void destroy_instance();

	ContextMode m_mode;
	vk::Instance m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice m_physical_device;
	QueueFamilyIndices m_queue_indices{};
	vk::Device m_device;
	vk::Queue m_graphics_queue;
};

} // namespace tri

#endif // TRIANGLEFRAME_VULKANCONTEXT_HPP
