// VulkanContext.cpp

#include <tri/VulkanContext.hpp>
#include <tri/Logger.hpp>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <format>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace tri {

namespace {

#ifdef NDEBUG
constexpr bool WANT_VALIDATION = false;
#else
constexpr bool WANT_VALIDATION = true;
#endif

constexpr const char* KHRONOS_VALIDATION = "VK_LAYER_KHRONOS_validation";

spdlog::level::level_enum to_log_level(vk::DebugUtilsMessageSeverityFlagBitsEXT severity)
{
	using Severity = vk::DebugUtilsMessageSeverityFlagBitsEXT;
	if (severity == Severity::eError) return spdlog::level::err;
	if (severity == Severity::eWarning) return spdlog::level::warn;
	if (severity == Severity::eInfo) return spdlog::level::debug;
	if (severity == Severity::eVerbose) return spdlog::level::trace;
	return spdlog::level::info;
}

vk::Bool32 forward_validation_message(
	vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
	[[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
	const vk::DebugUtilsMessengerCallbackDataEXT* data,
	[[maybe_unused]] void* user_data)
{
	auto& logger = Logger::instance();
	logger.use_origin("[VulkanDebug]");
	logger.log(to_log_level(severity), "{}", data->pMessage);
	return vk::False;
}

vk::DebugUtilsMessengerCreateInfoEXT messenger_info()
{
	using Severity = vk::DebugUtilsMessageSeverityFlagBitsEXT;
	using Type = vk::DebugUtilsMessageTypeFlagBitsEXT;
	return vk::DebugUtilsMessengerCreateInfoEXT{
		{},
		Severity::eWarning | Severity::eError,
		Type::eGeneral | Type::eValidation | Type::ePerformance,
		forward_validation_message,
	};
}

bool layer_present(const char* wanted)
{
	auto [result, layers] = vk::enumerateInstanceLayerProperties();
	if (result != vk::Result::eSuccess) {
		Logger::instance().warn("Layer enumeration failed: {}", vk::to_string(result));
		return false;
	}
	return std::ranges::any_of(layers, [&](const vk::LayerProperties& layer) {
		return std::string_view{layer.layerName} == wanted;
	});
}

// Extensions and layers the instance is created with
struct InstanceSetup
{
	std::vector<const char*> extensions;
	std::vector<const char*> layers;
	bool debug_utils = false;
};

InstanceSetup plan_instance(ContextMode mode)
{
	InstanceSetup setup;
	if (mode == ContextMode::Windowed) {
		uint32_t count = 0;
		const char** names = glfwGetRequiredInstanceExtensions(&count);
		if (names == nullptr) {
			throw std::runtime_error{"GLFW cannot present with Vulkan on this system"};
		}
		setup.extensions.insert(setup.extensions.end(), names, names + count);
	}

	if constexpr (WANT_VALIDATION) {
		setup.debug_utils = true;
		setup.extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
		if (layer_present(KHRONOS_VALIDATION)) {
			setup.layers.push_back(KHRONOS_VALIDATION);
		} else {
			Logger::instance().warn("{} is not installed, running without validation", KHRONOS_VALIDATION);
		}
	}
	return setup;
}

vk::Instance make_instance(std::string_view title, ContextMode mode)
{
	static vk::detail::DynamicLoader loader;
	VULKAN_HPP_DEFAULT_DISPATCHER.init(loader.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr"));

	const auto setup = plan_instance(mode);
	for (const char* name : setup.extensions) {
		Logger::instance().debug("Requesting instance extension {}", name);
	}

	const std::string name{title};
	const vk::ApplicationInfo app{
		name.c_str(), VK_MAKE_VERSION(0, 1, 0),
		"TriangleFrame", VK_MAKE_VERSION(0, 1, 0),
		VK_API_VERSION_1_3,
	};

	const auto messenger = messenger_info();
	vk::InstanceCreateInfo info{{}, &app, setup.layers, setup.extensions};
	// Chaining the messenger also reports problems in vkCreateInstance itself
	if (setup.debug_utils && !setup.layers.empty()) {
		info.pNext = &messenger;
		Logger::instance().info("Khronos validation active");
	}

	auto [result, instance] = vk::createInstance(info);
	if (result != vk::Result::eSuccess) {
		Logger::instance().error("vkCreateInstance returned {}", vk::to_string(result));
		throw std::runtime_error{"Failed to create Vulkan instance"};
	}
	VULKAN_HPP_DEFAULT_DISPATCHER.init(instance);
	Logger::instance().debug("Vulkan instance ready");
	return instance;
}

vk::DebugUtilsMessengerEXT make_messenger(vk::Instance instance)
{
	if constexpr (!WANT_VALIDATION) {
		return nullptr;
	}
	auto [result, messenger] = instance.createDebugUtilsMessengerEXT(messenger_info());
	if (result != vk::Result::eSuccess) {
		Logger::instance().warn("No debug messenger: {}", vk::to_string(result));
		return nullptr;
	}
	return messenger;
}

// Higher is better; lavapipe reports eCpu and still works for headless runs
int device_rank(vk::PhysicalDeviceType type)
{
	switch (type) {
	case vk::PhysicalDeviceType::eDiscreteGpu: return 3;
	case vk::PhysicalDeviceType::eIntegratedGpu: return 2;
	case vk::PhysicalDeviceType::eVirtualGpu: return 1;
	default: return 0;
	}
}

vk::PhysicalDevice pick_physical_device(vk::Instance instance, std::string_view device_name)
{
	auto [result, candidates] = instance.enumeratePhysicalDevices();
	if (result != vk::Result::eSuccess) {
		Logger::instance().error("vkEnumeratePhysicalDevices returned {}", vk::to_string(result));
		throw std::runtime_error{"Failed to enumerate physical devices"};
	}
	if (!device_name.empty()) {
		std::erase_if(candidates, [&](vk::PhysicalDevice device) {
			return !std::string_view{device.getProperties().deviceName.data()}.contains(device_name);
		});
		if (candidates.empty()) {
			throw std::runtime_error{std::format("No Vulkan device named like '{}'", device_name)};
		}
	}
	if (candidates.empty()) {
		throw std::runtime_error{"No Vulkan capable device present"};
	}

	auto best = std::ranges::max_element(candidates, {}, [](vk::PhysicalDevice device) {
		return device_rank(device.getProperties().deviceType);
	});
	const auto props = best->getProperties();
	Logger::instance().info("Using {} ({})", props.deviceName.data(), vk::to_string(props.deviceType));
	return *best;
}

QueueFamilyIndices pick_queue_families(vk::PhysicalDevice physical_device)
{
	const auto families = physical_device.getQueueFamilyProperties();
	auto graphics = std::ranges::find_if(families, [](const vk::QueueFamilyProperties& family) {
		return static_cast<bool>(family.queueFlags & vk::QueueFlagBits::eGraphics);
	});
	if (graphics == families.end()) {
		throw std::runtime_error{"Device exposes no graphics queue family"};
	}

	QueueFamilyIndices indices{static_cast<uint32_t>(std::distance(families.begin(), graphics))};
	Logger::instance().debug("Graphics queue family {}", indices.graphics);
	return indices;
}

vk::Device make_device(vk::PhysicalDevice physical_device, const QueueFamilyIndices& indices, ContextMode mode)
{
	const float priority = 1.0f;
	const vk::DeviceQueueCreateInfo queue_info{{}, indices.graphics, 1, &priority};

	std::vector<const char*> extensions;
	if (mode == ContextMode::Windowed) {
		extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
	}

	// GraphicsQueue orders every submission on a timeline semaphore
	vk::StructureChain<vk::DeviceCreateInfo, vk::PhysicalDeviceFeatures2, vk::PhysicalDeviceVulkan12Features> chain{
		vk::DeviceCreateInfo{{}, queue_info, {}, extensions},
		vk::PhysicalDeviceFeatures2{},
		vk::PhysicalDeviceVulkan12Features{}.setTimelineSemaphore(vk::True),
	};

	auto [result, device] = physical_device.createDevice(chain.get<vk::DeviceCreateInfo>());
	if (result != vk::Result::eSuccess) {
		Logger::instance().error("vkCreateDevice returned {}", vk::to_string(result));
		throw std::runtime_error{"Failed to create logical device"};
	}
	return device;
}

} // anonymous namespace

VulkanContext::VulkanContext(std::string_view title, ContextMode mode, std::string_view device_name)
	: m_mode(mode)
	, m_instance(make_instance(title, mode))
	, m_debug_messenger(make_messenger(m_instance))
{
	// The destructor does not run for a half built context
	try {
		m_physical_device = pick_physical_device(m_instance, device_name);
		m_queue_indices = pick_queue_families(m_physical_device);
		m_device = make_device(m_physical_device, m_queue_indices, mode);
	} catch (const std::exception& e) {
		Logger::instance().error("Context setup failed: {}", e.what());
		destroy_instance();
		throw;
	}
	VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);
	m_graphics_queue = m_device.getQueue(m_queue_indices.graphics, 0);
	Logger::instance().info("{} context up, Vulkan headers v{}",
		mode == ContextMode::Windowed ? "Windowed" : "Headless", VK_HEADER_VERSION);
}

VulkanContext::~VulkanContext()
{
	if (m_device) {
		m_device.destroy();
	}
	destroy_instance();
	Logger::instance().trace("VulkanContext torn down");
}

void VulkanContext::destroy_instance()
{
	if (m_debug_messenger) {
		m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
		m_debug_messenger = nullptr;
	}
	if (m_instance) {
		m_instance.destroy();
		m_instance = nullptr;
	}
}

} // namespace tri
