#ifndef TRIANGLEFRAME_COMMON_HPP
#define TRIANGLEFRAME_COMMON_HPP
#include <glm/glm.hpp>
#include <vulkan/vulkan.hpp>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#define CHECK_VK_RESULT(res, msg) \
if (res.result != vk::Result::eSuccess) \
{ \
	return std::unexpected(std::format(msg, vk::to_string(res.result))); \
} \

#define CHECK_VK_RESULT_VOID(res, msg) \
if (res != vk::Result::eSuccess) \
{ \
return std::unexpected(std::format(msg, vk::to_string(res))); \
} \

#endif // TRIANGLEFRAME_COMMON_HPP
