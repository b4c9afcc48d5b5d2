#ifndef TRIANGLEFRAME_SHADER_HPP
#define TRIANGLEFRAME_SHADER_HPP
#include <expected>
#include <slang.h>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Common.hpp"

namespace tri {

struct StageVariable
{
	std::string name;
	uint32_t	location;
	vk::Format	format;
};

struct VertexAttribute
{
	std::string name;
	uint32_t	location;
	uint32_t	binding;
	uint32_t	offset; // Within binding's stride
	vk::Format	format;

	[[nodiscard]] vk::VertexInputAttributeDescription to_attribute_description() const
	{
		return vk::VertexInputAttributeDescription()
			.setLocation(location)
			.setBinding(binding)
			.setFormat(format)
			.setOffset(offset);
	}
};

struct VertexBinding
{
	uint32_t	binding;
	uint32_t	stride;
	std::string name; // Struct name, e.g. "PosVertex"

	[[nodiscard]] vk::VertexInputBindingDescription to_binding_description(vk::VertexInputRate input_rate) const
	{
		return vk::VertexInputBindingDescription().setBinding(binding).setStride(stride).setInputRate(input_rate);
	}
};

struct FragmentDetails;

struct VertexDetails
{
	std::vector<VertexAttribute> inputs;
	std::vector<VertexBinding>	 bindings;
	std::vector<StageVariable>	 outputs;

	explicit VertexDetails(slang::IComponentType* linked);
	[[nodiscard]] bool matches(const FragmentDetails& next) const;
};

struct FragmentDetails
{
	std::vector<StageVariable> inputs;
	std::vector<StageVariable> outputs; // Color attachments

	explicit FragmentDetails(slang::IComponentType* linked);
};

using ShaderDetails = std::variant<VertexDetails, FragmentDetails>;

/// Check that every consumer input has a producer output with the same location and format.
[[nodiscard]] bool interfaces_match(const std::vector<StageVariable>& producer,
									const std::vector<StageVariable>& consumer, std::string_view producer_name,
									std::string_view consumer_name);

/// Size in bytes of the 32-bit vertex formats reflection produces.
[[nodiscard]] uint32_t format_size(vk::Format format);

class Shader
{
public:
	/**
	 * @brief Compile shader module `name` from SHADER_DIR to SPIR-V and reflect it
	 *
	 * Only vertex and fragment entry points are supported.
	 */
	static std::expected<Shader, std::string> create_shader(vk::Device device, std::string_view name,
															std::string_view entry_point = "main");

	[[nodiscard]] vk::ShaderModule get_shader_module() const;
	[[nodiscard]] vk::ShaderStageFlagBits get_stage() const;
	[[nodiscard]] vk::PipelineShaderStageCreateInfo create_pipeline_shader_stage_create_info() const;
	[[nodiscard]] const ShaderDetails& get_details() const;

	/// Number of global (descriptor or push-constant) parameters the program declares.
	[[nodiscard]] uint32_t global_parameter_count() const;

	Shader(const Shader&)			 = delete;
	Shader& operator=(const Shader&) = delete;

	Shader(Shader&& other) noexcept;
	Shader& operator=(Shader&& other) noexcept;
	~Shader();

private:
	Shader(vk::Device device, vk::ShaderModule shader_module, vk::ShaderStageFlagBits stage, ShaderDetails details,
		   uint32_t global_parameter_count, std::string entry_point);

	vk::Device				m_device;
	vk::ShaderModule		m_shader_module;
	vk::ShaderStageFlagBits m_stage;
	ShaderDetails			m_details;
	uint32_t				m_global_parameter_count;
	std::string				m_entry_point;
};

} // namespace tri

#endif // TRIANGLEFRAME_SHADER_HPP
