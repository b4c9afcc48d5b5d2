#include <tri/Logger.hpp>
#include <tri/Shader.hpp>
#include <algorithm>
#include <array>
#include <optional>
#include <slang-com-ptr.h>
#include <utility>

namespace tri {

namespace
{

std::string diagnostic_text(slang::IBlob* blob, std::string_view fallback)
{
	if (blob == nullptr || blob->getBufferSize() == 0)
	{
		return std::string{fallback};
	}
	return {static_cast<const char*>(blob->getBufferPointer()), blob->getBufferSize()};
}

/// Result of running one module through Slang: the linked program and its SPIR-V.
struct CompiledProgram
{
	Slang::ComPtr<slang::IComponentType> linked;
	Slang::ComPtr<slang::IBlob>			 spirv;
};

/**
 * Owns the Slang global session plus one SPIR-V 1.5 session rooted at SHADER_DIR.
 * Constructed on first use and kept for the lifetime of the process.
 */
class SlangCompiler
{
public:
	static SlangCompiler& get()
	{
		static SlangCompiler compiler;
		return compiler;
	}

	std::expected<CompiledProgram, std::string> compile(const std::string& module_name, const std::string& entry_name)
	{
		if (!m_session)
		{
			return fail("Slang session is unavailable");
		}

		Slang::ComPtr<slang::IBlob>	  diagnostics;
		Slang::ComPtr<slang::IModule> module{m_session->loadModule(module_name.c_str(), diagnostics.writeRef())};
		if (!module)
		{
			return fail(diagnostic_text(diagnostics, std::format("Cannot load module '{}'", module_name)));
		}
		if (diagnostics && diagnostics->getBufferSize() > 0)
		{
			Logger::instance().warn("Slang on '{}': {}", module_name, diagnostic_text(diagnostics, ""));
		}

		Slang::ComPtr<slang::IEntryPoint> entry;
		if (SLANG_FAILED(module->findEntryPointByName(entry_name.c_str(), entry.writeRef())) || !entry)
		{
			return fail(std::format("'{}' declares no entry point named '{}'", module_name, entry_name));
		}

		std::array<slang::IComponentType*, 2> parts{module.get(), entry.get()};
		Slang::ComPtr<slang::IComponentType>  composed;
		diagnostics = nullptr;
		m_session->createCompositeComponentType(parts.data(), parts.size(), composed.writeRef(),
												diagnostics.writeRef());
		if (!composed)
		{
			return fail(diagnostic_text(diagnostics, "Composing module and entry point failed"));
		}

		CompiledProgram program;
		diagnostics = nullptr;
		composed->link(program.linked.writeRef(), diagnostics.writeRef());
		if (!program.linked)
		{
			return fail(diagnostic_text(diagnostics, "Linking failed"));
		}

		diagnostics = nullptr;
		program.linked->getEntryPointCode(0, 0, program.spirv.writeRef(), diagnostics.writeRef());
		if (!program.spirv)
		{
			return fail(diagnostic_text(diagnostics, "SPIR-V generation failed"));
		}

		Logger::instance().trace("'{}:{}' compiled to {} bytes of SPIR-V", module_name, entry_name,
								 program.spirv->getBufferSize());
		return program;
	}

private:
	SlangCompiler()
	{
		SlangGlobalSessionDesc global_desc{};
		if (SLANG_FAILED(slang::createGlobalSession(&global_desc, m_global.writeRef())))
		{
			Logger::instance().error("Slang global session could not be created");
			return;
		}

		slang::TargetDesc target{};
		target.format  = SLANG_SPIRV;
		target.profile = m_global->findProfile("spirv_1_5");

		std::array<const char*, 1> search_paths{SHADER_DIR};

		slang::SessionDesc desc{};
		desc.targets		 = &target;
		desc.targetCount	 = 1;
		desc.searchPaths	 = search_paths.data();
		desc.searchPathCount = static_cast<SlangInt>(search_paths.size());

		m_global->createSession(desc, m_session.writeRef());
		Logger::instance().debug("Slang compiler ready, shader root {}", SHADER_DIR);
	}

	static std::unexpected<std::string> fail(std::string message)
	{
		Logger::instance().error("Shader compilation: {}", message);
		return std::unexpected{std::move(message)};
	}

	Slang::ComPtr<slang::IGlobalSession> m_global;
	Slang::ComPtr<slang::ISession>		 m_session;
};

// Rows: float, int, uint. Columns: component count - 1.
constexpr std::array<std::array<vk::Format, 4>, 3> VARYING_FORMATS{{
	{vk::Format::eR32Sfloat, vk::Format::eR32G32Sfloat, vk::Format::eR32G32B32Sfloat, vk::Format::eR32G32B32A32Sfloat},
	{vk::Format::eR32Sint, vk::Format::eR32G32Sint, vk::Format::eR32G32B32Sint, vk::Format::eR32G32B32A32Sint},
	{vk::Format::eR32Uint, vk::Format::eR32G32Uint, vk::Format::eR32G32B32Uint, vk::Format::eR32G32B32A32Uint},
}};

vk::Format varying_format(slang::TypeReflection* type)
{
	using Scalar = slang::TypeReflection::ScalarType;

	std::optional<std::size_t> row;
	switch (type->getScalarType())
	{
		case Scalar::Float32: row = 0; break;
		case Scalar::Int32: row = 1; break;
		case Scalar::UInt32: row = 2; break;
		default: break;
	}

	const std::size_t components = std::max<std::size_t>(type->getElementCount(), 1);
	if (!row || components > 4)
	{
		Logger::instance().warn("Varying of type '{}' has no vertex format", type->getName() ? type->getName() : "?");
		return vk::Format::eUndefined;
	}
	return VARYING_FORMATS[*row][components - 1];
}

slang::EntryPointReflection* first_entry_point(slang::IComponentType* linked)
{
	auto* program = linked->getLayout();
	return program->getEntryPointCount() > 0 ? program->getEntryPointByIndex(0) : nullptr;
}

// Walks through arrays and wrappers until a struct layout shows up
slang::TypeLayoutReflection* find_struct(slang::TypeLayoutReflection* layout)
{
	while (layout != nullptr)
	{
		if (layout->getKind() == slang::TypeReflection::Kind::Struct)
		{
			return layout;
		}
		auto* inner = layout->getElementTypeLayout();
		layout		= inner == layout ? nullptr : inner;
	}
	return nullptr;
}

bool is_system_value(slang::VariableLayoutReflection* field)
{
	const char* semantic = field->getSemanticName();
	return semantic != nullptr && std::string_view{semantic}.starts_with("SV_");
}

// SV_ semantics are Vulkan builtins and never occupy a location
void append_varyings(slang::TypeLayoutReflection* block, std::vector<StageVariable>& out)
{
	for (unsigned i = 0; i < block->getFieldCount(); ++i)
	{
		auto* field = block->getFieldByIndex(i);
		if (is_system_value(field))
		{
			continue;
		}
		out.push_back(StageVariable{
			.name	  = field->getName(),
			.location = field->getBindingIndex(),
			.format	  = varying_format(field->getTypeLayout()->getType()),
		});
	}
}

std::vector<StageVariable> entry_inputs(slang::EntryPointReflection* entry)
{
	std::vector<StageVariable> result;
	for (unsigned i = 0; i < entry->getParameterCount(); ++i)
	{
		if (auto* block = find_struct(entry->getParameterByIndex(i)->getTypeLayout()))
		{
			append_varyings(block, result);
		}
	}
	return result;
}

std::vector<StageVariable> entry_outputs(slang::EntryPointReflection* entry)
{
	std::vector<StageVariable> result;
	auto*					   returned = entry->getResultVarLayout();
	if (auto* block = returned ? find_struct(returned->getTypeLayout()) : nullptr)
	{
		append_varyings(block, result);
	}
	return result;
}

} // anonymous namespace

uint32_t format_size(vk::Format format)
{
	for (std::size_t components = 0; components < 4; ++components)
	{
		const bool listed = std::ranges::any_of(VARYING_FORMATS,
												[&](const auto& row) { return row[components] == format; });
		if (listed)
		{
			return static_cast<uint32_t>(4 * (components + 1));
		}
	}
	return 0;
}

bool interfaces_match(const std::vector<StageVariable>& producer, const std::vector<StageVariable>& consumer,
					  std::string_view producer_name, std::string_view consumer_name)
{
	std::size_t mismatches = 0;
	for (const auto& wanted : consumer)
	{
		auto source = std::ranges::find(producer, wanted.location, &StageVariable::location);
		if (source == producer.end())
		{
			Logger::instance().error("{} reads '{}' from location {}, which {} never writes", consumer_name,
									 wanted.name, wanted.location, producer_name);
			++mismatches;
		}
		else if (source->format != wanted.format)
		{
			Logger::instance().error("Location {} is {} in {} but {} in {}", wanted.location,
									 vk::to_string(source->format), producer_name, vk::to_string(wanted.format),
									 consumer_name);
			++mismatches;
		}
	}
	return mismatches == 0;
}

VertexDetails::VertexDetails(slang::IComponentType* linked)
{
	auto* entry = first_entry_point(linked);
	if (entry == nullptr)
	{
		return;
	}

	// One tightly packed binding per struct parameter; scalar parameters are SV_VertexID and similar
	for (unsigned i = 0; i < entry->getParameterCount(); ++i)
	{
		auto* block = entry->getParameterByIndex(i)->getTypeLayout();
		if (block->getKind() != slang::TypeReflection::Kind::Struct)
		{
			continue;
		}

		VertexBinding binding{.binding = static_cast<uint32_t>(bindings.size()), .stride = 0, .name = {}};
		if (const char* type_name = block->getType()->getName())
		{
			binding.name = type_name;
		}

		for (unsigned f = 0; f < block->getFieldCount(); ++f)
		{
			auto*	   field  = block->getFieldByIndex(f);
			const auto format = varying_format(field->getTypeLayout()->getType());
			inputs.push_back(VertexAttribute{
				.name	  = field->getName(),
				.location = field->getBindingIndex(),
				.binding  = binding.binding,
				.offset	  = binding.stride,
				.format	  = format,
			});
			binding.stride += format_size(format);
		}
		bindings.push_back(std::move(binding));
	}
	outputs = entry_outputs(entry);

	Logger::instance().debug("Vertex stage reads {} attributes from {} bindings and writes {} varyings",
							 inputs.size(), bindings.size(), outputs.size());
}

bool VertexDetails::matches(const FragmentDetails& next) const
{
	return interfaces_match(outputs, next.inputs, "vertex", "fragment");
}

FragmentDetails::FragmentDetails(slang::IComponentType* linked)
{
	if (auto* entry = first_entry_point(linked))
	{
		inputs	= entry_inputs(entry);
		outputs = entry_outputs(entry);
		Logger::instance().debug("Fragment stage reads {} varyings and writes {} targets", inputs.size(),
								 outputs.size());
	}
}

std::expected<Shader, std::string> Shader::create_shader(vk::Device device, std::string_view name,
														 std::string_view entry_point)
{
	auto program = SlangCompiler::get().compile(std::string{name}, std::string{entry_point});
	if (!program)
	{
		return std::unexpected{program.error()};
	}
	auto* linked = program->linked.get();

	auto* entry = first_entry_point(linked);
	if (entry == nullptr)
	{
		return std::unexpected{std::format("'{}' lost its entry point while linking", name)};
	}

	const SlangStage slang_stage = entry->getStage();
	if (slang_stage != SLANG_STAGE_VERTEX && slang_stage != SLANG_STAGE_FRAGMENT)
	{
		Logger::instance().error("'{}' is Slang stage {}, expected vertex or fragment", name,
								 static_cast<int>(slang_stage));
		return std::unexpected{std::format("Shader '{}' is neither a vertex nor a fragment shader", name)};
	}

	const bool vertex = slang_stage == SLANG_STAGE_VERTEX;
	const auto stage  = vertex ? vk::ShaderStageFlagBits::eVertex : vk::ShaderStageFlagBits::eFragment;
	ShaderDetails details = vertex ? ShaderDetails{std::in_place_type<VertexDetails>, linked}
								   : ShaderDetails{std::in_place_type<FragmentDetails>, linked};

	const auto* words = static_cast<const uint32_t*>(program->spirv->getBufferPointer());
	auto module_res = device.createShaderModule(vk::ShaderModuleCreateInfo{{}, program->spirv->getBufferSize(), words});
	CHECK_VK_RESULT(module_res, "vkCreateShaderModule: {}");

	const auto globals = static_cast<uint32_t>(linked->getLayout()->getParameterCount());
	Logger::instance().info("Loaded {} shader '{}:{}' with {} global parameters", vk::to_string(stage), name,
							entry_point, globals);
	return Shader{device, module_res.value, stage, std::move(details), globals, std::string{entry_point}};
}

vk::ShaderModule Shader::get_shader_module() const
{
	return m_shader_module;
}

vk::ShaderStageFlagBits Shader::get_stage() const
{
	return m_stage;
}

vk::PipelineShaderStageCreateInfo Shader::create_pipeline_shader_stage_create_info() const
{
	return {{}, m_stage, m_shader_module, m_entry_point.c_str()};
}

const ShaderDetails& Shader::get_details() const
{
	return m_details;
}

uint32_t Shader::global_parameter_count() const
{
	return m_global_parameter_count;
}

Shader::Shader(vk::Device device, vk::ShaderModule shader_module, vk::ShaderStageFlagBits stage,
			   ShaderDetails details, uint32_t global_parameter_count, std::string entry_point)
	: m_device(device)
	, m_shader_module(shader_module)
	, m_stage(stage)
	, m_details(std::move(details))
	, m_global_parameter_count(global_parameter_count)
	, m_entry_point(std::move(entry_point))
{
}

Shader::Shader(Shader&& other) noexcept
	: m_device(other.m_device)
	, m_shader_module(std::exchange(other.m_shader_module, nullptr))
	, m_stage(other.m_stage)
	, m_details(std::move(other.m_details))
	, m_global_parameter_count(other.m_global_parameter_count)
	, m_entry_point(std::move(other.m_entry_point))
{
}

Shader& Shader::operator=(Shader&& other) noexcept
{
	if (this == &other)
	{
		return *this;
	}
	if (m_shader_module)
	{
		m_device.destroyShaderModule(m_shader_module);
	}
	m_device				 = other.m_device;
	m_shader_module			 = std::exchange(other.m_shader_module, nullptr);
	m_stage					 = other.m_stage;
	m_details				 = std::move(other.m_details);
	m_global_parameter_count = other.m_global_parameter_count;
	m_entry_point			 = std::move(other.m_entry_point);
	return *this;
}

Shader::~Shader()
{
	if (m_shader_module)
	{
		m_device.destroyShaderModule(m_shader_module);
	}
}

} // namespace tri
