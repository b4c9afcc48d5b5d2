#include <catch2/catch_test_macros.hpp>

#include <tri/Logger.hpp>
#include <tri/Shader.hpp>

using namespace tri;

TEST_CASE("Stage interfaces are matched by location and format", "[shader][validation][matching]")
{
	Logger::instance().set_level(spdlog::level::off);

	std::vector<StageVariable> vertex_outputs{
		{.name = "normal", .location = 0, .format = vk::Format::eR32G32B32Sfloat},
		{.name = "uv", .location = 1, .format = vk::Format::eR32G32Sfloat},
	};

	SECTION("identical interfaces match")
	{
		REQUIRE(interfaces_match(vertex_outputs, vertex_outputs, "vertex", "fragment"));
	}

	SECTION("consumer may read a subset")
	{
		std::vector<StageVariable> fragment_inputs{
			{.name = "uv", .location = 1, .format = vk::Format::eR32G32Sfloat},
		};
		REQUIRE(interfaces_match(vertex_outputs, fragment_inputs, "vertex", "fragment"));
	}

	SECTION("nothing to read always matches")
	{
		REQUIRE(interfaces_match({}, {}, "vertex", "fragment"));
		REQUIRE(interfaces_match(vertex_outputs, {}, "vertex", "fragment"));
	}

	SECTION("missing location does not match")
	{
		std::vector<StageVariable> fragment_inputs{
			{.name = "color", .location = 2, .format = vk::Format::eR32G32B32A32Sfloat},
		};
		REQUIRE(!interfaces_match(vertex_outputs, fragment_inputs, "vertex", "fragment"));
	}

	SECTION("format mismatch does not match")
	{
		std::vector<StageVariable> fragment_inputs{
			{.name = "normal", .location = 0, .format = vk::Format::eR32G32B32A32Sfloat},
		};
		REQUIRE(!interfaces_match(vertex_outputs, fragment_inputs, "vertex", "fragment"));
	}
}

TEST_CASE("Vertex format sizes", "[shader][validation]")
{
	REQUIRE(format_size(vk::Format::eR32Sfloat) == 4);
	REQUIRE(format_size(vk::Format::eR32G32Sfloat) == 8);
	REQUIRE(format_size(vk::Format::eR32G32B32Uint) == 12);
	REQUIRE(format_size(vk::Format::eR32G32B32A32Sint) == 16);
	REQUIRE(format_size(vk::Format::eR8G8B8A8Unorm) == 0);
}

TEST_CASE("Reflected descriptions convert to Vulkan structs", "[shader][validation]")
{
	VertexAttribute attribute{.name = "position", .location = 0, .binding = 0, .offset = 0, .format = vk::Format::eR32G32Sfloat};
	auto attribute_desc = attribute.to_attribute_description();
	REQUIRE(attribute_desc.location == 0);
	REQUIRE(attribute_desc.binding == 0);
	REQUIRE(attribute_desc.offset == 0);
	REQUIRE(attribute_desc.format == vk::Format::eR32G32Sfloat);

	VertexBinding binding{.binding = 0, .stride = 8, .name = "PosVertex"};
	auto binding_desc = binding.to_binding_description(vk::VertexInputRate::eVertex);
	REQUIRE(binding_desc.binding == 0);
	REQUIRE(binding_desc.stride == 8);
	REQUIRE(binding_desc.inputRate == vk::VertexInputRate::eVertex);
}
