#include <tri/PipelineBuilder.hpp>
#include <tri/GraphicsQueue.hpp>
#include <tri/Logger.hpp>
#include <tri/PipelineState.hpp>
#include <tri/VulkanContext.hpp>

namespace tri {

DrawCommands make_draw_commands(
    vk::Pipeline pipeline,
    vk::Buffer vertex_buffer,
    uint32_t vertex_count,
    vk::Extent2D extent
) {
    return DrawCommands{
        .viewport = vk::Viewport(
            0.0f, 0.0f,
            static_cast<float>(extent.width), static_cast<float>(extent.height),
            0.0f, 1.0f),
        .pipeline = pipeline,
        .vertex_buffer = vertex_buffer,
        .vertex_binding = 0,
        .vertex_offset = 0,
        .vertex_count = vertex_count,
        .instance_count = 1,
    };
}

void record_draw_commands(vk::CommandBuffer cmd, const DrawCommands& commands) {
    cmd.setViewport(0, commands.viewport);
    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, commands.pipeline);
    cmd.bindVertexBuffers(commands.vertex_binding, commands.vertex_buffer, commands.vertex_offset);
    cmd.draw(commands.vertex_count, commands.instance_count, 0, 0);
}

std::expected<void, std::string> check_vertex_input(
    std::span<const VertexAttribute> attributes,
    std::span<const VertexBinding> bindings
) {
    const auto expected_binding = PosVertex::binding_description();
    const auto expected_attribute = PosVertex::attribute_description();

    if (bindings.size() != 1) {
        return std::unexpected(std::format("Vertex shader declares {} vertex bindings, expected 1", bindings.size()));
    }
    if (bindings[0].to_binding_description(vk::VertexInputRate::eVertex) != expected_binding) {
        return std::unexpected(std::format("Vertex binding {} has stride {}, expected binding {} with stride {}",
            bindings[0].binding, bindings[0].stride, expected_binding.binding, expected_binding.stride));
    }
    if (attributes.size() != 1) {
        return std::unexpected(std::format("Vertex shader declares {} vertex attributes, expected 1", attributes.size()));
    }

    const auto& attribute = attributes[0];
    if (attribute.to_attribute_description() != expected_attribute) {
        return std::unexpected(std::format(
            "Vertex attribute '{}' (location {}, binding {}, offset {}, {}) does not match PosVertex",
            attribute.name, attribute.location, attribute.binding, attribute.offset, vk::to_string(attribute.format)));
    }
    return {};
}

PipelineBuilder::PipelineBuilder(
    vk::Device device,
    DeviceBuffer vertex_buffer,
    uint32_t vertex_count,
    const Subpass& subpass,
    std::unique_ptr<CommandAllocator> commands
)
    : m_device(device)
    , m_vertex_buffer(std::move(vertex_buffer))
    , m_vertex_count(vertex_count)
    , m_subpass(subpass)
    , m_commands(std::move(commands))
{}

std::expected<std::unique_ptr<PipelineBuilder>, std::string> PipelineBuilder::create(
    const VulkanContext& context,
    const DeviceAllocator& allocator,
    const GraphicsQueue& queue,
    const Subpass& subpass
) {
    auto device = context.device();

    // Vertex buffer
    const auto vertices = triangle_vertices();
    auto vertex_buffer = DeviceBuffer::create_with_data(
        allocator,
        std::span<const PosVertex>{vertices},
        vk::BufferUsageFlagBits::eVertexBuffer
    );
    if (!vertex_buffer) {
        return std::unexpected(std::format("Failed to create vertex buffer: {}", vertex_buffer.error()));
    }

    // Shaders
    auto vert_result = Shader::create_shader(device, "triangle/triangle.vert.slang", "main");
    if (!vert_result) {
        return std::unexpected(std::format("Failed to load vertex shader: {}", vert_result.error()));
    }
    auto frag_result = Shader::create_shader(device, "triangle/triangle.frag.slang", "main");
    if (!frag_result) {
        return std::unexpected(std::format("Failed to load fragment shader: {}", frag_result.error()));
    }

    const auto* vertex_details = std::get_if<VertexDetails>(&vert_result->get_details());
    const auto* fragment_details = std::get_if<FragmentDetails>(&frag_result->get_details());
    if (!vertex_details || !fragment_details) {
        return std::unexpected("Triangle shaders are not a vertex/fragment pair");
    }
    if (auto layout_ok = check_vertex_input(vertex_details->inputs, vertex_details->bindings); !layout_ok) {
        return std::unexpected(layout_ok.error());
    }
    if (!vertex_details->matches(*fragment_details)) {
        return std::unexpected("Vertex outputs do not match fragment inputs");
    }
    if (vert_result->global_parameter_count() != 0 || frag_result->global_parameter_count() != 0) {
        return std::unexpected("Triangle shaders must not declare descriptors or push constants");
    }

    // Secondary command buffers
    auto commands = CommandAllocator::create(device, queue.family_index(), CommandAllocatorConfig{
        .primary_reserve = 0,
        .secondary_reserve = SECONDARY_RESERVE,
    });
    if (!commands) {
        return std::unexpected(commands.error());
    }

    auto builder = std::unique_ptr<PipelineBuilder>(new PipelineBuilder(
        device,
        std::move(*vertex_buffer),
        static_cast<uint32_t>(vertices.size()),
        subpass,
        std::move(*commands)
    ));

    if (auto result = builder->create_pipeline(*vert_result, *frag_result); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Created triangle pipeline ({} vertices, subpass {})", builder->m_vertex_count, subpass.index);
    return builder;
}

std::expected<void, std::string> PipelineBuilder::create_pipeline(const Shader& vertex, const Shader& fragment) {
    // No descriptor sets, no push constants
    auto layout_res = m_device.createPipelineLayout(vk::PipelineLayoutCreateInfo());
    CHECK_VK_RESULT(layout_res, "Failed to create pipeline layout: {}");
    m_layout = layout_res.value;

    std::array shader_stages = {
        vertex.create_pipeline_shader_stage_create_info(),
        fragment.create_pipeline_shader_stage_create_info()
    };

    const auto binding = PosVertex::binding_description();
    const auto attribute = PosVertex::attribute_description();
    auto vertex_input = vk::PipelineVertexInputStateCreateInfo()
        .setVertexBindingDescriptions(binding)
        .setVertexAttributeDescriptions(attribute);

    const auto state = make_triangle_fixed_function_state();
    FixedFunctionCreateInfos infos;
    fill_create_infos(state, infos);

    auto pipeline_info = vk::GraphicsPipelineCreateInfo()
        .setStages(shader_stages)
        .setPVertexInputState(&vertex_input)
        .setPInputAssemblyState(&infos.input_assembly)
        .setPViewportState(&infos.viewport)
        .setPRasterizationState(&infos.rasterization)
        .setPMultisampleState(&infos.multisample)
        .setPColorBlendState(&infos.color_blend)
        .setPDynamicState(&infos.dynamic)
        .setLayout(m_layout)
        .setRenderPass(m_subpass.render_pass)
        .setSubpass(m_subpass.index);

    auto pipeline_res = m_device.createGraphicsPipeline(nullptr, pipeline_info);
    CHECK_VK_RESULT(pipeline_res, "Failed to create graphics pipeline: {}");
    m_pipeline = pipeline_res.value;

    Logger::instance().debug("Created graphics pipeline");
    return {};
}

PipelineBuilder::~PipelineBuilder() {
    if (m_pipeline) {
        m_device.destroyPipeline(m_pipeline);
    }
    if (m_layout) {
        m_device.destroyPipelineLayout(m_layout);
    }
}

std::expected<SecondaryCommandBuffer, std::string> PipelineBuilder::draw(vk::Extent2D extent) {
    auto buffer = m_commands->allocate(vk::CommandBufferLevel::eSecondary);
    if (!buffer) {
        return std::unexpected(buffer.error());
    }

    auto inheritance = vk::CommandBufferInheritanceInfo()
        .setRenderPass(m_subpass.render_pass)
        .setSubpass(m_subpass.index);

    auto begin_info = vk::CommandBufferBeginInfo()
        .setFlags(vk::CommandBufferUsageFlagBits::eRenderPassContinue |
                  vk::CommandBufferUsageFlagBits::eOneTimeSubmit)
        .setPInheritanceInfo(&inheritance);

    auto cmd = buffer->handle();
    auto begin_res = cmd.begin(begin_info);
    CHECK_VK_RESULT_VOID(begin_res, "Failed to begin secondary command buffer: {}");

    auto commands = make_draw_commands(m_pipeline, m_vertex_buffer.buffer(), m_vertex_count, extent);
    record_draw_commands(cmd, commands);

    auto end_res = cmd.end();
    CHECK_VK_RESULT_VOID(end_res, "Failed to end secondary command buffer: {}");

    return SecondaryCommandBuffer{std::move(*buffer), commands};
}

} // namespace tri
