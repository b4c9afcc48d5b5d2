#include <tri/PipelineState.hpp>
#include <cstdint>
#include <limits>

namespace tri {

FixedFunctionState make_triangle_fixed_function_state() {
    constexpr auto max_extent = static_cast<uint32_t>(std::numeric_limits<int32_t>::max());

    return FixedFunctionState{
        .input_assembly = {
            .topology = vk::PrimitiveTopology::eTriangleList,
            .primitive_restart = false,
        },
        .viewport = {
            .viewport_count = 1,
            .scissor_count = 1,
            .scissor = vk::Rect2D{vk::Offset2D{0, 0}, vk::Extent2D{max_extent, max_extent}},
        },
        .rasterization = {
            .polygon_mode = vk::PolygonMode::eFill,
            .cull_mode = vk::CullModeFlagBits::eNone,
            .front_face = vk::FrontFace::eCounterClockwise,
            .line_width = 1.0f,
            .depth_clamp = false,
            .discard = false,
            .depth_bias = false,
        },
        .multisample = {
            .samples = vk::SampleCountFlagBits::e1,
            .sample_shading = false,
        },
        .color_blend = {
            .blend_enable = false,
            .write_mask = vk::ColorComponentFlagBits::eR | vk::ColorComponentFlagBits::eG |
                          vk::ColorComponentFlagBits::eB | vk::ColorComponentFlagBits::eA,
            .logic_op_enable = false,
        },
        .dynamic_states = {vk::DynamicState::eViewport},
    };
}

void fill_create_infos(const FixedFunctionState& state, FixedFunctionCreateInfos& out) {
    out.input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
        .setTopology(state.input_assembly.topology)
        .setPrimitiveRestartEnable(state.input_assembly.primitive_restart);

    out.viewport = vk::PipelineViewportStateCreateInfo()
        .setViewportCount(state.viewport.viewport_count)
        .setScissorCount(state.viewport.scissor_count)
        .setPScissors(&state.viewport.scissor);

    out.rasterization = vk::PipelineRasterizationStateCreateInfo()
        .setDepthClampEnable(state.rasterization.depth_clamp)
        .setRasterizerDiscardEnable(state.rasterization.discard)
        .setPolygonMode(state.rasterization.polygon_mode)
        .setLineWidth(state.rasterization.line_width)
        .setCullMode(state.rasterization.cull_mode)
        .setFrontFace(state.rasterization.front_face)
        .setDepthBiasEnable(state.rasterization.depth_bias);

    out.multisample = vk::PipelineMultisampleStateCreateInfo()
        .setSampleShadingEnable(state.multisample.sample_shading)
        .setRasterizationSamples(state.multisample.samples);

    out.color_blend_attachment = vk::PipelineColorBlendAttachmentState()
        .setColorWriteMask(state.color_blend.write_mask)
        .setBlendEnable(state.color_blend.blend_enable);

    out.color_blend = vk::PipelineColorBlendStateCreateInfo()
        .setLogicOpEnable(state.color_blend.logic_op_enable)
        .setAttachments(out.color_blend_attachment);

    out.dynamic = vk::PipelineDynamicStateCreateInfo()
        .setDynamicStates(state.dynamic_states);
}

} // namespace tri
