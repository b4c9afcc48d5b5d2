#pragma once

#include <tri/Common.hpp>
#include <cstdint>
#include <vector>

namespace tri {

struct InputAssemblyStage {
    vk::PrimitiveTopology topology;
    bool primitive_restart;
};

struct ViewportStage {
    uint32_t viewport_count;
    uint32_t scissor_count;
    vk::Rect2D scissor; // static, the viewport is dynamic
};

struct RasterizationStage {
    vk::PolygonMode polygon_mode;
    vk::CullModeFlags cull_mode;
    vk::FrontFace front_face;
    float line_width;
    bool depth_clamp;
    bool discard;
    bool depth_bias;
};

struct MultisampleStage {
    vk::SampleCountFlagBits samples;
    bool sample_shading;
};

struct ColorBlendStage {
    bool blend_enable;
    vk::ColorComponentFlags write_mask;
    bool logic_op_enable;
};

/**
 * @brief Every fixed-function setting of a graphics pipeline, one field per stage
 *
 * Fields have no defaults; make_triangle_fixed_function_state() spells out every value.
 */
struct FixedFunctionState {
    InputAssemblyStage input_assembly;
    ViewportStage viewport;
    RasterizationStage rasterization;
    MultisampleStage multisample;
    ColorBlendStage color_blend;
    std::vector<vk::DynamicState> dynamic_states;
};

/**
 * @brief State for the single-subpass red triangle: no culling, no blending, dynamic viewport
 */
[[nodiscard]] FixedFunctionState make_triangle_fixed_function_state();

/**
 * @brief Vulkan create-info structs pointing into a FixedFunctionState
 *
 * Holds pointers into the state it was built from; keep the state alive
 * until the pipeline is created.
 */
struct FixedFunctionCreateInfos {
    vk::PipelineInputAssemblyStateCreateInfo input_assembly;
    vk::PipelineViewportStateCreateInfo viewport;
    vk::PipelineRasterizationStateCreateInfo rasterization;
    vk::PipelineMultisampleStateCreateInfo multisample;
    vk::PipelineColorBlendAttachmentState color_blend_attachment;
    vk::PipelineColorBlendStateCreateInfo color_blend;
    vk::PipelineDynamicStateCreateInfo dynamic;
};

/**
 * @brief Translate state into create infos
 *
 * The result refers to state and to itself (color_blend -> color_blend_attachment),
 * so it is filled in place and must not be moved afterwards.
 */
void fill_create_infos(const FixedFunctionState& state, FixedFunctionCreateInfos& out);

} // namespace tri
