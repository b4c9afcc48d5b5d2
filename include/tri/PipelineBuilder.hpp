#pragma once

#include <tri/CommandAllocator.hpp>
#include <tri/Common.hpp>
#include <tri/DeviceAllocator.hpp>
#include <tri/Shader.hpp>
#include <array>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace tri {

class GraphicsQueue;
class VulkanContext;

struct PosVertex {
    glm::vec2 position;

    static vk::VertexInputBindingDescription binding_description() {
        return vk::VertexInputBindingDescription()
            .setBinding(0)
            .setStride(sizeof(PosVertex))
            .setInputRate(vk::VertexInputRate::eVertex);
    }

    static vk::VertexInputAttributeDescription attribute_description() {
        return vk::VertexInputAttributeDescription()
            .setLocation(0)
            .setBinding(0)
            .setFormat(vk::Format::eR32G32Sfloat)
            .setOffset(offsetof(PosVertex, position));
    }
};
static_assert(sizeof(PosVertex) == 8, "PosVertex must match the float2 shader input");

/**
 * @brief The fixed triangle: top center, bottom right, bottom left (clip space, y down)
 */
[[nodiscard]] inline std::array<PosVertex, 3> triangle_vertices() {
    return {{
        {glm::vec2{0.0f, -0.5f}},
        {glm::vec2{0.5f, 0.5f}},
        {glm::vec2{-0.5f, 0.5f}},
    }};
}

/**
 * @brief Plain-data copy of what a secondary command buffer records
 */
struct DrawCommands {
    vk::Viewport viewport;
    vk::Pipeline pipeline;
    vk::Buffer vertex_buffer;
    uint32_t vertex_binding = 0;
    vk::DeviceSize vertex_offset = 0;
    uint32_t vertex_count = 0;
    uint32_t instance_count = 1;

    bool operator==(const DrawCommands&) const = default;
};

/**
 * @brief Draw list for a target of the given size: full viewport with depth [0,1], one instance
 */
[[nodiscard]] DrawCommands make_draw_commands(
    vk::Pipeline pipeline,
    vk::Buffer vertex_buffer,
    uint32_t vertex_count,
    vk::Extent2D extent
);

/**
 * @brief Record set viewport, bind pipeline, bind vertex buffer, draw (in that order)
 */
void record_draw_commands(vk::CommandBuffer cmd, const DrawCommands& commands);

/**
 * @brief Check reflected vertex input against PosVertex
 *
 * Expects one binding of stride sizeof(PosVertex) and one R32G32Sfloat
 * attribute at location 0, offset 0.
 */
[[nodiscard]] std::expected<void, std::string> check_vertex_input(
    std::span<const VertexAttribute> attributes,
    std::span<const VertexBinding> bindings
);

struct SecondaryCommandBuffer {
    CommandBuffer buffer;
    DrawCommands commands;
};

/**
 * @brief Render pass subpass a pipeline is compiled against
 */
struct Subpass {
    vk::RenderPass render_pass;
    uint32_t index = 0;
};

/**
 * @brief Immutable triangle pipeline with its vertex buffer
 *
 * Produces secondary command buffers that draw the triangle inside the subpass
 * it was created for. Single-threaded.
 */
class PipelineBuilder {
public:
    static constexpr uint32_t SECONDARY_RESERVE = 32;

    /**
     * @brief Upload the vertices, compile the shaders and build the pipeline
     *
     * Every failure is fatal for startup.
     */
    static std::expected<std::unique_ptr<PipelineBuilder>, std::string> create(
        const VulkanContext& context,
        const DeviceAllocator& allocator,
        const GraphicsQueue& queue,
        const Subpass& subpass
    );

    ~PipelineBuilder();

    PipelineBuilder(const PipelineBuilder&) = delete;
    PipelineBuilder& operator=(const PipelineBuilder&) = delete;

    /**
     * @brief Record a secondary command buffer drawing the triangle into a target of extent
     *
     * Nothing is submitted. Equal extents record equal DrawCommands.
     */
    [[nodiscard]] std::expected<SecondaryCommandBuffer, std::string> draw(vk::Extent2D extent);

    [[nodiscard]] vk::Pipeline pipeline() const { return m_pipeline; }
    [[nodiscard]] vk::PipelineLayout layout() const { return m_layout; }
    [[nodiscard]] const DeviceBuffer& vertex_buffer() const { return m_vertex_buffer; }
    [[nodiscard]] uint32_t vertex_count() const { return m_vertex_count; }
    [[nodiscard]] const Subpass& subpass() const { return m_subpass; }
    [[nodiscard]] const CommandAllocator& command_allocator() const { return *m_commands; }

private:
    PipelineBuilder(
        vk::Device device,
        DeviceBuffer vertex_buffer,
        uint32_t vertex_count,
        const Subpass& subpass,
        std::unique_ptr<CommandAllocator> commands
    );

    std::expected<void, std::string> create_pipeline(const Shader& vertex, const Shader& fragment);

    vk::Device m_device;
    DeviceBuffer m_vertex_buffer;
    uint32_t m_vertex_count;
    Subpass m_subpass;
    std::unique_ptr<CommandAllocator> m_commands;
    vk::PipelineLayout m_layout;
    vk::Pipeline m_pipeline;
};

} // namespace tri
