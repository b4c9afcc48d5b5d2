#include <catch2/catch_test_macros.hpp>

#include <tri/DeviceAllocator.hpp>
#include <tri/GraphicsQueue.hpp>
#include <tri/Logger.hpp>
#include <tri/PipelineBuilder.hpp>
#include <tri/RenderTarget.hpp>
#include <tri/VulkanContext.hpp>

#include <array>

using namespace tri;

TEST_CASE("PipelineBuilder construction", "[pipeline][vulkan]")
{
    Logger::instance().set_level(spdlog::level::debug);
    VulkanContext ctx("PipelineBuilder Test", ContextMode::Headless);
    auto queue = GraphicsQueue::create(ctx);
    REQUIRE(queue.has_value());
    DeviceAllocator allocator(ctx);

    auto render_pass = RenderPass::create(ctx.device(), RenderPassConfig{
        .color_format = vk::Format::eR8G8B8A8Unorm,
        .final_layout = vk::ImageLayout::eTransferSrcOptimal,
    });
    REQUIRE(render_pass.has_value());

    auto builder_result = PipelineBuilder::create(ctx, allocator, **queue, Subpass{
        .render_pass = (*render_pass)->handle(),
        .index = 0,
    });
    REQUIRE(builder_result.has_value());
    auto& builder = **builder_result;

    SECTION("pipeline and layout are valid")
    {
        REQUIRE(builder.pipeline());
        REQUIRE(builder.layout());
        REQUIRE(builder.subpass().render_pass == (*render_pass)->handle());
        REQUIRE(builder.subpass().index == 0);
    }

    SECTION("vertex buffer holds the triangle")
    {
        REQUIRE(builder.vertex_count() == 3);
        REQUIRE(builder.vertex_buffer().size() == 3 * sizeof(PosVertex));

        std::array<PosVertex, 3> read_back{};
        auto result = builder.vertex_buffer().allocation().read(std::as_writable_bytes(std::span{read_back}));
        REQUIRE(result.has_value());

        const auto expected = triangle_vertices();
        for (std::size_t i = 0; i < expected.size(); ++i) {
            REQUIRE(read_back[i].position == expected[i].position);
        }
    }

    SECTION("secondary command buffers are reserved up front")
    {
        REQUIRE(builder.command_allocator().free_count(vk::CommandBufferLevel::eSecondary) == PipelineBuilder::SECONDARY_RESERVE);
        REQUIRE(builder.command_allocator().queue_family() == (*queue)->family_index());
    }

    SECTION("draw records a secondary command buffer")
    {
        auto secondary = builder.draw(vk::Extent2D{640, 480});
        REQUIRE(secondary.has_value());
        REQUIRE(secondary->buffer.valid());
        REQUIRE(secondary->buffer.level() == vk::CommandBufferLevel::eSecondary);
        REQUIRE(secondary->commands.viewport == vk::Viewport(0.0f, 0.0f, 640.0f, 480.0f, 0.0f, 1.0f));
        REQUIRE(secondary->commands.pipeline == builder.pipeline());
        REQUIRE(secondary->commands.vertex_buffer == builder.vertex_buffer().buffer());
        REQUIRE(secondary->commands.vertex_count == 3);
        REQUIRE(builder.command_allocator().free_count(vk::CommandBufferLevel::eSecondary) == PipelineBuilder::SECONDARY_RESERVE - 1);
    }

    SECTION("draw is idempotent for equal dimensions")
    {
        auto first = builder.draw(vk::Extent2D{1280, 720});
        auto second = builder.draw(vk::Extent2D{1280, 720});
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->commands == second->commands);
        REQUIRE(first->buffer.handle() != second->buffer.handle());
    }

    SECTION("dropped secondaries go back to the allocator")
    {
        {
            auto secondary = builder.draw(vk::Extent2D{64, 64});
            REQUIRE(secondary.has_value());
        }
        REQUIRE(builder.command_allocator().free_count(vk::CommandBufferLevel::eSecondary) == PipelineBuilder::SECONDARY_RESERVE);
    }
}
