#pragma once

#include <tri/Common.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace tri {

/**
 * @brief Image the frame is rendered into (a swapchain image or an offscreen image)
 */
struct TargetImage {
    vk::ImageView view;
    vk::Format format = vk::Format::eUndefined;
    vk::Extent2D extent;
    vk::ImageUsageFlags usage;
};

struct RenderPassConfig {
    vk::Format color_format;
    vk::ImageLayout final_layout = vk::ImageLayout::ePresentSrcKHR;
    vk::Extent2D max_extent{UINT32_MAX, UINT32_MAX}; // largest framebuffer the device accepts
};

/**
 * @brief Reasons a target cannot be bound to a render pass of the given format
 *
 * Returns an error message for a format mismatch, an extent that is empty or
 * beyond max_extent, a null view or a target that is not usable as a color
 * attachment.
 */
[[nodiscard]] std::expected<void, std::string> check_target_compatibility(
    vk::Format pass_format,
    const TargetImage& target,
    vk::Extent2D max_extent = vk::Extent2D{UINT32_MAX, UINT32_MAX}
);

/**
 * @brief One color attachment (clear, store), one subpass, no depth
 */
class RenderPass {
public:
    static std::expected<std::unique_ptr<RenderPass>, std::string> create(vk::Device device, const RenderPassConfig& config);

    ~RenderPass();

    RenderPass(const RenderPass&) = delete;
    RenderPass& operator=(const RenderPass&) = delete;

    [[nodiscard]] vk::RenderPass handle() const { return m_render_pass; }
    [[nodiscard]] const RenderPassConfig& config() const { return m_config; }

private:
    RenderPass(vk::Device device, vk::RenderPass render_pass, const RenderPassConfig& config);

    vk::Device m_device;
    vk::RenderPass m_render_pass;
    RenderPassConfig m_config;
};

/**
 * @brief RenderPass bound to one TargetImage
 */
class Framebuffer {
public:
    static std::expected<Framebuffer, std::string> create(vk::Device device, const RenderPass& pass, const TargetImage& target);

    ~Framebuffer();

    Framebuffer(const Framebuffer&) = delete;
    Framebuffer& operator=(const Framebuffer&) = delete;
    Framebuffer(Framebuffer&& other) noexcept;
    Framebuffer& operator=(Framebuffer&& other) noexcept;

    [[nodiscard]] vk::Framebuffer handle() const { return m_framebuffer; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }

private:
    Framebuffer(vk::Device device, vk::Framebuffer framebuffer, vk::Extent2D extent);

    vk::Device m_device;
    vk::Framebuffer m_framebuffer;
    vk::Extent2D m_extent;
};

} // namespace tri
