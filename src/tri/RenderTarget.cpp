#include <tri/RenderTarget.hpp>
#include <tri/Logger.hpp>

namespace tri {

std::expected<void, std::string> check_target_compatibility(
    vk::Format pass_format,
    const TargetImage& target,
    vk::Extent2D max_extent
) {
    if (!target.view) {
        return std::unexpected("Target has no image view");
    }
    if (target.format != pass_format) {
        return std::unexpected(std::format("Target format {} does not match render pass format {}",
            vk::to_string(target.format), vk::to_string(pass_format)));
    }
    if (target.extent.width == 0 || target.extent.height == 0) {
        return std::unexpected(std::format("Target extent {}x{} is empty",
            target.extent.width, target.extent.height));
    }
    if (target.extent.width > max_extent.width || target.extent.height > max_extent.height) {
        return std::unexpected(std::format("Target extent {}x{} exceeds the framebuffer limit {}x{}",
            target.extent.width, target.extent.height, max_extent.width, max_extent.height));
    }
    if (!(target.usage & vk::ImageUsageFlagBits::eColorAttachment)) {
        return std::unexpected(std::format("Target usage {} lacks color attachment",
            vk::to_string(target.usage)));
    }
    return {};
}

// --- RenderPass ---

RenderPass::RenderPass(vk::Device device, vk::RenderPass render_pass, const RenderPassConfig& config)
    : m_device(device)
    , m_render_pass(render_pass)
    , m_config(config)
{}

std::expected<std::unique_ptr<RenderPass>, std::string> RenderPass::create(vk::Device device, const RenderPassConfig& config) {
    auto color_attachment = vk::AttachmentDescription()
        .setFormat(config.color_format)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setLoadOp(vk::AttachmentLoadOp::eClear)
        .setStoreOp(vk::AttachmentStoreOp::eStore)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setFinalLayout(config.final_layout);

    auto color_ref = vk::AttachmentReference()
        .setAttachment(0)
        .setLayout(vk::ImageLayout::eColorAttachmentOptimal);

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_ref);

    // The acquire semaphore is waited on at color attachment output
    auto dependency = vk::SubpassDependency()
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setDstStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setDstAccessMask(vk::AccessFlagBits::eColorAttachmentWrite);

    auto render_pass_info = vk::RenderPassCreateInfo()
        .setAttachments(color_attachment)
        .setSubpasses(subpass)
        .setDependencies(dependency);

    auto render_pass_res = device.createRenderPass(render_pass_info);
    CHECK_VK_RESULT(render_pass_res, "Could not create render pass {}");

    Logger::instance().debug("Created render pass ({}, final layout {})",
        vk::to_string(config.color_format), vk::to_string(config.final_layout));
    return std::unique_ptr<RenderPass>(new RenderPass(device, render_pass_res.value, config));
}

RenderPass::~RenderPass() {
    if (m_render_pass) {
        m_device.destroyRenderPass(m_render_pass);
    }
}

// --- Framebuffer ---

Framebuffer::Framebuffer(vk::Device device, vk::Framebuffer framebuffer, vk::Extent2D extent)
    : m_device(device)
    , m_framebuffer(framebuffer)
    , m_extent(extent)
{}

std::expected<Framebuffer, std::string> Framebuffer::create(vk::Device device, const RenderPass& pass, const TargetImage& target) {
    if (auto compatible = check_target_compatibility(pass.config().color_format, target, pass.config().max_extent); !compatible) {
        return std::unexpected(compatible.error());
    }

    auto framebuffer_info = vk::FramebufferCreateInfo()
        .setRenderPass(pass.handle())
        .setAttachments(target.view)
        .setWidth(target.extent.width)
        .setHeight(target.extent.height)
        .setLayers(1);

    auto framebuffer_res = device.createFramebuffer(framebuffer_info);
    CHECK_VK_RESULT(framebuffer_res, "Could not create framebuffer {}");
    return Framebuffer{device, framebuffer_res.value, target.extent};
}

Framebuffer::~Framebuffer() {
    if (m_framebuffer) {
        m_device.destroyFramebuffer(m_framebuffer);
    }
}

Framebuffer::Framebuffer(Framebuffer&& other) noexcept
    : m_device(other.m_device)
    , m_framebuffer(std::exchange(other.m_framebuffer, nullptr))
    , m_extent(other.m_extent)
{}

Framebuffer& Framebuffer::operator=(Framebuffer&& other) noexcept {
    if (this != &other) {
        if (m_framebuffer) {
            m_device.destroyFramebuffer(m_framebuffer);
        }
        m_device = other.m_device;
        m_framebuffer = std::exchange(other.m_framebuffer, nullptr);
        m_extent = other.m_extent;
    }
    return *this;
}

} // namespace tri
