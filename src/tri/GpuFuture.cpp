#include <tri/GpuFuture.hpp>
#include <tri/Logger.hpp>
#include <algorithm>

namespace tri {

GpuFuture::GpuFuture(std::vector<WaitPoint> waits)
    : m_waits(std::move(waits))
{}

GpuFuture GpuFuture::now() {
    return GpuFuture{std::vector<WaitPoint>{}};
}

GpuFuture GpuFuture::after_semaphore(vk::Semaphore semaphore, vk::PipelineStageFlags stage) {
    return GpuFuture{std::vector<WaitPoint>{WaitPoint{.semaphore = semaphore, .value = 0, .stage = stage}}};
}

GpuFuture GpuFuture::after_timeline(vk::Semaphore timeline, uint64_t value) {
    return GpuFuture{std::vector<WaitPoint>{WaitPoint{.semaphore = timeline, .value = value, .stage = vk::PipelineStageFlagBits::eAllCommands}}};
}

GpuFuture::~GpuFuture() {
    if (!m_consumed && has_pending_binary()) {
        Logger::instance().warn("GpuFuture dropped with an unwaited binary semaphore");
    }
}

GpuFuture::GpuFuture(GpuFuture&& other) noexcept
    : m_waits(std::move(other.m_waits))
    , m_consumed(std::exchange(other.m_consumed, true))
{
    other.m_waits.clear();
}

GpuFuture& GpuFuture::operator=(GpuFuture&& other) noexcept {
    if (this != &other) {
        if (!m_consumed && has_pending_binary()) {
            Logger::instance().warn("GpuFuture overwritten with an unwaited binary semaphore");
        }
        m_waits = std::move(other.m_waits);
        m_consumed = std::exchange(other.m_consumed, true);
        other.m_waits.clear();
    }
    return *this;
}

bool GpuFuture::has_pending_binary() const {
    return std::ranges::any_of(m_waits, [](const WaitPoint& w) { return w.is_binary(); });
}

std::optional<uint64_t> GpuFuture::timeline_value(vk::Semaphore timeline) const {
    std::optional<uint64_t> value;
    for (const auto& w : m_waits) {
        if (!w.is_binary() && w.semaphore == timeline) {
            value = std::max(value.value_or(0), w.value);
        }
    }
    return value;
}

void GpuFuture::add_wait(const WaitPoint& point) {
    if (!point.is_binary()) {
        // Timeline points on the same semaphore collapse to the highest value
        auto it = std::ranges::find_if(m_waits, [&](const WaitPoint& w) {
            return !w.is_binary() && w.semaphore == point.semaphore;
        });
        if (it != m_waits.end()) {
            it->value = std::max(it->value, point.value);
            it->stage |= point.stage;
            return;
        }
    }
    m_waits.push_back(point);
}

std::expected<std::vector<WaitPoint>, std::string> GpuFuture::take() {
    if (m_consumed) {
        return std::unexpected("GpuFuture already consumed");
    }
    m_consumed = true;
    return std::exchange(m_waits, {});
}

void GpuFuture::restore(std::vector<WaitPoint> waits) {
    m_waits = std::move(waits);
    m_consumed = false;
}

GpuFuture GpuFuture::join(GpuFuture other) && {
    auto mine = take();
    auto theirs = std::move(other).take();

    GpuFuture joined{std::vector<WaitPoint>{}};
    if (mine) {
        for (const auto& w : *mine) joined.add_wait(w);
    }
    if (theirs) {
        for (const auto& w : *theirs) joined.add_wait(w);
    }
    if (!mine || !theirs) {
        Logger::instance().warn("Joined a consumed GpuFuture; it contributes no waits");
    }
    return joined;
}

std::expected<GpuFuture, std::string> GpuFuture::then_execute(SubmitQueue& queue, vk::CommandBuffer cmd) && {
    auto waits = take();
    if (!waits) {
        return std::unexpected(waits.error());
    }

    auto value = queue.submit(*waits, std::span{&cmd, 1}, nullptr);
    if (!value) {
        restore(std::move(*waits));
        return std::unexpected(value.error());
    }

    Logger::instance().trace("Submitted command buffer after {} wait(s), timeline -> {}", waits->size(), *value);
    return after_timeline(queue.timeline(), *value);
}

std::expected<GpuFuture, std::string> GpuFuture::then_signal_semaphore(SubmitQueue& queue, vk::Semaphore semaphore) && {
    auto waits = take();
    if (!waits) {
        return std::unexpected(waits.error());
    }

    auto value = queue.submit(*waits, {}, semaphore);
    if (!value) {
        restore(std::move(*waits));
        return std::unexpected(value.error());
    }
    return after_timeline(queue.timeline(), *value);
}

std::expected<GpuFuture, std::string> GpuFuture::flush(SubmitQueue& queue) && {
    if (m_consumed) {
        return std::unexpected("GpuFuture already consumed");
    }
    if (!has_pending_binary()) {
        return std::move(*this);
    }

    auto waits = take();
    auto value = queue.submit(*waits, {}, nullptr);
    if (!value) {
        restore(std::move(*waits));
        return std::unexpected(value.error());
    }
    return after_timeline(queue.timeline(), *value);
}

std::expected<void, std::string> GpuFuture::wait(SubmitQueue& queue, uint64_t timeout) && {
    if (m_consumed) {
        return std::unexpected("GpuFuture already consumed");
    }
    if (m_waits.empty()) {
        m_consumed = true;
        return {};
    }

    // Anything but our own timeline gets folded into it by a wait-only batch
    bool own_timeline_only = std::ranges::all_of(m_waits, [&](const WaitPoint& w) {
        return !w.is_binary() && w.semaphore == queue.timeline();
    });
    auto fenced = own_timeline_only
        ? std::expected<GpuFuture, std::string>{std::move(*this)}
        : std::move(*this).then_signal_semaphore(queue, nullptr);
    if (!fenced) {
        return std::unexpected(fenced.error());
    }

    auto value = fenced->timeline_value(queue.timeline());
    return queue.wait_for(value.value_or(0), timeout);
}

} // namespace tri
