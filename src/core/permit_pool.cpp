#include <vellum/core/permit_pool.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace vellum::core {

const char* permitLaneName(PermitLane lane) noexcept {
    switch (lane) {
        case PermitLane::Embedding: return "embedding";
        case PermitLane::Reranker: return "reranker";
    }
    return "unknown";
}

namespace {
std::uint32_t checkedPermits(std::uint32_t permits, const char* lane) {
    if (permits == 0 || permits > static_cast<std::uint32_t>(kMaxPermitsPerLane)) {
        throw std::invalid_argument(std::string("permit count out of range for lane ") + lane);
    }
    return permits;
}
} // namespace

PermitPool::PermitPool(std::uint32_t embeddingPermits, std::uint32_t rerankerPermits) {
    lanes_[static_cast<std::size_t>(PermitLane::Embedding)] =
        std::make_unique<LaneState>(checkedPermits(embeddingPermits, "embedding"));
    lanes_[static_cast<std::size_t>(PermitLane::Reranker)] =
        std::make_unique<LaneState>(checkedPermits(rerankerPermits, "reranker"));
    spdlog::debug("[PermitPool] embedding={} reranker={}", embeddingPermits, rerankerPermits);
}

bool PermitPool::acquire(PermitLane lane, std::chrono::milliseconds timeout) {
    auto& s = state(lane);
    if (!s.slots.try_acquire_for(timeout)) {
        s.timeouts.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[PermitPool] {} permit not available within {}ms", permitLaneName(lane),
                      timeout.count());
        return false;
    }

    auto now = s.inFlight.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto peak = s.peak.load(std::memory_order_relaxed);
    while (now > peak && !s.peak.compare_exchange_weak(peak, now, std::memory_order_relaxed)) {
    }
    return true;
}

void PermitPool::release(PermitLane lane) {
    auto& s = state(lane);
    s.inFlight.fetch_sub(1, std::memory_order_acq_rel);
    s.slots.release();
}

PermitLaneMetrics PermitPool::metrics(PermitLane lane) const noexcept {
    const auto& s = state(lane);
    PermitLaneMetrics m;
    m.capacity = s.capacity;
    m.inFlight = s.inFlight.load(std::memory_order_acquire);
    m.peakInFlight = s.peak.load(std::memory_order_acquire);
    m.timeouts = s.timeouts.load(std::memory_order_acquire);
    return m;
}

} // namespace vellum::core
