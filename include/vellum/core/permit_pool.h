#pragma once

// PermitPool
// ----------
// Process-wide gate in front of the external providers. Each lane owns a fixed
// number of permits; every ingestion job and every query draws from the same
// pool, so the provider sees at most `permits(lane)` concurrent calls.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <semaphore>

namespace vellum::core {

enum class PermitLane : std::uint8_t {
    Embedding = 0,
    Reranker = 1,
};

constexpr std::uint8_t kPermitLaneCount = 2;
constexpr std::ptrdiff_t kMaxPermitsPerLane = 256;

const char* permitLaneName(PermitLane lane) noexcept;

struct PermitLaneMetrics {
    std::uint32_t capacity{0};
    std::uint32_t inFlight{0};
    std::uint32_t peakInFlight{0};
    std::uint32_t timeouts{0};
};

class PermitPool {
public:
    PermitPool(std::uint32_t embeddingPermits, std::uint32_t rerankerPermits);
    ~PermitPool() = default;

    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    /// Blocks for at most `timeout`. Returns false when no permit became free.
    [[nodiscard]] bool acquire(PermitLane lane, std::chrono::milliseconds timeout);
    void release(PermitLane lane);

    /// RAII permit
    class Permit {
    public:
        Permit(PermitPool& pool, PermitLane lane, std::chrono::milliseconds timeout)
            : pool_(pool), lane_(lane), acquired_(pool.acquire(lane, timeout)) {}

        ~Permit() {
            if (acquired_) {
                pool_.release(lane_);
            }
        }

        [[nodiscard]] bool acquired() const noexcept { return acquired_; }
        explicit operator bool() const noexcept { return acquired_; }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&&) = delete;
        Permit& operator=(Permit&&) = delete;

    private:
        PermitPool& pool_;
        PermitLane lane_;
        bool acquired_;
    };

    [[nodiscard]] PermitLaneMetrics metrics(PermitLane lane) const noexcept;

private:
    struct LaneState {
        explicit LaneState(std::uint32_t permits)
            : capacity(permits), slots(static_cast<std::ptrdiff_t>(permits)) {}

        std::uint32_t capacity;
        std::counting_semaphore<kMaxPermitsPerLane> slots;
        std::atomic<std::uint32_t> inFlight{0};
        std::atomic<std::uint32_t> peak{0};
        std::atomic<std::uint32_t> timeouts{0};
    };

    LaneState& state(PermitLane lane) noexcept { return *lanes_[static_cast<std::size_t>(lane)]; }
    const LaneState& state(PermitLane lane) const noexcept {
        return *lanes_[static_cast<std::size_t>(lane)];
    }

    std::array<std::unique_ptr<LaneState>, kPermitLaneCount> lanes_;
};

} // namespace vellum::core
