#pragma once

#include "velo/core/macros.hpp"

#include <cstddef>
#include <atomic>
#include <cstdint>

// =============================================================================
/// @file progress.hpp
/// @brief Lock-free progress slots for long-running batch fits
///
/// A fixed pool of slots is shared process-wide. A batch fit acquires one
/// slot, bumps it as genes finish, and releases it on scope exit. Callers
/// poll a slot without blocking the workers. Precision is secondary.
///
/// @code{.cpp}
/// velo::progress::ScopedProgress progress(n_genes);
/// parallel_for(0, n_genes, [&](size_t g) {
///     // fit gene g ...
///     progress.tick();
/// });
/// @endcode
// =============================================================================

namespace velo::progress {

/// @brief Percentage in [0, 100]
using ProgressValue = std::uint8_t;

struct ProgressSlot {
    std::atomic<ProgressValue> value{0};
    std::atomic<bool> active{false};
};

class VELO_EXPORT ProgressPool {
public:
    static ProgressPool& instance();

    /// @return Slot pointer, or nullptr when every slot is in use
    ProgressSlot* acquire();

    void release(ProgressSlot* slot);

    ProgressValue get_value(ProgressSlot* slot) const;

    bool is_active(ProgressSlot* slot) const;

private:
    static constexpr size_t POOL_SIZE = 64;
    ProgressSlot slots_[POOL_SIZE];
    std::atomic<size_t> next_index_{0};

    ProgressPool() = default;
    ~ProgressPool() = default;
    ProgressPool(const ProgressPool&) = delete;
    ProgressPool& operator=(const ProgressPool&) = delete;
};

/// @brief Holds one pool slot for the enclosing scope and converts a count
/// of completed items into a percentage.
class ScopedProgress {
public:
    explicit ScopedProgress(size_t total)
        : slot_(ProgressPool::instance().acquire()), total_(total) {}

    ~ScopedProgress() {
        ProgressPool::instance().release(slot_);
    }

    ScopedProgress(const ScopedProgress&) = delete;
    ScopedProgress& operator=(const ScopedProgress&) = delete;

    /// @brief Record one completed item. Safe from worker threads.
    void tick() noexcept {
        const size_t done = done_.fetch_add(1, std::memory_order_relaxed) + 1;
        if (slot_ == nullptr || total_ == 0) return;
        const auto pct = static_cast<ProgressValue>((done * 100) / total_);
        slot_->value.store(pct > 100 ? ProgressValue(100) : pct, std::memory_order_relaxed);
    }

    [[nodiscard]] size_t completed() const noexcept {
        return done_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] ProgressSlot* slot() const noexcept { return slot_; }

private:
    ProgressSlot* slot_;
    size_t total_;
    std::atomic<size_t> done_{0};
};

} // namespace velo::progress
