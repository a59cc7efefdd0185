#pragma once

#include "runtime/resource/store/task_store.h"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace docket {

/// @brief Purges records older than a maximum age, whatever their status
/// Never schedules itself; the owner decides when to sweep
class RetentionSweeper
{
public:
    /// @param maxAgeSeconds Default age used by sweep() without arguments
    explicit RetentionSweeper(ITaskStore& store, double maxAgeSeconds = 3600.0);

    /// @brief Remove records with now - createdAt >= maxAge
    /// @return Number of records removed
    size_t sweep();
    size_t sweep(double maxAgeSeconds);
    size_t sweep(double maxAgeSeconds, double now);

    [[nodiscard]] double maxAge() const { return m_maxAgeSeconds; }

    [[nodiscard]] uint64_t sweepCount() const { return m_sweeps.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t totalRemoved() const { return m_totalRemoved.load(std::memory_order_relaxed); }

private:
    ITaskStore& m_store;
    double m_maxAgeSeconds;

    std::atomic<uint64_t> m_sweeps{0};
    std::atomic<uint64_t> m_totalRemoved{0};
};

} // namespace docket
