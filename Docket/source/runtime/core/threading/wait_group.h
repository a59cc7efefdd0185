#pragma once

#include "runtime/core/base/macro.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>

namespace docket {

/// @brief Counter that lets a thread wait for a group of jobs to finish
/// Similar to Go's sync.WaitGroup
class WaitGroup
{
public:
    WaitGroup() = default;
    ~WaitGroup() = default;

    DOCKET_DISABLE_COPY_AND_MOVE(WaitGroup)

    /// @brief Add delta to the counter (can be negative)
    void add(int32_t delta = 1)
    {
        const int32_t newValue = m_counter.fetch_add(delta, std::memory_order_acq_rel) + delta;

        if (newValue < 0)
        {
            // More done() than add() is a programming error
            std::terminate();
        }

        if (newValue == 0)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cv.notify_all();
        }
    }

    /// @brief Decrement the counter by 1
    void done()
    {
        add(-1);
    }

    /// @brief Block until the counter reaches zero
    void wait()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() {
            return m_counter.load(std::memory_order_acquire) == 0;
        });
    }

    /// @brief Block until the counter reaches zero or the timeout expires
    /// @return true if the counter reached zero
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this]() {
            return m_counter.load(std::memory_order_acquire) == 0;
        });
    }

    [[nodiscard]] bool isDone() const
    {
        return m_counter.load(std::memory_order_acquire) == 0;
    }

    [[nodiscard]] int32_t count() const
    {
        return m_counter.load(std::memory_order_acquire);
    }

private:
    std::atomic<int32_t> m_counter{0};
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

using WaitGroupPtr = std::shared_ptr<WaitGroup>;

/// @brief Create a new WaitGroup with initial count
inline WaitGroupPtr makeWaitGroup(int32_t initialCount = 0)
{
    auto wg = std::make_shared<WaitGroup>();
    if (initialCount > 0)
    {
        wg->add(initialCount);
    }
    return wg;
}

} // namespace docket
