#pragma once

#include "runtime/core/base/macro.h"
#include "runtime/core/threading/job.h"
#include "runtime/core/threading/wait_group.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace docket {

/// @brief Thread configuration for worker threads
struct ThreadConfig
{
    std::string namePrefix{"DocketWorker"};  // Thread name prefix (e.g., "DocketWorker-0")
};

/// @brief Worker pool configuration
struct WorkerPoolConfig
{
    uint32_t numWorkers{4};     // Number of execution slots, must be > 0
    ThreadConfig threadConfig{};
};

/// @brief Statistics for worker pool monitoring
struct WorkerPoolStats
{
    std::atomic<uint64_t> jobsSubmitted{0};
    std::atomic<uint64_t> jobsCompleted{0};
    std::atomic<uint64_t> jobsThrew{0};         // Jobs whose function let an exception escape
    std::atomic<uint64_t> jobsRejected{0};      // Submissions refused because the pool was not running
    std::atomic<uint32_t> activeJobs{0};        // Jobs executing right now
    std::atomic<uint32_t> peakActiveJobs{0};    // High-water mark of activeJobs

    void reset()
    {
        jobsSubmitted.store(0, std::memory_order_relaxed);
        jobsCompleted.store(0, std::memory_order_relaxed);
        jobsThrew.store(0, std::memory_order_relaxed);
        jobsRejected.store(0, std::memory_order_relaxed);
        peakActiveJobs.store(activeJobs.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }
};

/// @brief Fixed-size thread pool with an unbounded FIFO queue
/// Submission never waits for a free worker; at most workerCount() jobs run at once
class WorkerPool
{
public:
    WorkerPool();
    ~WorkerPool();

    DOCKET_DISABLE_COPY_AND_MOVE(WorkerPool)

    /// @brief Start the worker threads
    /// @param config Configuration options
    /// @return true if successful
    bool initialize(const WorkerPoolConfig& config = {});

    /// @brief Stop accepting jobs, run everything already queued, join the workers
    void shutdown();

    /// @brief Submit a job to the pool
    /// @param job Job to execute
    /// @return WaitGroup signaled when the job completes, or nullptr if the pool is not running
    WaitGroupPtr submit(Job job);

    /// @brief Submit a function as a job
    WaitGroupPtr submit(JobFunction fn, std::string debugName = "");

    [[nodiscard]] bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    [[nodiscard]] uint32_t workerCount() const { return static_cast<uint32_t>(m_workers.size()); }

    /// @brief Number of jobs waiting for a worker
    [[nodiscard]] size_t queueSize() const;

    [[nodiscard]] const WorkerPoolStats& stats() const { return m_stats; }

    void resetStats() { m_stats.reset(); }

private:
    void workerLoop(uint32_t workerId);

    void runJob(Job& job, uint32_t workerId);

    /// @brief Set thread name (platform-specific)
    static void setThreadName(const std::string& name);

private:
    std::vector<std::thread> m_workers;

    std::deque<Job> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_running{false};
    bool m_stopping{false};     // Guarded by m_mutex

    WorkerPoolConfig m_config;
    WorkerPoolStats m_stats;
};

} // namespace docket
