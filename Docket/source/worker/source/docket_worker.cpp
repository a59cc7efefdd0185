#include "docket_worker.h"

#include "runtime/core/log/log_system.h"
#include "runtime/function/task/task_queue.h"

#include <algorithm>
#include <thread>

namespace docket {

DocketWorker::DocketWorker() = default;

DocketWorker::~DocketWorker()
{
    shutdown();
}

bool DocketWorker::initialize(const DocketConfig& config)
{
    if (!m_context.startSystems(config))
    {
        return false;
    }

    LOG_INFO("DocketWorker: Ready (retention {}s, sweep every {}s, stale after {}s)",
             config.retentionMaxAge, config.sweepInterval, config.staleAfter);
    m_running.store(true, std::memory_order_release);
    return true;
}

void DocketWorker::run()
{
    using Clock = std::chrono::steady_clock;

    // Configs built in code skip ConfigManager validation; keep the cast in range
    const double intervalSeconds = std::clamp(m_context.config().sweepInterval, 0.0, kMaxIntervalSeconds);
    const auto sweepInterval = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(intervalSeconds));
    auto nextSweep = Clock::now() + sweepInterval;

    while (m_running.load(std::memory_order_acquire))
    {
        std::this_thread::sleep_for(m_pollInterval);

        const auto now = Clock::now();
        if (now >= nextSweep)
        {
            tick();
            nextSweep = now + sweepInterval;
        }
    }

    LOG_INFO("DocketWorker: Stop requested");
}

void DocketWorker::shutdown()
{
    m_running.store(false, std::memory_order_release);
    m_context.shutdownSystems();
}

MaintenanceReport DocketWorker::tick()
{
    MaintenanceReport report = m_context.runMaintenance();
    logStatus(report);
    return report;
}

void DocketWorker::logStatus(const MaintenanceReport& report)
{
    if (!m_context.m_task_queue)
    {
        return;
    }

    const TaskQueue& queue = *m_context.m_task_queue;
    const TaskQueueStats& stats = queue.stats();
    const WorkerPoolStats& pool = queue.poolStats();

    LOG_INFO("DocketWorker: swept {} | stored {} | submitted {} completed {} failed {} | active {} peak {} queued {}"
             " | cache expired {}",
             report.removed, report.stored,
             stats.tasksSubmitted.load(std::memory_order_relaxed),
             stats.tasksCompleted.load(std::memory_order_relaxed),
             stats.tasksFailed.load(std::memory_order_relaxed),
             pool.activeJobs.load(std::memory_order_relaxed),
             pool.peakActiveJobs.load(std::memory_order_relaxed),
             queue.queuedCount(),
             report.cacheExpired);

    if (report.stale > 0)
    {
        LOG_WARN("DocketWorker: {} task(s) processing for more than {}s", report.stale, m_context.config().staleAfter);
    }
    if (m_context.isDegraded())
    {
        LOG_WARN("DocketWorker: Running on local fallback, Redis at '{}' was unreachable",
                 m_context.config().redisUrl);
    }
}

} // namespace docket
