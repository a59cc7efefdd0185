#include "runtime/core/threading/worker_pool.h"
#include "runtime/core/log/log_system.h"

#include <exception>
#include <utility>

#if !defined(DOCKET_PLATFORM_WINDOWS)
#include <pthread.h>
#endif

namespace docket {

// ============================================================================
// Platform-specific thread utilities
// ============================================================================

void WorkerPool::setThreadName(const std::string& name)
{
#if defined(DOCKET_PLATFORM_MACOS)
    pthread_setname_np(name.c_str());
#elif defined(DOCKET_PLATFORM_LINUX)
    // Linux pthread naming (max 16 chars including null)
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#endif
}

WorkerPool::WorkerPool() = default;

WorkerPool::~WorkerPool()
{
    if (m_running.load(std::memory_order_acquire))
    {
        shutdown();
    }
}

bool WorkerPool::initialize(const WorkerPoolConfig& config)
{
    if (m_running.load(std::memory_order_acquire))
    {
        LOG_WARN("WorkerPool already initialized");
        return false;
    }

    if (config.numWorkers == 0)
    {
        LOG_ERROR("WorkerPool: numWorkers must be at least 1");
        return false;
    }

    m_config = config;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = false;
    }

    LOG_INFO("WorkerPool: Initializing with {} worker threads", config.numWorkers);

    m_running.store(true, std::memory_order_release);

    try
    {
        m_workers.reserve(config.numWorkers);
        for (uint32_t i = 0; i < config.numWorkers; ++i)
        {
            m_workers.emplace_back(&WorkerPool::workerLoop, this, i);
        }
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("WorkerPool: Failed to start worker threads: {}", e.what());
        shutdown();
        return false;
    }

    return true;
}

void WorkerPool::shutdown()
{
    if (!m_running.exchange(false, std::memory_order_acq_rel))
    {
        return;
    }

    LOG_INFO("WorkerPool: Shutting down, {} queued jobs will still run", queueSize());

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();

    for (auto& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }

    m_workers.clear();

    LOG_INFO("WorkerPool: Shutdown complete. Jobs completed: {}",
             m_stats.jobsCompleted.load(std::memory_order_relaxed));
}

WaitGroupPtr WorkerPool::submit(Job job)
{
    if (!m_running.load(std::memory_order_acquire))
    {
        LOG_WARN("WorkerPool: Cannot submit job '{}' - pool is not running", job.debugName);
        m_stats.jobsRejected.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Create wait group if not provided
    WaitGroupPtr wg = job.waitGroup;
    if (!wg)
    {
        wg = makeWaitGroup(1);
        job.waitGroup = wg;
    }
    else
    {
        wg->add(1);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping)
        {
            wg->done();
            m_stats.jobsRejected.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        m_queue.push_back(std::move(job));
    }

    m_stats.jobsSubmitted.fetch_add(1, std::memory_order_relaxed);
    m_cv.notify_one();
    return wg;
}

WaitGroupPtr WorkerPool::submit(JobFunction fn, std::string debugName)
{
    return submit(makeJob(std::move(fn), nullptr, std::move(debugName)));
}

size_t WorkerPool::queueSize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void WorkerPool::workerLoop(uint32_t workerId)
{
    const std::string threadName = m_config.threadConfig.namePrefix + "-" + std::to_string(workerId);
    setThreadName(threadName);

    LOG_DEBUG("WorkerPool: Worker {} started (name: {})", workerId, threadName);

    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() {
                return !m_queue.empty() || m_stopping;
            });

            // Queued work is drained before a stopping worker exits
            if (m_queue.empty())
            {
                break;
            }

            job = std::move(m_queue.front());
            m_queue.pop_front();
        }

        runJob(job, workerId);
    }

    LOG_DEBUG("WorkerPool: Worker {} stopped", workerId);
}

void WorkerPool::runJob(Job& job, uint32_t workerId)
{
    const uint32_t active = m_stats.activeJobs.fetch_add(1, std::memory_order_acq_rel) + 1;

    uint32_t peak = m_stats.peakActiveJobs.load(std::memory_order_relaxed);
    while (active > peak &&
           !m_stats.peakActiveJobs.compare_exchange_weak(peak, active, std::memory_order_relaxed))
    {
    }

    try
    {
        job.execute();
    }
    catch (const std::exception& e)
    {
        m_stats.jobsThrew.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("WorkerPool: Worker {} job '{}' threw: {}", workerId, job.debugName, e.what());
    }
    catch (...)
    {
        m_stats.jobsThrew.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("WorkerPool: Worker {} job '{}' threw a non-standard exception", workerId, job.debugName);
    }

    m_stats.activeJobs.fetch_sub(1, std::memory_order_acq_rel);
    m_stats.jobsCompleted.fetch_add(1, std::memory_order_relaxed);
}

} // namespace docket
