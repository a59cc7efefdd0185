#include "service_context.h"

#include "runtime/core/log/log_system.h"
#include "runtime/function/task/task_queue.h"
#include "runtime/resource/cache/cache_factory.h"

#include <chrono>
#include <exception>

namespace docket {

TaskQueueConfig makeTaskQueueConfig(const DocketConfig& config)
{
    TaskQueueConfig queueConfig;
    queueConfig.maxWorkers = config.maxWorkers;
    queueConfig.redisUrl = config.redisUrl;
    queueConfig.redisKeyPrefix = config.redisKeyPrefix;
    queueConfig.redisConnectTimeout = std::chrono::milliseconds(config.redisConnectTimeoutMs);
    queueConfig.workerNamePrefix = config.workerNamePrefix;
    queueConfig.retentionMaxAge = config.retentionMaxAge;
    return queueConfig;
}

RedisCacheConfig makeCacheConfig(const DocketConfig& config)
{
    RedisCacheConfig cacheConfig;
    cacheConfig.url = config.redisUrl;
    cacheConfig.keyPrefix = config.cacheKeyPrefix;
    cacheConfig.connectTimeout = std::chrono::milliseconds(config.redisConnectTimeoutMs);
    cacheConfig.socketTimeout = std::chrono::milliseconds(config.redisConnectTimeoutMs);
    return cacheConfig;
}

ServiceContext::ServiceContext() = default;

ServiceContext::~ServiceContext()
{
    shutdownSystems();
}

bool ServiceContext::startSystems(const DocketConfig& config)
{
    if (m_task_queue)
    {
        LOG_WARN("ServiceContext: Systems already started");
        return false;
    }

    m_config = config;

    try
    {
        m_task_queue = std::make_shared<TaskQueue>(makeTaskQueueConfig(config));
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("ServiceContext: Failed to start task queue: {}", e.what());
        m_task_queue.reset();
        return false;
    }

    if (config.cacheEnabled)
    {
        m_cache = createCache(makeCacheConfig(config));
    }

    if (isDegraded())
    {
        LOG_WARN("ServiceContext: Redis configured but unreachable, tasks and cache are local to this process");
    }
    else
    {
        LOG_INFO("ServiceContext: Task queue on {} store with {} workers, cache {}",
                 m_task_queue->store().backendName(), m_task_queue->workerCount(),
                 m_cache ? m_cache->backendName() : "disabled");
    }
    return true;
}

void ServiceContext::shutdownSystems()
{
    if (!m_task_queue)
    {
        return;
    }

    LOG_INFO("ServiceContext: Shutting down systems...");

    m_task_queue->shutdown();
    m_task_queue.reset();
    m_cache.reset();

    LOG_INFO("ServiceContext: All systems shut down");
}

MaintenanceReport ServiceContext::runMaintenance()
{
    MaintenanceReport report;
    if (!m_task_queue)
    {
        return report;
    }

    report.removed = m_task_queue->cleanup(m_config.retentionMaxAge);
    report.stale = m_task_queue->staleTasks(m_config.staleAfter).size();
    report.stored = m_task_queue->store().size();
    if (m_cache)
    {
        report.cacheExpired = m_cache->purgeExpired();
    }
    return report;
}

bool ServiceContext::isDegraded() const
{
    if (!m_task_queue || m_config.redisUrl.empty())
    {
        return false;
    }
    return !m_task_queue->usingSharedStore() || (m_cache && !m_cache->isShared());
}

} // namespace docket
