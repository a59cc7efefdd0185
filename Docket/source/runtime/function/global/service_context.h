#pragma once

#include "runtime/core/base/macro.h"
#include "runtime/resource/config/config_manager.h"

#include <cstddef>
#include <memory>

namespace docket {

class ICache;
class TaskQueue;
struct RedisCacheConfig;
struct TaskQueueConfig;

/// @brief Outcome of one maintenance pass
struct MaintenanceReport
{
    size_t removed{0};      // Records swept this pass
    size_t stale{0};        // Processing records past stale_after_s
    size_t stored{0};       // Records left in the store
    size_t cacheExpired{0}; // Cache entries dropped this pass
};

/// @brief Task queue settings derived from the daemon configuration
TaskQueueConfig makeTaskQueueConfig(const DocketConfig& config);

/// @brief Cache settings derived from the daemon configuration; shares the task store's Redis
RedisCacheConfig makeCacheConfig(const DocketConfig& config);

/// @brief Owns the services of one worker process
/// Constructed by main() and passed down; there is no process-wide instance
class ServiceContext
{
public:
    ServiceContext();
    ~ServiceContext();

    DOCKET_DISABLE_COPY_AND_MOVE(ServiceContext)

    /// @brief Start the task queue and, when enabled, the cache on the configured backend
    /// @return false if the queue could not be started
    bool startSystems(const DocketConfig& config);

    /// @brief Drain queued tasks and release the queue and cache
    void shutdownSystems();

    /// @brief Sweep expired records, count stale ones and purge expired cache entries
    MaintenanceReport runMaintenance();

    /// @brief Redis was configured but the queue or the cache runs on the local fallback
    [[nodiscard]] bool isDegraded() const;

    [[nodiscard]] bool isRunning() const { return m_task_queue != nullptr; }

    [[nodiscard]] const DocketConfig& config() const { return m_config; }

public:
    std::shared_ptr<TaskQueue> m_task_queue;
    std::shared_ptr<ICache> m_cache;        // Null when cache_enabled is false

private:
    DocketConfig m_config;
};

} // namespace docket
