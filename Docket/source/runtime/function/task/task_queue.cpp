#include "runtime/function/task/task_queue.h"
#include "runtime/resource/store/task_store_factory.h"
#include "runtime/core/log/log_system.h"

#include <exception>
#include <stdexcept>

namespace docket {

namespace {

RedisStoreConfig makeStoreConfig(const TaskQueueConfig& config)
{
    RedisStoreConfig storeConfig;
    storeConfig.url = config.redisUrl;
    storeConfig.keyPrefix = config.redisKeyPrefix;
    storeConfig.connectTimeout = config.redisConnectTimeout;
    storeConfig.socketTimeout = config.redisConnectTimeout;
    storeConfig.poolSize = config.maxWorkers + 1;
    return storeConfig;
}

} // namespace

TaskQueue::TaskQueue(const TaskQueueConfig& config)
    : TaskQueue(createTaskStore(makeStoreConfig(config)), config)
{
}

TaskQueue::TaskQueue(std::unique_ptr<ITaskStore> store, const TaskQueueConfig& config)
    : m_config(config)
    , m_store(requireStore(std::move(store)))
    , m_sweeper(*m_store, config.retentionMaxAge)
    , m_inFlight(makeWaitGroup(0))
{
    if (config.maxWorkers == 0)
    {
        throw std::invalid_argument("TaskQueue: maxWorkers must be at least 1");
    }

    WorkerPoolConfig poolConfig;
    poolConfig.numWorkers = config.maxWorkers;
    poolConfig.threadConfig.namePrefix = config.workerNamePrefix;

    if (!m_pool.initialize(poolConfig))
    {
        throw std::runtime_error("TaskQueue: failed to start worker pool");
    }

    LOG_INFO("TaskQueue: Started with {} workers on {} store", m_pool.workerCount(), m_store->backendName());
}

std::unique_ptr<ITaskStore> TaskQueue::requireStore(std::unique_ptr<ITaskStore> store)
{
    if (!store)
    {
        throw std::invalid_argument("TaskQueue: store must not be null");
    }
    return store;
}

TaskQueue::~TaskQueue()
{
    shutdown();
}

TaskId TaskQueue::submitTask(TaskFunction work, std::string debugName)
{
    TaskId id = TaskId::generate();

    StoreResult created = m_store->create(TaskRecord::makePending(id, nowSeconds()));
    if (!created)
    {
        // Nothing would track the outcome, so the work is not queued
        m_stats.storeErrors.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("TaskQueue: Could not record task {} ({}: {})", id.str(), toString(created.error), created.message);
        return id;
    }

    m_stats.tasksSubmitted.fetch_add(1, std::memory_order_relaxed);

    if (debugName.empty())
    {
        debugName = "task-" + id.str();
    }

    Job job = makeJob([this, id, work = std::move(work)]() { runTask(id, work); }, m_inFlight, std::move(debugName));

    if (!m_pool.submit(std::move(job)))
    {
        m_stats.tasksRejected.fetch_add(1, std::memory_order_relaxed);
        failTask(id, "task queue is shut down");
    }
    return id;
}

void TaskQueue::runTask(const TaskId& id, const TaskFunction& work)
{
    commit(id, "processing", [](TaskRecord& record) { markProcessing(record, nowSeconds()); });

    Json::Value result;
    try
    {
        result = work();
    }
    catch (const std::exception& e)
    {
        failTask(id, e.what());
        return;
    }
    catch (...)
    {
        failTask(id, "unknown error");
        return;
    }

    m_stats.tasksCompleted.fetch_add(1, std::memory_order_relaxed);
    commit(id, "completed", [&result](TaskRecord& record) {
        markCompleted(record, std::move(result), nowSeconds());
    });
}

void TaskQueue::failTask(const TaskId& id, std::string error)
{
    LOG_DEBUG("TaskQueue: Task {} failed: {}", id.str(), error);

    m_stats.tasksFailed.fetch_add(1, std::memory_order_relaxed);
    commit(id, "failed", [&error](TaskRecord& record) {
        markFailed(record, std::move(error), nowSeconds());
    });
}

bool TaskQueue::commit(const TaskId& id, const char* transition, const RecordMutator& mutator)
{
    StoreResult updated = m_store->update(id, mutator);
    if (!updated)
    {
        m_stats.storeErrors.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("TaskQueue: Could not mark task {} {} ({}: {})",
                  id.str(), transition, toString(updated.error), updated.message);
        return false;
    }
    return true;
}

StoreLookup TaskQueue::lookup(const TaskId& id)
{
    StoreLookup result = m_store->get(id);
    if (!result && result.error != StoreError::NotFound)
    {
        LOG_WARN("TaskQueue: Lookup of {} failed ({}: {})", id.str(), toString(result.error), result.message);
    }
    return result;
}

StoreLookup TaskQueue::lookup(std::string_view id)
{
    auto parsed = TaskId::fromString(id);
    if (!parsed)
    {
        return {std::nullopt, StoreError::NotFound, "'" + std::string(id) + "' is not a task id"};
    }
    return lookup(*parsed);
}

std::optional<TaskRecord> TaskQueue::status(const TaskId& id)
{
    return lookup(id).record;
}

std::optional<TaskRecord> TaskQueue::status(std::string_view id)
{
    return lookup(id).record;
}

size_t TaskQueue::cleanup(double maxAgeSeconds)
{
    return m_sweeper.sweep(maxAgeSeconds);
}

size_t TaskQueue::cleanup()
{
    return m_sweeper.sweep();
}

std::vector<TaskRecord> TaskQueue::staleTasks(double thresholdSeconds)
{
    const double now = nowSeconds();

    std::vector<TaskRecord> stale;
    for (auto& record : m_store->snapshot())
    {
        if (record.isStale(thresholdSeconds, now))
        {
            stale.push_back(std::move(record));
        }
    }
    return stale;
}

void TaskQueue::waitIdle()
{
    m_inFlight->wait();
}

void TaskQueue::shutdown()
{
    if (!m_pool.isRunning())
    {
        return;
    }

    LOG_INFO("TaskQueue: Shutting down ({} queued)", m_pool.queueSize());
    m_pool.shutdown();
}

} // namespace docket
