#pragma once

#include "runtime/core/base/macro.h"
#include "runtime/core/threading/wait_group.h"
#include "runtime/core/threading/worker_pool.h"
#include "runtime/function/task/retention_sweeper.h"
#include "runtime/resource/store/task_store.h"

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace docket {

/// @brief Task queue configuration
struct TaskQueueConfig
{
    uint32_t maxWorkers{4};                             // Tasks executing at once
    std::string redisUrl;                               // Empty selects the local store
    std::string redisKeyPrefix{"task:"};
    std::chrono::milliseconds redisConnectTimeout{1500};
    std::string workerNamePrefix{"DocketWorker"};
    double retentionMaxAge{3600.0};                     // Default for cleanup() without arguments
};

/// @brief Task-level counters (the pool keeps its own job counters)
struct TaskQueueStats
{
    std::atomic<uint64_t> tasksSubmitted{0};
    std::atomic<uint64_t> tasksCompleted{0};
    std::atomic<uint64_t> tasksFailed{0};
    std::atomic<uint64_t> tasksRejected{0};    // Submitted after shutdown
    std::atomic<uint64_t> storeErrors{0};      // Record writes the store refused
};

/// @brief Public entry point: submit work, poll its status by id
///
/// Every submission gets a Pending record before it is queued. A worker moves it to
/// Processing, runs it, then to Completed with the returned value or to Failed with
/// the exception text. Failures never leave the worker; they only show in the record.
class TaskQueue
{
public:
    using TaskFunction = std::function<Json::Value()>;

    /// @brief Build the store from the config and start the workers
    explicit TaskQueue(const TaskQueueConfig& config = {});

    /// @brief Use an existing store
    TaskQueue(std::unique_ptr<ITaskStore> store, const TaskQueueConfig& config = {});

    ~TaskQueue();

    DOCKET_DISABLE_COPY_AND_MOVE(TaskQueue)

    /// @brief Queue fn(args...) and return its id immediately
    /// The return value becomes the task result; void callables complete with null
    template<typename Fn, typename... Args>
    TaskId submit(Fn&& fn, Args&&... args)
    {
        using Result = std::invoke_result_t<std::decay_t<Fn>&, std::decay_t<Args>&...>;
        static_assert(std::is_void_v<Result> || std::is_constructible_v<Json::Value, Result>,
                      "task result must be convertible to Json::Value");

        TaskFunction work = [fn = std::forward<Fn>(fn),
                             bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> Json::Value {
            if constexpr (std::is_void_v<Result>)
            {
                std::apply(fn, bound);
                return Json::Value();
            }
            else
            {
                return Json::Value(std::apply(fn, bound));
            }
        };
        return submitTask(std::move(work));
    }

    /// @brief Queue an already bound function
    TaskId submitTask(TaskFunction work, std::string debugName = "");

    /// @brief Current record, or empty if the id is unknown or was swept
    /// A store failure is logged and also reads as empty; use lookup() to tell the two apart
    std::optional<TaskRecord> status(const TaskId& id);

    /// @brief Current record with the store's error channel: NotFound for an unknown or swept id,
    /// BackendUnavailable or CorruptRecord when the store could not answer
    StoreLookup lookup(const TaskId& id);
    StoreLookup lookup(std::string_view id);

    /// @brief Same as status(TaskId) for an id in text form; malformed text is not found
    std::optional<TaskRecord> status(std::string_view id);

    /// @brief Remove records whose age is at least maxAgeSeconds
    size_t cleanup(double maxAgeSeconds);
    size_t cleanup();

    /// @brief Processing records not updated for thresholdSeconds
    std::vector<TaskRecord> staleTasks(double thresholdSeconds);

    /// @brief Block until every task submitted so far is terminal
    void waitIdle();

    /// @return true if idle before the timeout
    template<typename Rep, typename Period>
    bool waitIdleFor(std::chrono::duration<Rep, Period> timeout)
    {
        return m_inFlight->waitFor(timeout);
    }

    /// @brief Stop accepting tasks, finish everything queued, join the workers
    void shutdown();

    [[nodiscard]] bool isRunning() const { return m_pool.isRunning(); }

    /// @brief True when records live in a store other processes can see
    [[nodiscard]] bool usingSharedStore() const { return m_store->isShared(); }

    [[nodiscard]] ITaskStore& store() { return *m_store; }
    [[nodiscard]] RetentionSweeper& sweeper() { return m_sweeper; }

    [[nodiscard]] const TaskQueueStats& stats() const { return m_stats; }
    [[nodiscard]] const WorkerPoolStats& poolStats() const { return m_pool.stats(); }
    [[nodiscard]] uint32_t workerCount() const { return m_pool.workerCount(); }
    [[nodiscard]] size_t queuedCount() const { return m_pool.queueSize(); }

private:
    static std::unique_ptr<ITaskStore> requireStore(std::unique_ptr<ITaskStore> store);

    /// @brief Body of every queued job
    void runTask(const TaskId& id, const TaskFunction& work);

    void failTask(const TaskId& id, std::string error);

    /// @brief Apply a transition, logging and counting a refusal
    bool commit(const TaskId& id, const char* transition, const RecordMutator& mutator);

private:
    TaskQueueConfig m_config;
    std::unique_ptr<ITaskStore> m_store;
    RetentionSweeper m_sweeper;
    TaskQueueStats m_stats;

    WaitGroupPtr m_inFlight;
    WorkerPool m_pool;          // Declared last so workers stop before the store goes away
};

} // namespace docket
