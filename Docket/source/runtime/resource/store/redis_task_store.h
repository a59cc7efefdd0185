#pragma once

#include "runtime/core/base/macro.h"
#include "runtime/resource/store/local_task_store.h"
#include "runtime/resource/store/task_store.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

namespace sw::redis {
class Redis;
}

namespace docket {

/// @brief Redis connection settings for the shared store
struct RedisStoreConfig
{
    std::string url;                                    // e.g. "tcp://127.0.0.1:6379" or "redis://host:6379/0"
    std::string keyPrefix{"task:"};                     // Record key is keyPrefix + id
    std::chrono::milliseconds connectTimeout{1500};
    std::chrono::milliseconds socketTimeout{1500};
    size_t poolSize{4};                                 // Connections shared by all threads
};

/// @brief Task store kept in Redis hashes, visible to every process using the same server
///
/// Hash layout under "{prefix}{id}": id, status, created_at, updated_at (decimal text),
/// result (JSON text, Completed only), error (text, Failed only).
///
/// Construction pings the server. When that fails the store switches to an embedded
/// LocalTaskStore for the rest of its lifetime; isDegraded() reports the switch.
/// create and update run as server-side scripts: create never leaves a partial hash behind,
/// and update writes only if the key still exists with the status it was validated against.
class RedisTaskStore final : public ITaskStore
{
public:
    explicit RedisTaskStore(RedisStoreConfig config);
    ~RedisTaskStore() override;

    DOCKET_DISABLE_COPY_AND_MOVE(RedisTaskStore)

    StoreResult create(const TaskRecord& record) override;
    StoreResult update(const TaskId& id, const RecordMutator& mutator) override;
    StoreLookup get(const TaskId& id) override;
    StoreResult remove(const TaskId& id) override;
    size_t cleanup(double maxAgeSeconds, double now) override;
    std::vector<TaskRecord> snapshot() override;
    size_t size() override;

    [[nodiscard]] const char* backendName() const override;
    [[nodiscard]] bool isShared() const override { return !isDegraded(); }

    /// @brief True when Redis was unreachable at construction and the local fallback is in use
    [[nodiscard]] bool isDegraded() const { return m_fallback != nullptr; }

    /// @brief Redis commands that failed after construction
    [[nodiscard]] uint64_t backendErrorCount() const { return m_backendErrors.load(std::memory_order_relaxed); }

    [[nodiscard]] std::string keyFor(const TaskId& id) const { return m_config.keyPrefix + id.str(); }

private:
    StoreResult backendFailure(const char* operation, const std::string& key, const std::exception& e);

    /// @brief Fetch and decode one record
    StoreLookup fetch(const std::string& key);

    /// @brief Visit every key matching the prefix (SCAN, no blocking KEYS)
    template<typename Visitor>
    void forEachKey(Visitor&& visit);

    RedisStoreConfig m_config;
    std::unique_ptr<sw::redis::Redis> m_redis;
    std::unique_ptr<LocalTaskStore> m_fallback;
    std::atomic<uint64_t> m_backendErrors{0};
};

} // namespace docket
