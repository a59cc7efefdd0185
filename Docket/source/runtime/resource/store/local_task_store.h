#pragma once

#include "runtime/core/base/macro.h"
#include "runtime/resource/store/task_store.h"

#include <mutex>
#include <unordered_map>

namespace docket {

/// @brief In-process task store
/// One mutex guards the whole map, so every operation observes whole records only.
/// Grows without bound unless cleanup() runs periodically.
class LocalTaskStore final : public ITaskStore
{
public:
    LocalTaskStore() = default;
    ~LocalTaskStore() override = default;

    DOCKET_DISABLE_COPY_AND_MOVE(LocalTaskStore)

    StoreResult create(const TaskRecord& record) override;
    StoreResult update(const TaskId& id, const RecordMutator& mutator) override;
    StoreLookup get(const TaskId& id) override;
    StoreResult remove(const TaskId& id) override;
    size_t cleanup(double maxAgeSeconds, double now) override;
    std::vector<TaskRecord> snapshot() override;
    size_t size() override;

    [[nodiscard]] const char* backendName() const override { return "local"; }
    [[nodiscard]] bool isShared() const override { return false; }

private:
    std::mutex m_mutex;
    std::unordered_map<TaskId, TaskRecord> m_records;
};

} // namespace docket
