#include "runtime/resource/store/local_task_store.h"
#include "runtime/core/log/log_system.h"

namespace docket {

StoreResult LocalTaskStore::create(const TaskRecord& record)
{
    if (!isConsistent(record))
    {
        return StoreResult::failure(StoreError::InvalidTransition,
                                    "initial record for '" + record.id.str() + "' is inconsistent");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_records.emplace(record.id, record);
    if (!inserted)
    {
        return StoreResult::failure(StoreError::AlreadyExists,
                                    "task '" + record.id.str() + "' already exists");
    }
    return StoreResult::success();
}

StoreResult LocalTaskStore::update(const TaskId& id, const RecordMutator& mutator)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_records.find(id);
    if (it == m_records.end())
    {
        return StoreResult::failure(StoreError::NotFound, "task '" + id.str() + "' not found");
    }

    TaskRecord next = it->second;
    mutator(next);

    if (!isValidTransition(it->second, next))
    {
        LOG_WARN("LocalTaskStore: Rejected transition {} -> {} for task {}",
                 toString(it->second.status), toString(next.status), id.str());
        return StoreResult::failure(StoreError::InvalidTransition,
                                    std::string("cannot move task from ") + toString(it->second.status) +
                                    " to " + toString(next.status));
    }

    it->second = std::move(next);
    return StoreResult::success();
}

StoreLookup LocalTaskStore::get(const TaskId& id)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_records.find(id);
    if (it == m_records.end())
    {
        return {std::nullopt, StoreError::NotFound, "task '" + id.str() + "' not found"};
    }
    return {it->second, StoreError::None, {}};
}

StoreResult LocalTaskStore::remove(const TaskId& id)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_records.erase(id) == 0)
    {
        return StoreResult::failure(StoreError::NotFound, "task '" + id.str() + "' not found");
    }
    return StoreResult::success();
}

size_t LocalTaskStore::cleanup(double maxAgeSeconds, double now)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t removed = 0;
    for (auto it = m_records.begin(); it != m_records.end();)
    {
        if (it->second.age(now) >= maxAgeSeconds)
        {
            it = m_records.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::vector<TaskRecord> LocalTaskStore::snapshot()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<TaskRecord> records;
    records.reserve(m_records.size());
    for (const auto& [id, record] : m_records)
    {
        records.push_back(record);
    }
    return records;
}

size_t LocalTaskStore::size()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

} // namespace docket
