#include "runtime/resource/core/task_record.h"

#include <algorithm>
#include <chrono>
#include <utility>

namespace docket {

const char* toString(TaskStatus status)
{
    switch (status)
    {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::Processing: return "processing";
        case TaskStatus::Completed:  return "completed";
        case TaskStatus::Failed:     return "failed";
    }
    return "unknown";
}

std::optional<TaskStatus> parseTaskStatus(std::string_view name)
{
    if (name == "pending") return TaskStatus::Pending;
    if (name == "processing") return TaskStatus::Processing;
    if (name == "completed") return TaskStatus::Completed;
    if (name == "failed") return TaskStatus::Failed;
    return std::nullopt;
}

double nowSeconds()
{
    const auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(sinceEpoch).count();
}

TaskRecord TaskRecord::makePending(TaskId id, double now)
{
    TaskRecord record;
    record.id = std::move(id);
    record.status = TaskStatus::Pending;
    record.createdAt = now;
    record.updatedAt = now;
    return record;
}

bool TaskRecord::isStale(double thresholdSeconds, double now) const
{
    return status == TaskStatus::Processing && (now - updatedAt) > thresholdSeconds;
}

namespace {

void touch(TaskRecord& record, double now)
{
    record.updatedAt = std::max({now, record.updatedAt, record.createdAt});
}

} // namespace

void markProcessing(TaskRecord& record, double now)
{
    record.status = TaskStatus::Processing;
    touch(record, now);
}

void markCompleted(TaskRecord& record, Json::Value result, double now)
{
    record.status = TaskStatus::Completed;
    record.result = std::move(result);
    record.error.reset();
    touch(record, now);
}

void markFailed(TaskRecord& record, std::string error, double now)
{
    if (error.empty())
    {
        error = "unknown error";
    }

    record.status = TaskStatus::Failed;
    record.error = std::move(error);
    record.result.reset();
    touch(record, now);
}

bool isConsistent(const TaskRecord& record)
{
    if (!record.id.isValid() || record.createdAt > record.updatedAt)
    {
        return false;
    }

    switch (record.status)
    {
        case TaskStatus::Pending:
        case TaskStatus::Processing:
            return !record.result && !record.error;
        case TaskStatus::Completed:
            return record.result.has_value() && !record.error;
        case TaskStatus::Failed:
            return record.error.has_value() && !record.error->empty() && !record.result;
    }
    return false;
}

bool isValidTransition(const TaskRecord& before, const TaskRecord& after)
{
    if (before.id != after.id || before.createdAt != after.createdAt)
    {
        return false;
    }

    if (after.updatedAt < before.updatedAt)
    {
        return false;
    }

    if (before.isTerminal())
    {
        // Terminal records accept no further change at all
        return before.status == after.status &&
               before.result == after.result &&
               before.error == after.error;
    }

    if (static_cast<uint8_t>(after.status) < static_cast<uint8_t>(before.status))
    {
        return false;
    }

    return isConsistent(after);
}

} // namespace docket
