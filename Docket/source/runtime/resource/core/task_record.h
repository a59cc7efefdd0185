#pragma once

#include "runtime/resource/core/task_id.h"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docket {

/// @brief Lifecycle state of a task
/// Pending -> Processing -> Completed | Failed; terminal states never change
enum class TaskStatus : uint8_t
{
    Pending = 0,
    Processing = 1,
    Completed = 2,
    Failed = 3,
};

/// @brief External name ("pending", "processing", "completed", "failed")
const char* toString(TaskStatus status);

std::optional<TaskStatus> parseTaskStatus(std::string_view name);

[[nodiscard]] constexpr bool isTerminal(TaskStatus status)
{
    return status == TaskStatus::Completed || status == TaskStatus::Failed;
}

/// @brief Wall-clock seconds since the Unix epoch, sub-second precision
double nowSeconds();

/// @brief State of one submitted unit of work
struct TaskRecord
{
    TaskId id;
    TaskStatus status{TaskStatus::Pending};
    double createdAt{0.0};
    double updatedAt{0.0};
    std::optional<Json::Value> result;  // Completed only
    std::optional<std::string> error;   // Failed only

    /// @brief Initial record written at submission time
    static TaskRecord makePending(TaskId id, double now);

    [[nodiscard]] bool isTerminal() const { return docket::isTerminal(status); }

    /// @brief Age relative to now, based on createdAt
    [[nodiscard]] double age(double now) const { return now - createdAt; }

    /// @brief True for a Processing record not updated within threshold seconds
    /// A stale record usually means the worker running it died
    [[nodiscard]] bool isStale(double thresholdSeconds, double now) const;
};

// =============================================================================
// Transitions
// These only edit the record; stores check the outcome with isValidTransition
// before committing it. updatedAt never moves backwards.
// =============================================================================

void markProcessing(TaskRecord& record, double now);
void markCompleted(TaskRecord& record, Json::Value result, double now);

/// @brief An empty description is replaced by "unknown error"
void markFailed(TaskRecord& record, std::string error, double now);

/// @brief Check the record-level invariants
/// (valid id, createdAt <= updatedAt, result only when Completed, error only when Failed)
[[nodiscard]] bool isConsistent(const TaskRecord& record);

/// @brief Check that after is a legal successor of before
/// Same id and createdAt, status moves forward or stays, terminal states are final,
/// updatedAt does not decrease, and after is consistent
[[nodiscard]] bool isValidTransition(const TaskRecord& before, const TaskRecord& after);

} // namespace docket
