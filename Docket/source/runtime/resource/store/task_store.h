#pragma once

#include "runtime/resource/core/task_record.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docket {

/// @brief Outcome codes shared by every store backend
enum class StoreError : uint8_t
{
    None = 0,
    NotFound,               // No record under that id (never submitted, swept or evicted)
    AlreadyExists,          // create() on an id that is already stored
    InvalidTransition,      // update() produced a record that breaks the lifecycle rules
    BackendUnavailable,     // The external store rejected or failed the command
    CorruptRecord,          // Stored fields could not be decoded
};

const char* toString(StoreError error);

/// @brief Result of a store mutation
struct StoreResult
{
    StoreError error{StoreError::None};
    std::string message;

    [[nodiscard]] bool ok() const { return error == StoreError::None; }
    explicit operator bool() const { return ok(); }

    static StoreResult success() { return {}; }
    static StoreResult failure(StoreError code, std::string text)
    {
        return {code, std::move(text)};
    }
};

/// @brief Result of a store lookup
/// record is set exactly when error == None
struct StoreLookup
{
    std::optional<TaskRecord> record;
    StoreError error{StoreError::None};
    std::string message;

    [[nodiscard]] bool ok() const { return error == StoreError::None; }
    explicit operator bool() const { return ok(); }
};

/// @brief Applies a lifecycle change to a copy of the stored record
using RecordMutator = std::function<void(TaskRecord&)>;

/// @brief Task-state storage capability
/// One concrete class per backend; the backend is chosen once, at construction
class ITaskStore
{
public:
    virtual ~ITaskStore() = default;

    /// @brief Store the initial record (normally Pending)
    virtual StoreResult create(const TaskRecord& record) = 0;

    /// @brief Apply mutator atomically with respect to other operations on the same store
    /// The change is committed only if isValidTransition(old, new) holds
    virtual StoreResult update(const TaskId& id, const RecordMutator& mutator) = 0;

    /// @brief Look up a record; unknown ids yield StoreError::NotFound
    virtual StoreLookup get(const TaskId& id) = 0;

    /// @brief Explicit eviction of one record
    virtual StoreResult remove(const TaskId& id) = 0;

    /// @brief Remove every record with now - createdAt >= maxAgeSeconds, whatever its status
    /// @return Number of records removed
    virtual size_t cleanup(double maxAgeSeconds, double now) = 0;

    /// @brief Copy of every stored record, in no particular order
    virtual std::vector<TaskRecord> snapshot() = 0;

    /// @brief Number of stored records
    virtual size_t size() = 0;

    /// @brief Short backend name for logs ("local", "redis")
    [[nodiscard]] virtual const char* backendName() const = 0;

    /// @brief True when records are visible to other processes
    [[nodiscard]] virtual bool isShared() const = 0;
};

} // namespace docket
