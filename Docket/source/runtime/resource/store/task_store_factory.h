#pragma once

#include "runtime/resource/store/redis_task_store.h"
#include "runtime/resource/store/task_store.h"

#include <memory>

namespace docket {

/// @brief Pick the backend once: Redis when a url is configured, the local store otherwise
/// An unreachable Redis still yields a RedisTaskStore, running degraded on its local fallback
std::unique_ptr<ITaskStore> createTaskStore(const RedisStoreConfig& config);

} // namespace docket
