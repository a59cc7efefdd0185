#include "runtime/resource/store/task_store_factory.h"
#include "runtime/resource/store/local_task_store.h"
#include "runtime/core/log/log_system.h"

namespace docket {

std::unique_ptr<ITaskStore> createTaskStore(const RedisStoreConfig& config)
{
    if (config.url.empty())
    {
        LOG_INFO("TaskStore: No Redis url configured, using local store");
        return std::make_unique<LocalTaskStore>();
    }

    return std::make_unique<RedisTaskStore>(config);
}

} // namespace docket
