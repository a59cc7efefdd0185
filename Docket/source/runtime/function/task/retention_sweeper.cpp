#include "runtime/function/task/retention_sweeper.h"
#include "runtime/core/log/log_system.h"

namespace docket {

RetentionSweeper::RetentionSweeper(ITaskStore& store, double maxAgeSeconds)
    : m_store(store)
    , m_maxAgeSeconds(maxAgeSeconds)
{
}

size_t RetentionSweeper::sweep()
{
    return sweep(m_maxAgeSeconds, nowSeconds());
}

size_t RetentionSweeper::sweep(double maxAgeSeconds)
{
    return sweep(maxAgeSeconds, nowSeconds());
}

size_t RetentionSweeper::sweep(double maxAgeSeconds, double now)
{
    const size_t removed = m_store.cleanup(maxAgeSeconds, now);

    m_sweeps.fetch_add(1, std::memory_order_relaxed);
    m_totalRemoved.fetch_add(removed, std::memory_order_relaxed);

    if (removed > 0)
    {
        LOG_INFO("RetentionSweeper: Removed {} task(s) older than {}s from {} store",
                 removed, maxAgeSeconds, m_store.backendName());
    }
    else
    {
        LOG_DEBUG("RetentionSweeper: Nothing older than {}s", maxAgeSeconds);
    }
    return removed;
}

} // namespace docket
