#pragma once

#include "runtime/core/base/macro.h"
#include "runtime/function/global/service_context.h"

#include <atomic>
#include <chrono>

namespace docket {

/// @brief Long-running worker process: runs queued tasks and periodic maintenance
class DocketWorker
{
public:
    DocketWorker();
    ~DocketWorker();

    DOCKET_DISABLE_COPY_AND_MOVE(DocketWorker)

    /// @brief Start the services
    /// @return true if the task queue is up
    bool initialize(const DocketConfig& config);

    /// @brief Block until requestStop(), sweeping every sweep_interval_s
    void run();

    /// @brief Drain queued tasks and stop the services
    void shutdown();

    /// @brief Ask run() to return; safe to call from a signal handler
    void requestStop() { m_running.store(false, std::memory_order_release); }

    [[nodiscard]] bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    [[nodiscard]] ServiceContext& context() { return m_context; }

    /// @brief One maintenance pass plus the status log line
    MaintenanceReport tick();

private:
    void logStatus(const MaintenanceReport& report);

private:
    ServiceContext m_context;
    std::atomic<bool> m_running{false};
    std::chrono::milliseconds m_pollInterval{250};
};

} // namespace docket
