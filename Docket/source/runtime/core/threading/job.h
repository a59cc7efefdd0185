#pragma once

#include "runtime/core/threading/wait_group.h"

#include <functional>
#include <string>
#include <utility>

namespace docket {

/// @brief Function type for job execution
using JobFunction = std::function<void()>;

/// @brief A unit of work queued on the worker pool
/// The pool only sees opaque jobs; task bookkeeping lives in the function itself
struct Job
{
    JobFunction     function;           // The work to execute
    WaitGroupPtr    waitGroup;          // Optional wait group to signal on completion
    std::string     debugName;          // Optional name for logging

    Job() = default;

    Job(JobFunction fn, WaitGroupPtr wg = nullptr, std::string name = "")
        : function(std::move(fn))
        , waitGroup(std::move(wg))
        , debugName(std::move(name))
    {}

    /// @brief Execute the job and signal completion
    /// The wait group is signaled even when the function throws; the exception is rethrown
    void execute()
    {
        try
        {
            if (function)
            {
                function();
            }
        }
        catch (...)
        {
            signalDone();
            throw;
        }

        signalDone();
    }

    /// @brief Check if job is valid (has a function)
    [[nodiscard]] bool isValid() const
    {
        return function != nullptr;
    }

private:
    void signalDone()
    {
        if (waitGroup)
        {
            waitGroup->done();
            waitGroup.reset();
        }
    }
};

/// @brief Create a job with an optional wait group
inline Job makeJob(JobFunction fn, WaitGroupPtr wg = nullptr, std::string name = "")
{
    return Job(std::move(fn), std::move(wg), std::move(name));
}

} // namespace docket
