#include "runtime/resource/store/task_store.h"

namespace docket {

const char* toString(StoreError error)
{
    switch (error)
    {
        case StoreError::None:               return "none";
        case StoreError::NotFound:           return "not found";
        case StoreError::AlreadyExists:      return "already exists";
        case StoreError::InvalidTransition:  return "invalid transition";
        case StoreError::BackendUnavailable: return "backend unavailable";
        case StoreError::CorruptRecord:      return "corrupt record";
    }
    return "unknown";
}

} // namespace docket
