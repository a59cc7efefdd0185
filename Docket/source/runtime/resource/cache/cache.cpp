#include "runtime/resource/cache/cache.h"
#include "runtime/resource/store/record_codec.h"
#include "runtime/core/log/log_system.h"

#include <fmt/format.h>

namespace docket {

namespace {

// 64-bit FNV-1a
uint64_t hashText(std::string_view text)
{
    uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : text)
    {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return hash;
}

} // namespace

const char* toString(CacheError error)
{
    switch (error)
    {
        case CacheError::None:               return "none";
        case CacheError::InvalidTtl:         return "invalid ttl";
        case CacheError::BackendUnavailable: return "backend unavailable";
        case CacheError::CorruptValue:       return "corrupt value";
    }
    return "unknown";
}

std::string makeCacheKey(std::string_view prefix, const Json::Value& arguments)
{
    return fmt::format("{}:{:016x}", prefix, hashText(writeJson(arguments)));
}

Json::Value getOrCompute(ICache& cache, const std::string& key, std::chrono::seconds ttl,
                         const std::function<Json::Value()>& compute)
{
    CacheLookup cached = cache.get(key);
    if (cached.hit())
    {
        return std::move(*cached.value);
    }
    if (!cached)
    {
        LOG_DEBUG("Cache: Read of {} failed ({}), computing", key, toString(cached.error));
    }

    Json::Value value = compute();

    CacheResult stored = cache.set(key, value, ttl);
    if (!stored)
    {
        LOG_DEBUG("Cache: Could not store {} ({}: {})", key, toString(stored.error), stored.message);
    }
    return value;
}

} // namespace docket
