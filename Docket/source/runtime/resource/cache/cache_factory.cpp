#include "runtime/resource/cache/cache_factory.h"
#include "runtime/resource/cache/local_cache.h"
#include "runtime/core/log/log_system.h"

namespace docket {

std::unique_ptr<ICache> createCache(const RedisCacheConfig& config)
{
    if (config.url.empty())
    {
        LOG_INFO("Cache: No Redis url configured, using local cache");
        return std::make_unique<LocalCache>();
    }

    return std::make_unique<RedisCache>(config);
}

} // namespace docket
