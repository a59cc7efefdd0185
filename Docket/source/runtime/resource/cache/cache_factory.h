#pragma once

#include "runtime/resource/cache/cache.h"
#include "runtime/resource/cache/redis_cache.h"

#include <memory>

namespace docket {

/// @brief Redis cache when a url is configured, local cache otherwise
std::unique_ptr<ICache> createCache(const RedisCacheConfig& config);

} // namespace docket
