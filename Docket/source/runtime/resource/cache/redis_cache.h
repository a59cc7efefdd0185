#pragma once

#include "runtime/core/base/macro.h"
#include "runtime/resource/cache/cache.h"
#include "runtime/resource/cache/local_cache.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

namespace sw::redis {
class Redis;
}

namespace docket {

/// @brief Redis connection settings for the shared cache
struct RedisCacheConfig
{
    std::string url;
    std::string keyPrefix{"cache:"};                    // Entry key is keyPrefix + key
    std::chrono::milliseconds connectTimeout{1500};
    std::chrono::milliseconds socketTimeout{1500};
    size_t poolSize{2};
};

/// @brief Cache kept in Redis string keys written with SETEX; Redis expires them
///
/// Values are stored as compact JSON text. Construction pings the server and falls back
/// to an embedded LocalCache for the rest of its lifetime when that fails.
/// clear() deletes only keys under the configured prefix.
class RedisCache final : public ICache
{
public:
    explicit RedisCache(RedisCacheConfig config);
    ~RedisCache() override;

    DOCKET_DISABLE_COPY_AND_MOVE(RedisCache)

    CacheLookup get(std::string_view key) override;
    CacheResult set(std::string_view key, const Json::Value& value, std::chrono::seconds ttl) override;
    CacheResult remove(std::string_view key) override;
    CacheResult clear() override;
    size_t purgeExpired() override;

    [[nodiscard]] const char* backendName() const override;
    [[nodiscard]] bool isShared() const override { return !isDegraded(); }

    [[nodiscard]] bool isDegraded() const { return m_fallback != nullptr; }

    /// @brief Redis commands that failed after construction
    [[nodiscard]] uint64_t backendErrorCount() const { return m_backendErrors.load(std::memory_order_relaxed); }

    [[nodiscard]] std::string keyFor(std::string_view key) const { return m_config.keyPrefix + std::string(key); }

private:
    CacheResult backendFailure(const char* operation, const std::string& key, const std::exception& e);

    RedisCacheConfig m_config;
    std::unique_ptr<sw::redis::Redis> m_redis;
    std::unique_ptr<LocalCache> m_fallback;
    std::atomic<uint64_t> m_backendErrors{0};
};

} // namespace docket
