#include "runtime/resource/cache/redis_cache.h"
#include "runtime/resource/store/record_codec.h"
#include "runtime/core/log/log_system.h"

#include <sw/redis++/redis++.h>

#include <iterator>
#include <utility>
#include <vector>

namespace docket {

namespace {

constexpr long long kScanBatch = 100;

} // namespace

RedisCache::RedisCache(RedisCacheConfig config)
    : m_config(std::move(config))
{
    try
    {
        sw::redis::ConnectionOptions connectionOptions(m_config.url);
        connectionOptions.connect_timeout = m_config.connectTimeout;
        connectionOptions.socket_timeout = m_config.socketTimeout;

        sw::redis::ConnectionPoolOptions poolOptions;
        poolOptions.size = m_config.poolSize > 0 ? m_config.poolSize : 1;

        auto redis = std::make_unique<sw::redis::Redis>(connectionOptions, poolOptions);
        redis->ping();

        m_redis = std::move(redis);
        LOG_INFO("RedisCache: Connected to {} (key prefix '{}')", m_config.url, m_config.keyPrefix);
    }
    catch (const std::exception& e)
    {
        m_redis.reset();
        m_fallback = std::make_unique<LocalCache>();
        LOG_WARN("RedisCache: Redis at '{}' unavailable ({}); using in-process cache", m_config.url, e.what());
    }
}

RedisCache::~RedisCache() = default;

const char* RedisCache::backendName() const
{
    return isDegraded() ? "local (redis fallback)" : "redis";
}

CacheResult RedisCache::backendFailure(const char* operation, const std::string& key, const std::exception& e)
{
    m_backendErrors.fetch_add(1, std::memory_order_relaxed);
    LOG_ERROR("RedisCache: {} failed for {}: {}", operation, key, e.what());
    return CacheResult::failure(CacheError::BackendUnavailable, e.what());
}

CacheLookup RedisCache::get(std::string_view key)
{
    if (m_fallback)
    {
        return m_fallback->get(key);
    }

    const std::string fullKey = keyFor(key);
    try
    {
        auto text = m_redis->get(fullKey);
        if (!text)
        {
            return {};
        }

        std::string errors;
        auto value = parseJson(*text, &errors);
        if (!value)
        {
            LOG_WARN("RedisCache: Value at {} is not JSON: {}", fullKey, errors);
            return {std::nullopt, CacheError::CorruptValue, "value at '" + fullKey + "' is not JSON"};
        }
        return {std::move(value), CacheError::None, {}};
    }
    catch (const sw::redis::Error& e)
    {
        CacheResult failure = backendFailure("get", fullKey, e);
        return {std::nullopt, failure.error, failure.message};
    }
}

CacheResult RedisCache::set(std::string_view key, const Json::Value& value, std::chrono::seconds ttl)
{
    if (m_fallback)
    {
        return m_fallback->set(key, value, ttl);
    }

    if (ttl.count() <= 0)
    {
        return CacheResult::failure(CacheError::InvalidTtl, "ttl must be positive");
    }

    const std::string fullKey = keyFor(key);
    try
    {
        m_redis->setex(fullKey, ttl, writeJson(value));
        return CacheResult::success();
    }
    catch (const sw::redis::Error& e)
    {
        return backendFailure("set", fullKey, e);
    }
}

CacheResult RedisCache::remove(std::string_view key)
{
    if (m_fallback)
    {
        return m_fallback->remove(key);
    }

    const std::string fullKey = keyFor(key);
    try
    {
        m_redis->del(fullKey);
        return CacheResult::success();
    }
    catch (const sw::redis::Error& e)
    {
        return backendFailure("remove", fullKey, e);
    }
}

CacheResult RedisCache::clear()
{
    if (m_fallback)
    {
        return m_fallback->clear();
    }

    const std::string pattern = m_config.keyPrefix + "*";
    try
    {
        long long cursor = 0;
        do
        {
            std::vector<std::string> keys;
            cursor = m_redis->scan(cursor, pattern, kScanBatch, std::back_inserter(keys));
            if (!keys.empty())
            {
                m_redis->del(keys.begin(), keys.end());
            }
        } while (cursor != 0);
        return CacheResult::success();
    }
    catch (const sw::redis::Error& e)
    {
        return backendFailure("clear", pattern, e);
    }
}

size_t RedisCache::purgeExpired()
{
    // Redis drops expired keys itself
    return m_fallback ? m_fallback->purgeExpired() : 0;
}

} // namespace docket
