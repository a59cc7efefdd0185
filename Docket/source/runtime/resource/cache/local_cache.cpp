#include "runtime/resource/cache/local_cache.h"

#include <utility>

namespace docket {

LocalCache::LocalCache(TimeSource now)
    : m_now(std::move(now))
{
}

LocalCache::~LocalCache() = default;

LocalCache::Clock::time_point LocalCache::now() const
{
    return m_now ? m_now() : Clock::now();
}

CacheLookup LocalCache::get(std::string_view key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(std::string(key));
    if (it == m_entries.end())
    {
        return {};
    }
    if (now() >= it->second.expiresAt)
    {
        m_entries.erase(it);
        return {};
    }
    return {it->second.value, CacheError::None, {}};
}

CacheResult LocalCache::set(std::string_view key, const Json::Value& value, std::chrono::seconds ttl)
{
    if (ttl.count() <= 0)
    {
        return CacheResult::failure(CacheError::InvalidTtl, "ttl must be positive");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[std::string(key)] = Entry{value, now() + ttl};
    return CacheResult::success();
}

CacheResult LocalCache::remove(std::string_view key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(std::string(key));
    return CacheResult::success();
}

CacheResult LocalCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    return CacheResult::success();
}

size_t LocalCache::purgeExpired()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto current = now();
    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();)
    {
        if (current >= it->second.expiresAt)
        {
            it = m_entries.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

size_t LocalCache::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace docket
