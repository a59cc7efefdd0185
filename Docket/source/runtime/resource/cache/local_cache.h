#pragma once

#include "runtime/core/base/macro.h"
#include "runtime/resource/cache/cache.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace docket {

/// @brief In-process cache; expired entries are dropped when read or purged
class LocalCache final : public ICache
{
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    /// @param now Clock override; defaults to steady_clock::now
    explicit LocalCache(TimeSource now = {});
    ~LocalCache() override;

    DOCKET_DISABLE_COPY_AND_MOVE(LocalCache)

    CacheLookup get(std::string_view key) override;
    CacheResult set(std::string_view key, const Json::Value& value, std::chrono::seconds ttl) override;
    CacheResult remove(std::string_view key) override;
    CacheResult clear() override;
    size_t purgeExpired() override;

    [[nodiscard]] const char* backendName() const override { return "local"; }
    [[nodiscard]] bool isShared() const override { return false; }

    /// @brief Entries held, including expired ones not yet dropped
    [[nodiscard]] size_t size() const;

private:
    struct Entry
    {
        Json::Value value;
        Clock::time_point expiresAt;
    };

    Clock::time_point now() const;

    TimeSource m_now;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace docket
