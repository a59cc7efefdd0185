#pragma once

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace docket {

/// @brief Outcome codes shared by every cache backend
enum class CacheError : uint8_t
{
    None = 0,
    InvalidTtl,             // set() with a lifetime of zero or less
    BackendUnavailable,     // The external cache rejected or failed the command
    CorruptValue,           // Stored text is not valid JSON
};

const char* toString(CacheError error);

/// @brief Result of a cache mutation
struct CacheResult
{
    CacheError error{CacheError::None};
    std::string message;

    [[nodiscard]] bool ok() const { return error == CacheError::None; }
    explicit operator bool() const { return ok(); }

    static CacheResult success() { return {}; }
    static CacheResult failure(CacheError code, std::string text)
    {
        return {code, std::move(text)};
    }
};

/// @brief Result of a cache read
/// A miss is ok() with no value; an error never carries a value
struct CacheLookup
{
    std::optional<Json::Value> value;
    CacheError error{CacheError::None};
    std::string message;

    [[nodiscard]] bool ok() const { return error == CacheError::None; }
    [[nodiscard]] bool hit() const { return value.has_value(); }
    explicit operator bool() const { return ok(); }
};

/// @brief Key/value cache with per-entry lifetime
class ICache
{
public:
    virtual ~ICache() = default;

    /// @brief Value stored under key, if present and not expired
    virtual CacheLookup get(std::string_view key) = 0;

    /// @brief Store value under key for ttl, replacing any previous entry
    virtual CacheResult set(std::string_view key, const Json::Value& value, std::chrono::seconds ttl) = 0;

    /// @brief Drop one entry; dropping an absent key succeeds
    virtual CacheResult remove(std::string_view key) = 0;

    /// @brief Drop every entry this cache owns
    virtual CacheResult clear() = 0;

    /// @brief Drop expired entries now instead of on their next read
    /// @return Number of entries dropped
    virtual size_t purgeExpired() = 0;

    [[nodiscard]] virtual const char* backendName() const = 0;

    /// @brief True when entries are visible to other processes
    [[nodiscard]] virtual bool isShared() const = 0;
};

/// @brief Deterministic key for a call: "{prefix}:{hash of the compact JSON arguments}"
/// Object members are written in sorted order, so equal arguments give equal keys
std::string makeCacheKey(std::string_view prefix, const Json::Value& arguments);

/// @brief Return the cached value for key, or compute it and cache it for ttl
/// Cache failures are logged and never stop compute from running
Json::Value getOrCompute(ICache& cache, const std::string& key, std::chrono::seconds ttl,
                         const std::function<Json::Value()>& compute);

} // namespace docket
