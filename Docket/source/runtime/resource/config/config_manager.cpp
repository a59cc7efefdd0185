#include "runtime/resource/config/config_manager.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace docket {

namespace {

namespace keys {
    constexpr const char* kMaxWorkers = "max_workers";
    constexpr const char* kRedisUrl = "redis_url";
    constexpr const char* kRedisKeyPrefix = "redis_key_prefix";
    constexpr const char* kRedisConnectTimeoutMs = "redis_connect_timeout_ms";
    constexpr const char* kRetentionMaxAge = "retention_max_age_s";
    constexpr const char* kSweepInterval = "sweep_interval_s";
    constexpr const char* kStaleAfter = "stale_after_s";
    constexpr const char* kLogLevel = "log_level";
    constexpr const char* kLogFile = "log_file";
    constexpr const char* kWorkerNamePrefix = "worker_name_prefix";
    constexpr const char* kCacheEnabled = "cache_enabled";
    constexpr const char* kCacheTtl = "cache_ttl_s";
    constexpr const char* kCacheKeyPrefix = "cache_key_prefix";
}

namespace env {
    constexpr const char* kRedisUrl = "DOCKET_REDIS_URL";
    constexpr const char* kMaxWorkers = "DOCKET_MAX_WORKERS";
    constexpr const char* kRetentionMaxAge = "DOCKET_RETENTION_MAX_AGE";
    constexpr const char* kSweepInterval = "DOCKET_SWEEP_INTERVAL";
    constexpr const char* kLogLevel = "DOCKET_LOG_LEVEL";
    constexpr const char* kLogFile = "DOCKET_LOG_FILE";
    constexpr const char* kCacheTtl = "DOCKET_CACHE_TTL";
}

uint32_t parseCount(const std::string& text, const char* source)
{
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (text.empty() || text.front() == '-' || end != text.c_str() + text.size() || errno == ERANGE ||
        value > std::numeric_limits<uint32_t>::max())
    {
        throw ConfigError(std::string(source) + ": expected a non-negative integer, got '" + text + "'");
    }
    return static_cast<uint32_t>(value);
}

double parseSeconds(const std::string& text, const char* source)
{
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value))
    {
        throw ConfigError(std::string(source) + ": expected a number of seconds, got '" + text + "'");
    }
    return value;
}

LogLevel parseLevel(const std::string& text, const char* source)
{
    auto level = parseLogLevel(text);
    if (!level)
    {
        throw ConfigError(std::string(source) + ": unknown log level '" + text + "'");
    }
    return *level;
}

uint32_t readCount(const Json::Value& value, const char* key)
{
    if (!value.isUInt())
    {
        throw ConfigError(std::string(key) + ": expected a non-negative integer");
    }
    return value.asUInt();
}

double readSeconds(const Json::Value& value, const char* key)
{
    if (!value.isNumeric())
    {
        throw ConfigError(std::string(key) + ": expected a number of seconds");
    }
    return value.asDouble();
}

bool readFlag(const Json::Value& value, const char* key)
{
    if (!value.isBool())
    {
        throw ConfigError(std::string(key) + ": expected true or false");
    }
    return value.asBool();
}

std::string readString(const Json::Value& value, const char* key)
{
    if (!value.isString())
    {
        throw ConfigError(std::string(key) + ": expected a string");
    }
    return value.asString();
}

} // namespace

std::optional<std::string> systemEnvironment(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

void ConfigManager::initialize(const std::string& configFilePath, const EnvironmentLookup& environment)
{
    reset();
    m_configFilePath = configFilePath;

    if (!configFilePath.empty())
    {
        std::ifstream file(configFilePath);
        if (!file)
        {
            throw ConfigError("cannot open config file '" + configFilePath + "'");
        }

        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        if (!Json::parseFromStream(builder, file, &root, &errors))
        {
            throw ConfigError("malformed config file '" + configFilePath + "': " + errors);
        }
        applyJson(root);
    }

    applyEnvironment(environment);
    validate();
}

void ConfigManager::applyJson(const Json::Value& root)
{
    if (!root.isObject())
    {
        throw ConfigError("config root must be a JSON object");
    }

    if (root.isMember(keys::kMaxWorkers))
    {
        m_config.maxWorkers = readCount(root[keys::kMaxWorkers], keys::kMaxWorkers);
    }
    if (root.isMember(keys::kRedisUrl))
    {
        m_config.redisUrl = readString(root[keys::kRedisUrl], keys::kRedisUrl);
    }
    if (root.isMember(keys::kRedisKeyPrefix))
    {
        m_config.redisKeyPrefix = readString(root[keys::kRedisKeyPrefix], keys::kRedisKeyPrefix);
    }
    if (root.isMember(keys::kRedisConnectTimeoutMs))
    {
        m_config.redisConnectTimeoutMs = readCount(root[keys::kRedisConnectTimeoutMs], keys::kRedisConnectTimeoutMs);
    }
    if (root.isMember(keys::kRetentionMaxAge))
    {
        m_config.retentionMaxAge = readSeconds(root[keys::kRetentionMaxAge], keys::kRetentionMaxAge);
    }
    if (root.isMember(keys::kSweepInterval))
    {
        m_config.sweepInterval = readSeconds(root[keys::kSweepInterval], keys::kSweepInterval);
    }
    if (root.isMember(keys::kStaleAfter))
    {
        m_config.staleAfter = readSeconds(root[keys::kStaleAfter], keys::kStaleAfter);
    }
    if (root.isMember(keys::kLogLevel))
    {
        m_config.logLevel = parseLevel(readString(root[keys::kLogLevel], keys::kLogLevel), keys::kLogLevel);
    }
    if (root.isMember(keys::kLogFile))
    {
        m_config.logFile = readString(root[keys::kLogFile], keys::kLogFile);
    }
    if (root.isMember(keys::kWorkerNamePrefix))
    {
        m_config.workerNamePrefix = readString(root[keys::kWorkerNamePrefix], keys::kWorkerNamePrefix);
    }
    if (root.isMember(keys::kCacheEnabled))
    {
        m_config.cacheEnabled = readFlag(root[keys::kCacheEnabled], keys::kCacheEnabled);
    }
    if (root.isMember(keys::kCacheTtl))
    {
        m_config.cacheTtl = readCount(root[keys::kCacheTtl], keys::kCacheTtl);
    }
    if (root.isMember(keys::kCacheKeyPrefix))
    {
        m_config.cacheKeyPrefix = readString(root[keys::kCacheKeyPrefix], keys::kCacheKeyPrefix);
    }
}

void ConfigManager::applyEnvironment(const EnvironmentLookup& environment)
{
    if (auto value = environment(env::kRedisUrl))
    {
        m_config.redisUrl = *value;
    }
    if (auto value = environment(env::kMaxWorkers))
    {
        m_config.maxWorkers = parseCount(*value, env::kMaxWorkers);
    }
    if (auto value = environment(env::kRetentionMaxAge))
    {
        m_config.retentionMaxAge = parseSeconds(*value, env::kRetentionMaxAge);
    }
    if (auto value = environment(env::kSweepInterval))
    {
        m_config.sweepInterval = parseSeconds(*value, env::kSweepInterval);
    }
    if (auto value = environment(env::kLogLevel))
    {
        m_config.logLevel = parseLevel(*value, env::kLogLevel);
    }
    if (auto value = environment(env::kLogFile))
    {
        m_config.logFile = *value;
    }
    if (auto value = environment(env::kCacheTtl))
    {
        m_config.cacheTtl = parseCount(*value, env::kCacheTtl);
    }
}

void ConfigManager::reset()
{
    m_config = DocketConfig{};
    m_configFilePath.clear();
}

void ConfigManager::validate() const
{
    if (m_config.maxWorkers == 0)
    {
        throw ConfigError("max_workers must be at least 1");
    }
    if (m_config.redisConnectTimeoutMs == 0)
    {
        throw ConfigError("redis_connect_timeout_ms must be positive");
    }
    if (m_config.retentionMaxAge < 0.0)
    {
        throw ConfigError("retention_max_age_s must not be negative");
    }
    if (m_config.sweepInterval <= 0.0 || m_config.sweepInterval > kMaxIntervalSeconds)
    {
        throw ConfigError("sweep_interval_s must be positive and at most one year");
    }
    if (m_config.staleAfter <= 0.0 || m_config.staleAfter > kMaxIntervalSeconds)
    {
        throw ConfigError("stale_after_s must be positive and at most one year");
    }
    if (m_config.redisKeyPrefix.empty())
    {
        throw ConfigError("redis_key_prefix must not be empty");
    }
    if (m_config.cacheTtl == 0 || m_config.cacheTtl > kMaxIntervalSeconds)
    {
        throw ConfigError("cache_ttl_s must be positive and at most one year");
    }
    // Each prefix is scanned on its own, so neither may contain the other
    if (m_config.cacheKeyPrefix.empty() ||
        m_config.cacheKeyPrefix.rfind(m_config.redisKeyPrefix, 0) == 0 ||
        m_config.redisKeyPrefix.rfind(m_config.cacheKeyPrefix, 0) == 0)
    {
        throw ConfigError("cache_key_prefix must be non-empty and distinct from redis_key_prefix");
    }
}

} // namespace docket
