#pragma once

#include "runtime/core/log/log_system.h"

#include <json/json.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace docket {

/// @brief Raised when a configuration file or override holds an unusable value
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// @brief Longest accepted sweep interval, stale threshold or cache TTL (one year)
constexpr double kMaxIntervalSeconds = 365.0 * 24.0 * 3600.0;

/// @brief Every setting the worker daemon reads
/// Keys in the JSON file use the names in the comments
struct DocketConfig
{
    uint32_t maxWorkers{4};                     // max_workers
    std::string redisUrl;                       // redis_url, empty = local store
    std::string redisKeyPrefix{"task:"};        // redis_key_prefix
    uint32_t redisConnectTimeoutMs{1500};       // redis_connect_timeout_ms
    double retentionMaxAge{3600.0};             // retention_max_age_s
    double sweepInterval{300.0};                // sweep_interval_s
    double staleAfter{1800.0};                  // stale_after_s
    LogLevel logLevel{LogLevel::Info};          // log_level
    std::string logFile;                        // log_file, empty = console only
    std::string workerNamePrefix{"DocketWorker"}; // worker_name_prefix
    bool cacheEnabled{true};                    // cache_enabled
    uint32_t cacheTtl{300};                     // cache_ttl_s, default entry lifetime
    std::string cacheKeyPrefix{"cache:"};       // cache_key_prefix
};

/// @brief Reads one environment variable; empty when unset
using EnvironmentLookup = std::function<std::optional<std::string>(const char* name)>;

/// @brief Process environment via std::getenv
std::optional<std::string> systemEnvironment(const char* name);

/// @brief Layers defaults, an optional JSON file and DOCKET_* environment overrides
class ConfigManager
{
public:
    ConfigManager();
    ~ConfigManager();

    /// @brief Load configuration
    /// @param configFilePath JSON file, skipped when empty
    /// @param environment Source of DOCKET_* overrides
    /// @throws ConfigError on unreadable files, malformed JSON or invalid values
    void initialize(const std::string& configFilePath = "",
                    const EnvironmentLookup& environment = systemEnvironment);

    /// @brief Apply the keys present in a parsed JSON object over the current values
    void applyJson(const Json::Value& root);

    /// @brief Apply DOCKET_* overrides over the current values
    void applyEnvironment(const EnvironmentLookup& environment);

    /// @brief Back to defaults
    void reset();

    [[nodiscard]] const DocketConfig& config() const { return m_config; }
    [[nodiscard]] const std::string& configFilePath() const { return m_configFilePath; }

private:
    void validate() const;

    DocketConfig m_config;
    std::string m_configFilePath;
};

} // namespace docket
