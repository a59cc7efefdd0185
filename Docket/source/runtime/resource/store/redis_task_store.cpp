#include "runtime/resource/store/redis_task_store.h"
#include "runtime/resource/store/record_codec.h"
#include "runtime/core/log/log_system.h"

#include <sw/redis++/redis++.h>

#include <iterator>
#include <utility>
#include <vector>

namespace docket {

namespace {

constexpr long long kScanBatch = 100;

// Writes the whole hash only if the key is absent. 1 = created, 0 = exists
constexpr const char* kCreateScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 1 then
    return 0
end
redis.call('HSET', KEYS[1], unpack(ARGV))
return 1
)lua";

// ARGV[1] is the status the caller read; the remaining ARGV are field/value pairs.
// 1 = written, 0 = key gone, -1 = status changed since the read
constexpr const char* kUpdateScript = R"lua(
local current = redis.call('HGET', KEYS[1], 'status')
if not current then
    return 0
end
if current ~= ARGV[1] then
    return -1
end
redis.call('HSET', KEYS[1], unpack(ARGV, 2))
return 1
)lua";

} // namespace

RedisTaskStore::RedisTaskStore(RedisStoreConfig config)
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
        LOG_INFO("RedisTaskStore: Connected to {} (key prefix '{}')", m_config.url, m_config.keyPrefix);
    }
    catch (const std::exception& e)
    {
        m_redis.reset();
        m_fallback = std::make_unique<LocalTaskStore>();
        LOG_WARN("RedisTaskStore: Redis at '{}' unavailable ({}); using in-process store. "
                 "Tasks will NOT be visible to other processes", m_config.url, e.what());
    }
}

RedisTaskStore::~RedisTaskStore() = default;

const char* RedisTaskStore::backendName() const
{
    return isDegraded() ? "local (redis fallback)" : "redis";
}

StoreResult RedisTaskStore::backendFailure(const char* operation, const std::string& key, const std::exception& e)
{
    m_backendErrors.fetch_add(1, std::memory_order_relaxed);
    LOG_ERROR("RedisTaskStore: {} failed for {}: {}", operation, key, e.what());
    return StoreResult::failure(StoreError::BackendUnavailable, e.what());
}

StoreResult RedisTaskStore::create(const TaskRecord& record)
{
    if (m_fallback)
    {
        return m_fallback->create(record);
    }

    if (!isConsistent(record))
    {
        return StoreResult::failure(StoreError::InvalidTransition,
                                    "initial record for '" + record.id.str() + "' is inconsistent");
    }

    const std::string key = keyFor(record.id);
    try
    {
        std::vector<std::string> args;
        for (auto& field : toFields(record))
        {
            args.push_back(std::move(field.first));
            args.push_back(std::move(field.second));
        }

        const std::vector<std::string> keys{key};
        const long long created = m_redis->eval<long long>(kCreateScript, keys.begin(), keys.end(),
                                                           args.begin(), args.end());
        if (created == 0)
        {
            return StoreResult::failure(StoreError::AlreadyExists,
                                        "task '" + record.id.str() + "' already exists");
        }
        return StoreResult::success();
    }
    catch (const sw::redis::Error& e)
    {
        return backendFailure("create", key, e);
    }
}

StoreLookup RedisTaskStore::fetch(const std::string& key)
{
    FieldMap fields;
    m_redis->hgetall(key, std::inserter(fields, fields.begin()));

    if (fields.empty())
    {
        return {std::nullopt, StoreError::NotFound, "no record at '" + key + "'"};
    }

    auto record = fromFields(fields);
    if (!record)
    {
        LOG_WARN("RedisTaskStore: Record at {} could not be decoded", key);
        return {std::nullopt, StoreError::CorruptRecord, "record at '" + key + "' could not be decoded"};
    }
    return {std::move(record), StoreError::None, {}};
}

StoreResult RedisTaskStore::update(const TaskId& id, const RecordMutator& mutator)
{
    if (m_fallback)
    {
        return m_fallback->update(id, mutator);
    }

    const std::string key = keyFor(id);
    try
    {
        StoreLookup current = fetch(key);
        if (!current)
        {
            return StoreResult::failure(current.error, current.message);
        }

        const TaskRecord& before = *current.record;
        TaskRecord next = before;
        mutator(next);

        if (!isValidTransition(before, next))
        {
            LOG_WARN("RedisTaskStore: Rejected transition {} -> {} for task {}",
                     toString(before.status), toString(next.status), id.str());
            return StoreResult::failure(StoreError::InvalidTransition,
                                        std::string("cannot move task from ") + toString(before.status) +
                                        " to " + toString(next.status));
        }

        // id and created_at never change; the rest is rewritten only if nobody moved the status meanwhile
        std::vector<std::string> args{toString(before.status)};
        for (auto& field : toFields(next))
        {
            if (field.first != record_fields::kId && field.first != record_fields::kCreatedAt)
            {
                args.push_back(std::move(field.first));
                args.push_back(std::move(field.second));
            }
        }

        const std::vector<std::string> keys{key};
        const long long written = m_redis->eval<long long>(kUpdateScript, keys.begin(), keys.end(),
                                                           args.begin(), args.end());
        if (written == 0)
        {
            return StoreResult::failure(StoreError::NotFound, "task '" + id.str() + "' was removed during update");
        }
        if (written < 0)
        {
            return StoreResult::failure(StoreError::InvalidTransition,
                                        "task '" + id.str() + "' changed status during update");
        }
        return StoreResult::success();
    }
    catch (const sw::redis::Error& e)
    {
        return backendFailure("update", key, e);
    }
}

StoreLookup RedisTaskStore::get(const TaskId& id)
{
    if (m_fallback)
    {
        return m_fallback->get(id);
    }

    const std::string key = keyFor(id);
    try
    {
        return fetch(key);
    }
    catch (const sw::redis::Error& e)
    {
        StoreResult failure = backendFailure("get", key, e);
        return {std::nullopt, failure.error, failure.message};
    }
}

StoreResult RedisTaskStore::remove(const TaskId& id)
{
    if (m_fallback)
    {
        return m_fallback->remove(id);
    }

    const std::string key = keyFor(id);
    try
    {
        if (m_redis->del(key) == 0)
        {
            return StoreResult::failure(StoreError::NotFound, "task '" + id.str() + "' not found");
        }
        return StoreResult::success();
    }
    catch (const sw::redis::Error& e)
    {
        return backendFailure("remove", key, e);
    }
}

template<typename Visitor>
void RedisTaskStore::forEachKey(Visitor&& visit)
{
    const std::string pattern = m_config.keyPrefix + "*";
    long long cursor = 0;
    do
    {
        std::vector<std::string> keys;
        cursor = m_redis->scan(cursor, pattern, kScanBatch, std::back_inserter(keys));
        for (const auto& key : keys)
        {
            visit(key);
        }
    } while (cursor != 0);
}

size_t RedisTaskStore::cleanup(double maxAgeSeconds, double now)
{
    if (m_fallback)
    {
        return m_fallback->cleanup(maxAgeSeconds, now);
    }

    size_t removed = 0;
    try
    {
        forEachKey([&](const std::string& key) {
            auto createdText = m_redis->hget(key, record_fields::kCreatedAt);
            auto created = createdText ? parseTimestamp(*createdText) : std::nullopt;

            // A hash without a readable created_at is a fragment and goes as well
            if (!created || now - *created >= maxAgeSeconds)
            {
                if (!created)
                {
                    LOG_WARN("RedisTaskStore: Removing {} with no readable created_at", key);
                }
                removed += static_cast<size_t>(m_redis->del(key));
            }
        });
    }
    catch (const sw::redis::Error& e)
    {
        (void)backendFailure("cleanup", m_config.keyPrefix + "*", e);
    }
    return removed;
}

std::vector<TaskRecord> RedisTaskStore::snapshot()
{
    if (m_fallback)
    {
        return m_fallback->snapshot();
    }

    std::vector<TaskRecord> records;
    try
    {
        forEachKey([&](const std::string& key) {
            StoreLookup lookup = fetch(key);
            if (lookup)
            {
                records.push_back(std::move(*lookup.record));
            }
        });
    }
    catch (const sw::redis::Error& e)
    {
        (void)backendFailure("snapshot", m_config.keyPrefix + "*", e);
    }
    return records;
}

size_t RedisTaskStore::size()
{
    if (m_fallback)
    {
        return m_fallback->size();
    }

    size_t count = 0;
    try
    {
        forEachKey([&count](const std::string&) { ++count; });
    }
    catch (const sw::redis::Error& e)
    {
        (void)backendFailure("size", m_config.keyPrefix + "*", e);
    }
    return count;
}

} // namespace docket
