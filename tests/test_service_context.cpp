#include <gtest/gtest.h>

#include "docket_worker.h"
#include "runtime/function/global/service_context.h"
#include "runtime/function/task/task_queue.h"
#include "runtime/resource/cache/cache.h"
#include "runtime/resource/cache/redis_cache.h"

#include <chrono>
#include <thread>

namespace docket {
namespace test {

namespace {

DocketConfig testConfig() {
    DocketConfig config;
    config.maxWorkers = 2;
    config.workerNamePrefix = "TestSvc";
    return config;
}

} // namespace

TEST(ServiceContextTest, MapsDaemonConfigOntoQueueConfig) {
    DocketConfig config = testConfig();
    config.redisUrl = "tcp://redis:6379";
    config.redisKeyPrefix = "jobs:";
    config.redisConnectTimeoutMs = 250;
    config.retentionMaxAge = 60.0;

    TaskQueueConfig queueConfig = makeTaskQueueConfig(config);
    EXPECT_EQ(queueConfig.maxWorkers, 2u);
    EXPECT_EQ(queueConfig.redisUrl, "tcp://redis:6379");
    EXPECT_EQ(queueConfig.redisKeyPrefix, "jobs:");
    EXPECT_EQ(queueConfig.redisConnectTimeout, std::chrono::milliseconds(250));
    EXPECT_EQ(queueConfig.workerNamePrefix, "TestSvc");
    EXPECT_DOUBLE_EQ(queueConfig.retentionMaxAge, 60.0);
}

TEST(ServiceContextTest, MapsDaemonConfigOntoCacheConfig) {
    DocketConfig config = testConfig();
    config.redisUrl = "tcp://redis:6379";
    config.redisConnectTimeoutMs = 250;
    config.cacheKeyPrefix = "answers:";

    RedisCacheConfig cacheConfig = makeCacheConfig(config);
    EXPECT_EQ(cacheConfig.url, "tcp://redis:6379");
    EXPECT_EQ(cacheConfig.keyPrefix, "answers:");
    EXPECT_EQ(cacheConfig.connectTimeout, std::chrono::milliseconds(250));
}

TEST(ServiceContextTest, CacheStartsWithQueue) {
    ServiceContext context;
    ASSERT_TRUE(context.startSystems(testConfig()));
    ASSERT_NE(context.m_cache, nullptr);
    EXPECT_STREQ(context.m_cache->backendName(), "local");

    ASSERT_TRUE(context.m_cache->set("q", Json::Value(1), std::chrono::seconds(60)));
    EXPECT_TRUE(context.m_cache->get("q").hit());
    EXPECT_EQ(context.runMaintenance().cacheExpired, 0u);

    context.shutdownSystems();
    EXPECT_EQ(context.m_cache, nullptr);
}

TEST(ServiceContextTest, CacheCanBeDisabled) {
    DocketConfig config = testConfig();
    config.cacheEnabled = false;

    ServiceContext context;
    ASSERT_TRUE(context.startSystems(config));
    EXPECT_EQ(context.m_cache, nullptr);
    EXPECT_EQ(context.runMaintenance().cacheExpired, 0u);
}

TEST(ServiceContextTest, StartAndShutdown) {
    ServiceContext context;
    EXPECT_FALSE(context.isRunning());

    ASSERT_TRUE(context.startSystems(testConfig()));
    EXPECT_TRUE(context.isRunning());
    ASSERT_NE(context.m_task_queue, nullptr);
    EXPECT_EQ(context.m_task_queue->workerCount(), 2u);
    EXPECT_FALSE(context.isDegraded());

    EXPECT_FALSE(context.startSystems(testConfig()));

    context.shutdownSystems();
    EXPECT_FALSE(context.isRunning());
    context.shutdownSystems();
}

TEST(ServiceContextTest, InvalidConfigFailsToStart) {
    DocketConfig config = testConfig();
    config.maxWorkers = 0;

    ServiceContext context;
    EXPECT_FALSE(context.startSystems(config));
    EXPECT_FALSE(context.isRunning());
}

TEST(ServiceContextTest, UnreachableRedisIsReportedDegraded) {
    DocketConfig config = testConfig();
    config.redisUrl = "tcp://127.0.0.1:1";
    config.redisConnectTimeoutMs = 200;

    ServiceContext context;
    ASSERT_TRUE(context.startSystems(config));
    EXPECT_TRUE(context.isDegraded());
    EXPECT_FALSE(context.m_task_queue->usingSharedStore());
    ASSERT_NE(context.m_cache, nullptr);
    EXPECT_FALSE(context.m_cache->isShared());
}

TEST(ServiceContextTest, MaintenanceSweepsAndCountsStale) {
    DocketConfig config = testConfig();
    config.retentionMaxAge = 0.0;
    config.staleAfter = 1800.0;

    ServiceContext context;
    ASSERT_TRUE(context.startSystems(config));

    for (int i = 0; i < 3; ++i) {
        context.m_task_queue->submit([i]() { return i; });
    }
    context.m_task_queue->waitIdle();

    MaintenanceReport report = context.runMaintenance();
    EXPECT_EQ(report.removed, 3u);
    EXPECT_EQ(report.stale, 0u);
    EXPECT_EQ(report.stored, 0u);
}

TEST(ServiceContextTest, MaintenanceWithoutQueueIsEmpty) {
    ServiceContext context;
    MaintenanceReport report = context.runMaintenance();
    EXPECT_EQ(report.removed, 0u);
    EXPECT_EQ(report.stored, 0u);
}

TEST(DocketWorkerTest, RunReturnsAfterStopRequest) {
    DocketConfig config = testConfig();
    config.sweepInterval = 0.05;

    DocketWorker worker;
    ASSERT_TRUE(worker.initialize(config));
    EXPECT_TRUE(worker.isRunning());

    std::thread stopper([&worker]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        worker.requestStop();
    });
    worker.run();
    stopper.join();

    EXPECT_FALSE(worker.isRunning());
    worker.shutdown();
    EXPECT_FALSE(worker.context().isRunning());
}

TEST(DocketWorkerTest, HugeSweepIntervalStillStops) {
    DocketConfig config = testConfig();
    config.sweepInterval = 1e20;

    DocketWorker worker;
    ASSERT_TRUE(worker.initialize(config));

    std::thread stopper([&worker]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        worker.requestStop();
    });
    worker.run();
    stopper.join();

    EXPECT_FALSE(worker.isRunning());
}

TEST(DocketWorkerTest, TickSweepsExpiredTasks) {
    DocketConfig config = testConfig();
    config.retentionMaxAge = 0.0;

    DocketWorker worker;
    ASSERT_TRUE(worker.initialize(config));

    TaskQueue& queue = *worker.context().m_task_queue;
    queue.submit([]() { return 1; });
    queue.waitIdle();

    MaintenanceReport report = worker.tick();
    EXPECT_EQ(report.removed, 1u);
    EXPECT_EQ(queue.store().size(), 0u);
}

} // namespace test
} // namespace docket
