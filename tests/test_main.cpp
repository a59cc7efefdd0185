#include <gtest/gtest.h>

#include "runtime/core/log/log_system.h"

#include <memory>

// Global log system for tests
static std::unique_ptr<docket::LogSystem> g_testLogSystem;

namespace docket {
    LogSystem* getLogSystem() { return g_testLogSystem.get(); }
}

class TestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        docket::LogSystemConfig config;
        config.loggerName = "docket-tests";
        config.level = docket::LogLevel::Warn; // Reduce noise during tests
        g_testLogSystem = std::make_unique<docket::LogSystem>(config);
    }

    void TearDown() override {
        g_testLogSystem.reset();
    }
};

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new TestEnvironment());

    return RUN_ALL_TESTS();
}
