#include "docket_worker.h"
#include "runtime/core/log/log_system.h"
#include "runtime/resource/config/config_manager.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

// Global log system instance
static std::unique_ptr<docket::LogSystem> g_logSystem;

static docket::DocketWorker* g_worker = nullptr;

namespace docket {
    LogSystem* getLogSystem() { return g_logSystem.get(); }
}

static void handleSignal(int)
{
    if (g_worker)
    {
        g_worker->requestStop();
    }
}

int main(int argc, char** argv)
{
    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")))
    {
        std::cerr << "usage: docketd [config.json]" << std::endl;
        return argc > 2 ? 2 : 0;
    }

    // Configuration decides the log level and file, so it is read before logging starts
    docket::ConfigManager configManager;
    try
    {
        configManager.initialize(argc == 2 ? argv[1] : "");
    }
    catch (const docket::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    const docket::DocketConfig& config = configManager.config();

    docket::LogSystemConfig logConfig;
    logConfig.level = config.logLevel;
    logConfig.filePath = config.logFile;
    try
    {
        g_logSystem = std::make_unique<docket::LogSystem>(logConfig);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    if (!configManager.configFilePath().empty())
    {
        LOG_INFO("Loaded configuration from {}", configManager.configFilePath());
    }

    int exitCode = 0;

    try
    {
        docket::DocketWorker worker;

        if (worker.initialize(config))
        {
            g_worker = &worker;
            std::signal(SIGINT, handleSignal);
            std::signal(SIGTERM, handleSignal);

            worker.run();

            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            g_worker = nullptr;

            worker.shutdown();
        }
        else
        {
            exitCode = 1;
        }
    }
    catch (const std::exception& e)
    {
        g_worker = nullptr;
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        exitCode = 1;
    }

    // Shutdown log system
    g_logSystem.reset();

    return exitCode;
}
