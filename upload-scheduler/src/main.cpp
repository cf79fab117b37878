/**
 * @file main.cpp
 * @brief
 */

// System Includes
#include <pthread.h>
#include <signal.h>

// Standard Library Includes
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <stop_token>
#include <thread>

// Third Party Includes
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/ConfigStore.hpp>
#include <automation/upload_scheduler/FtpClient.hpp>
#include <automation/upload_scheduler/Logging.hpp>
#include <automation/upload_scheduler/UploadScheduler.hpp>
#include <automation/upload_scheduler/WallClock.hpp>

namespace
{
auto config_directory() -> std::filesystem::path
{
    // NOLINTNEXTLINE(*-mt-unsafe)
    const auto* configDirEnv = std::getenv("UPLOAD_SCHEDULER_CONFIG_DIR");

    return (configDirEnv != nullptr ? configDirEnv : "configs");
}
} // namespace

auto main() -> int
{
    using namespace automation::upload_scheduler;

    // Blocked before any thread exists so every thread inherits the mask and
    // only sigwait() below sees them
    ::sigset_t shutdownSignals;
    ::sigemptyset(&shutdownSignals);
    ::sigaddset(&shutdownSignals, SIGINT);
    ::sigaddset(&shutdownSignals, SIGTERM);
    ::pthread_sigmask(SIG_BLOCK, &shutdownSignals, nullptr);

    try
    {
        const CurlGlobal  curlGlobal {};
        const ConfigStore configStore { config_directory() };
        const Settings    settings = configStore.load_settings();

        init_logging(settings.logsDirectory, current_local_time());
        spdlog::cfg::load_env_levels();

        UploadScheduler uploadScheduler {
            configStore,
            settings,
            FtpClient::make_factory()
        };

        std::jthread schedulerThread(
            [&uploadScheduler](const std::stop_token& stopToken)
            { uploadScheduler.run(stopToken); }
        );

        int receivedSignal = 0;
        ::sigwait(&shutdownSignals, &receivedSignal);

        spdlog::info("Received signal {}, shutting down", receivedSignal);
        schedulerThread.request_stop();
    }
    catch (std::exception& e)
    {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
