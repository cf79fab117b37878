/**
 * @file UploadScheduler.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/UploadScheduler.hpp>

// Standard Library Includes
#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <exception>
#include <expected>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <spdlog/spdlog.h>
#include <zmq.hpp>

// Project Includes
#include <automation/upload_scheduler/ControlRequest.hpp>
#include <automation/upload_scheduler/Errors.hpp>
#include <automation/upload_scheduler/Profile.hpp>
#include <automation/upload_scheduler/Task.hpp>

namespace automation::upload_scheduler
{
namespace
{
auto apply_environment(Settings settings) -> Settings
{
    // NOLINTNEXTLINE(*-mt-unsafe)
    if (const auto* dryRunPtr = std::getenv("DRY_RUN"))
    {
        std::string dryRun(dryRunPtr);
        std::transform(
            std::begin(dryRun),
            std::end(dryRun),
            std::begin(dryRun),
            [](auto c) { return std::toupper(c); }
        );

        settings.forceDryRun = (dryRun == "TRUE");
    }

    if (settings.forceDryRun)
    {
        spdlog::info("Dry run forced by the environment. No uploads will occur.");
    }

    return settings;
}
} // namespace

UploadScheduler::UploadScheduler(
    ConfigStore           configStore,
    Settings              settings,
    TransferClientFactory clientFactory,
    TaskRunner::Clock     clock
)
try
    : m_ConfigStore(std::move(configStore)),
      m_Settings(apply_environment(std::move(settings))),
      m_ClientFactory(std::move(clientFactory)),
      m_Catalogue(m_ConfigStore.load_catalogue()),
      m_TaskStore(
          m_ConfigStore.load_tasks(),
          [this](const std::vector<Task>& tasks)
          { m_ConfigStore.save_tasks(tasks); }
      ),
      m_TaskRunner(m_Settings, m_ClientFactory, std::move(clock)),
      m_Scheduler(m_TaskStore, m_TaskRunner, m_Catalogue)
{
    spdlog::info(
        "Loaded {} profiles, {} mappings and {} tasks from {}",
        m_Catalogue.profiles.size(),
        m_Catalogue.mappings.size(),
        m_TaskStore.get_tasks().size(),
        m_ConfigStore.get_directory().string()
    );

    if (m_Settings.tickInterval >= std::chrono::minutes(1))
    {
        spdlog::warn(
            "Tick interval is {}s. Tasks only fire on their exact minute, so "
            "an interval of 60s or more can miss a trigger entirely.",
            m_Settings.tickInterval.count()
        );
    }

    if (m_Settings.autoStart)
    {
        m_Scheduler.start();
    }
}
catch (std::runtime_error& re)
{
    spdlog::error("{}", re.what());
    throw;
}

auto UploadScheduler::start_scheduler() -> void
{
    const std::lock_guard<std::mutex> tickLock(m_TickMutex);
    m_Scheduler.start();
}

auto UploadScheduler::stop_scheduler() -> void
{
    const std::lock_guard<std::mutex> tickLock(m_TickMutex);
    m_Scheduler.stop();
}

auto UploadScheduler::tick(LocalTime now) -> void
{
    const std::lock_guard<std::mutex> tickLock(m_TickMutex);
    m_Scheduler.tick(now);
}

auto UploadScheduler::run_task_now(std::string_view taskName) -> bool
{
    const std::lock_guard<std::mutex> tickLock(m_TickMutex);

    const auto index = m_TaskStore.find(taskName);

    if (!index.has_value())
    {
        spdlog::error("[TASK] Task not found: {}", taskName);
        return false;
    }

    // Copied so a reload on another thread cannot pull it out from under us
    const Task task = m_TaskStore.get_tasks().at(*index);

    spdlog::info("[TASK] Run-now requested: {}", task.name);

    try
    {
        if (m_TaskRunner.run(task, task.dryRun, m_Catalogue))
        {
            spdlog::info("[TASK] Run-now complete: {}", task.name);
            return true;
        }
    }
    catch (const std::exception& e)
    {
        spdlog::error(
            "[TASK] {} failed with an unexpected error: {}",
            task.name,
            e.what()
        );
    }

    spdlog::warn("[TASK] Run-now failed: {}", task.name);
    return false;
}

auto UploadScheduler::test_connection(std::string_view profileName)
    -> std::expected<std::string, std::string>
{
    const std::lock_guard<std::mutex> tickLock(m_TickMutex);

    const auto profile = find_profile(m_Catalogue.profiles, profileName);

    if (!profile.has_value())
    {
        spdlog::error("Profile not found: {}", profileName);
        return std::unexpected(fmt::format("Profile not found: {}", profileName));
    }

    spdlog::info(
        "Testing connection to {}:{} TLS={}",
        profile->host,
        profile->port,
        profile->tls
    );

    try
    {
        const auto client = m_ClientFactory(*profile, m_Settings.transferTimeout);

        if (!client)
        {
            throw connection_error("No transfer client available");
        }

        const ScopedConnection connection(*client);
        auto workingDirectory = client->current_remote_directory();

        spdlog::info("Connected. PWD: {}", workingDirectory);
        return workingDirectory;
    }
    catch (const std::exception& e)
    {
        spdlog::error("Connection failed: {}", e.what());
        return std::unexpected(std::string(e.what()));
    }
}

auto UploadScheduler::reload() -> bool
{
    const std::lock_guard<std::mutex> tickLock(m_TickMutex);

    try
    {
        auto catalogue = m_ConfigStore.load_catalogue();
        auto tasks     = m_ConfigStore.load_tasks();

        m_Catalogue = std::move(catalogue);
        m_TaskStore.replace(std::move(tasks));
    }
    catch (const std::exception& e)
    {
        spdlog::error(
            "Reload failed, keeping the previous configuration: {}",
            e.what()
        );
        return false;
    }

    spdlog::info(
        "Reloaded {} profiles, {} mappings and {} tasks",
        m_Catalogue.profiles.size(),
        m_Catalogue.mappings.size(),
        m_TaskStore.get_tasks().size()
    );
    return true;
}

auto UploadScheduler::status() -> std::string
{
    const std::lock_guard<std::mutex> tickLock(m_TickMutex);

    if (m_Scheduler.get_state() == Scheduler::State::RUNNING)
    {
        return fmt::format(
            "Scheduler: RUNNING (tick {}s, {} tasks)",
            m_Settings.tickInterval.count(),
            m_TaskStore.get_tasks().size()
        );
    }

    return fmt::format(
        "Scheduler: STOPPED ({} tasks)",
        m_TaskStore.get_tasks().size()
    );
}

auto UploadScheduler::handle_request(std::string_view message) -> std::string
{
    const auto request = parse_control_request(message);

    if (!request.has_value())
    {
        spdlog::warn("Rejected control request: {}", request.error());
        return fmt::format("FAILURE: {}", request.error());
    }

    const auto& name = request->argument;

    switch (request->command)
    {
    case ControlCommand::START:
        this->start_scheduler();
        return "SUCCESS: scheduler started";

    case ControlCommand::STOP:
        this->stop_scheduler();
        return "SUCCESS: scheduler stopped";

    case ControlCommand::STATUS:
        return fmt::format("SUCCESS: {}", this->status());

    case ControlCommand::RUN:
        if (this->run_task_now(name))
        {
            return fmt::format("SUCCESS: task {} completed", name);
        }
        return fmt::format("FAILURE: task {} failed. Check the log.", name);

    case ControlCommand::TEST:
    {
        const auto workingDirectory = this->test_connection(name);

        if (workingDirectory.has_value())
        {
            return fmt::format("SUCCESS: connected. PWD: {}", *workingDirectory);
        }
        return fmt::format("FAILURE: {}", workingDirectory.error());
    }

    case ControlCommand::RELOAD:
        if (this->reload())
        {
            return "SUCCESS: configuration reloaded";
        }
        return "FAILURE: reload failed. Check the log.";
    }

    return "FAILURE: unhandled request";
}

auto UploadScheduler::control_loop(const std::stop_token& stopToken) -> void
{
    zmq::context_t socketContext {};
    zmq::socket_t  socket { socketContext, zmq::socket_type::rep };

    const std::string CONTROL_PORT = []() -> std::string
    {
        // NOLINTNEXTLINE(*-mt-unsafe)
        const auto* controlPortEnv = std::getenv("CONTROL_PORT");

        return (controlPortEnv != nullptr ? controlPortEnv : "9281");
    }();

    // Wake up periodically so a stop request is noticed
    constexpr int RECEIVE_TIMEOUT_MS = 500;
    socket.set(zmq::sockopt::rcvtimeo, RECEIVE_TIMEOUT_MS);

    try
    {
        socket.bind(fmt::format("tcp://*:{}", CONTROL_PORT));
    }
    catch (const zmq::error_t& ze)
    {
        spdlog::error(
            "Failed to bind control socket on port {}! {}. Manual control "
            "is unavailable.",
            CONTROL_PORT,
            ze.what()
        );
        return;
    }

    spdlog::info("Listening for control requests on port {}", CONTROL_PORT);

    while (!stopToken.stop_requested())
    {
        zmq::message_t request;

        const auto received = socket.recv(request, zmq::recv_flags::none);

        if (!received.has_value())
        {
            continue;
        }

        const std::string message = request.to_string();
        spdlog::info("Control request: {}", message);

        const auto reply = this->handle_request(message);
        socket.send(zmq::message_t(reply), zmq::send_flags::none);
    }

    spdlog::info("Control thread stop requested");
}

auto UploadScheduler::run(const std::stop_token& stopToken) -> void
{
    spdlog::trace("Starting control thread");
    m_ControlThread = std::jthread(
        [this](const std::stop_token& controlToken)
        { this->control_loop(controlToken); }
    );

    const auto tickInterval
        = std::max(m_Settings.tickInterval, std::chrono::seconds(1));

    std::mutex                  sleepMutex;
    std::condition_variable_any sleepVariable;

    spdlog::trace("Entering the main running loop");
    while (!stopToken.stop_requested())
    {
        try
        {
            this->tick(current_local_time());
        }
        catch (const std::exception& e)
        {
            spdlog::error("Scheduler error: {}", e.what());
        }

        std::unique_lock<std::mutex> sleepLock(sleepMutex);
        sleepVariable.wait_for(
            sleepLock,
            stopToken,
            tickInterval,
            []() { return false; }
        );
    }

    m_ControlThread.request_stop();
    m_ControlThread.join();

    spdlog::info("Leaving the main running loop");
}
} // namespace automation::upload_scheduler
