/**
 * @file test_control.cpp
 * @brief Control request parsing and the service operations behind them
 */

// System Includes
#include <stdlib.h>

// Standard Library Includes
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <string>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include "TestSupport.hpp"
#include <automation/upload_scheduler/ConfigStore.hpp>
#include <automation/upload_scheduler/ControlRequest.hpp>
#include <automation/upload_scheduler/Settings.hpp>
#include <automation/upload_scheduler/TaskRunner.hpp>
#include <automation/upload_scheduler/UploadScheduler.hpp>
#include <automation/upload_scheduler/WallClock.hpp>

using namespace automation::upload_scheduler;
using namespace automation::upload_scheduler::testing;
using nlohmann::json;

static auto starts_with(const std::string& text, const std::string& prefix) -> bool
{
    return text.rfind(prefix, 0) == 0;
}

static auto morning_task(const std::string& name) -> json
{
    return json {
        {         "name",                     name },
        {      "profile",                   "Main" },
        {       "preset",                    "pvp" },
        {         "days", json::array({ "Mon" }) },
        {         "hour",                        9 },
        {       "minute",                        0 },
        { "mapping_mode",                "enabled" },
        {     "last_run",                       "" },
    };
}

struct Service
{
    explicit Service(const std::string& name, bool autoStart = false)
        : root(make_temp_dir("control_" + name))
    {
        write_file(root / "presets" / "pvp" / "types.xml", "<types/>");
        write_file(root / "presets" / "pvp" / "globals.xml", "<globals/>");

        write_file(root / "configs" / "profiles.json", R"({
            "profiles": [ { "name": "Main", "host": "ftp.example.net" } ]
        })");
        write_file(root / "configs" / "mappings.json", R"({
            "mappings": [
                { "name": "types", "local_relpath": "types.xml",
                  "remote_path": "mpmissions/types.xml" },
                { "name": "globals", "local_relpath": "globals.xml",
                  "remote_path": "mpmissions/globals.xml" } ]
        })");
        write_tasks(json::array({ morning_task("Morning") }));

        settings.presetsDirectory = root / "presets";
        settings.logsDirectory    = root / "logs";
        settings.autoStart        = autoStart;
    }

    auto write_tasks(const json& tasks) const -> void
    {
        write_file(root / "configs" / "tasks.json", json { { "tasks", tasks } }.dump(4));
    }

    [[nodiscard]]
    auto saved_last_run() const -> std::string
    {
        return json::parse(read_file(root / "configs" / "tasks.json"))
            .at("tasks")
            .at(0)
            .at("last_run")
            .get<std::string>();
    }

    [[nodiscard]]
    auto make_scheduler(TaskRunner::Clock clock = current_local_time)
        -> std::unique_ptr<UploadScheduler>
    {
        return std::make_unique<UploadScheduler>(
            ConfigStore(root / "configs"),
            settings,
            make_stub_factory(record),
            std::move(clock)
        );
    }

    fs::path       root;
    Settings       settings;
    TransferRecord record;
};

static void test_parse_requests()
{
    auto request = parse_control_request("start");
    assert(request.has_value());
    assert(request->command == ControlCommand::START);
    assert(request->argument.empty());

    request = parse_control_request("  status \r\n");
    assert(request.has_value());
    assert(request->command == ControlCommand::STATUS);

    request = parse_control_request("run  Night PvE ");
    assert(request.has_value());
    assert(request->command == ControlCommand::RUN);
    assert(request->argument == "Night PvE");

    request = parse_control_request("test Main");
    assert(request.has_value());
    assert(request->command == ControlCommand::TEST);
    assert(request->argument == "Main");

    assert(parse_control_request("reload")->command == ControlCommand::RELOAD);
    assert(parse_control_request("stop")->command == ControlCommand::STOP);
}

static void test_reject_malformed_requests()
{
    assert(!parse_control_request("").has_value());
    assert(!parse_control_request("   ").has_value());
    assert(!parse_control_request("run").has_value());
    assert(!parse_control_request("test ").has_value());
    assert(!parse_control_request("stop now").has_value());
    assert(!parse_control_request("START").has_value());

    const auto unknown = parse_control_request("launch rockets");
    assert(!unknown.has_value());
    assert(unknown.error() == "Unknown request 'launch'");
}

static void test_start_stop_and_status()
{
    Service    service("start_stop");
    const auto scheduler = service.make_scheduler();

    assert(scheduler->handle_request("status") == "SUCCESS: Scheduler: STOPPED (1 tasks)");
    assert(scheduler->handle_request("start") == "SUCCESS: scheduler started");
    assert(scheduler->handle_request("status") == "SUCCESS: Scheduler: RUNNING (tick 20s, 1 tasks)");
    assert(scheduler->handle_request("stop") == "SUCCESS: scheduler stopped");
    assert(starts_with(scheduler->status(), "Scheduler: STOPPED"));
    assert(starts_with(scheduler->handle_request("jump"), "FAILURE: "));
}

static void test_auto_start()
{
    Service    service("auto_start", true);
    const auto scheduler = service.make_scheduler();

    assert(starts_with(scheduler->status(), "Scheduler: RUNNING"));
}

static void test_tick_persists_last_run()
{
    using namespace std::chrono;

    Service    service("tick");
    const auto scheduler = service.make_scheduler();

    scheduler->start_scheduler();
    scheduler->tick(make_local_time(2024y / January / 1d, 9, 0, 15));

    assert(service.record.uploads.size() == 2);
    assert(service.saved_last_run() == "2024-01-01 09:00");
}

static void test_run_now_does_not_stamp()
{
    Service    service("run_now");
    const auto scheduler = service.make_scheduler();

    assert(scheduler->handle_request("run Morning") == "SUCCESS: task Morning completed");
    assert(service.record.uploads.size() == 2);
    assert(service.saved_last_run().empty());

    assert(!scheduler->run_task_now("Evening"));
    assert(starts_with(scheduler->handle_request("run Evening"), "FAILURE: task Evening"));
}

static void test_connection_check()
{
    Service service("connection");
    service.record.workingDirectory = "/home/dayz";
    const auto scheduler = service.make_scheduler();

    assert(scheduler->handle_request("test Main") == "SUCCESS: connected. PWD: /home/dayz");
    assert(service.record.connects == 1);
    assert(service.record.closes == 1);

    assert(scheduler->handle_request("test Backup") == "FAILURE: Profile not found: Backup");

    service.record.unreachableHosts = { "ftp.example.net" };
    const auto failed = scheduler->test_connection("Main");
    assert(!failed.has_value());
    assert(failed.error() == "Connection refused: ftp.example.net");
}

static void test_reload()
{
    Service    service("reload");
    const auto scheduler = service.make_scheduler();

    service.write_tasks(json::array({ morning_task("Morning"), morning_task("Evening") }));
    assert(scheduler->handle_request("reload") == "SUCCESS: configuration reloaded");
    assert(scheduler->status() == "Scheduler: STOPPED (2 tasks)");
    assert(scheduler->run_task_now("Evening"));

    // A broken file leaves the previous configuration in place
    write_file(service.root / "configs" / "tasks.json", "{ not json");
    assert(scheduler->handle_request("reload") == "FAILURE: reload failed. Check the log.");
    assert(scheduler->status() == "Scheduler: STOPPED (2 tasks)");
}

static void test_run_now_survives_an_unexpected_error()
{
    Service    service("run_now_error");
    const auto scheduler = service.make_scheduler(
        []() -> LocalTime { throw std::runtime_error("clock unavailable"); }
    );
    const LogCapture capture;

    assert(!scheduler->run_task_now("Morning"));
    assert(
        scheduler->handle_request("run Morning")
        == "FAILURE: task Morning failed. Check the log."
    );
    assert(capture.count("unexpected error: clock unavailable") == 2);
    assert(service.record.uploads.empty());
}

static void test_bad_task_does_not_block_the_rest()
{
    Service service("bad_task");
    auto    typo = morning_task("Typo");
    typo["hour"] = 25;
    service.write_tasks(json::array({ typo, morning_task("Morning") }));

    const auto scheduler = service.make_scheduler();
    assert(scheduler->status() == "Scheduler: STOPPED (1 tasks)");
    assert(scheduler->run_task_now("Morning"));
    assert(!scheduler->run_task_now("Typo"));

    service.write_tasks(json::array({ typo, morning_task("Morning"), morning_task("Evening") }));
    assert(scheduler->handle_request("reload") == "SUCCESS: configuration reloaded");
    assert(scheduler->status() == "Scheduler: STOPPED (2 tasks)");
}

int main()
{
    // Would otherwise turn every run into a dry run
    ::unsetenv("DRY_RUN");

    test_parse_requests();
    test_reject_malformed_requests();
    test_start_stop_and_status();
    test_auto_start();
    test_tick_persists_last_run();
    test_run_now_does_not_stamp();
    test_run_now_survives_an_unexpected_error();
    test_connection_check();
    test_reload();
    test_bad_task_does_not_block_the_rest();

    std::cout << "All control tests passed!" << std::endl;
    return 0;
}
