/**
 * @file test_task_runner.cpp
 * @brief Preconditions, dry runs, backups and transfer failures of one task run
 */

// Standard Library Includes
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

// Project Includes
#include "TestSupport.hpp"
#include <automation/upload_scheduler/Catalogue.hpp>
#include <automation/upload_scheduler/Settings.hpp>
#include <automation/upload_scheduler/Task.hpp>
#include <automation/upload_scheduler/TaskRunner.hpp>
#include <automation/upload_scheduler/WallClock.hpp>

using namespace automation::upload_scheduler;
using namespace automation::upload_scheduler::testing;
using namespace std::chrono_literals;

static const std::string TYPES_REMOTE   = "/dayzstandalone/mpmissions/db/types.xml";
static const std::string GLOBALS_REMOTE = "/dayzstandalone/mpmissions/db/globals.xml";

struct Fixture
{
    fs::path       root;
    Settings       settings;
    Catalogue      catalogue;
    Task           task;
    TransferRecord record;
};

static auto fixed_clock() -> LocalTime
{
    using namespace std::chrono;
    return make_local_time(2024y / January / 1d, 9, 0, 5);
}

static auto make_fixture(const std::string& name) -> Fixture
{
    Fixture fixture;
    fixture.root = make_temp_dir("runner_" + name);

    fixture.settings.presetsDirectory = fixture.root / "presets";
    fixture.settings.logsDirectory    = fixture.root / "logs";
    fixture.settings.transferTimeout  = 5s;

    write_file(fixture.root / "presets" / "pvp" / "db" / "types.xml", "<types/>");
    write_file(fixture.root / "presets" / "pvp" / "db" / "globals.xml", "<globals/>");

    fixture.catalogue.profiles.emplace_back(Profile {
        .name     = "Main",
        .host     = "ftp.example.net",
        .port     = 21,
        .username = "admin",
        .password = "hunter2",
        .tls      = false,
        .root     = "/dayzstandalone/",
    });

    fixture.catalogue.mappings.emplace_back(Mapping {
        .name                  = "types",
        .enabled               = true,
        .localRelativePath     = "db/types.xml",
        .remotePath            = "\\mpmissions\\db\\types.xml",
        .backupBeforeOverwrite = true,
    });
    fixture.catalogue.mappings.emplace_back(Mapping {
        .name                  = "globals",
        .enabled               = true,
        .localRelativePath     = "db/globals.xml",
        .remotePath            = "mpmissions/db/globals.xml",
        .backupBeforeOverwrite = false,
    });

    fixture.task.name    = "Weekend PvP";
    fixture.task.profile = "Main";
    fixture.task.preset  = "pvp";
    fixture.task.days    = { std::chrono::Monday };
    fixture.task.hour    = 9;

    return fixture;
}

static auto make_runner(Fixture& fixture) -> TaskRunner
{
    return TaskRunner(fixture.settings, make_stub_factory(fixture.record), fixed_clock);
}

static void test_dry_run_logs_without_connecting()
{
    auto fixture = make_fixture("dry_run");
    auto runner  = make_runner(fixture);
    const LogCapture capture;

    assert(runner.run(fixture.task, true, fixture.catalogue));
    assert(capture.count("Would upload") == 2);
    assert(capture.count(TYPES_REMOTE) == 1);
    assert(fixture.record.factoryCalls == 0);
    assert(fixture.record.connects == 0);
}

static void test_forced_dry_run_overrides_the_task()
{
    auto fixture = make_fixture("forced_dry_run");
    fixture.settings.forceDryRun = true;
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(runner.run(fixture.task, false, fixture.catalogue));
    assert(capture.count("Would upload") == 2);
    assert(fixture.record.connects == 0);
}

static void test_missing_local_file_aborts_before_connecting()
{
    auto fixture = make_fixture("missing_file");
    fs::remove(fixture.root / "presets" / "pvp" / "db" / "globals.xml");
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(!runner.run(fixture.task, false, fixture.catalogue));
    assert(fixture.record.factoryCalls == 0);
    assert(fixture.record.connects == 0);
    assert(fixture.record.uploads.empty());
    assert(capture.count("[error]") == 1);
    assert(capture.count("precondition failed") == 1);
    assert(capture.count("db/globals.xml") == 1);
}

static void test_missing_file_fails_a_dry_run_too()
{
    auto fixture = make_fixture("missing_file_dry");
    fs::remove(fixture.root / "presets" / "pvp" / "db" / "types.xml");
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(!runner.run(fixture.task, true, fixture.catalogue));
    assert(capture.count("Would upload") == 0);
}

static void test_unknown_profile()
{
    auto fixture = make_fixture("unknown_profile");
    fixture.task.profile = "Deleted";
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(!runner.run(fixture.task, false, fixture.catalogue));
    assert(capture.count("Profile not found: Deleted") == 1);
    assert(fixture.record.connects == 0);

    const auto plan = runner.plan(fixture.task, fixture.catalogue);
    assert(!plan.has_value());
    assert(plan.error().kind == ErrorKind::CONFIGURATION);
}

static void test_unknown_preset()
{
    auto fixture = make_fixture("unknown_preset");
    fixture.task.preset = "pve";
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(!runner.run(fixture.task, false, fixture.catalogue));
    assert(capture.count("Preset not found") == 1);

    fixture.task.preset = "";
    assert(!runner.run(fixture.task, false, fixture.catalogue));
    assert(fixture.record.connects == 0);
}

static void test_empty_selection_is_a_hard_error()
{
    auto fixture = make_fixture("empty_selection");
    fixture.task.mappingMode = MappingMode::SELECTED;
    fixture.task.mappings    = { "deleted-mapping" };
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(!runner.run(fixture.task, true, fixture.catalogue));
    assert(capture.count("No mappings to run") == 1);
    assert(capture.count("Would upload") == 0);
}

static void test_plan_orders_transfers_and_composes_paths()
{
    auto fixture = make_fixture("plan");
    auto runner  = make_runner(fixture);

    const auto plan = runner.plan(fixture.task, fixture.catalogue);

    assert(plan.has_value());
    assert(plan->profile.name == "Main");
    assert(plan->transfers.size() == 2);
    assert(plan->transfers.at(0).remotePath == TYPES_REMOTE);
    assert(plan->transfers.at(1).remotePath == GLOBALS_REMOTE);
    assert(plan->transfers.at(0).localPath
           == fixture.root / "presets" / "pvp" / "db" / "types.xml");
}

static void test_upload_uses_one_connection()
{
    auto fixture = make_fixture("upload");
    auto runner  = make_runner(fixture);
    const LogCapture capture;

    assert(runner.run(fixture.task, false, fixture.catalogue));
    assert(fixture.record.factoryCalls == 1);
    assert(fixture.record.connects == 1);
    assert(fixture.record.closes == 1);
    assert((fixture.record.uploads == std::vector<std::string> { TYPES_REMOTE, GLOBALS_REMOTE }));
    assert(capture.count("Uploaded") == 2);
}

static void test_backup_failure_is_not_fatal()
{
    auto fixture = make_fixture("backup_missing");
    auto runner  = make_runner(fixture);
    const LogCapture capture;

    // Nothing exists remotely yet, so the backup download fails
    assert(runner.run(fixture.task, false, fixture.catalogue));
    assert(capture.count("Backup skipped/failed") == 1);
    assert(fixture.record.uploads.size() == 2);
    assert(capture.count("[error]") == 0);
}

static void test_backup_only_for_flagged_mappings()
{
    auto fixture = make_fixture("backup_flags");
    fixture.record.remoteFiles = { TYPES_REMOTE, GLOBALS_REMOTE };
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(runner.run(fixture.task, false, fixture.catalogue));
    assert((fixture.record.downloads == std::vector<std::string> { TYPES_REMOTE }));
    assert(capture.count("Backup OK") == 1);
}

static void test_backup_directory_layout()
{
    auto fixture = make_fixture("backup_layout");
    fixture.record.remoteFiles = { TYPES_REMOTE };
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(runner.run(fixture.task, false, fixture.catalogue));

    const auto backup = fixture.root / "logs" / "backups" / "Main" / "pvp"
                      / "20240101_090005" / "db" / "types.xml";
    assert(fs::is_regular_file(backup));
    assert(read_file(backup) == "previous contents of " + TYPES_REMOTE);
}

static void test_upload_failure_aborts_remaining_mappings()
{
    auto fixture = make_fixture("upload_failure");
    fixture.record.failingUploads = { TYPES_REMOTE };
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(!runner.run(fixture.task, false, fixture.catalogue));
    assert(fixture.record.uploads.empty());
    assert(fixture.record.closes == 1);
    assert(capture.count("[error]") == 1);
    assert(capture.count("failed, transfer error") == 1);
}

static void test_partial_upload_is_not_rolled_back()
{
    auto fixture = make_fixture("partial_upload");
    fixture.record.failingUploads = { GLOBALS_REMOTE };
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(!runner.run(fixture.task, false, fixture.catalogue));
    assert((fixture.record.uploads == std::vector<std::string> { TYPES_REMOTE }));
    assert(fixture.record.closes == 1);
}

static void test_connection_failure()
{
    auto fixture = make_fixture("connection_failure");
    fixture.record.unreachableHosts = { "ftp.example.net" };
    auto runner = make_runner(fixture);
    const LogCapture capture;

    assert(!runner.run(fixture.task, false, fixture.catalogue));
    assert(fixture.record.connects == 1);
    assert(fixture.record.closes == 1);
    assert(fixture.record.uploads.empty());
    assert(fixture.record.downloads.empty());
    assert(capture.count("[error]") == 1);
    assert(capture.count("failed, connection error") == 1);
}

int main()
{
    test_dry_run_logs_without_connecting();
    test_forced_dry_run_overrides_the_task();
    test_missing_local_file_aborts_before_connecting();
    test_missing_file_fails_a_dry_run_too();
    test_unknown_profile();
    test_unknown_preset();
    test_empty_selection_is_a_hard_error();
    test_plan_orders_transfers_and_composes_paths();
    test_upload_uses_one_connection();
    test_backup_failure_is_not_fatal();
    test_backup_only_for_flagged_mappings();
    test_backup_directory_layout();
    test_upload_failure_aborts_remaining_mappings();
    test_partial_upload_is_not_rolled_back();
    test_connection_failure();

    std::cout << "All task runner tests passed!" << std::endl;
    return 0;
}
