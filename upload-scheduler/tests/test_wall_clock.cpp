/**
 * @file test_wall_clock.cpp
 * @brief Stamp formatting and weekday names
 */

// Standard Library Includes
#include <cassert>
#include <chrono>
#include <iostream>

// Project Includes
#include <automation/upload_scheduler/WallClock.hpp>

using namespace automation::upload_scheduler;
using namespace std::chrono;

static void test_stamp_minute_truncates_seconds()
{
    const auto now = make_local_time(2024y / March / 9d, 7, 5, 59);

    assert(format_stamp_minute(now) == "2024-03-09 07:05");
    assert(format_stamp_minute(now + seconds(1)) == "2024-03-09 07:06");
}

static void test_run_stamp()
{
    assert(format_run_stamp(make_local_time(2024y / December / 31d, 23, 59, 58))
           == "20241231_235958");
}

static void test_is_stamp_minute()
{
    assert(is_stamp_minute("2024-01-01 09:00"));
    assert(!is_stamp_minute(""));
    assert(!is_stamp_minute("2024-01-01T09:00"));
    assert(!is_stamp_minute("2024-01-01 9:00"));
    assert(!is_stamp_minute("2024-01-01 09:00:00"));
}

static void test_weekday_names()
{
    assert(weekday_name(Monday) == "Mon");
    assert(weekday_name(Sunday) == "Sun");
    assert(parse_weekday("Sat") == Saturday);
    assert(!parse_weekday("sat").has_value());
    assert(!parse_weekday("Saturday").has_value());

    const auto midnight = floor<days>(make_local_time(2024y / January / 1d, 0, 0));
    assert(weekday { midnight } == Monday);
}

int main()
{
    test_stamp_minute_truncates_seconds();
    test_run_stamp();
    test_is_stamp_minute();
    test_weekday_names();

    std::cout << "All wall clock tests passed!" << std::endl;
    return 0;
}
