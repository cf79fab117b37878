/**
 * @file WallClock.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/WallClock.hpp>

// System Includes
#include <time.h>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

// Third Party Library Includes
#include <spdlog/spdlog.h>

namespace automation::upload_scheduler
{
namespace
{
using namespace std::string_view_literals;

// Indexed by std::chrono::weekday::c_encoding(), Sunday first
constexpr std::array<std::string_view, 7> DAY_NAMES
    = { "Sun"sv, "Mon"sv, "Tue"sv, "Wed"sv, "Thu"sv, "Fri"sv, "Sat"sv };

struct Broken
{
    std::chrono::year_month_day date;
    std::chrono::hh_mm_ss<std::chrono::seconds> time;
};

auto split(LocalTime now) -> Broken
{
    const auto midnight = std::chrono::floor<std::chrono::days>(now);

    return { std::chrono::year_month_day { midnight },
             std::chrono::hh_mm_ss<std::chrono::seconds> { now - midnight } };
}
} // namespace

auto current_local_time() -> LocalTime
{
    const std::time_t now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now()
    );

    std::tm local {};

    if (::localtime_r(&now, &local) == nullptr)
    {
        std::string errorMessage(BUFSIZ, '\0');

        throw std::runtime_error(
            fmt::format(
                "localtime_r() failed! OS Error: {}",
                // NOLINTNEXTLINE(*-include-cleaner)
                ::strerror_r(errno, errorMessage.data(), errorMessage.size())
            )
        );
    }

    return make_local_time(
        std::chrono::year { local.tm_year + 1900 }
            / std::chrono::month { static_cast<unsigned>(local.tm_mon + 1) }
            / std::chrono::day { static_cast<unsigned>(local.tm_mday) },
        local.tm_hour,
        local.tm_min,
        // tm_sec can be 60 on a leap second
        std::min(local.tm_sec, 59)
    );
}

auto make_local_time(
    const std::chrono::year_month_day& date,
    int                                hour,
    int                                minute,
    int                                second
) -> LocalTime
{
    return std::chrono::local_days { date } + std::chrono::hours { hour }
         + std::chrono::minutes { minute } + std::chrono::seconds { second };
}

auto format_stamp_minute(LocalTime now) -> std::string
{
    const auto [date, timeOfDay] = split(now);

    return fmt::format(
        "{:04}-{:02}-{:02} {:02}:{:02}",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()),
        timeOfDay.hours().count(),
        timeOfDay.minutes().count()
    );
}

auto format_run_stamp(LocalTime now) -> std::string
{
    const auto [date, timeOfDay] = split(now);

    return fmt::format(
        "{:04}{:02}{:02}_{:02}{:02}{:02}",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()),
        timeOfDay.hours().count(),
        timeOfDay.minutes().count(),
        timeOfDay.seconds().count()
    );
}

auto is_stamp_minute(std::string_view stamp) -> bool
{
    // YYYY-MM-DD HH:MM
    constexpr std::string_view SHAPE = "dddd-dd-dd dd:dd";

    if (stamp.size() != SHAPE.size())
    {
        return false;
    }

    for (std::size_t idx = 0; idx < SHAPE.size(); ++idx)
    {
        const bool digitExpected = SHAPE[idx] == 'd';
        const bool isDigit
            = std::isdigit(static_cast<unsigned char>(stamp[idx])) != 0;

        if (digitExpected != isDigit
            || (!digitExpected && stamp[idx] != SHAPE[idx]))
        {
            return false;
        }
    }

    return true;
}

auto weekday_name(std::chrono::weekday day) -> std::string_view
{
    return DAY_NAMES.at(day.c_encoding());
}

auto parse_weekday(std::string_view name) -> std::optional<std::chrono::weekday>
{
    for (unsigned idx = 0; idx < DAY_NAMES.size(); ++idx)
    {
        if (DAY_NAMES.at(idx) == name)
        {
            return std::chrono::weekday { idx };
        }
    }

    return std::nullopt;
}
} // namespace automation::upload_scheduler
