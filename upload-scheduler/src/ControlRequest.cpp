/**
 * @file ControlRequest.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/ControlRequest.hpp>

// Standard Library Includes
#include <array>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

// Third Party Library Includes
#include <spdlog/spdlog.h>

namespace automation::upload_scheduler
{
namespace
{
using namespace std::string_view_literals;

struct CommandEntry
{
    std::string_view verb;
    ControlCommand   command;
    bool             needsArgument;
};

constexpr std::array<CommandEntry, 6> COMMANDS = {
    CommandEntry {  "start"sv,  ControlCommand::START, false },
    CommandEntry {   "stop"sv,   ControlCommand::STOP, false },
    CommandEntry { "status"sv, ControlCommand::STATUS, false },
    CommandEntry { "reload"sv, ControlCommand::RELOAD, false },
    CommandEntry {    "run"sv,    ControlCommand::RUN,  true },
    CommandEntry {   "test"sv,   ControlCommand::TEST,  true },
};

auto trim(std::string_view text) -> std::string_view
{
    constexpr auto WHITESPACE = " \t\r\n"sv;

    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos)
    {
        return {};
    }

    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}
} // namespace

auto parse_control_request(std::string_view message)
    -> std::expected<ControlRequest, std::string>
{
    const auto request = trim(message);

    if (request.empty())
    {
        return std::unexpected(std::string("Empty request"));
    }

    const auto separator = request.find(' ');
    const auto verb      = request.substr(0, separator);
    const auto argument  = (separator == std::string_view::npos)
                             ? std::string_view {}
                             : trim(request.substr(separator + 1));

    for (const auto& entry : COMMANDS)
    {
        if (entry.verb != verb)
        {
            continue;
        }

        if (entry.needsArgument && argument.empty())
        {
            return std::unexpected(
                fmt::format("Request '{}' needs a name", verb)
            );
        }

        if (!entry.needsArgument && !argument.empty())
        {
            return std::unexpected(
                fmt::format("Request '{}' takes no arguments", verb)
            );
        }

        return ControlRequest { .command  = entry.command,
                                .argument = std::string(argument) };
    }

    return std::unexpected(fmt::format("Unknown request '{}'", verb));
}
} // namespace automation::upload_scheduler
