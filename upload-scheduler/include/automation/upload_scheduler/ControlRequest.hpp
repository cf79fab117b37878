/**
 * @file ControlRequest.hpp
 * @brief Requests accepted on the control socket
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace automation::upload_scheduler
{
enum class ControlCommand : std::uint8_t
{
    START,
    STOP,
    STATUS,
    RUN,
    TEST,
    RELOAD,
};

struct ControlRequest
{
    ControlCommand command;
    // Task name for RUN, profile name for TEST, empty otherwise
    std::string    argument;
};

/**
 * @brief Parses "start", "stop", "status", "reload", "run <task>" and
 * "test <profile>"
 *
 * Names may contain spaces; everything after the first space is the
 * argument.
 *
 * @return The request, or a message describing why it was rejected
 */
[[nodiscard]]
auto parse_control_request(std::string_view message)
    -> std::expected<ControlRequest, std::string>;
} // namespace automation::upload_scheduler
