/**
 * @file Errors.hpp
 * @brief Failure types shared by the scheduling core and the transport layer
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace automation::upload_scheduler
{
struct configuration_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct connection_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct transfer_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

enum class ErrorKind : std::uint8_t
{
    CONFIGURATION,
    PRECONDITION,
    CONNECTION,
    TRANSFER,
};

struct TaskError
{
    ErrorKind   kind;
    std::string message;
};

[[nodiscard]]
auto to_string(ErrorKind kind) -> std::string_view;
} // namespace automation::upload_scheduler
