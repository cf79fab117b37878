/**
 * @file Errors.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/Errors.hpp>

// Standard Library Includes
#include <string_view>

namespace automation::upload_scheduler
{
auto to_string(ErrorKind kind) -> std::string_view
{
    using namespace std::string_view_literals;

    switch (kind)
    {
    case ErrorKind::CONFIGURATION:
        return "configuration error"sv;
    case ErrorKind::PRECONDITION:
        return "precondition failed"sv;
    case ErrorKind::CONNECTION:
        return "connection error"sv;
    case ErrorKind::TRANSFER:
        return "transfer error"sv;
    }

    return "unknown error"sv;
}
} // namespace automation::upload_scheduler
