//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_COMMON_HELPERS_HPP_INCLUDED
#define ZCLI_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace zcli
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Same as `performWithoutThrowing`, but keeps the exception message for the caller (instead of logging it).
///
/// Used at the boundary with third-party (plugin) code, so anything thrown is caught;
/// exceptions not derived from the given type are reported as "unknown error".
///
/// @return Empty string on success, or the message of the caught exception.
///
template <typename Exception = std::exception, typename Action>
std::string performCatchingMessage(Action&& action) noexcept
{
    try
    {
        std::forward<Action>(action)();
        return {};

    } catch (const Exception& ex)
    {
        std::string msg = ex.what();
        return msg.empty() ? std::string{"unknown error"} : msg;

    } catch (...)
    {
        return "unknown error";
    }
}

/// Splits the text by the given separator. Empty parts are skipped.
///
inline std::vector<std::string> splitNonEmpty(const std::string& text, const char separator)
{
    std::vector<std::string> parts;
    std::string::size_type   begin = 0;
    while (begin <= text.size())
    {
        auto end = text.find(separator, begin);
        if (end == std::string::npos)
        {
            end = text.size();
        }
        if (end > begin)
        {
            parts.emplace_back(text.substr(begin, end - begin));
        }
        begin = end + 1;
    }
    return parts;
}

}  // namespace common
}  // namespace zcli

#endif  // ZCLI_COMMON_HELPERS_HPP_INCLUDED
