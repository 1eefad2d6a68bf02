//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "sample_printer.hpp"

#include <zcli/sdk/error.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace zcli
{
namespace cli
{

void SamplePrinter::printLine(const std::string& line)
{
    const std::lock_guard<std::mutex> lock{mutex_};
    out_ << rstrip(line) << '\n';
    out_.flush();
}

FormatLine::Result formatSampleLine(const std::string& format, const std::string& key, const std::string& value)
{
    try
    {
        return fmt::format(fmt::runtime(format), fmt::arg("key", key), fmt::arg("value", value));

    } catch (const fmt::format_error& ex)
    {
        return sdk::Error{EINVAL, "Invalid line format '" + format + "': " + ex.what()};
    }
}

FormatLine::Result formatLivelinessLine(const cetl::optional<std::string>& format,
                                        const bool                         json,
                                        const std::string&                 key,
                                        const std::string&                 status,
                                        const std::string&                 timestamp)
{
    if (json)
    {
        const nlohmann::ordered_json object{{"key", key}, {"status", status}, {"timestamp", timestamp}};
        return object.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }

    const std::string& fmt_str = format ? *format : std::string{"[{status}] {key}"};
    try
    {
        return fmt::format(fmt::runtime(fmt_str),
                           fmt::arg("key", key),
                           fmt::arg("status", status),
                           fmt::arg("timestamp", timestamp));

    } catch (const fmt::format_error& ex)
    {
        return sdk::Error{EINVAL, "Invalid line format '" + fmt_str + "': " + ex.what()};
    }
}

std::string utcTimestampNow()
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm    utc{};
    ::gmtime_r(&now, &utc);

    std::array<char, sizeof("YYYY-MM-DDTHH:MM:SSZ")> buffer{};
    const auto len = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer.data(), len);
}

std::string rstrip(std::string text)
{
    while (!text.empty() && (std::isspace(static_cast<unsigned char>(text.back())) != 0))
    {
        text.pop_back();
    }
    return text;
}

}  // namespace cli
}  // namespace zcli
