//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_CLI_SAMPLE_PRINTER_HPP_INCLUDED
#define ZCLI_CLI_SAMPLE_PRINTER_HPP_INCLUDED

#include <zcli/sdk/error.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <mutex>
#include <ostream>
#include <string>

namespace zcli
{
namespace cli
{

/// Writes data lines to the output stream.
///
/// Lines may come from the Zenoh threads (subscriber callbacks), so writes are serialized.
///
class SamplePrinter final
{
public:
    explicit SamplePrinter(std::ostream& out)
        : out_{out}
    {
    }

    /// Prints the line with trailing whitespace stripped, followed by a newline; flushes the stream.
    ///
    void printLine(const std::string& line);

private:
    std::mutex    mutex_;
    std::ostream& out_;

};  // SamplePrinter

struct FormatLine final
{
    using Success = std::string;
    using Failure = sdk::Error;  // `EINVAL` for invalid format strings (or unknown fields)
    using Result  = cetl::variant<Success, Failure>;
};

/// Renders a sample line, f.e. `{key}: {value}`.
///
CETL_NODISCARD FormatLine::Result formatSampleLine(const std::string& format,
                                                   const std::string& key,
                                                   const std::string& value);

/// Renders a liveliness line.
///
/// With `json` a single line object `{"key":...,"status":...,"timestamp":...}` is made;
/// otherwise the `format` (default `[{status}] {key}`) with `{key}`, `{status}` and `{timestamp}` fields.
///
CETL_NODISCARD FormatLine::Result formatLivelinessLine(const cetl::optional<std::string>& format,
                                                       const bool                         json,
                                                       const std::string&                 key,
                                                       const std::string&                 status,
                                                       const std::string&                 timestamp);

/// Current UTC time in ISO 8601 (`2024-01-01T12:00:00Z`).
///
std::string utcTimestampNow();

/// Removes trailing whitespace.
///
std::string rstrip(std::string text);

}  // namespace cli
}  // namespace zcli

#endif  // ZCLI_CLI_SAMPLE_PRINTER_HPP_INCLUDED
