//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "sample_printer.hpp"

#include "sdk_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace
{

using namespace zcli::cli;  // NOLINT This our main concern here in the unit tests.

using testing::HasSubstr;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

// MARK: - Tests:

TEST(TestSamplePrinter, print_line_strips_trailing_whitespace)
{
    std::ostringstream out;
    SamplePrinter      printer{out};

    printer.printLine("a: 1  \n");
    printer.printLine("  b: 2");
    printer.printLine("");

    EXPECT_THAT(out.str(), "a: 1\n  b: 2\n\n");
}

TEST(TestSamplePrinter, concurrent_lines_are_not_interleaved)
{
    std::ostringstream out;
    SamplePrinter      printer{out};

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
    {
        threads.emplace_back([&printer, i] {
            //
            for (int j = 0; j < 100; ++j)
            {
                printer.printLine(std::string(20, static_cast<char>('a' + i)));
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    std::istringstream in{out.str()};
    std::string        line;
    int                count = 0;
    while (std::getline(in, line))
    {
        ++count;
        ASSERT_THAT(line.size(), 20U);
        EXPECT_THAT(line, testing::Each(line.front()));
    }
    EXPECT_THAT(count, 400);
}

TEST(TestSamplePrinter, format_sample_line)
{
    EXPECT_THAT(formatSampleLine("{key}: {value}", "demo/a", "42"), VariantWith<std::string>("demo/a: 42"));
    EXPECT_THAT(formatSampleLine("{value}", "demo/a", "42"), VariantWith<std::string>("42"));
    EXPECT_THAT(formatSampleLine("[{key:>8}]", "k", "v"), VariantWith<std::string>("[       k]"));

    EXPECT_THAT(formatSampleLine("{unknown}", "k", "v"),
                VariantWith<FormatLine::Failure>(zcli::ErrorWith(EINVAL, HasSubstr("{unknown}"))));
    EXPECT_THAT(formatSampleLine("{key", "k", "v"), VariantWith<FormatLine::Failure>(zcli::ErrorWithCode(EINVAL)));
}

TEST(TestSamplePrinter, format_liveliness_line)
{
    const std::string ts{"2024-01-01T12:00:00Z"};

    EXPECT_THAT(formatLivelinessLine(cetl::nullopt, false, "group/a", "ALIVE", ts),
                VariantWith<std::string>("[ALIVE] group/a"));
    EXPECT_THAT(formatLivelinessLine(std::string{"{timestamp} {key} {status}"}, false, "group/a", "DROPPED", ts),
                VariantWith<std::string>("2024-01-01T12:00:00Z group/a DROPPED"));

    // JSON output ignores the line format.
    EXPECT_THAT(formatLivelinessLine(std::string{"{key}"}, true, "group/a", "ALIVE", ts),
                VariantWith<std::string>(R"({"key":"group/a","status":"ALIVE","timestamp":"2024-01-01T12:00:00Z"})"));

    EXPECT_THAT(formatLivelinessLine(std::string{"{value}"}, false, "group/a", "ALIVE", ts),
                VariantWith<FormatLine::Failure>(zcli::ErrorWithCode(EINVAL)));
}

TEST(TestSamplePrinter, utc_timestamp_now)
{
    const auto ts = utcTimestampNow();
    EXPECT_THAT(ts, testing::MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}Z"));
}

TEST(TestSamplePrinter, rstrip)
{
    EXPECT_THAT(rstrip("abc \t\r\n"), "abc");
    EXPECT_THAT(rstrip(" \n"), "");
    EXPECT_THAT(rstrip(" x"), " x");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
