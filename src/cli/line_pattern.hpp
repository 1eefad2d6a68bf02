//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_CLI_LINE_PATTERN_HPP_INCLUDED
#define ZCLI_CLI_LINE_PATTERN_HPP_INCLUDED

#include <zcli/sdk/error.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <regex>
#include <string>
#include <utility>

namespace zcli
{
namespace cli
{

/// Matches input lines against a pattern like `{key}: {value}`.
///
/// Pattern is a literal text with `{name}` fields; `{{` and `}}` stand for literal braces.
/// Every field matches one or more characters (lazily), and the whole line must match.
/// Only `key` and `value` fields are captured, other fields are matched and ignored.
///
class LinePattern final
{
public:
    struct Match final
    {
        cetl::optional<std::string> key;
        cetl::optional<std::string> value;

    };  // Match

    struct Compile final
    {
        using Success = LinePattern;
        using Failure = sdk::Error;  // `EINVAL` for unbalanced braces
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static Compile::Result compile(const std::string& pattern);

    /// Matches a single line (a trailing `\n` or `\r\n` is ignored).
    ///
    cetl::optional<Match> match(std::string line) const;

    bool hasKey() const noexcept
    {
        return key_group_ > 0;
    }

    bool hasValue() const noexcept
    {
        return value_group_ > 0;
    }

private:
    LinePattern(std::regex regex, const std::size_t key_group, const std::size_t value_group)
        : regex_{std::move(regex)}
        , key_group_{key_group}
        , value_group_{value_group}
    {
    }

    std::regex  regex_;
    std::size_t key_group_;
    std::size_t value_group_;

};  // LinePattern

}  // namespace cli
}  // namespace zcli

#endif  // ZCLI_CLI_LINE_PATTERN_HPP_INCLUDED
