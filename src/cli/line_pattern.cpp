//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "line_pattern.hpp"

#include <zcli/sdk/error.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <regex>
#include <string>
#include <utility>

namespace zcli
{
namespace cli
{
namespace
{

void appendEscaped(std::string& regex_text, const char ch)
{
    if (std::strchr("\\^$.|?*+()[]{}", ch) != nullptr)
    {
        regex_text += '\\';
    }
    regex_text += ch;
}

}  // namespace

LinePattern::Compile::Result LinePattern::compile(const std::string& pattern)
{
    std::string regex_text{"^"};
    std::size_t group       = 0;
    std::size_t key_group   = 0;
    std::size_t value_group = 0;

    for (std::size_t i = 0; i < pattern.size(); ++i)
    {
        const char ch = pattern[i];
        if (ch == '{')
        {
            if (((i + 1) < pattern.size()) && (pattern[i + 1] == '{'))
            {
                appendEscaped(regex_text, '{');
                ++i;
                continue;
            }
            const auto close = pattern.find('}', i + 1);
            if (close == std::string::npos)
            {
                return sdk::Error{EINVAL, "Unbalanced '{' at position " + std::to_string(i) + " of the line pattern."};
            }

            // Format spec (after `:`) is accepted, but does not change the matching.
            auto name = pattern.substr(i + 1, close - i - 1);
            name      = name.substr(0, name.find(':'));

            ++group;
            regex_text += "(.+?)";
            if ((name == "key") && (key_group == 0))
            {
                key_group = group;
            }
            else if ((name == "value") && (value_group == 0))
            {
                value_group = group;
            }
            i = close;
            continue;
        }
        if (ch == '}')
        {
            if (((i + 1) < pattern.size()) && (pattern[i + 1] == '}'))
            {
                appendEscaped(regex_text, '}');
                ++i;
                continue;
            }
            return sdk::Error{EINVAL, "Unbalanced '}' at position " + std::to_string(i) + " of the line pattern."};
        }
        appendEscaped(regex_text, ch);
    }
    regex_text += '$';

    return LinePattern{std::regex{regex_text, std::regex::ECMAScript}, key_group, value_group};
}

cetl::optional<LinePattern::Match> LinePattern::match(std::string line) const
{
    if (!line.empty() && (line.back() == '\n'))
    {
        line.pop_back();
    }
    if (!line.empty() && (line.back() == '\r'))
    {
        line.pop_back();
    }

    std::smatch results;
    if (!std::regex_match(line, results, regex_))
    {
        return cetl::nullopt;
    }

    Match match;
    if (key_group_ > 0)
    {
        match.key = results[key_group_].str();
    }
    if (value_group_ > 0)
    {
        match.value = results[value_group_].str();
    }
    return match;
}

}  // namespace cli
}  // namespace zcli
