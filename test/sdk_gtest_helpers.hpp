//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_GTEST_HELPERS_HPP_INCLUDED
#define ZCLI_SDK_GTEST_HELPERS_HPP_INCLUDED

#include <zcli/sdk/error.hpp>
#include <zcli/sdk/session.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <ostream>
#include <string>

// MARK: - GTest Printers:

namespace zcli
{
namespace sdk
{

inline void PrintTo(const Error& error, std::ostream* os)
{
    *os << "Error{code=" << error.code << ", text='" << error.text << "'}";
}

inline void PrintTo(const Sample& sample, std::ostream* os)
{
    *os << "Sample{key='" << sample.key << "', size=" << sample.payload.size()
        << ", kind=" << ((sample.kind == Sample::Kind::Put) ? "Put" : "Delete") << "}";
}

}  // namespace sdk
}  // namespace zcli

// MARK: - GTest Matchers:

namespace zcli
{

MATCHER_P(ErrorWithCode, code, "")
{
    return arg.code == code;
}

MATCHER_P2(ErrorWith, code, text_matcher, "")
{
    return (arg.code == code) && testing::Matches(text_matcher)(arg.text);
}

}  // namespace zcli

#endif  // ZCLI_SDK_GTEST_HELPERS_HPP_INCLUDED
