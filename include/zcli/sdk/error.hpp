//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_ERROR_HPP_INCLUDED
#define ZCLI_SDK_ERROR_HPP_INCLUDED

#include <string>
#include <utility>

namespace zcli
{
namespace sdk
{

/// Describes a failure of an SDK operation.
///
/// The `code` is an `errno`-like value (f.e. `ENOENT` for unknown codec names or missing files,
/// `EINVAL` for malformed input, `EIO` for failures reported by the Zenoh session).
/// The `text` is a human-readable description, suitable for printing to the user.
///
struct Error final
{
    int         code;
    std::string text;

    Error(const int code_, std::string text_)
        : code{code_}
        , text{std::move(text_)}
    {
    }

};  // Error

}  // namespace sdk
}  // namespace zcli

#endif  // ZCLI_SDK_ERROR_HPP_INCLUDED
