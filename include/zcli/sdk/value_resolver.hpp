//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_VALUE_RESOLVER_HPP_INCLUDED
#define ZCLI_SDK_VALUE_RESOLVER_HPP_INCLUDED

#include "codec.hpp"
#include "error.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <unistd.h>
#include <utility>

namespace zcli
{
namespace sdk
{

/// Describes where the value of a command comes from.
///
/// Command line syntax:
/// - `-`       standard input (read to exhaustion);
/// - `@path`   content of the file at `path`;
/// - `@@text`  literal `@text` (escaped `@`);
/// - otherwise the text itself is the value.
///
class ValueSpec final
{
public:
    enum class Source
    {
        Literal,
        File,
        Stdin,
    };

    static ValueSpec parse(const std::string& text);

    static ValueSpec literal(std::string text)
    {
        return ValueSpec{Source::Literal, std::move(text)};
    }

    static ValueSpec file(std::string path)
    {
        return ValueSpec{Source::File, std::move(path)};
    }

    static ValueSpec stdinput()
    {
        return ValueSpec{Source::Stdin, {}};
    }

    Source source() const noexcept
    {
        return source_;
    }

    /// The literal value, or the file path (empty for the standard input).
    ///
    const std::string& text() const noexcept
    {
        return text_;
    }

private:
    ValueSpec(const Source source, std::string text)
        : source_{source}
        , text_{std::move(text)}
    {
    }

    Source      source_;
    std::string text_;

};  // ValueSpec

/// Translates values between the command line and the wire.
///
class ValueResolver final
{
public:
    struct ReadText final
    {
        using Success = std::string;
        using Failure = Error;  // `errno` of the failed I/O call
        using Result  = cetl::variant<Success, Failure>;
    };
    struct ToBytes final
    {
        using Success = Payload;
        using Failure = Error;  // I/O `errno`, or `EINVAL` when the encoder rejected the value
        using Result  = cetl::variant<Success, Failure>;
    };
    struct ToText final
    {
        using Success = std::string;
        using Failure = Error;  // `EINVAL` when the decoder rejected the payload
        using Result  = cetl::variant<Success, Failure>;
    };

    /// @param stdin_fd The file descriptor which stands for the standard input. Not owned.
    ///
    explicit ValueResolver(const int stdin_fd = STDIN_FILENO)
        : stdin_fd_{stdin_fd}
    {
    }

    /// Obtains the raw text of a value (reads the file or the standard input if needed).
    ///
    CETL_NODISCARD ReadText::Result readText(const ValueSpec& spec) const;

    /// Obtains the value, and encodes it with the given encoder.
    ///
    /// Nothing is produced on failure (no partially read or encoded value).
    ///
    CETL_NODISCARD ToBytes::Result toBytes(const std::string& key, const ValueSpec& spec, const Encoder& encoder) const;

    /// Encodes an already obtained value with the given encoder.
    ///
    CETL_NODISCARD ToBytes::Result encode(const std::string& key,
                                          const std::string& value,
                                          const Encoder&     encoder) const;

    /// Renders received bytes as a human-readable value with the given decoder.
    ///
    CETL_NODISCARD ToText::Result toText(const std::string& key, const Payload& payload, const Decoder& decoder) const;

private:
    int stdin_fd_;

};  // ValueResolver

}  // namespace sdk
}  // namespace zcli

#endif  // ZCLI_SDK_VALUE_RESOLVER_HPP_INCLUDED
