//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <zcli/sdk/value_resolver.hpp>

#include "common_helpers.hpp"
#include "io/io.hpp"
#include "logging.hpp"

#include <zcli/sdk/codec.hpp>
#include <zcli/sdk/error.hpp>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace zcli
{
namespace sdk
{
namespace
{

std::string describeErrno(const int err)
{
    return std::strerror(err);  // NOLINT(concurrency-mt-unsafe)
}

}  // namespace

ValueSpec ValueSpec::parse(const std::string& text)
{
    if (text == "-")
    {
        return stdinput();
    }
    if (!text.empty() && (text.front() == '@'))
    {
        if ((text.size() > 1) && (text[1] == '@'))
        {
            return literal(text.substr(1));
        }
        return file(text.substr(1));
    }
    return literal(text);
}

ValueResolver::ReadText::Result ValueResolver::readText(const ValueSpec& spec) const
{
    switch (spec.source())
    {
    case ValueSpec::Source::Literal:
        return spec.text();

    case ValueSpec::Source::Stdin: {
        auto read_result = common::io::readAll(stdin_fd_);
        if (const auto* const err = cetl::get_if<common::io::ReadAll::Failure>(&read_result))
        {
            return Error{*err, "Failed to read standard input: " + describeErrno(*err) + "."};
        }
        return cetl::get<std::string>(std::move(read_result));
    }

    case ValueSpec::Source::File: {
        auto open_result = common::io::openForReading(spec.text());
        if (const auto* const err = cetl::get_if<common::io::OpenForReading::Failure>(&open_result))
        {
            return Error{*err, "Failed to open '" + spec.text() + "': " + describeErrno(*err) + "."};
        }
        const auto fd          = cetl::get<common::io::OwnFd>(std::move(open_result));
        auto       read_result = common::io::readAll(static_cast<int>(fd));
        if (const auto* const err = cetl::get_if<common::io::ReadAll::Failure>(&read_result))
        {
            return Error{*err, "Failed to read '" + spec.text() + "': " + describeErrno(*err) + "."};
        }
        return cetl::get<std::string>(std::move(read_result));
    }
    }
    return Error{EINVAL, "Unknown value source."};
}

ValueResolver::ToBytes::Result ValueResolver::toBytes(const std::string& key,
                                                      const ValueSpec&   spec,
                                                      const Encoder&     encoder) const
{
    auto text_result = readText(spec);
    if (auto* const failure = cetl::get_if<ReadText::Failure>(&text_result))
    {
        return std::move(*failure);
    }
    return encode(key, cetl::get<std::string>(text_result), encoder);
}

ValueResolver::ToBytes::Result ValueResolver::encode(const std::string& key,
                                                     const std::string& value,
                                                     const Encoder&     encoder) const
{
    Payload    payload;
    const auto err_msg = common::performCatchingMessage([&] {
        //
        payload = encoder(key, value);
    });
    if (!err_msg.empty())
    {
        common::getLogger("codec")->debug("Encoder failed for key '{}': {}", key, err_msg);
        return Error{EINVAL, err_msg};
    }
    return payload;
}

ValueResolver::ToText::Result ValueResolver::toText(const std::string& key,
                                                    const Payload&     payload,
                                                    const Decoder&     decoder) const
{
    std::string text;
    const auto  err_msg = common::performCatchingMessage([&] {
        //
        text = decoder(key, payload);
    });
    if (!err_msg.empty())
    {
        common::getLogger("codec")->debug("Decoder failed for key '{}': {}", key, err_msg);
        return Error{EINVAL, err_msg};
    }
    return text;
}

}  // namespace sdk
}  // namespace zcli
