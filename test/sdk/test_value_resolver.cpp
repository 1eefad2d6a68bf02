//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <zcli/sdk/value_resolver.hpp>

#include "sdk_gtest_helpers.hpp"

#include <zcli/sdk/codec.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace
{

using namespace zcli::sdk;  // NOLINT This our main concern here in the unit tests.

using testing::HasSubstr;
using testing::MockFunction;
using testing::Return;
using testing::StrictMock;
using testing::VariantWith;
using testing::_;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestValueResolver : public testing::Test
{
protected:
    void SetUp() override
    {
        registerBuiltinCodecs(registry_);
    }

    void TearDown() override
    {
        for (const auto& path : temp_files_)
        {
            ::unlink(path.c_str());
        }
        for (const int fd : pipe_fds_)
        {
            ::close(fd);
        }
    }

    std::string makeTempFile(const std::string& content)
    {
        std::string path_template{"/tmp/zcli_value_XXXXXX"};
        const int   fd = ::mkstemp(&path_template[0]);
        EXPECT_THAT(fd, testing::Ge(0));
        EXPECT_THAT(::write(fd, content.data(), content.size()), static_cast<ssize_t>(content.size()));
        ::close(fd);
        temp_files_.push_back(path_template);
        return path_template;
    }

    /// Makes a pipe with the given content already written (and the write end closed).
    ///
    int makeStdinPipe(const std::string& content)
    {
        std::array<int, 2> fds{};
        EXPECT_THAT(::pipe(fds.data()), 0);
        EXPECT_THAT(::write(fds[1], content.data(), content.size()), static_cast<ssize_t>(content.size()));
        ::close(fds[1]);
        pipe_fds_.push_back(fds[0]);
        return fds[0];
    }

    Encoder encoder(const std::string& name) const
    {
        return cetl::get<Encoder>(registry_.resolveEncoder(name));
    }

    Decoder decoder(const std::string& name) const
    {
        return cetl::get<Decoder>(registry_.resolveDecoder(name));
    }

    static Payload bytes(const std::string& text)
    {
        return Payload(text.begin(), text.end());
    }

    // MARK: Data members:

    // NOLINTBEGIN
    CodecRegistry            registry_;
    std::vector<std::string> temp_files_;
    std::vector<int>         pipe_fds_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestValueResolver, parse_value_spec)
{
    const auto literal = ValueSpec::parse("hello");
    EXPECT_THAT(literal.source(), ValueSpec::Source::Literal);
    EXPECT_THAT(literal.text(), "hello");

    const auto file = ValueSpec::parse("@/tmp/data.json");
    EXPECT_THAT(file.source(), ValueSpec::Source::File);
    EXPECT_THAT(file.text(), "/tmp/data.json");

    const auto std_in = ValueSpec::parse("-");
    EXPECT_THAT(std_in.source(), ValueSpec::Source::Stdin);

    const auto escaped = ValueSpec::parse("@@home");
    EXPECT_THAT(escaped.source(), ValueSpec::Source::Literal);
    EXPECT_THAT(escaped.text(), "@home");

    EXPECT_THAT(ValueSpec::parse("").source(), ValueSpec::Source::Literal);
    EXPECT_THAT(ValueSpec::parse("--").source(), ValueSpec::Source::Literal);
}

TEST_F(TestValueResolver, to_bytes_literal)
{
    const ValueResolver resolver;

    EXPECT_THAT(resolver.toBytes("k", ValueSpec::literal("hi"), encoder("text")),
                VariantWith<ValueResolver::ToBytes::Success>(bytes("hi")));
    EXPECT_THAT(resolver.toBytes("k", ValueSpec::literal("aGk="), encoder("base64")),
                VariantWith<ValueResolver::ToBytes::Success>(bytes("hi")));
}

TEST_F(TestValueResolver, to_bytes_passes_key_to_encoder)
{
    const ValueResolver resolver;

    StrictMock<MockFunction<Payload(const std::string&, const std::string&)>> encoder_mock;
    EXPECT_CALL(encoder_mock, Call("some/key", "value")).WillOnce(Return(bytes("encoded")));

    EXPECT_THAT(resolver.toBytes("some/key", ValueSpec::literal("value"), encoder_mock.AsStdFunction()),
                VariantWith<ValueResolver::ToBytes::Success>(bytes("encoded")));
}

TEST_F(TestValueResolver, to_bytes_file)
{
    const ValueResolver resolver;

    const auto path = makeTempFile(R"({"temperature": 21.5})");
    EXPECT_THAT(resolver.toBytes("k", ValueSpec::file(path), encoder("json")),
                VariantWith<ValueResolver::ToBytes::Success>(bytes(R"({"temperature": 21.5})")));
}

TEST_F(TestValueResolver, to_bytes_base64_with_trailing_newline)
{
    const auto path = makeTempFile("SGVsbG8=\n");

    const ValueResolver file_resolver;
    EXPECT_THAT(file_resolver.toBytes("k", ValueSpec::parse("@" + path), encoder("base64")),
                VariantWith<ValueResolver::ToBytes::Success>(bytes("Hello")));

    // Like `echo SGVsbG8= | zenoh-cli put -k k -v - --encoder base64`.
    const ValueResolver stdin_resolver{makeStdinPipe("SGVsbG8=\n")};
    EXPECT_THAT(stdin_resolver.toBytes("k", ValueSpec::stdinput(), encoder("base64")),
                VariantWith<ValueResolver::ToBytes::Success>(bytes("Hello")));
}

TEST_F(TestValueResolver, to_bytes_missing_file)
{
    const ValueResolver resolver;

    StrictMock<MockFunction<Payload(const std::string&, const std::string&)>> encoder_mock;

    // The encoder is never called, so there is no partial output.
    EXPECT_THAT(resolver.toBytes("k", ValueSpec::file("/no/such/dir/value.txt"), encoder_mock.AsStdFunction()),
                VariantWith<ValueResolver::ToBytes::Failure>(zcli::ErrorWith(ENOENT, HasSubstr("value.txt"))));
}

TEST_F(TestValueResolver, to_bytes_stdin)
{
    const ValueResolver resolver{makeStdinPipe("line 1\nline 2\n")};

    EXPECT_THAT(resolver.toBytes("k", ValueSpec::stdinput(), encoder("text")),
                VariantWith<ValueResolver::ToBytes::Success>(bytes("line 1\nline 2\n")));
}

TEST_F(TestValueResolver, to_bytes_unreadable_stdin)
{
    const ValueResolver resolver{-1};

    EXPECT_THAT(resolver.toBytes("k", ValueSpec::stdinput(), encoder("text")),
                VariantWith<ValueResolver::ToBytes::Failure>(zcli::ErrorWithCode(EBADF)));
}

TEST_F(TestValueResolver, to_bytes_malformed_value)
{
    const ValueResolver resolver;

    EXPECT_THAT(resolver.toBytes("k", ValueSpec::literal("{oops"), encoder("json")),
                VariantWith<ValueResolver::ToBytes::Failure>(zcli::ErrorWith(EINVAL, HasSubstr("Invalid JSON"))));

    StrictMock<MockFunction<Payload(const std::string&, const std::string&)>> encoder_mock;
    EXPECT_CALL(encoder_mock, Call(_, _)).WillOnce(testing::Throw(std::runtime_error("")));
    EXPECT_THAT(resolver.encode("k", "v", encoder_mock.AsStdFunction()),
                VariantWith<ValueResolver::ToBytes::Failure>(zcli::ErrorWithCode(EINVAL)));

    // Plugin codecs may throw anything, not only standard exceptions.
    StrictMock<MockFunction<Payload(const std::string&, const std::string&)>> odd_encoder_mock;
    EXPECT_CALL(odd_encoder_mock, Call(_, _)).WillOnce(testing::Throw(42));
    EXPECT_THAT(resolver.encode("k", "v", odd_encoder_mock.AsStdFunction()),
                VariantWith<ValueResolver::ToBytes::Failure>(zcli::ErrorWith(EINVAL, "unknown error")));

    StrictMock<MockFunction<std::string(const std::string&, const Payload&)>> odd_decoder_mock;
    EXPECT_CALL(odd_decoder_mock, Call(_, _)).WillOnce(testing::Throw(std::string{"oops"}));
    EXPECT_THAT(resolver.toText("k", bytes("v"), odd_decoder_mock.AsStdFunction()),
                VariantWith<ValueResolver::ToText::Failure>(zcli::ErrorWith(EINVAL, "unknown error")));
}

TEST_F(TestValueResolver, to_text)
{
    const ValueResolver resolver;

    EXPECT_THAT(resolver.toText("k", bytes("hi"), decoder("text")), VariantWith<ValueResolver::ToText::Success>("hi"));
    EXPECT_THAT(resolver.toText("k", bytes("hi"), decoder("base64")),
                VariantWith<ValueResolver::ToText::Success>("aGk="));
    EXPECT_THAT(resolver.toText("k", bytes("[1,"), decoder("json")),
                VariantWith<ValueResolver::ToText::Failure>(zcli::ErrorWithCode(EINVAL)));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
