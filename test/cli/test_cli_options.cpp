//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_options.hpp"

#include "sdk_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace zcli::cli;  // NOLINT This our main concern here in the unit tests.

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::Optional;
using testing::Pair;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestCliOptions : public testing::Test
{
protected:
    static ParsedArgs parse(const std::vector<std::string>& args)
    {
        auto result = parseArgs(args);
        if (const auto* const failure = cetl::get_if<ParseArgs::Failure>(&result))
        {
            ADD_FAILURE() << "Unexpected parse failure: " << failure->text;
            return ParsedArgs{GlobalOptions{}, InfoOptions{}};
        }
        return cetl::get<ParsedArgs>(std::move(result));
    }

    template <typename Options>
    static Options parseCommand(const std::vector<std::string>& args)
    {
        const auto parsed = parse(args);
        EXPECT_TRUE(cetl::holds_alternative<Options>(parsed.command));
        if (const auto* const options = cetl::get_if<Options>(&parsed.command))
        {
            return *options;
        }
        return Options{};
    }

    static void expectUsageError(const std::vector<std::string>& args)
    {
        EXPECT_THAT(parseArgs(args), VariantWith<ParseArgs::Failure>(zcli::ErrorWithCode(EINVAL)))
            << testing::PrintToString(args);
    }
};

// MARK: - Tests:

TEST_F(TestCliOptions, global_defaults)
{
    const auto parsed = parse({"info"});

    EXPECT_FALSE(parsed.help);
    EXPECT_FALSE(parsed.version);
    EXPECT_TRUE(cetl::holds_alternative<InfoOptions>(parsed.command));

    EXPECT_THAT(parsed.global.mode, "peer");
    EXPECT_THAT(parsed.global.connect, IsEmpty());
    EXPECT_THAT(parsed.global.listen, IsEmpty());
    EXPECT_FALSE(parsed.global.config_file);
    EXPECT_THAT(parsed.global.cfg, IsEmpty());
    EXPECT_THAT(parsed.global.log_level, 30);
    EXPECT_FALSE(parsed.global.log_file);
    EXPECT_THAT(parsed.global.codec_plugins, IsEmpty());
}

TEST_F(TestCliOptions, global_options)
{
    const auto parsed = parse({"--mode",
                               "client",
                               "--connect",
                               "tcp/10.0.0.1:7447",
                               "--connect",
                               "tcp/10.0.0.2:7447",
                               "--listen",
                               "tcp/0.0.0.0:7448",
                               "--config",
                               "zenoh.json5",
                               "--cfg",
                               "scouting/multicast/enabled:false",
                               "--cfg",
                               "metadata:{\"name\":\"a:b\"}",
                               "--log-level",
                               "10",
                               "--log-file",
                               "/tmp/zenoh-cli.log",
                               "--codec-plugin",
                               "/opt/plugins",
                               "info"});

    EXPECT_THAT(parsed.global.mode, "client");
    EXPECT_THAT(parsed.global.connect, ElementsAre("tcp/10.0.0.1:7447", "tcp/10.0.0.2:7447"));
    EXPECT_THAT(parsed.global.listen, ElementsAre("tcp/0.0.0.0:7448"));
    EXPECT_THAT(parsed.global.config_file, Optional(std::string{"zenoh.json5"}));
    EXPECT_THAT(parsed.global.cfg,
                ElementsAre(Pair("scouting/multicast/enabled", "false"), Pair("metadata", "{\"name\":\"a:b\"}")));
    EXPECT_THAT(parsed.global.log_level, 10);
    EXPECT_THAT(parsed.global.log_file, Optional(std::string{"/tmp/zenoh-cli.log"}));
    EXPECT_THAT(parsed.global.codec_plugins, ElementsAre("/opt/plugins"));
}

TEST_F(TestCliOptions, help_and_version)
{
    EXPECT_TRUE(parse({"--help"}).help);
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_TRUE(parse({"put", "--help"}).help);
    EXPECT_TRUE(parse({"--version"}).version);
}

TEST_F(TestCliOptions, usage_errors)
{
    expectUsageError({});
    expectUsageError({"frobnicate"});
    expectUsageError({"--mode", "satellite", "info"});
    expectUsageError({"--cfg", "no-colon", "info"});
    expectUsageError({"--log-level", "loud", "info"});
    expectUsageError({"info", "--bogus"});
    expectUsageError({"delete"});
    expectUsageError({"subscribe"});
    expectUsageError({"get"});
    expectUsageError({"get", "-s", "demo/**", "--timeout", "-1"});
    expectUsageError({"scout", "-t", "-0.5"});
    expectUsageError({"liveliness"});
    expectUsageError({"liveliness", "watch", "-k", "a"});
    expectUsageError({"liveliness", "get"});
    expectUsageError({"liveliness", "token"});
}

TEST_F(TestCliOptions, scout)
{
    const auto defaults = parseCommand<ScoutOptions>({"scout"});
    EXPECT_THAT(defaults.what, "peer|router");
    EXPECT_THAT(defaults.timeout_s, 1.0);

    const auto opts = parseCommand<ScoutOptions>({"scout", "-w", "router", "-t", "0.5"});
    EXPECT_THAT(opts.what, "router");
    EXPECT_THAT(opts.timeout_s, 0.5);
}

TEST_F(TestCliOptions, delete_keys)
{
    const auto opts = parseCommand<DeleteOptions>({"delete", "-k", "demo/a", "--key", "demo/b"});
    EXPECT_THAT(opts.keys, ElementsAre("demo/a", "demo/b"));
}

TEST_F(TestCliOptions, put)
{
    const auto opts = parseCommand<PutOptions>({"--mode", "client", "put", "-k", "demo/a", "-v", "hello world"});
    EXPECT_THAT(opts.key, Optional(std::string{"demo/a"}));
    EXPECT_THAT(opts.value, Optional(std::string{"hello world"}));
    EXPECT_FALSE(opts.line);
    EXPECT_THAT(opts.encoder, "text");
    EXPECT_FALSE(opts.liveliness.requested);

    const auto from_stdin = parseCommand<PutOptions>({"put", "-k", "demo/a", "-v", "-", "--encoder", "json"});
    EXPECT_THAT(from_stdin.value, Optional(std::string{"-"}));
    EXPECT_THAT(from_stdin.encoder, "json");

    const auto lines = parseCommand<PutOptions>({"put", "--line", "{key}: {value}"});
    EXPECT_FALSE(lines.key);
    EXPECT_FALSE(lines.value);
    EXPECT_THAT(lines.line, Optional(std::string{"{key}: {value}"}));
}

TEST_F(TestCliOptions, put_liveliness)
{
    const auto bare = parseCommand<PutOptions>({"put", "-k", "demo/a", "-v", "1", "--liveliness"});
    EXPECT_TRUE(bare.liveliness.requested);
    EXPECT_THAT(bare.liveliness.key, "");

    const auto bare_in_middle = parseCommand<PutOptions>({"put", "-k", "demo/a", "--liveliness", "-v", "1"});
    EXPECT_TRUE(bare_in_middle.liveliness.requested);
    EXPECT_THAT(bare_in_middle.liveliness.key, "");
    EXPECT_THAT(bare_in_middle.value, Optional(std::string{"1"}));

    const auto with_key = parseCommand<PutOptions>({"put", "--liveliness", "group/me", "-k", "demo/a", "-v", "1"});
    EXPECT_TRUE(with_key.liveliness.requested);
    EXPECT_THAT(with_key.liveliness.key, "group/me");
    EXPECT_THAT(with_key.key, Optional(std::string{"demo/a"}));

    const auto with_eq = parseCommand<PutOptions>({"put", "--liveliness=group/me", "-k", "demo/a", "-v", "1"});
    EXPECT_THAT(with_eq.liveliness.key, "group/me");
}

TEST_F(TestCliOptions, subscribe)
{
    const auto defaults = parseCommand<SubscribeOptions>({"subscribe", "-k", "demo/**"});
    EXPECT_THAT(defaults.keys, ElementsAre("demo/**"));
    EXPECT_THAT(defaults.line, "{value}");
    EXPECT_THAT(defaults.decoder, "base64");
    EXPECT_FALSE(defaults.liveliness.requested);

    const auto opts = parseCommand<SubscribeOptions>({"subscribe",
                                                      "-k",
                                                      "demo/a",
                                                      "-k",
                                                      "demo/b",
                                                      "--line",
                                                      "{key}: {value}",
                                                      "--decoder",
                                                      "text",
                                                      "--liveliness",
                                                      "group/sub"});
    EXPECT_THAT(opts.keys, ElementsAre("demo/a", "demo/b"));
    EXPECT_THAT(opts.line, "{key}: {value}");
    EXPECT_THAT(opts.decoder, "text");
    EXPECT_TRUE(opts.liveliness.requested);
    EXPECT_THAT(opts.liveliness.key, "group/sub");
}

TEST_F(TestCliOptions, get)
{
    const auto defaults = parseCommand<GetOptions>({"get", "-s", "demo/**"});
    EXPECT_THAT(defaults.selector, "demo/**");
    EXPECT_FALSE(defaults.value);
    EXPECT_THAT(defaults.line, "{value}");
    EXPECT_THAT(defaults.encoder, "text");
    EXPECT_THAT(defaults.decoder, "base64");
    EXPECT_THAT(defaults.timeout_s, 10.0);

    const auto opts = parseCommand<GetOptions>({"get",
                                                "--selector",
                                                "demo/**?arg=1",
                                                "-v",
                                                "@query.json",
                                                "--encoder",
                                                "json",
                                                "--decoder",
                                                "json",
                                                "--timeout",
                                                "2.5",
                                                "--line",
                                                "{key} -> {value}"});
    EXPECT_THAT(opts.selector, "demo/**?arg=1");
    EXPECT_THAT(opts.value, Optional(std::string{"@query.json"}));
    EXPECT_THAT(opts.encoder, "json");
    EXPECT_THAT(opts.decoder, "json");
    EXPECT_THAT(opts.timeout_s, 2.5);
    EXPECT_THAT(opts.line, "{key} -> {value}");
}

TEST_F(TestCliOptions, liveliness)
{
    const auto get = parseCommand<LivelinessGetOptions>({"liveliness", "get", "-k", "group/**", "--json", "-t", "3"});
    EXPECT_THAT(get.key, "group/**");
    EXPECT_TRUE(get.json);
    EXPECT_FALSE(get.line);
    EXPECT_THAT(get.timeout_s, 3.0);

    const auto sub = parseCommand<LivelinessSubscribeOptions>(
        {"liveliness", "sub", "-k", "group/**", "--history", "--line", "{timestamp} {status} {key}"});
    EXPECT_THAT(sub.key, "group/**");
    EXPECT_TRUE(sub.history);
    EXPECT_FALSE(sub.json);
    EXPECT_THAT(sub.line, Optional(std::string{"{timestamp} {status} {key}"}));

    const auto sub_long = parseCommand<LivelinessSubscribeOptions>({"liveliness", "subscribe", "-k", "group/**"});
    EXPECT_FALSE(sub_long.history);

    const auto token = parseCommand<LivelinessTokenOptions>({"liveliness", "token", "-k", "group/me"});
    EXPECT_THAT(token.key, "group/me");
}

TEST_F(TestCliOptions, network)
{
    const auto defaults = parseCommand<NetworkOptions>({"network"});
    EXPECT_THAT(defaults.metadata_field, "/name");
    EXPECT_FALSE(defaults.save_fig);
    EXPECT_FALSE(defaults.dot);
    EXPECT_THAT(defaults.scout_timeout_s, 1.0);

    const auto opts = parseCommand<NetworkOptions>(
        {"network", "--metadata-field", "/site/name", "--save-fig", "--scout-timeout", "2"});
    EXPECT_THAT(opts.metadata_field, "/site/name");
    EXPECT_TRUE(opts.save_fig);
    EXPECT_THAT(opts.scout_timeout_s, 2.0);

    EXPECT_TRUE(parseCommand<NetworkOptions>({"network", "--dot"}).dot);
}

TEST_F(TestCliOptions, usage_text_lists_codecs)
{
    const auto text = usageText({"base64", "hex", "text"}, {"base64", "text"});

    EXPECT_THAT(text, HasSubstr("Usage: zenoh-cli"));
    EXPECT_THAT(text, HasSubstr("--log-level"));
    EXPECT_THAT(text, HasSubstr("--liveliness"));
    EXPECT_THAT(text, HasSubstr("Encoders: base64, hex, text\n"));
    EXPECT_THAT(text, HasSubstr("Decoders: base64, text\n"));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
