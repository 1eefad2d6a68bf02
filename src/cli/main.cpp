//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_options.hpp"
#include "commands.hpp"
#include "sample_printer.hpp"
#include "setup_logging.hpp"

#include <zcli/sdk/codec.hpp>
#include <zcli/sdk/codec_plugin.hpp>
#include <zcli/sdk/session.hpp>
#include <zcli/sdk/value_resolver.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>
#include <utility>
#include <vector>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

void loadCodecPlugins(zcli::sdk::CodecPlugins& plugins,
                      zcli::sdk::CodecRegistry& registry,
                      const std::vector<std::string>& cli_paths)
{
    if (const auto* const env_path = std::getenv(ZCLI_CODEC_PLUGIN_PATH_ENV))
    {
        plugins.loadSearchPath(env_path, registry);
    }
    for (const auto& path : cli_paths)
    {
        plugins.loadSearchPath(path, registry);
    }
    spdlog::debug("Codec plugins loaded (libraries={}).", plugins.loadedCount());
}

zcli::sdk::Session::Config makeSessionConfig(const zcli::cli::GlobalOptions& global)
{
    zcli::sdk::Session::Config config;
    config.file              = global.config_file;
    config.mode              = global.mode;
    config.connect_endpoints = global.connect;
    config.listen_endpoints  = global.listen;
    config.options           = global.cfg;
    return config;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using zcli::cli::ExitUsage;
    using Session = zcli::sdk::Session;

    setupSignalHandlers();

    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const std::vector<std::string> args(argv + 1, argv + argc);

    auto parse_result = zcli::cli::parseArgs(args);
    if (const auto* const failure = cetl::get_if<zcli::cli::ParseArgs::Failure>(&parse_result))
    {
        std::cerr << "zenoh-cli: error: " << failure->text << "\nTry 'zenoh-cli --help' for more information.\n";
        return ExitUsage;
    }
    const auto parsed = cetl::get<zcli::cli::ParsedArgs>(std::move(parse_result));
    if (parsed.version)
    {
        std::cout << "zenoh-cli " << VERSION_MAJOR << '.' << VERSION_MINOR << '\n';
        return EXIT_SUCCESS;
    }

    setupLogging(parsed.global.log_level, parsed.global.log_file);

    spdlog::info("zenoh-cli started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        zcli::sdk::CodecRegistry registry;
        zcli::sdk::registerBuiltinCodecs(registry);

        const auto plugins = zcli::sdk::CodecPlugins::make();
        loadCodecPlugins(*plugins, registry, parsed.global.codec_plugins);

        if (parsed.help)
        {
            std::cout << zcli::cli::usageText(registry.encoderNames(), registry.decoderNames());
            return EXIT_SUCCESS;
        }

        auto session_result = Session::make(makeSessionConfig(parsed.global));
        if (const auto* const failure = cetl::get_if<Session::Make::Failure>(&session_result))
        {
            spdlog::critical("{}", failure->text);
            std::cerr << "zenoh-cli: error: " << failure->text << '\n';
            return EXIT_FAILURE;
        }
        const auto session = cetl::get<Session::Make::Success>(std::move(session_result));

        const zcli::sdk::ValueResolver resolver;
        zcli::cli::SamplePrinter       printer{std::cout};
        zcli::cli::CommandContext      context{*session, registry, resolver, std::cin, printer, [] {
                                              //
                                              return g_running != 0;
                                          }};

        zcli::cli::CommandDispatcher dispatcher{context};
        if (const auto failure = dispatcher.dispatch(parsed.command))
        {
            spdlog::error("Command failed: {}", failure->message);
            std::cerr << "zenoh-cli: error: " << failure->message << '\n';
            result = failure->exit_code;
        }

        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        std::cerr << "zenoh-cli: error: " << ex.what() << '\n';
        result = EXIT_FAILURE;
    }
    spdlog::info("zenoh-cli terminated.");

    return result;
}
