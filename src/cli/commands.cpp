//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "commands.hpp"

#include "cli_options.hpp"
#include "line_pattern.hpp"
#include "logging.hpp"
#include "sample_printer.hpp"

#include <zcli/sdk/codec.hpp>
#include <zcli/sdk/error.hpp>
#include <zcli/sdk/execution.hpp>
#include <zcli/sdk/network_graph.hpp>
#include <zcli/sdk/session.hpp>
#include <zcli/sdk/value_resolver.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace zcli
{
namespace cli
{

/// Forwards replies to the command handler until closed.
///
/// Once a wait for replies is abandoned (on a termination signal), the session may still deliver
/// late replies from its threads; closing the gate drops them instead of touching the finished command.
///
class ReplyGate final
{
public:
    explicit ReplyGate(sdk::Session::ReplyHandler handler)
        : handler_{std::move(handler)}
    {
    }

    void operator()(const sdk::Reply& reply)
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        if (handler_)
        {
            handler_(reply);
        }
    }

    void close()
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        handler_ = nullptr;
    }

private:
    std::mutex                 mutex_;
    sdk::Session::ReplyHandler handler_;

};  // ReplyGate

namespace
{

using Query = sdk::Session::Query;

constexpr auto RouterAdminSelector = "@/*/router";
constexpr auto NetworkFileName     = "zenoh_network.png";
constexpr auto NetworkFileFormat   = "png";

std::chrono::milliseconds toMilliseconds(const double seconds)
{
    constexpr double MsPerSecond = 1000.0;
    return std::chrono::milliseconds{static_cast<std::int64_t>(seconds * MsPerSecond)};
}

std::string payloadText(const sdk::Payload& payload)
{
    return std::string(payload.begin(), payload.end());
}

CommandFailure usageError(std::string message)
{
    return CommandFailure{ExitUsage, std::move(message)};
}

CommandFailure operationError(const sdk::Error& error)
{
    return CommandFailure{ExitFailure, error.text};
}

sdk::Session::ReplyHandler makeReplyHandler(const std::shared_ptr<ReplyGate>& gate)
{
    return [gate](const sdk::Reply& reply) {
        //
        (*gate)(reply);
    };
}

/// Picks the liveliness token key: the explicit one, or the single key of the command.
///
cetl::optional<std::string> livelinessKeyOf(const LivelinessOption& option, const std::vector<std::string>& keys)
{
    if (!option.key.empty())
    {
        return option.key;
    }
    if (keys.size() == 1)
    {
        return keys.front();
    }
    return cetl::nullopt;
}

}  // namespace

CommandOutcome CommandDispatcher::dispatch(const CommandOptions& options)
{
    return cetl::visit([this](const auto& command_options) { return run(command_options); }, options);
}

CommandOutcome CommandDispatcher::run(const InfoOptions&)
{
    auto& session = context_.session;
    context_.printer.printLine(fmt::format("zid: {}", session.zid()));
    context_.printer.printLine(fmt::format("routers: [{}]", fmt::join(session.routersZid(), ", ")));
    context_.printer.printLine(fmt::format("peers: [{}]", fmt::join(session.peersZid(), ", ")));
    return cetl::nullopt;
}

CommandOutcome CommandDispatcher::run(const ScoutOptions& options)
{
    using Scout = sdk::Session::Scout;

    context_.printer.printLine("Scouting...");

    auto sender = context_.session.scout(options.what, toMilliseconds(options.timeout_s));
    auto result = sdk::sync_wait<Scout::Result>(sender, context_.idle_period, context_.keep_running);
    if (!result)
    {
        logger_->debug("Scouting is interrupted.");
        return cetl::nullopt;
    }
    if (const auto* const failure = cetl::get_if<Scout::Failure>(&*result))
    {
        return CommandFailure{(failure->code == EINVAL) ? ExitUsage : ExitFailure, failure->text};
    }

    for (const auto& hello : cetl::get<Scout::Success>(*result))
    {
        context_.printer.printLine(fmt::format("Hello(zid: {}, whatami: {}, locators: [{}])",
                                               hello.zid,
                                               hello.whatami,
                                               fmt::join(hello.locators, ", ")));
    }
    return cetl::nullopt;
}

CommandOutcome CommandDispatcher::run(const DeleteOptions& options)
{
    for (const auto& key : options.keys)
    {
        if (const auto error = context_.session.remove(key))
        {
            return operationError(*error);
        }
    }
    return cetl::nullopt;
}

CommandOutcome CommandDispatcher::run(const PutOptions& options)
{
    // MARK: Validation

    cetl::optional<LinePattern> pattern;
    if (options.line)
    {
        auto compile_result = LinePattern::compile(*options.line);
        if (const auto* const failure = cetl::get_if<LinePattern::Compile::Failure>(&compile_result))
        {
            return usageError(failure->text);
        }
        pattern.emplace(cetl::get<LinePattern>(std::move(compile_result)));

        if (!pattern->hasKey() && !options.key)
        {
            return usageError("A key must be specified either on the command line or as a pattern parameter.");
        }
        if (!pattern->hasValue() && !options.value)
        {
            return usageError("A value must be specified either on the command line or as a pattern parameter.");
        }
    }
    else if (!options.key || !options.value)
    {
        return usageError("A key and a value must be specified on the command line.");
    }

    cetl::optional<std::string> token_key;
    if (options.liveliness.requested)
    {
        const std::vector<std::string> keys = options.key ? std::vector<std::string>{*options.key}
                                                          : std::vector<std::string>{};
        token_key = livelinessKeyOf(options.liveliness, keys);
        if (!token_key)
        {
            return usageError("Cannot infer liveliness key: use '--liveliness KEY' or specify '-k KEY'.");
        }
    }

    auto encoder_result = context_.registry.resolveEncoder(options.encoder);
    if (const auto* const failure = cetl::get_if<sdk::CodecRegistry::ResolveEncoder::Failure>(&encoder_result))
    {
        return usageError(failure->text);
    }
    const auto encoder = cetl::get<sdk::Encoder>(std::move(encoder_result));

    // MARK: Execution

    sdk::Session::LivelinessToken::Ptr token;
    if (token_key)
    {
        auto token_result = context_.session.declareLivelinessToken(*token_key);
        if (const auto* const failure = cetl::get_if<sdk::Session::DeclareToken::Failure>(&token_result))
        {
            return operationError(*failure);
        }
        token = cetl::get<sdk::Session::DeclareToken::Success>(std::move(token_result));
    }

    if (!pattern)
    {
        auto bytes_result = context_.resolver.toBytes(*options.key, sdk::ValueSpec::parse(*options.value), encoder);
        if (const auto* const failure = cetl::get_if<sdk::ValueResolver::ToBytes::Failure>(&bytes_result))
        {
            return operationError(*failure);
        }
        if (const auto error = context_.session.put(*options.key, cetl::get<sdk::Payload>(bytes_result)))
        {
            return operationError(*error);
        }
        return cetl::nullopt;
    }

    // The fixed value (if any) is resolved only once, before reading the lines.
    cetl::optional<std::string> fixed_value;
    if (options.value)
    {
        const auto spec = sdk::ValueSpec::parse(*options.value);
        if (spec.source() == sdk::ValueSpec::Source::Stdin)
        {
            return usageError("Standard input cannot be used for both the value and the '--line' input.");
        }
        auto text_result = context_.resolver.readText(spec);
        if (const auto* const failure = cetl::get_if<sdk::ValueResolver::ReadText::Failure>(&text_result))
        {
            return operationError(*failure);
        }
        fixed_value = cetl::get<std::string>(std::move(text_result));
    }

    std::string line;
    while (std::getline(context_.input, line))
    {
        const auto match = pattern->match(line);
        if (!match)
        {
            logger_->error("Failed to parse line: {}", line);
            continue;
        }

        const auto& key   = options.key ? *options.key : *match->key;
        const auto& value = fixed_value ? *fixed_value : *match->value;

        auto bytes_result = context_.resolver.encode(key, value, encoder);
        if (const auto* const failure = cetl::get_if<sdk::ValueResolver::ToBytes::Failure>(&bytes_result))
        {
            logger_->error("Encoder ({}) failed, skipping! {}", options.encoder, failure->text);
            continue;
        }
        if (const auto error = context_.session.put(key, cetl::get<sdk::Payload>(bytes_result)))
        {
            return operationError(*error);
        }
    }
    return cetl::nullopt;
}

CommandOutcome CommandDispatcher::run(const SubscribeOptions& options)
{
    cetl::optional<std::string> token_key;
    if (options.liveliness.requested)
    {
        token_key = livelinessKeyOf(options.liveliness, options.keys);
        if (!token_key)
        {
            return usageError("Cannot infer liveliness key from multiple '-k' keys: use '--liveliness KEY'.");
        }
    }

    auto decoder_result = context_.registry.resolveDecoder(options.decoder);
    if (const auto* const failure = cetl::get_if<sdk::CodecRegistry::ResolveDecoder::Failure>(&decoder_result))
    {
        return usageError(failure->text);
    }
    const auto decoder = cetl::get<sdk::Decoder>(std::move(decoder_result));

    sdk::Session::LivelinessToken::Ptr token;
    if (token_key)
    {
        auto token_result = context_.session.declareLivelinessToken(*token_key);
        if (const auto* const failure = cetl::get_if<sdk::Session::DeclareToken::Failure>(&token_result))
        {
            return operationError(*failure);
        }
        token = cetl::get<sdk::Session::DeclareToken::Success>(std::move(token_result));
    }

    std::vector<sdk::Session::Subscriber::Ptr> subscribers;
    for (const auto& key : options.keys)
    {
        auto sub_result = context_.session.declareSubscriber(  //
            key,
            [this, &options, decoder](const sdk::Sample& sample) {
                //
                printSample(sample, options.line, options.decoder, decoder);
            });
        if (const auto* const failure = cetl::get_if<sdk::Session::DeclareSubscriber::Failure>(&sub_result))
        {
            return operationError(*failure);
        }
        subscribers.push_back(cetl::get<sdk::Session::DeclareSubscriber::Success>(std::move(sub_result)));
    }

    waitUntilInterrupted();

    // Subscribers go first, so that no more samples arrive while the token is being undeclared.
    subscribers.clear();
    return cetl::nullopt;
}

CommandOutcome CommandDispatcher::run(const GetOptions& options)
{
    auto encoder_result = context_.registry.resolveEncoder(options.encoder);
    if (const auto* const failure = cetl::get_if<sdk::CodecRegistry::ResolveEncoder::Failure>(&encoder_result))
    {
        return usageError(failure->text);
    }
    auto decoder_result = context_.registry.resolveDecoder(options.decoder);
    if (const auto* const failure = cetl::get_if<sdk::CodecRegistry::ResolveDecoder::Failure>(&decoder_result))
    {
        return usageError(failure->text);
    }
    const auto decoder = cetl::get<sdk::Decoder>(std::move(decoder_result));

    cetl::optional<sdk::Payload> payload;
    if (options.value)
    {
        auto bytes_result = context_.resolver.toBytes(options.selector,
                                                      sdk::ValueSpec::parse(*options.value),
                                                      cetl::get<sdk::Encoder>(encoder_result));
        if (const auto* const failure = cetl::get_if<sdk::ValueResolver::ToBytes::Failure>(&bytes_result))
        {
            return operationError(*failure);
        }
        payload = cetl::get<sdk::Payload>(std::move(bytes_result));
    }

    const auto gate = std::make_shared<ReplyGate>([this, &options, decoder](const sdk::Reply& reply) {
        //
        cetl::visit(cetl::make_overloaded(
                        [this, &options, &decoder](const sdk::Sample& sample) {
                            //
                            printSample(sample, options.line, options.decoder, decoder);
                        },
                        [this, &options](const sdk::ReplyError& error) {
                            //
                            logger_->error("Received error ({}) on get({})", payloadText(error.payload), options.selector);
                        }),
                    reply);
    });

    auto sender = context_.session.get(options.selector,
                                       payload,
                                       toMilliseconds(options.timeout_s),
                                       makeReplyHandler(gate));
    return awaitQuery(sender, *gate);
}

CommandOutcome CommandDispatcher::run(const LivelinessGetOptions& options)
{
    const auto gate = std::make_shared<ReplyGate>([this, &options](const sdk::Reply& reply) {
        //
        cetl::visit(cetl::make_overloaded(
                        [this, &options](const sdk::Sample& sample) {
                            //
                            printLiveliness(sample, options.line, options.json);
                        },
                        [this, &options](const sdk::ReplyError& error) {
                            //
                            logger_->error("Received error ({}) on liveliness get({})",
                                           payloadText(error.payload),
                                           options.key);
                        }),
                    reply);
    });

    auto sender = context_.session.livelinessGet(options.key, toMilliseconds(options.timeout_s), makeReplyHandler(gate));
    return awaitQuery(sender, *gate);
}

CommandOutcome CommandDispatcher::run(const LivelinessSubscribeOptions& options)
{
    auto sub_result = context_.session.declareLivelinessSubscriber(  //
        options.key,
        options.history,
        [this, &options](const sdk::Sample& sample) {
            //
            printLiveliness(sample, options.line, options.json);
        });
    if (const auto* const failure = cetl::get_if<sdk::Session::DeclareSubscriber::Failure>(&sub_result))
    {
        return operationError(*failure);
    }
    const auto subscriber = cetl::get<sdk::Session::DeclareSubscriber::Success>(std::move(sub_result));

    waitUntilInterrupted();
    return cetl::nullopt;
}

CommandOutcome CommandDispatcher::run(const LivelinessTokenOptions& options)
{
    auto token_result = context_.session.declareLivelinessToken(options.key);
    if (const auto* const failure = cetl::get_if<sdk::Session::DeclareToken::Failure>(&token_result))
    {
        return operationError(*failure);
    }
    const auto token = cetl::get<sdk::Session::DeclareToken::Success>(std::move(token_result));
    logger_->info("Liveliness token '{}' is declared.", options.key);

    waitUntilInterrupted();
    return cetl::nullopt;
}

CommandOutcome CommandDispatcher::run(const NetworkOptions& options)
{
    using Scout = sdk::Session::Scout;

    auto& session = context_.session;

    sdk::NetworkGraph graph;
    const auto        self_zid = session.zid();
    graph.addNode(self_zid, session.mode());

    // Scout the nearby network.
    {
        auto sender = session.scout("peer|router", toMilliseconds(options.scout_timeout_s));
        auto result = sdk::sync_wait<Scout::Result>(sender, context_.idle_period, context_.keep_running);
        if (!result)
        {
            logger_->debug("Network scouting is interrupted.");
            return cetl::nullopt;
        }
        if (const auto* const failure = cetl::get_if<Scout::Failure>(&*result))
        {
            return operationError(*failure);
        }
        for (const auto& hello : cetl::get<Scout::Success>(*result))
        {
            logger_->debug("Scout answer (zid={}, whatami={}).", hello.zid, hello.whatami);
            graph.addNode(hello.zid, hello.whatami);
        }
    }

    // Query routers for more information. Replies come from the Zenoh threads,
    // so they are only collected here, and added to the graph afterwards.
    {
        std::mutex               mutex;
        std::vector<std::string> router_infos;

        const auto gate = std::make_shared<ReplyGate>([this, &mutex, &router_infos](const sdk::Reply& reply) {
            //
            if (const auto* const sample = cetl::get_if<sdk::Sample>(&reply))
            {
                const std::lock_guard<std::mutex> lock{mutex};
                router_infos.push_back(payloadText(sample->payload));
                return;
            }
            logger_->error("Received error ({})", payloadText(cetl::get<sdk::ReplyError>(reply).payload));
        });

        auto sender = session.get(RouterAdminSelector,
                                  cetl::nullopt,
                                  toMilliseconds(GetOptions{}.timeout_s),
                                  makeReplyHandler(gate));
        auto result = sdk::sync_wait<Query::Result>(sender, context_.idle_period, context_.keep_running);
        gate->close();
        if (!result)
        {
            logger_->debug("Router query is interrupted.");
            return cetl::nullopt;
        }
        if (const auto* const failure = cetl::get_if<Query::Failure>(&*result))
        {
            return operationError(*failure);
        }

        const std::lock_guard<std::mutex> lock{mutex};
        for (const auto& router_info : router_infos)
        {
            logger_->debug("Received router info: {}", router_info);
            if (const auto error = graph.addRouterInfo(router_info))
            {
                logger_->error("Skipping router info: {}", error->text);
            }
        }
    }

    if (options.dot)
    {
        auto dot_result = graph.renderDot(self_zid, options.metadata_field);
        if (const auto* const failure = cetl::get_if<sdk::NetworkGraph::RenderDot::Failure>(&dot_result))
        {
            return operationError(*failure);
        }
        context_.printer.printLine(cetl::get<std::string>(dot_result));
        return cetl::nullopt;
    }

    if (!options.save_fig)
    {
        if (const auto error = graph.display(self_zid, options.metadata_field))
        {
            return CommandFailure{ExitFailure, error->text + " Use '--save-fig' or '--dot' instead."};
        }
        return cetl::nullopt;
    }

    const auto file_path = context_.output_dir + "/" + NetworkFileName;
    if (const auto error = graph.renderToFile(self_zid, options.metadata_field, NetworkFileFormat, file_path))
    {
        return operationError(*error);
    }

    const std::unique_ptr<char, decltype(&std::free)> abs_path{::realpath(file_path.c_str(), nullptr), &std::free};
    context_.printer.printLine(
        fmt::format("Network visualization saved to {}", abs_path ? abs_path.get() : file_path.c_str()));
    return cetl::nullopt;
}

void CommandDispatcher::printSample(const sdk::Sample&  sample,
                                    const std::string&  format,
                                    const std::string&  decoder_name,
                                    const sdk::Decoder& decoder)
{
    auto text_result = context_.resolver.toText(sample.key, sample.payload, decoder);
    if (const auto* const failure = cetl::get_if<sdk::ValueResolver::ToText::Failure>(&text_result))
    {
        logger_->error("Decoder ({}) failed, skipping! {}", decoder_name, failure->text);
        return;
    }

    auto line_result = formatSampleLine(format, sample.key, cetl::get<std::string>(text_result));
    if (const auto* const failure = cetl::get_if<FormatLine::Failure>(&line_result))
    {
        logger_->error("{}", failure->text);
        return;
    }
    context_.printer.printLine(cetl::get<std::string>(line_result));
}

void CommandDispatcher::printLiveliness(const sdk::Sample&                 sample,
                                        const cetl::optional<std::string>& format,
                                        const bool                         json)
{
    const auto* const status = (sample.kind == sdk::Sample::Kind::Delete) ? "DROPPED" : "ALIVE";

    auto line_result = formatLivelinessLine(format, json, sample.key, status, context_.timestamp());
    if (const auto* const failure = cetl::get_if<FormatLine::Failure>(&line_result))
    {
        logger_->error("{}", failure->text);
        return;
    }
    context_.printer.printLine(cetl::get<std::string>(line_result));
}

CommandOutcome CommandDispatcher::awaitQuery(sdk::SenderOf<Query::Result>::Ptr& sender, ReplyGate& gate)
{
    auto result = sdk::sync_wait<Query::Result>(sender, context_.idle_period, context_.keep_running);
    gate.close();

    if (!result)
    {
        logger_->debug("Waiting for replies is interrupted.");
        return cetl::nullopt;
    }
    if (const auto* const failure = cetl::get_if<Query::Failure>(&*result))
    {
        return operationError(*failure);
    }
    return cetl::nullopt;
}

void CommandDispatcher::waitUntilInterrupted() const
{
    logger_->debug("Running until interrupted...");
    while (context_.keep_running())
    {
        std::this_thread::sleep_for(context_.idle_period);
    }
    logger_->debug("Interrupted.");
}

}  // namespace cli
}  // namespace zcli
