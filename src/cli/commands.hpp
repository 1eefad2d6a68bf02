//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_CLI_COMMANDS_HPP_INCLUDED
#define ZCLI_CLI_COMMANDS_HPP_INCLUDED

#include "cli_options.hpp"
#include "logging.hpp"
#include "sample_printer.hpp"

#include <zcli/sdk/codec.hpp>
#include <zcli/sdk/session.hpp>
#include <zcli/sdk/value_resolver.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <functional>
#include <istream>
#include <string>

namespace zcli
{
namespace cli
{

class ReplyGate;

constexpr int ExitFailure = 1;
constexpr int ExitUsage   = 2;

/// Describes why a command has failed, and with which process exit code.
///
struct CommandFailure final
{
    int         exit_code;
    std::string message;

};  // CommandFailure

using CommandOutcome = cetl::optional<CommandFailure>;

/// Everything a command needs from the outside world.
///
struct CommandContext final
{
    sdk::Session&             session;
    const sdk::CodecRegistry& registry;
    const sdk::ValueResolver& resolver;

    /// Source of `put --line` lines.
    std::istream& input;

    SamplePrinter& printer;

    /// Long running commands (`subscribe` ...) keep running while this returns `true`.
    std::function<bool()> keep_running;

    std::function<std::string()> timestamp{&utcTimestampNow};
    std::chrono::milliseconds    idle_period{100};  // NOLINT(*-magic-numbers)

    /// Where `network --save-fig` writes its file.
    std::string output_dir{"."};

};  // CommandContext

/// Executes commands against the session.
///
/// Every command is a direct call into the session; a failed call surfaces immediately (no retries).
///
class CommandDispatcher final
{
public:
    explicit CommandDispatcher(CommandContext& context)
        : context_{context}
        , logger_{common::getLogger("cli")}
    {
    }

    CETL_NODISCARD CommandOutcome dispatch(const CommandOptions& options);

    CETL_NODISCARD CommandOutcome run(const InfoOptions& options);
    CETL_NODISCARD CommandOutcome run(const ScoutOptions& options);
    CETL_NODISCARD CommandOutcome run(const DeleteOptions& options);
    CETL_NODISCARD CommandOutcome run(const PutOptions& options);
    CETL_NODISCARD CommandOutcome run(const SubscribeOptions& options);
    CETL_NODISCARD CommandOutcome run(const GetOptions& options);
    CETL_NODISCARD CommandOutcome run(const LivelinessGetOptions& options);
    CETL_NODISCARD CommandOutcome run(const LivelinessSubscribeOptions& options);
    CETL_NODISCARD CommandOutcome run(const LivelinessTokenOptions& options);
    CETL_NODISCARD CommandOutcome run(const NetworkOptions& options);

private:
    void printSample(const sdk::Sample&  sample,
                     const std::string&  format,
                     const std::string&  decoder_name,
                     const sdk::Decoder& decoder);

    void printLiveliness(const sdk::Sample&                 sample,
                         const cetl::optional<std::string>& format,
                         const bool                         json);

    /// Waits for the end of query replies (or a termination signal), and then closes the reply gate.
    ///
    CommandOutcome awaitQuery(sdk::SenderOf<sdk::Session::Query::Result>::Ptr& sender, ReplyGate& gate);

    void waitUntilInterrupted() const;

    CommandContext&   context_;
    common::LoggerPtr logger_;

};  // CommandDispatcher

}  // namespace cli
}  // namespace zcli

#endif  // ZCLI_CLI_COMMANDS_HPP_INCLUDED
