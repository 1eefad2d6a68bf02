//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_CLI_OPTIONS_HPP_INCLUDED
#define ZCLI_CLI_OPTIONS_HPP_INCLUDED

#include <zcli/sdk/error.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>
#include <vector>

namespace zcli
{
namespace cli
{

/// Options which precede the command.
///
struct GlobalOptions final
{
    std::string                                      mode{"peer"};
    std::vector<std::string>                         connect;
    std::vector<std::string>                         listen;
    cetl::optional<std::string>                      config_file;
    std::vector<std::pair<std::string, std::string>> cfg;  // `PATH:VALUE` pairs
    int                                              log_level{30};
    cetl::optional<std::string>                      log_file;
    std::vector<std::string>                         codec_plugins;

};  // GlobalOptions

/// `--liveliness [KEY]` of `put` and `subscribe`.
///
struct LivelinessOption final
{
    bool        requested{false};
    std::string key;  // empty for the bare flag (the key is inferred from `-k`)

};  // LivelinessOption

struct InfoOptions final
{};

struct ScoutOptions final
{
    std::string what{"peer|router"};
    double      timeout_s{1.0};
};

struct DeleteOptions final
{
    std::vector<std::string> keys;
};

struct PutOptions final
{
    cetl::optional<std::string> key;
    cetl::optional<std::string> value;
    cetl::optional<std::string> line;
    std::string                 encoder{"text"};
    LivelinessOption            liveliness;
};

struct SubscribeOptions final
{
    std::vector<std::string> keys;
    std::string              line{"{value}"};
    std::string              decoder{"base64"};
    LivelinessOption         liveliness;
};

struct GetOptions final
{
    std::string                 selector;
    cetl::optional<std::string> value;
    std::string                 line{"{value}"};
    std::string                 encoder{"text"};
    std::string                 decoder{"base64"};
    double                      timeout_s{10.0};
};

struct LivelinessGetOptions final
{
    std::string                 key;
    double                      timeout_s{10.0};
    cetl::optional<std::string> line;
    bool                        json{false};
};

struct LivelinessSubscribeOptions final
{
    std::string                 key;
    bool                        history{false};
    cetl::optional<std::string> line;
    bool                        json{false};
};

struct LivelinessTokenOptions final
{
    std::string key;
};

struct NetworkOptions final
{
    std::string metadata_field{"/name"};
    bool        save_fig{false};
    bool        dot{false};
    double      scout_timeout_s{1.0};
};

using CommandOptions = cetl::variant<InfoOptions,
                                     ScoutOptions,
                                     DeleteOptions,
                                     PutOptions,
                                     SubscribeOptions,
                                     GetOptions,
                                     LivelinessGetOptions,
                                     LivelinessSubscribeOptions,
                                     LivelinessTokenOptions,
                                     NetworkOptions>;

struct ParsedArgs final
{
    GlobalOptions  global;
    CommandOptions command;
    bool           help{false};
    bool           version{false};
};

struct ParseArgs final
{
    using Success = ParsedArgs;
    using Failure = sdk::Error;  // `EINVAL` usage error
    using Result  = cetl::variant<Success, Failure>;
};
/// Parses the command line (without the program name).
///
/// Codec names are not validated here (plugins are not loaded yet).
///
CETL_NODISCARD ParseArgs::Result parseArgs(const std::vector<std::string>& args);

/// Makes the usage text, including the lists of available encoders and decoders.
///
std::string usageText(const std::vector<std::string>& encoders, const std::vector<std::string>& decoders);

}  // namespace cli
}  // namespace zcli

#endif  // ZCLI_CLI_OPTIONS_HPP_INCLUDED
