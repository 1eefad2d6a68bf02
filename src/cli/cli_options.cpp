//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_options.hpp"

#include <zcli/sdk/error.hpp>

#include <boost/program_options.hpp>

#include <cerrno>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace zcli
{
namespace cli
{
namespace
{

namespace po = boost::program_options;

using Strings = std::vector<std::string>;

// Abbreviated option names are not accepted (command options are parsed in two passes).
constexpr int ParserStyle = po::command_line_style::default_style & ~po::command_line_style::allow_guessing;

// MARK: - Option descriptions

po::options_description describeGlobal()
{
    po::options_description desc{"Global options"};
    desc.add_options()                                                                                   //
        ("help,h", "Show this help message and exit.")                                                  //
        ("version", "Show version and exit.")                                                           //
        ("mode", po::value<std::string>()->default_value("peer"), "Session mode: peer, client or router.")  //
        ("connect", po::value<Strings>()->composing(), "Endpoint to connect to (repeatable).")         //
        ("listen", po::value<Strings>()->composing(), "Endpoint to listen on (repeatable).")           //
        ("config", po::value<std::string>(), "A path to a Zenoh configuration file.")                   //
        ("cfg",
         po::value<Strings>()->composing(),
         "Configuration option according to 'PATH:VALUE' (repeatable).")  //
        ("log-level",
         po::value<int>()->default_value(30),  // NOLINT(*-magic-numbers)
         "Log level: 0=TRACE, 10=DEBUG, 20=INFO, 30=WARNING, 40=ERROR, 50=CRITICAL.")  //
        ("log-file", po::value<std::string>(), "Also write logs to this (rotated) file.")  //
        ("codec-plugin", po::value<Strings>()->composing(), "Codec plugin library or directory (repeatable).");
    return desc;
}

po::options_description describeHidden()
{
    po::options_description desc;
    desc.add_options()                          //
        ("command", po::value<std::string>())  //
        ("subargs", po::value<Strings>());
    return desc;
}

po::options_description describeScout(ScoutOptions& opts)
{
    po::options_description desc{"scout"};
    desc.add_options()  //
        ("what,w", po::value<std::string>(&opts.what)->default_value(opts.what), "What to scout for.")  //
        ("timeout,t", po::value<double>(&opts.timeout_s)->default_value(opts.timeout_s), "Timeout in seconds.");
    return desc;
}

po::options_description describeDelete(DeleteOptions& opts)
{
    po::options_description desc{"delete"};
    desc.add_options()  //
        ("key,k", po::value<Strings>(&opts.keys)->required()->composing(), "Key expression (repeatable).");
    return desc;
}

po::options_description describePut(PutOptions& opts)
{
    po::options_description desc{"put"};
    desc.add_options()                                                                                 //
        ("key,k", po::value<std::string>(), "Key expression.")                                        //
        ("value,v", po::value<std::string>(), "Value: literal, '@path' for a file, '-' for stdin.")   //
        ("line", po::value<std::string>(), "Read stdin lines matching this pattern ({key}, {value}).")  //
        ("encoder", po::value<std::string>(&opts.encoder)->default_value(opts.encoder), "Encoder name.")  //
        ("liveliness",
         po::value<std::string>()->implicit_value(""),
         "Declare a liveliness token (on KEY, or on the -k key) while running.");
    return desc;
}

po::options_description describeSubscribe(SubscribeOptions& opts)
{
    po::options_description desc{"subscribe"};
    desc.add_options()                                                                                   //
        ("key,k", po::value<Strings>(&opts.keys)->required()->composing(), "Key expression (repeatable).")  //
        ("line", po::value<std::string>(&opts.line)->default_value(opts.line), "Output line format.")   //
        ("decoder", po::value<std::string>(&opts.decoder)->default_value(opts.decoder), "Decoder name.")  //
        ("liveliness",
         po::value<std::string>()->implicit_value(""),
         "Declare a liveliness token (on KEY, or on the -k key) while running.");
    return desc;
}

po::options_description describeGet(GetOptions& opts)
{
    po::options_description desc{"get"};
    desc.add_options()                                                                                   //
        ("selector,s", po::value<std::string>(&opts.selector)->required(), "Selector (key expression and parameters).")  //
        ("value,v", po::value<std::string>(), "Query payload: literal, '@path' for a file, '-' for stdin.")  //
        ("line", po::value<std::string>(&opts.line)->default_value(opts.line), "Output line format.")      //
        ("encoder", po::value<std::string>(&opts.encoder)->default_value(opts.encoder), "Encoder name.")   //
        ("decoder", po::value<std::string>(&opts.decoder)->default_value(opts.decoder), "Decoder name.")   //
        ("timeout", po::value<double>(&opts.timeout_s)->default_value(opts.timeout_s), "Timeout in seconds.");
    return desc;
}

po::options_description describeLivelinessGet(LivelinessGetOptions& opts)
{
    po::options_description desc{"liveliness get"};
    desc.add_options()                                                                       //
        ("key,k", po::value<std::string>(&opts.key)->required(), "Key expression.")         //
        ("timeout,t", po::value<double>(&opts.timeout_s)->default_value(opts.timeout_s), "Timeout in seconds.")  //
        ("line", po::value<std::string>(), "Output line format ({key}, {status}, {timestamp}).")  //
        ("json", po::bool_switch(&opts.json), "Print JSON objects.");
    return desc;
}

po::options_description describeLivelinessSubscribe(LivelinessSubscribeOptions& opts)
{
    po::options_description desc{"liveliness subscribe"};
    desc.add_options()                                                                       //
        ("key,k", po::value<std::string>(&opts.key)->required(), "Key expression.")         //
        ("history", po::bool_switch(&opts.history), "Also report tokens alive before subscribing.")  //
        ("line", po::value<std::string>(), "Output line format ({key}, {status}, {timestamp}).")    //
        ("json", po::bool_switch(&opts.json), "Print JSON objects.");
    return desc;
}

po::options_description describeLivelinessToken(LivelinessTokenOptions& opts)
{
    po::options_description desc{"liveliness token"};
    desc.add_options()  //
        ("key,k", po::value<std::string>(&opts.key)->required(), "Key expression.");
    return desc;
}

po::options_description describeNetwork(NetworkOptions& opts)
{
    po::options_description desc{"network"};
    desc.add_options()  //
        ("metadata-field",
         po::value<std::string>(&opts.metadata_field)->default_value(opts.metadata_field),
         "JSON pointer to a field in a routers metadata configuration.")  //
        ("save-fig",
         po::bool_switch(&opts.save_fig),
         "Save the network graph to 'zenoh_network.png' instead of showing it.")  //
        ("dot",
         po::bool_switch(&opts.dot),
         "Print the network graph as a Graphviz DOT document instead of showing it.")  //
        ("scout-timeout",
         po::value<double>(&opts.scout_timeout_s)->default_value(opts.scout_timeout_s),
         "Scouting timeout in seconds.");
    return desc;
}

// MARK: - Parsing helpers

/// Makes `--liveliness KEY` equivalent to `--liveliness=KEY` (the value of the option is optional).
///
Strings joinOptionalValues(const Strings& args)
{
    Strings result;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if ((args[i] == "--liveliness") && ((i + 1) < args.size()) && !args[i + 1].empty() &&
            (args[i + 1].front() != '-'))
        {
            result.push_back(args[i] + "=" + args[i + 1]);
            ++i;
            continue;
        }
        result.push_back(args[i]);
    }
    return result;
}

po::variables_map parseCommand(const Strings& args, const po::options_description& desc)
{
    po::variables_map vm;
    po::store(po::command_line_parser(joinOptionalValues(args)).options(desc).style(ParserStyle).run(), vm);
    po::notify(vm);
    return vm;
}

cetl::optional<std::string> optionalString(const po::variables_map& vm, const char* const name)
{
    if (vm.count(name) == 0)
    {
        return cetl::nullopt;
    }
    return vm[name].as<std::string>();
}

LivelinessOption livelinessOf(const po::variables_map& vm)
{
    LivelinessOption option;
    if (vm.count("liveliness") > 0)
    {
        option.requested = true;
        option.key       = vm["liveliness"].as<std::string>();
    }
    return option;
}

void checkTimeout(const double timeout_s, const char* const name)
{
    if (!(timeout_s >= 0.0))
    {
        throw po::error(std::string{"the argument for option '--"} + name + "' must not be negative");
    }
}

CommandOptions parseLiveliness(const Strings& args)
{
    if (args.empty())
    {
        throw po::error("liveliness requires a subcommand: get, subscribe or token");
    }
    const auto&   sub = args.front();
    const Strings rest{args.begin() + 1, args.end()};

    if (sub == "get")
    {
        LivelinessGetOptions opts;
        const auto           vm = parseCommand(rest, describeLivelinessGet(opts));
        opts.line               = optionalString(vm, "line");
        checkTimeout(opts.timeout_s, "timeout");
        return opts;
    }
    if ((sub == "subscribe") || (sub == "sub"))
    {
        LivelinessSubscribeOptions opts;
        const auto                 vm = parseCommand(rest, describeLivelinessSubscribe(opts));
        opts.line                     = optionalString(vm, "line");
        return opts;
    }
    if (sub == "token")
    {
        LivelinessTokenOptions opts;
        parseCommand(rest, describeLivelinessToken(opts));
        return opts;
    }
    throw po::error("unknown liveliness subcommand '" + sub + "'");
}

CommandOptions parseCommandOptions(const std::string& command, const Strings& args)
{
    if (command == "info")
    {
        parseCommand(args, po::options_description{"info"});
        return InfoOptions{};
    }
    if (command == "scout")
    {
        ScoutOptions opts;
        parseCommand(args, describeScout(opts));
        checkTimeout(opts.timeout_s, "timeout");
        return opts;
    }
    if (command == "delete")
    {
        DeleteOptions opts;
        parseCommand(args, describeDelete(opts));
        return opts;
    }
    if (command == "put")
    {
        PutOptions opts;
        const auto vm   = parseCommand(args, describePut(opts));
        opts.key        = optionalString(vm, "key");
        opts.value      = optionalString(vm, "value");
        opts.line       = optionalString(vm, "line");
        opts.liveliness = livelinessOf(vm);
        return opts;
    }
    if (command == "subscribe")
    {
        SubscribeOptions opts;
        const auto       vm = parseCommand(args, describeSubscribe(opts));
        opts.liveliness     = livelinessOf(vm);
        return opts;
    }
    if (command == "get")
    {
        GetOptions opts;
        const auto vm = parseCommand(args, describeGet(opts));
        opts.value    = optionalString(vm, "value");
        checkTimeout(opts.timeout_s, "timeout");
        return opts;
    }
    if (command == "liveliness")
    {
        return parseLiveliness(args);
    }
    if (command == "network")
    {
        NetworkOptions opts;
        parseCommand(args, describeNetwork(opts));
        checkTimeout(opts.scout_timeout_s, "scout-timeout");
        return opts;
    }
    throw po::error("unknown command '" + command + "'");
}

GlobalOptions globalOptionsOf(const po::variables_map& vm)
{
    GlobalOptions global;

    global.mode = vm["mode"].as<std::string>();
    if ((global.mode != "peer") && (global.mode != "client") && (global.mode != "router"))
    {
        throw po::error("invalid mode '" + global.mode + "' (choose from peer, client, router)");
    }
    if (vm.count("connect") > 0)
    {
        global.connect = vm["connect"].as<Strings>();
    }
    if (vm.count("listen") > 0)
    {
        global.listen = vm["listen"].as<Strings>();
    }
    global.config_file = optionalString(vm, "config");
    if (vm.count("cfg") > 0)
    {
        for (const auto& option : vm["cfg"].as<Strings>())
        {
            const auto colon = option.find(':');
            if (colon == std::string::npos)
            {
                throw po::error("invalid --cfg '" + option + "' (expected 'PATH:VALUE')");
            }
            global.cfg.emplace_back(option.substr(0, colon), option.substr(colon + 1));
        }
    }
    global.log_level = vm["log-level"].as<int>();
    global.log_file  = optionalString(vm, "log-file");
    if (vm.count("codec-plugin") > 0)
    {
        global.codec_plugins = vm["codec-plugin"].as<Strings>();
    }
    return global;
}

}  // namespace

ParseArgs::Result parseArgs(const std::vector<std::string>& args)
{
    try
    {
        po::options_description all;
        all.add(describeGlobal()).add(describeHidden());

        po::positional_options_description positional;
        positional.add("command", 1).add("subargs", -1);

        const auto parsed = po::command_line_parser(args)
                                .options(all)
                                .positional(positional)
                                .style(ParserStyle)
                                .allow_unregistered()
                                .run();

        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        ParsedArgs result{globalOptionsOf(vm), InfoOptions{}};
        result.help    = vm.count("help") > 0;
        result.version = vm.count("version") > 0;
        if (result.help || result.version)
        {
            return result;
        }

        if (vm.count("command") == 0)
        {
            return sdk::Error{EINVAL, "a command is required"};
        }

        // Everything after the command name (in the original order) belongs to the command.
        auto command_args = po::collect_unrecognized(parsed.options, po::include_positional);
        if (!command_args.empty())
        {
            command_args.erase(command_args.begin());
        }

        result.command = parseCommandOptions(vm["command"].as<std::string>(), command_args);
        return result;

    } catch (const po::error& ex)
    {
        return sdk::Error{EINVAL, ex.what()};
    }
}

std::string usageText(const std::vector<std::string>& encoders, const std::vector<std::string>& decoders)
{
    const auto join = [](const Strings& names) {
        std::string joined;
        for (const auto& name : names)
        {
            joined += joined.empty() ? name : (", " + name);
        }
        return joined;
    };

    ScoutOptions               scout;
    DeleteOptions              del;
    PutOptions                 put;
    SubscribeOptions           subscribe;
    GetOptions                 get;
    LivelinessGetOptions       lv_get;
    LivelinessSubscribeOptions lv_sub;
    LivelinessTokenOptions     lv_token;
    NetworkOptions             network;

    std::ostringstream out;
    out << "Zenoh command-line client application\n\n"
        << "Usage: zenoh-cli [global options] <command> [command options]\n\n"
        << "Commands: info, network, scout, delete, put, subscribe, get,\n"
        << "          liveliness get|subscribe|token\n\n"
        << describeGlobal() << '\n'
        << describeNetwork(network) << '\n'
        << describeScout(scout) << '\n'
        << describeDelete(del) << '\n'
        << describePut(put) << '\n'
        << describeSubscribe(subscribe) << '\n'
        << describeGet(get) << '\n'
        << describeLivelinessGet(lv_get) << '\n'
        << describeLivelinessSubscribe(lv_sub) << '\n'
        << describeLivelinessToken(lv_token) << '\n'
        << "Encoders: " << join(encoders) << '\n'
        << "Decoders: " << join(decoders) << '\n';
    return out.str();
}

}  // namespace cli
}  // namespace zcli
