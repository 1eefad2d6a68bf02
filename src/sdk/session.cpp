//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <zcli/sdk/session.hpp>

#include "common_helpers.hpp"
#include "logging.hpp"

#include <zcli/sdk/error.hpp>
#include <zcli/sdk/execution.hpp>

#include <nlohmann/json.hpp>

#include <zenoh.hxx>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace zcli
{
namespace sdk
{
namespace
{

constexpr int WhatRouter = 1;
constexpr int WhatPeer   = 2;
constexpr int WhatClient = 4;

template <typename Id>
std::string idToString(const Id& id)
{
    std::ostringstream out;
    out << id;
    return out.str();
}

std::string whatamiToString(const int whatami)
{
    switch (whatami)
    {
    case WhatRouter:
        return "router";
    case WhatPeer:
        return "peer";
    case WhatClient:
        return "client";
    default:
        return "unknown";
    }
}

std::string toJsonString(const std::string& text)
{
    return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string toJsonArray(const std::vector<std::string>& items)
{
    return nlohmann::json(items).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Sample toSample(const zenoh::Sample& z_sample)
{
    Sample sample;
    sample.key     = std::string{z_sample.get_keyexpr().as_string_view()};
    sample.payload = z_sample.get_payload().as_vector();
    sample.kind    = (z_sample.get_kind() == Z_SAMPLE_KIND_DELETE) ? Sample::Kind::Delete : Sample::Kind::Put;
    return sample;
}

Reply toReply(const zenoh::Reply& z_reply)
{
    if (z_reply.is_ok())
    {
        return toSample(z_reply.get_ok());
    }
    return ReplyError{z_reply.get_err().get_payload().as_vector()};
}

/// Parses `peer|router` like combinations into the scouting mask.
///
cetl::optional<int> parseWhat(const std::string& what)
{
    int mask = 0;
    for (const auto& part : common::splitNonEmpty(what, '|'))
    {
        if (part == "router")
        {
            mask |= WhatRouter;
        }
        else if (part == "peer")
        {
            mask |= WhatPeer;
        }
        else if (part == "client")
        {
            mask |= WhatClient;
        }
        else
        {
            return cetl::nullopt;
        }
    }
    if (mask == 0)
    {
        return cetl::nullopt;
    }
    return mask;
}

/// Builds Zenoh configuration from the command line options.
///
zenoh::Config makeZenohConfig(const Session::Config& config)
{
    auto logger = common::getLogger("sdk");

    auto z_config = config.file ? zenoh::Config::from_file(*config.file) : zenoh::Config::create_default();
    if (!config.mode.empty())
    {
        z_config.insert_json5("mode", toJsonString(config.mode));
    }
    if (!config.connect_endpoints.empty())
    {
        z_config.insert_json5("connect/endpoints", toJsonArray(config.connect_endpoints));
    }
    if (!config.listen_endpoints.empty())
    {
        z_config.insert_json5("listen/endpoints", toJsonArray(config.listen_endpoints));
    }
    for (const auto& option : config.options)
    {
        logger->info("Configuring with PATH={}, VALUE={}", option.first, option.second);

        zenoh::ZResult err = Z_OK;
        z_config.insert_json5(option.first, option.second, &err);
        if (err != Z_OK)
        {
            logger->debug("Value of '{}' is not JSON5 (err={}), inserting it as a string.", option.first, err);
            z_config.insert_json5(option.first, toJsonString(option.second));
        }
    }
    return z_config;
}

/// Extracts the mode from the configuration (stored as a JSON string, f.e. `"peer"`).
///
std::string modeOf(const zenoh::Config& z_config)
{
    const auto json_text = z_config.get("mode");

    const auto value = nlohmann::json::parse(json_text, nullptr, false);
    if (value.is_string())
    {
        return value.get<std::string>();
    }
    return json_text;
}

/// Sender which starts a Zenoh operation on submit, and completes when the operation is over.
///
/// The start function receives the completion callback; it may be called from the Zenoh threads.
/// A synchronous `ZException` of the start function completes the sender with a failure.
///
template <typename Result>
class ZenohSender final : public SenderOf<Result>
{
public:
    using Complete = std::function<void(Result&&)>;
    using Start    = std::function<void(const std::shared_ptr<Complete>&)>;

    ZenohSender(std::string description, Start start)
        : description_{std::move(description)}
        , start_{std::move(start)}
    {
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        auto complete = std::make_shared<Complete>(std::move(receiver));
        try
        {
            start_(complete);

        } catch (const zenoh::ZException& ex)
        {
            common::getLogger("sdk")->warn("Failed to start {}: {}", description_, ex.what());
            (*complete)(Error{EIO, description_ + " failed: " + ex.what()});
        }
    }

private:
    std::string description_;
    Start       start_;

};  // ZenohSender

class SubscriberImpl final : public Session::Subscriber
{
public:
    explicit SubscriberImpl(zenoh::Subscriber<void>&& subscriber)
        : subscriber_{std::move(subscriber)}
    {
    }

private:
    zenoh::Subscriber<void> subscriber_;

};  // SubscriberImpl

class LivelinessTokenImpl final : public Session::LivelinessToken
{
public:
    explicit LivelinessTokenImpl(zenoh::LivelinessToken&& token)
        : token_{std::move(token)}
    {
    }

private:
    zenoh::LivelinessToken token_;

};  // LivelinessTokenImpl

class SessionImpl final : public Session
{
public:
    SessionImpl(zenoh::Session&& session, Config config, std::string mode)
        : session_{std::move(session)}
        , config_{std::move(config)}
        , mode_{std::move(mode)}
        , logger_{common::getLogger("sdk")}
    {
    }

    ~SessionImpl() override
    {
        logger_->debug("Closing Zenoh session...");
    }

    // MARK: Session

    std::string zid() const override
    {
        return idToString(session_.get_zid());
    }

    std::vector<std::string> routersZid() const override
    {
        return idsToStrings(session_.get_routers_z_id());
    }

    std::vector<std::string> peersZid() const override
    {
        return idsToStrings(session_.get_peers_z_id());
    }

    std::string mode() const override
    {
        return mode_;
    }

    CETL_NODISCARD cetl::optional<Error> put(const std::string& key, const Payload& payload) override
    {
        try
        {
            logger_->trace("put(key='{}', size={}).", key, payload.size());
            session_.put(zenoh::KeyExpr{key}, zenoh::Bytes{Payload{payload}});
            return cetl::nullopt;

        } catch (const zenoh::ZException& ex)
        {
            return Error{EIO, "put(" + key + ") failed: " + ex.what()};
        }
    }

    CETL_NODISCARD cetl::optional<Error> remove(const std::string& key) override
    {
        try
        {
            logger_->trace("delete(key='{}').", key);
            session_.delete_resource(zenoh::KeyExpr{key});
            return cetl::nullopt;

        } catch (const zenoh::ZException& ex)
        {
            return Error{EIO, "delete(" + key + ") failed: " + ex.what()};
        }
    }

    SenderOf<Query::Result>::Ptr get(const std::string&              selector,
                                     const cetl::optional<Payload>&  payload,
                                     const std::chrono::milliseconds timeout,
                                     ReplyHandler                    on_reply) override
    {
        const auto  query_pos  = selector.find('?');
        std::string key        = selector.substr(0, query_pos);
        std::string parameters = (query_pos != std::string::npos) ? selector.substr(query_pos + 1) : std::string{};

        return std::make_unique<ZenohSender<Query::Result>>(  //
            "get(" + selector + ")",
            [this, key, parameters, payload, timeout, on_reply](const auto& complete) {
                //
                auto options       = zenoh::Session::GetOptions::create_default();
                options.timeout_ms = static_cast<std::uint64_t>(timeout.count());
                if (payload)
                {
                    options.payload.emplace(Payload{*payload});
                }
                session_.get(
                    zenoh::KeyExpr{key},
                    parameters,
                    [on_reply](const zenoh::Reply& z_reply) { deliver(on_reply, toReply(z_reply)); },
                    [complete] { (*complete)(Query::Success{}); },
                    std::move(options));
            });
    }

    CETL_NODISCARD DeclareSubscriber::Result declareSubscriber(const std::string& key,
                                                               SampleHandler      on_sample) override
    {
        try
        {
            auto z_subscriber = session_.declare_subscriber(  //
                zenoh::KeyExpr{key},
                [on_sample](const zenoh::Sample& z_sample) { deliver(on_sample, toSample(z_sample)); },
                zenoh::closures::none);

            logger_->debug("Declared subscriber on '{}'.", key);
            return std::make_unique<SubscriberImpl>(std::move(z_subscriber));

        } catch (const zenoh::ZException& ex)
        {
            return Error{EIO, "Failed to declare subscriber on '" + key + "': " + ex.what()};
        }
    }

    SenderOf<Scout::Result>::Ptr scout(const std::string& what, const std::chrono::milliseconds timeout) override
    {
        const auto mask = parseWhat(what);
        if (!mask)
        {
            return std::make_unique<ZenohSender<Scout::Result>>(  //
                "scout",
                [what](const auto& complete) {
                    //
                    (*complete)(Error{EINVAL, "Invalid scouting target '" + what + "'."});
                });
        }

        return std::make_unique<ZenohSender<Scout::Result>>(  //
            "scout",
            [this, mask, timeout](const auto& complete) {
                //
                struct Collected final
                {
                    std::mutex         mutex;
                    std::vector<Hello> hellos;
                };
                auto collected = std::make_shared<Collected>();

                auto options       = zenoh::ScoutOptions::create_default();
                options.timeout_ms = static_cast<decltype(options.timeout_ms)>(timeout.count());
                options.what       = static_cast<decltype(options.what)>(*mask);

                zenoh::scout(
                    makeZenohConfig(config_),
                    [collected](const zenoh::Hello& z_hello) {
                        //
                        Hello hello;
                        hello.zid     = idToString(z_hello.get_id());
                        hello.whatami = whatamiToString(static_cast<int>(z_hello.get_whatami()));
                        for (const auto& locator : z_hello.get_locators())
                        {
                            hello.locators.emplace_back(locator);
                        }
                        const std::lock_guard<std::mutex> lock{collected->mutex};
                        collected->hellos.push_back(std::move(hello));
                    },
                    [collected, complete] {
                        //
                        std::vector<Hello> hellos;
                        {
                            const std::lock_guard<std::mutex> lock{collected->mutex};
                            hellos = std::move(collected->hellos);
                        }
                        (*complete)(std::move(hellos));
                    },
                    std::move(options));
            });
    }

    CETL_NODISCARD DeclareToken::Result declareLivelinessToken(const std::string& key) override
    {
        try
        {
            auto z_token = session_.liveliness_declare_token(zenoh::KeyExpr{key});
            logger_->debug("Declared liveliness token on '{}'.", key);
            return std::make_unique<LivelinessTokenImpl>(std::move(z_token));

        } catch (const zenoh::ZException& ex)
        {
            return Error{EIO, "Failed to declare liveliness token on '" + key + "': " + ex.what()};
        }
    }

    SenderOf<Query::Result>::Ptr livelinessGet(const std::string&              key,
                                               const std::chrono::milliseconds timeout,
                                               ReplyHandler                    on_reply) override
    {
        return std::make_unique<ZenohSender<Query::Result>>(  //
            "liveliness get(" + key + ")",
            [this, key, timeout, on_reply](const auto& complete) {
                //
                auto options       = zenoh::Session::LivelinessGetOptions::create_default();
                options.timeout_ms = static_cast<decltype(options.timeout_ms)>(timeout.count());

                session_.liveliness_get(
                    zenoh::KeyExpr{key},
                    [on_reply](const zenoh::Reply& z_reply) { deliver(on_reply, toReply(z_reply)); },
                    [complete] { (*complete)(Query::Success{}); },
                    std::move(options));
            });
    }

    CETL_NODISCARD DeclareSubscriber::Result declareLivelinessSubscriber(const std::string& key,
                                                                         const bool         history,
                                                                         SampleHandler      on_sample) override
    {
        try
        {
            auto options    = zenoh::Session::LivelinessSubscriberOptions::create_default();
            options.history = history;

            auto z_subscriber = session_.liveliness_declare_subscriber(  //
                zenoh::KeyExpr{key},
                [on_sample](const zenoh::Sample& z_sample) { deliver(on_sample, toSample(z_sample)); },
                zenoh::closures::none,
                std::move(options));

            logger_->debug("Declared liveliness subscriber on '{}' (history={}).", key, history);
            return std::make_unique<SubscriberImpl>(std::move(z_subscriber));

        } catch (const zenoh::ZException& ex)
        {
            return Error{EIO, "Failed to declare liveliness subscriber on '" + key + "': " + ex.what()};
        }
    }

private:
    template <typename Ids>
    static std::vector<std::string> idsToStrings(const Ids& ids)
    {
        std::vector<std::string> result;
        result.reserve(ids.size());
        for (const auto& id : ids)
        {
            result.push_back(idToString(id));
        }
        return result;
    }

    /// Invokes user handler from a Zenoh thread; exceptions must not leak into the library.
    ///
    template <typename Handler, typename Arg>
    static void deliver(const Handler& handler, const Arg& arg)
    {
        common::performWithoutThrowing([&handler, &arg] {
            //
            handler(arg);
        });
    }

    zenoh::Session    session_;
    const Config      config_;
    const std::string mode_;
    common::LoggerPtr logger_;

};  // SessionImpl

}  // namespace

Session::Make::Result Session::make(const Config& config)
{
    auto logger = common::getLogger("sdk");

    // Zenoh has its own logging (`RUST_LOG` environment variable); only errors are reported by default.
    static std::once_flag zenoh_log_once;
    std::call_once(zenoh_log_once, [] { zenoh::init_log_from_env_or("error"); });

    try
    {
        auto z_config = makeZenohConfig(config);
        auto mode     = modeOf(z_config);

        logger->info("Opening Zenoh session (mode={})...", mode);
        auto z_session = zenoh::Session::open(std::move(z_config));
        return std::make_shared<SessionImpl>(std::move(z_session), config, std::move(mode));

    } catch (const zenoh::ZException& ex)
    {
        return Error{EIO, std::string{"Failed to open Zenoh session: "} + ex.what()};
    }
}

}  // namespace sdk
}  // namespace zcli
