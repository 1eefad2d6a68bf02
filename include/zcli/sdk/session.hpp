//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_SESSION_HPP_INCLUDED
#define ZCLI_SDK_SESSION_HPP_INCLUDED

#include "codec.hpp"
#include "error.hpp"
#include "execution.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace zcli
{
namespace sdk
{

/// A piece of data received from the Zenoh network.
///
struct Sample final
{
    enum class Kind
    {
        Put,
        Delete,
    };

    std::string key;
    Payload     payload;
    Kind        kind{Kind::Put};

};  // Sample

/// An error reply to a query.
///
struct ReplyError final
{
    Payload payload;

};  // ReplyError

using Reply = cetl::variant<Sample, ReplyError>;

/// An answer to scouting.
///
struct Hello final
{
    std::string              zid;
    std::string              whatami;
    std::vector<std::string> locators;

};  // Hello

/// Defines the interface of a Zenoh session.
///
/// All network operations are delegated to the Zenoh library; this interface only adapts them
/// to the SDK types. Callbacks (`SampleHandler`, `ReplyHandler`) may be invoked from the library threads.
///
class Session
{
public:
    using Ptr = std::shared_ptr<Session>;

    using SampleHandler = std::function<void(const Sample&)>;
    using ReplyHandler  = std::function<void(const Reply&)>;

    /// Session configuration, as collected from the command line.
    ///
    struct Config final
    {
        /// Optional path to a Zenoh (JSON5) configuration file.
        cetl::optional<std::string> file;

        /// One of `peer`, `client` or `router`. Empty keeps the mode of the file (or the default).
        std::string mode;

        std::vector<std::string> connect_endpoints;
        std::vector<std::string> listen_endpoints;

        /// Extra `PATH` -> `VALUE` configuration insertions (in order).
        /// Values are JSON5; a value which is not valid JSON5 is inserted as a JSON string.
        std::vector<std::pair<std::string, std::string>> options;

    };  // Config

    /// RAII handle of a declared subscriber. Undeclares the subscriber on destruction.
    ///
    class Subscriber
    {
    public:
        using Ptr = std::unique_ptr<Subscriber>;

        Subscriber(Subscriber&&)                 = delete;
        Subscriber(const Subscriber&)            = delete;
        Subscriber& operator=(Subscriber&&)      = delete;
        Subscriber& operator=(const Subscriber&) = delete;

        virtual ~Subscriber() = default;

    protected:
        Subscriber() = default;

    };  // Subscriber

    /// RAII handle of a declared liveliness token. Undeclares the token on destruction.
    ///
    class LivelinessToken
    {
    public:
        using Ptr = std::unique_ptr<LivelinessToken>;

        LivelinessToken(LivelinessToken&&)                 = delete;
        LivelinessToken(const LivelinessToken&)            = delete;
        LivelinessToken& operator=(LivelinessToken&&)      = delete;
        LivelinessToken& operator=(const LivelinessToken&) = delete;

        virtual ~LivelinessToken() = default;

    protected:
        LivelinessToken() = default;

    };  // LivelinessToken

    struct Make final
    {
        using Success = Ptr;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Opens a new Zenoh session.
    ///
    /// The session is closed when the last reference to it is released.
    ///
    CETL_NODISCARD static Make::Result make(const Config& config);

    Session(Session&&)                 = delete;
    Session(const Session&)            = delete;
    Session& operator=(Session&&)      = delete;
    Session& operator=(const Session&) = delete;

    virtual ~Session() = default;

    virtual std::string              zid() const        = 0;
    virtual std::vector<std::string> routersZid() const = 0;
    virtual std::vector<std::string> peersZid() const   = 0;

    /// The mode (`peer`, `client` or `router`) the session was opened with.
    ///
    virtual std::string mode() const = 0;

    CETL_NODISCARD virtual cetl::optional<Error> put(const std::string& key, const Payload& payload) = 0;
    CETL_NODISCARD virtual cetl::optional<Error> remove(const std::string& key)                      = 0;

    /// Defines the result of a query (either a regular or a liveliness one).
    ///
    /// Success means that the stream of replies has ended; individual replies are
    /// delivered to the reply handler as they arrive.
    ///
    struct Query final
    {
        using Success = cetl::monostate;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Makes async sender of a query.
    ///
    /// @param selector Key expression, optionally followed by `?` and parameters.
    /// @param payload Optional payload attached to the query.
    /// @param timeout Maximum time to wait for the replies.
    /// @param on_reply Handler of every received reply.
    ///
    virtual SenderOf<Query::Result>::Ptr get(const std::string&             selector,
                                             const cetl::optional<Payload>& payload,
                                             const std::chrono::milliseconds timeout,
                                             ReplyHandler                   on_reply) = 0;

    struct DeclareSubscriber final
    {
        using Success = Subscriber::Ptr;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual DeclareSubscriber::Result declareSubscriber(const std::string& key,
                                                                       SampleHandler      on_sample) = 0;

    struct Scout final
    {
        using Success = std::vector<Hello>;
        using Failure = Error;  // `EINVAL` for unknown `what` entries
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Makes async sender of scouting, which emits all the answers collected within the timeout.
    ///
    /// @param what Pipe-separated combination of `peer`, `router` and `client`.
    ///
    virtual SenderOf<Scout::Result>::Ptr scout(const std::string& what, const std::chrono::milliseconds timeout) = 0;

    struct DeclareToken final
    {
        using Success = LivelinessToken::Ptr;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual DeclareToken::Result declareLivelinessToken(const std::string& key) = 0;

    /// Makes async sender of a liveliness query; every alive token is delivered as a `Put` sample.
    ///
    virtual SenderOf<Query::Result>::Ptr livelinessGet(const std::string&              key,
                                                       const std::chrono::milliseconds timeout,
                                                       ReplyHandler                    on_reply) = 0;

    /// Declares subscriber to liveliness changes (`Put` sample - token alive, `Delete` sample - token dropped).
    ///
    /// @param history If `true`, currently alive tokens are delivered right after the declaration.
    ///
    CETL_NODISCARD virtual DeclareSubscriber::Result declareLivelinessSubscriber(const std::string& key,
                                                                                 const bool         history,
                                                                                 SampleHandler      on_sample) = 0;

protected:
    Session() = default;

};  // Session

}  // namespace sdk
}  // namespace zcli

#endif  // ZCLI_SDK_SESSION_HPP_INCLUDED
