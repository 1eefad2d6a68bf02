//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_SESSION_MOCK_HPP_INCLUDED
#define ZCLI_SDK_SESSION_MOCK_HPP_INCLUDED

#include "ref_wrapper.hpp"

#include <zcli/sdk/execution.hpp>
#include <zcli/sdk/session.hpp>

#include <gmock/gmock.h>

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

class SubscriberMock
{
public:
    using Wrapper = RefWrapper<Session::Subscriber, SubscriberMock>;

    MOCK_METHOD(void, deinit, (), (const));

};  // SubscriberMock

class LivelinessTokenMock
{
public:
    using Wrapper = RefWrapper<Session::LivelinessToken, LivelinessTokenMock>;

    MOCK_METHOD(void, deinit, (), (const));

};  // LivelinessTokenMock

/// Sender which emits a prepared result on submit (synchronously, in the calling thread).
///
template <typename Result>
class ReadySender final : public SenderOf<Result>
{
public:
    explicit ReadySender(Result result)
        : result_{std::move(result)}
    {
    }

    static typename SenderOf<Result>::Ptr make(Result result)
    {
        return std::make_unique<ReadySender>(std::move(result));
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        receiver(std::move(result_));
    }

private:
    Result result_;

};  // ReadySender

/// Sender which never emits a result (like a query which still waits for its replies).
///
/// The submitted receiver is kept, so it is possible to emit a result later (or never).
///
template <typename Result>
class PendingSender final : public SenderOf<Result>
{
public:
    static typename SenderOf<Result>::Ptr make()
    {
        return std::make_unique<PendingSender>();
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        receiver_ = std::move(receiver);
    }

private:
    std::function<void(Result&&)> receiver_;

};  // PendingSender

class SessionMock : public Session
{
public:
    SessionMock() = default;

    MOCK_METHOD(std::string, zid, (), (const, override));
    MOCK_METHOD(std::vector<std::string>, routersZid, (), (const, override));
    MOCK_METHOD(std::vector<std::string>, peersZid, (), (const, override));
    MOCK_METHOD(std::string, mode, (), (const, override));

    MOCK_METHOD(cetl::optional<Error>, put, (const std::string& key, const Payload& payload), (override));
    MOCK_METHOD(cetl::optional<Error>, remove, (const std::string& key), (override));

    MOCK_METHOD(SenderOf<Query::Result>::Ptr,
                get,
                (const std::string&             selector,
                 const cetl::optional<Payload>& payload,
                 const std::chrono::milliseconds timeout,
                 ReplyHandler                   on_reply),
                (override));

    MOCK_METHOD(DeclareSubscriber::Result,
                declareSubscriber,
                (const std::string& key, SampleHandler on_sample),
                (override));

    MOCK_METHOD(SenderOf<Scout::Result>::Ptr,
                scout,
                (const std::string& what, const std::chrono::milliseconds timeout),
                (override));

    MOCK_METHOD(DeclareToken::Result, declareLivelinessToken, (const std::string& key), (override));

    MOCK_METHOD(SenderOf<Query::Result>::Ptr,
                livelinessGet,
                (const std::string& key, const std::chrono::milliseconds timeout, ReplyHandler on_reply),
                (override));

    MOCK_METHOD(DeclareSubscriber::Result,
                declareLivelinessSubscriber,
                (const std::string& key, const bool history, SampleHandler on_sample),
                (override));

};  // SessionMock

}  // namespace sdk
}  // namespace zcli

#endif  // ZCLI_SDK_SESSION_MOCK_HPP_INCLUDED
