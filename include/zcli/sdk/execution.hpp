//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_EXECUTION_HPP_INCLUDED
#define ZCLI_SDK_EXECUTION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace zcli
{
namespace sdk
{

/// Internal implementation details.
/// Not supposed to be used directly by the users of the SDK.
///
namespace detail
{

template <typename Result>
class StateOf;

template <typename Result>
class ReceiverOf final
{
public:
    explicit ReceiverOf(std::shared_ptr<StateOf<Result>> state)
        : state_{std::move(state)}
    {
    }

    template <typename... Args>
    void operator()(Args&&... args)
    {
        state_->complete(std::forward<Args>(args)...);
    }

private:
    std::shared_ptr<StateOf<Result>> state_;

};  // ReceiverOf

/// Holds the (eventual) result of an operation.
///
/// Results are emitted by the Zenoh runtime threads, so the state is guarded by a mutex,
/// and the waiting side is woken up by a condition variable.
/// Only the first emitted result is kept; later ones are ignored.
///
template <typename Result>
class StateOf final : public std::enable_shared_from_this<StateOf<Result>>
{
public:
    bool completed() const
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return maybe_result_.has_value();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock{mutex_};
        condition_.wait(lock, [this] { return maybe_result_.has_value(); });
    }

    /// @return `true` if the result has been emitted within the given timeout.
    ///
    bool waitFor(const std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock{mutex_};
        return condition_.wait_for(lock, timeout, [this] { return maybe_result_.has_value(); });
    }

    Result get()
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        CETL_DEBUG_ASSERT(maybe_result_, "");
        return std::move(*maybe_result_);
    }

    ReceiverOf<Result> makeReceiver()
    {
        return ReceiverOf<Result>{this->shared_from_this()};
    }

private:
    friend class ReceiverOf<Result>;

    template <typename... Args>
    void complete(Args&&... args)
    {
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (maybe_result_.has_value())
            {
                return;
            }
            maybe_result_.emplace(std::forward<Args>(args)...);
        }
        condition_.notify_all();
    }

    mutable std::mutex      mutex_;
    std::condition_variable condition_;
    cetl::optional<Result>  maybe_result_;

};  // StateOf

}  // namespace detail

/// Abstract interface of a result sender.
///
template <typename Result_>
class SenderOf
{
public:
    using Ptr    = std::unique_ptr<SenderOf>;
    using Result = Result_;

    SenderOf(SenderOf&&)                 = delete;
    SenderOf(const SenderOf&)            = delete;
    SenderOf& operator=(SenderOf&&)      = delete;
    SenderOf& operator=(const SenderOf&) = delete;

    virtual ~SenderOf() = default;

    /// Initiates an operation execution by submitting a given receiver to this sender.
    ///
    /// The submit "consumes" the receiver (no longer usable after this call).
    ///
    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

protected:
    SenderOf() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // SenderOf

/// Initiates an operation execution by submitting a given receiver to the sender.
///
/// Submit "consumes" the receiver (no longer usable after this call).
///
template <typename Sender, typename Receiver>
void submit(Sender& sender, Receiver&& receiver)
{
    sender.submit(std::forward<Receiver>(receiver));
}

/// Initiates an operation execution by submitting a given receiver to the sender.
///
/// The submit "consumes" the receiver (no longer usable after this call).
///
template <typename Sender, typename Receiver>
void submit(std::unique_ptr<Sender>& sender_ptr, Receiver&& receiver)
{
    sender_ptr->submit(std::forward<Receiver>(receiver));
}

/// Algorithm that synchronously waits for the sender to emit result.
///
/// This algorithm "consumes" the sender, meaning that the sender is no longer usable after this call.
/// The calling thread is blocked until the result is emitted (possibly from another thread).
///
template <typename Result, typename Sender>
Result sync_wait(Sender&& sender)
{
    auto state = std::make_shared<detail::StateOf<Result>>();

    submit(sender, state->makeReceiver());

    spdlog::trace("Waiting for sender result...");
    state->wait();
    spdlog::trace("Sender result is emitted.");

    return state->get();
}

/// Algorithm that synchronously waits for the sender to emit result, but only while `keep_waiting` allows it.
///
/// The calling thread wakes up at least once per `poll_period` to consult the `keep_waiting` predicate
/// (f.e. to react on a termination signal). A result emitted after the wait is abandoned is dropped.
///
/// @return The emitted result, or empty if the wait has been abandoned.
///
template <typename Result, typename Sender, typename Predicate>
cetl::optional<Result> sync_wait(Sender&& sender, const std::chrono::milliseconds poll_period, Predicate keep_waiting)
{
    auto state = std::make_shared<detail::StateOf<Result>>();

    submit(sender, state->makeReceiver());

    spdlog::trace("Waiting for sender result (poll_period={}ms)...", poll_period.count());
    while (!state->waitFor(poll_period))
    {
        if (!keep_waiting())
        {
            spdlog::trace("Waiting for sender result is abandoned.");
            return cetl::nullopt;
        }
    }
    spdlog::trace("Sender result is emitted.");

    return state->get();
}

}  // namespace sdk
}  // namespace zcli

#endif  // ZCLI_SDK_EXECUTION_HPP_INCLUDED
