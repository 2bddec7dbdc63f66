//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/failover_gate.hpp"

#include "remoting/sdk/errors.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace remoting
{
namespace sdk
{

FailoverGate::Ptr FailoverGate::make(const Options& options)
{
    return std::make_shared<FailoverGate>(options);
}

bool FailoverGate::enterFailingOver()
{
    const std::lock_guard<std::mutex> lock{mutex_};
    if (state_.load() == State::FailingOver)
    {
        return false;
    }
    state_.store(State::FailingOver);
    return true;
}

bool FailoverGate::leaveFailingOver()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        if (state_.load() == State::Stable)
        {
            return false;
        }
        state_.store(State::Stable);
    }
    stable_cv_.notify_all();
    return true;
}

OptError FailoverGate::pass() const
{
    if (state_.load() == State::Stable)
    {
        return cetl::nullopt;
    }

    if ((options_.policy == FailoverPolicy::FailFast) || !awaitStable(options_.timeout))
    {
        return Error::FailingOver{};
    }
    return cetl::nullopt;
}

bool FailoverGate::awaitStable(const std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock{mutex_};
    return stable_cv_.wait_for(lock, timeout, [this] { return state_.load() == State::Stable; });
}

}  // namespace sdk
}  // namespace remoting
