//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/dispatch_pipeline.hpp"

#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/invocation.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace remoting
{
namespace sdk
{
namespace
{

/// Runs the invocation through `interceptors[index..]`, and then through the terminal step.
///
Invocation::Result invokeFrom(const std::vector<Interceptor::Ptr>& interceptors,
                              const std::size_t                    index,
                              Interceptor&                         terminal,
                              Invocation&                          invocation)
{
    if (index == interceptors.size())
    {
        return terminal.intercept(invocation, {});
    }

    const Interceptor::Next next = [&interceptors, index, &terminal](Invocation& next_invocation) {
        //
        return invokeFrom(interceptors, index + 1, terminal, next_invocation);
    };
    return interceptors[index]->intercept(invocation, next);
}

}  // namespace

DispatchPipeline::Ptr DispatchPipeline::make(std::vector<Interceptor::Ptr> interceptors)
{
    return std::make_shared<DispatchPipeline>(std::move(interceptors));
}

void DispatchPipeline::addInterceptor(Interceptor::Ptr interceptor)
{
    CETL_DEBUG_ASSERT(interceptor, "");

    const std::lock_guard<std::mutex> lock{mutex_};
    interceptors_.push_back(std::move(interceptor));
}

OptError DispatchPipeline::attachTerminal(const std::shared_ptr<Interceptor>& terminal)
{
    CETL_DEBUG_ASSERT(terminal, "");

    const std::lock_guard<std::mutex> lock{mutex_};

    const auto existing = terminal_.lock();
    if (existing == terminal)
    {
        return cetl::nullopt;
    }
    if (existing)
    {
        return Error::InvalidState{"pipeline already has another terminal step"};
    }
    terminal_ = terminal;
    return cetl::nullopt;
}

bool DispatchPipeline::hasTerminal() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return !terminal_.expired();
}

Invocation::Result DispatchPipeline::invoke(Invocation& invocation) const
{
    // Snapshot the chain, so that interceptors run without the lock.
    //
    std::vector<Interceptor::Ptr> interceptors;
    std::shared_ptr<Interceptor>  terminal;
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        interceptors = interceptors_;
        terminal     = terminal_.lock();
    }
    if (!terminal)
    {
        return Error::Var{Error::InvalidState{"no terminal step attached"}};
    }

    return invokeFrom(interceptors, 0, *terminal, invocation);
}

}  // namespace sdk
}  // namespace remoting
