//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/delegate.hpp"

#include "logging.hpp"

#include "remoting/sdk/dispatch_pipeline.hpp"
#include "remoting/sdk/endpoint_state.hpp"
#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/invocation.hpp"
#include "remoting/sdk/operation_table.hpp"
#include "remoting/sdk/transport.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cerrno>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace remoting
{
namespace sdk
{

constexpr DelegateId DelegateHandle::InvalidId;

DelegateHandle::Ptr DelegateHandle::make(OperationTable::Ptr operations, const DelegateId id)
{
    return std::make_shared<DelegateHandle>(Private(), std::move(operations), id);
}

DelegateHandle::DelegateHandle(Private, OperationTable::Ptr operations, const DelegateId id)
    : operations_{std::move(operations)}
    , logger_{common::getLogger("sdk")}
    , id_{id}
    , closed_{false}
{
    CETL_DEBUG_ASSERT(operations_, "");
}

DelegateHandle::~DelegateHandle() = default;

bool DelegateHandle::isAttached() const
{
    const std::lock_guard<std::mutex> lock{pipeline_mutex_};
    return static_cast<bool>(pipeline_);
}

OptError DelegateHandle::attach(const DispatchPipeline::Ptr& pipeline)
{
    CETL_DEBUG_ASSERT(pipeline, "");

    const std::lock_guard<std::mutex> lock{pipeline_mutex_};

    if (pipeline_ == pipeline)
    {
        return cetl::nullopt;
    }
    if (pipeline_)
    {
        return Error::InvalidState{"delegate is already attached to another pipeline"};
    }

    if (auto error = pipeline->attachTerminal(shared_from_this()))
    {
        return error;
    }
    pipeline_ = pipeline;

    logger_->trace("Delegate attached (id={}).", id());
    return cetl::nullopt;
}

Invocation::Result DelegateHandle::invoke(Invocation& invocation)
{
    if (!isAttached())
    {
        return Error::Var{Error::InvalidState{"delegate is not attached"}};
    }
    if (isClosed())
    {
        return Error::Var{Error::ResourceClosed{id()}};
    }

    EndpointState::Ptr state;
    DelegateId         target_id = InvalidId;
    while (true)
    {
        state = endpointState();
        if (!state)
        {
            return Error::Var{Error::InvalidState{"delegate has no endpoint state"}};
        }
        target_id = id();

        // Failover re-synchronizes the id before it installs a new state, and it stays in the "failing over" state
        // until then. So the id and the state belong to the same connection only if the gate is stable,
        // and the state is still the current one after the id has been read.
        //
        if ((state->gate().state() == FailoverGate::State::Stable) && (endpointState() == state))
        {
            break;
        }

        // While failing over, the gate either holds us until a new endpoint state is installed, or fails at once.
        //
        if (auto error = state->gate().pass())
        {
            logger_->debug("Invocation is not passed by the failover gate (id={}, op='{}').",
                           target_id,
                           invocation.operation.name);
            return std::move(*error);
        }
    }

    // From now on, only this snapshot is used, so transport, version and target id always belong together.
    //
    const InvocationEnvelope envelope{state->negotiatedVersion(),
                                      InvocationEnvelope::Call{target_id, invocation.operation, invocation.arguments}};

    if (operations_->isOneWay(invocation.operation))
    {
        return invokeOneWay(*state, envelope);
    }
    return invokeRequest(*state, envelope);
}

Invocation::Result DelegateHandle::call(Invocation& invocation)
{
    DispatchPipeline::Ptr pipeline;
    {
        const std::lock_guard<std::mutex> lock{pipeline_mutex_};
        pipeline = pipeline_;
    }
    if (!pipeline)
    {
        return Error::Var{Error::InvalidState{"delegate is not attached"}};
    }
    return pipeline->invoke(invocation);
}

OptError DelegateHandle::synchronizeWith(const DelegateHandle& source)
{
    const auto source_id = source.id();
    if (source_id == InvalidId)
    {
        return Error::InvalidState{"synchronization source has no valid id"};
    }

    const auto old_id = id_.exchange(source_id);
    if (old_id != source_id)
    {
        logger_->debug("Delegate synchronized (id={} -> {}).", old_id, source_id);
    }
    return cetl::nullopt;
}

void DelegateHandle::setEndpointState(EndpointState::Ptr endpoint_state)
{
    std::atomic_store(&endpoint_state_, std::move(endpoint_state));
}

cetl::string_view DelegateHandle::name() const noexcept
{
    return "delegate";
}

Invocation::Result DelegateHandle::intercept(Invocation& invocation, const Next& next)
{
    CETL_DEBUG_ASSERT(!next, "Delegate is always the terminal step.");
    (void) next;

    return invoke(invocation);
}

Invocation::Result DelegateHandle::dispatch(const cetl::string_view operation_name, Bytes arguments)
{
    Invocation invocation{Operation::make(operation_name), std::move(arguments)};
    return call(invocation);
}

Invocation::Result DelegateHandle::invokeOneWay(const EndpointState& state, const InvocationEnvelope& envelope)
{
    const auto& call = cetl::get<InvocationEnvelope::Call>(envelope.payload());
    logger_->trace("Invoking one-way (id={}, op='{}', ver={}).",
                   call.target_id,
                   call.operation.name,
                   state.negotiatedVersion());

    if (const int err = state.transport().sendOneWay(envelope))
    {
        logger_->debug("Failed to send one-way (id={}, op='{}', err={}).",
                       call.target_id,
                       call.operation.name,
                       err);
        return Error::Var{Error::TransportFailure{err}};
    }

    logger_->trace("Invoked one-way (id={}, op='{}').", call.target_id, call.operation.name);
    return Invocation::Success{};
}

Invocation::Result DelegateHandle::invokeRequest(const EndpointState& state, const InvocationEnvelope& envelope)
{
    const auto& call = cetl::get<InvocationEnvelope::Call>(envelope.payload());
    logger_->trace("Invoking (id={}, op='{}', ver={}).",
                   call.target_id,
                   call.operation.name,
                   state.negotiatedVersion());

    auto request_result = state.transport().sendRequest(envelope);
    if (const auto* const err = cetl::get_if<Transport::Request::Failure>(&request_result))
    {
        logger_->debug("Failed to send request (id={}, op='{}', err={}).",
                       call.target_id,
                       call.operation.name,
                       *err);

        // The transport drops replies of unsupported versions, and fails their requests.
        if (*err == static_cast<int>(ErrorCode::ProtocolVersion))
        {
            return Error::Var{Error::ProtocolVersion{0}};
        }
        return Error::Var{Error::TransportFailure{*err}};
    }

    auto result = unwrapReply(state, cetl::get<Transport::Request::Success>(std::move(request_result)));
    if (const auto* const error = cetl::get_if<Invocation::Failure>(&result))
    {
        logger_->trace("Invoked (id={}, op='{}', error='{}').",
                       call.target_id,
                       call.operation.name,
                       *error);
    }
    else
    {
        logger_->trace("Invoked (id={}, op='{}').", call.target_id, call.operation.name);
    }
    return result;
}

Invocation::Result DelegateHandle::unwrapReply(const EndpointState& state, InvocationEnvelope&& reply)
{
    // A reply must belong to the same connection (hence version) as its request.
    //
    const auto reply_version = static_cast<std::uint8_t>(reply.version());
    if (!isSupportedVersion(reply_version) || (reply.version() != state.negotiatedVersion()))
    {
        logger_->warn("Reply version mismatch (id={}, ver={}, expected={}).",
                      id(),
                      reply_version,
                      state.negotiatedVersion());
        return Error::Var{Error::ProtocolVersion{reply_version}};
    }

    auto payload = std::move(reply).releasePayload();
    return cetl::visit(  //
        cetl::make_overloaded(
            [](InvocationEnvelope::Reply& value) -> Invocation::Result {
                //
                return Invocation::Success{std::move(value.value)};
            },
            [this](InvocationEnvelope::Fault& fault) -> Invocation::Result {
                //
                if (fault.code == static_cast<std::int32_t>(ErrorCode::ObjectClosed))
                {
                    markClosed();
                    return Error::Var{Error::ResourceClosed{id()}};
                }
                return Error::Var{Error::ServerFault{fault.code, std::move(fault.message)}};
            },
            [](InvocationEnvelope::Call&) -> Invocation::Result {
                //
                return Error::Var{Error::ServerFault{EPROTO, "unexpected call in place of reply"}};
            }),
        payload);
}

}  // namespace sdk
}  // namespace remoting
