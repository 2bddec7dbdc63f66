//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_DELEGATE_HPP_INCLUDED
#define REMOTING_SDK_DELEGATE_HPP_INCLUDED

#include "dispatch_pipeline.hpp"
#include "endpoint_state.hpp"
#include "errors.hpp"
#include "invocation.hpp"
#include "operation_table.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <atomic>
#include <limits>
#include <memory>
#include <mutex>

namespace spdlog
{
class logger;
}

namespace remoting
{
namespace sdk
{

/// Client-side handle of a server-resident resource.
///
/// Turns local operations into remote invocations: every call is wrapped into an envelope which
/// carries the server-side id of the resource and the protocol version negotiated for the current connection.
/// The handle stays valid across failovers - its owning session re-points it at a new endpoint state
/// (and re-synchronizes its id) without the callers noticing anything but a short blocking (or a retryable error).
///
/// Thread-safe: any number of threads may invoke operations concurrently.
///
class DelegateHandle : public Interceptor, public std::enable_shared_from_this<DelegateHandle>
{
protected:
    /// Restricts construction to the `make` factories, so that a handle is always owned by a `std::shared_ptr`.
    struct Private
    {
        explicit Private() = default;
    };

public:
    using Ptr = std::shared_ptr<DelegateHandle>;

    /// Id of a handle which is not (yet) bound to any server-side resource.
    static constexpr DelegateId InvalidId = std::numeric_limits<DelegateId>::min();

    CETL_NODISCARD static Ptr make(OperationTable::Ptr operations, const DelegateId id = InvalidId);

    DelegateHandle(Private, OperationTable::Ptr operations, const DelegateId id);

    DelegateHandle(DelegateHandle&&)                 = delete;
    DelegateHandle(const DelegateHandle&)            = delete;
    DelegateHandle& operator=(DelegateHandle&&)      = delete;
    DelegateHandle& operator=(const DelegateHandle&) = delete;

    ~DelegateHandle() override;

    CETL_NODISCARD DelegateId id() const noexcept
    {
        return id_.load();
    }

    CETL_NODISCARD bool isClosed() const noexcept
    {
        return closed_.load();
    }

    CETL_NODISCARD bool isAttached() const;

    CETL_NODISCARD const OperationTable& operations() const noexcept
    {
        return *operations_;
    }

    CETL_NODISCARD EndpointState::Ptr endpointState() const
    {
        return std::atomic_load(&endpoint_state_);
    }

    /// Installs this handle as the terminal step of the given dispatch pipeline.
    ///
    /// Attaching to the same pipeline again is a no-op.
    ///
    /// @return `Error::InvalidState` if the handle is already attached to a different pipeline,
    ///         or if the pipeline already has a different terminal step.
    ///
    CETL_NODISCARD OptError attach(const DispatchPipeline::Ptr& pipeline);

    /// Performs remote invocation of an operation on the server-side resource.
    ///
    /// One-way operations are sent without waiting, and complete with an empty success value.
    /// Request/response operations block until the reply (or a transport failure) arrives.
    /// The whole call works with a single endpoint state snapshot, so its transport, its version and
    /// the target id always belong to the same connection, even if a failover happens in the middle.
    ///
    CETL_NODISCARD Invocation::Result invoke(Invocation& invocation);

    /// Invokes an operation through the attached pipeline, so that all its interceptors see the invocation.
    ///
    /// @return `Error::InvalidState` if the handle is not attached.
    ///
    CETL_NODISCARD Invocation::Result call(Invocation& invocation);

    /// Replaces the id of this handle with the id of the given one.
    ///
    /// Used by failover to re-bind the handle to the resource recreated on a new server.
    /// Nothing else is copied. Idempotent, and has no network side effects.
    ///
    /// @return `Error::InvalidState` if the source does not have a valid id.
    ///
    CETL_NODISCARD OptError synchronizeWith(const DelegateHandle& source);

    /// Atomically replaces the endpoint state which all subsequent invocations will use.
    ///
    /// Invocations already in flight keep their snapshot.
    ///
    void setEndpointState(EndpointState::Ptr endpoint_state);

    // MARK: Interceptor

    CETL_NODISCARD cetl::string_view name() const noexcept override;

    Invocation::Result intercept(Invocation& invocation, const Next& next) override;

protected:
    CETL_NODISCARD Invocation::Result dispatch(const cetl::string_view operation_name, Bytes arguments);

    void markClosed() noexcept
    {
        closed_.store(true);
    }

    CETL_NODISCARD spdlog::logger& logger() const noexcept
    {
        return *logger_;
    }

private:
    CETL_NODISCARD Invocation::Result invokeOneWay(const EndpointState& state, const InvocationEnvelope& envelope);
    CETL_NODISCARD Invocation::Result invokeRequest(const EndpointState& state, const InvocationEnvelope& envelope);
    CETL_NODISCARD Invocation::Result unwrapReply(const EndpointState& state, InvocationEnvelope&& reply);

    const OperationTable::Ptr             operations_;
    const std::shared_ptr<spdlog::logger> logger_;
    std::atomic<DelegateId>               id_;
    std::atomic<bool>                     closed_;
    EndpointState::Ptr                    endpoint_state_;  // accessed with `std::atomic_load/store` only
    mutable std::mutex                    pipeline_mutex_;
    DispatchPipeline::Ptr                 pipeline_;

};  // DelegateHandle

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_DELEGATE_HPP_INCLUDED
