//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_CLIENT_SESSION_HPP_INCLUDED
#define REMOTING_SDK_CLIENT_SESSION_HPP_INCLUDED

#include "client_pipe.hpp"
#include "config.hpp"
#include "consumer_delegate.hpp"
#include "delegate.hpp"
#include "dispatch_pipeline.hpp"
#include "endpoint_state.hpp"
#include "errors.hpp"
#include "failover_gate.hpp"
#include "invocation.hpp"
#include "operation_table.hpp"
#include "producer_delegate.hpp"
#include "session_delegate.hpp"
#include "transport.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace remoting
{
namespace sdk
{

/// Defines the client side of one logical connection to the server.
///
/// The session owns the connection-level state (the current endpoint state and the failover gate),
/// adopts delegates (attaches them to their dispatch pipelines and hands them the endpoint state),
/// and coordinates failover: it is the only writer of the endpoint state of its delegates.
///
class ClientSession
{
public:
    using Ptr = std::shared_ptr<ClientSession>;

    struct Options final
    {
        /// Extra one-way operations (in addition to the built-in ones).
        std::vector<std::string> one_way_operations;

        ProtocolVersion           protocol_version{ProtocolVersion::Current};
        FailoverGate::Options     failover;
        std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};  // NOLINT(*-magic-numbers)

        /// Interceptors which every adopted delegate's pipeline starts with.
        std::vector<Interceptor::Ptr> interceptors;

        /// Builds options from the configuration. Absent keys keep their defaults.
        ///
        CETL_NODISCARD static Options fromConfig(const Config& config);

    };  // Options

    /// Produces the replacement handle (the resource recreated on the new server) of a delegate.
    ///
    /// Returning `nullptr` means that the resource could not be recovered.
    ///
    using Resolver = std::function<DelegateHandle::Ptr(const DelegateHandle& lost)>;

    struct Failover final
    {
        using Success = std::size_t;  // number of re-synchronized delegates
        using Failure = Error::Var;
        using Result  = cetl::variant<Success, Failure>;
    };

    template <typename Delegate>
    struct Create final
    {
        using Success = std::shared_ptr<Delegate>;
        using Failure = Error::Var;
        using Result  = cetl::variant<Success, Failure>;
    };

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory, Transport::Ptr transport, Options options);

    /// Makes a session which talks to the server over the given pipe.
    ///
    /// The pipe transport waits for replies up to `options.request_timeout`, and its disconnection
    /// switches the session into "failing over" state.
    ///
    /// @return `nullptr` if the transport could not be started.
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory, ClientPipe::Ptr client_pipe, Options options);

    ClientSession(ClientSession&&)                 = delete;
    ClientSession(const ClientSession&)            = delete;
    ClientSession& operator=(ClientSession&&)      = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    virtual ~ClientSession() = default;

    CETL_NODISCARD virtual const OperationTable::Ptr& operations() const noexcept = 0;

    CETL_NODISCARD virtual EndpointState::Ptr endpointState() const = 0;

    CETL_NODISCARD virtual bool isFailingOver() const noexcept = 0;

    /// Attaches the delegate to a new dispatch pipeline, and hands it the current endpoint state.
    ///
    /// The session tracks adopted delegates weakly; it does not prolong their lifetime.
    ///
    CETL_NODISCARD virtual OptError adopt(const DelegateHandle::Ptr& delegate) = 0;

    /// Number of delegates the session currently tracks (including expired ones not yet pruned).
    ///
    CETL_NODISCARD virtual std::size_t trackedDelegates() const = 0;

    /// Makes and adopts the handle of an already existing server-side session.
    ///
    CETL_NODISCARD virtual Create<SessionDelegate>::Result openSession(const DelegateId session_id) = 0;

    /// Asks the server session to create a producer, and then makes and adopts its handle.
    ///
    CETL_NODISCARD virtual Create<ProducerDelegate>::Result createProducer(SessionDelegate&        session,
                                                                           const cetl::string_view address) = 0;

    /// Asks the server session to create a consumer, and then makes and adopts its handle.
    ///
    CETL_NODISCARD virtual Create<ConsumerDelegate>::Result createConsumer(SessionDelegate&        session,
                                                                           const cetl::string_view address) = 0;

    /// Switches the session into "failing over" state.
    ///
    /// Called on loss of the current transport. Subsequent invocations either block or fail
    /// (depending on the failover policy) until `failover` completes.
    ///
    virtual void onTransportDisconnected() = 0;

    /// Re-points all live delegates to the new transport.
    ///
    /// For every delegate the `resolver` provides its replacement, which the delegate is synchronized with.
    /// Then the new endpoint state is installed (as a single pointer swap per delegate),
    /// and the session becomes stable again.
    ///
    /// @return Number of re-synchronized delegates, or `Error::InvalidState` on bad arguments.
    ///
    CETL_NODISCARD virtual Failover::Result failover(Transport::Ptr        new_transport,
                                                     const ProtocolVersion new_version,
                                                     const Resolver&       resolver) = 0;

    /// Re-points all live delegates to a pipe transport over the given new pipe.
    ///
    /// The transport is made and started the same way as by the pipe-based `make`.
    ///
    /// @return `Error::TransportFailure` if the transport could not be started (the session stays as it was).
    ///
    CETL_NODISCARD virtual Failover::Result failover(ClientPipe::Ptr       new_pipe,
                                                     const ProtocolVersion new_version,
                                                     const Resolver&       resolver) = 0;

    /// Invokes through the delegate's pipeline, and resubmits once if the first attempt failed
    /// because of failover or a transport failure (after waiting for the session to become stable).
    ///
    CETL_NODISCARD virtual Invocation::Result resubmit(DelegateHandle& delegate, Invocation& invocation) = 0;

protected:
    ClientSession() = default;

};  // ClientSession

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_CLIENT_SESSION_HPP_INCLUDED
