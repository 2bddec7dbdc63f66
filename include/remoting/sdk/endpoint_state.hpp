//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_ENDPOINT_STATE_HPP_INCLUDED
#define REMOTING_SDK_ENDPOINT_STATE_HPP_INCLUDED

#include "failover_gate.hpp"
#include "invocation.hpp"
#include "transport.hpp"

#include <cetl/cetl.hpp>

#include <memory>
#include <utility>

namespace remoting
{
namespace sdk
{

/// Per-connection state which delegates need to reach the server.
///
/// Immutable: a failover installs a brand-new instance instead of modifying the current one,
/// so an invocation always sees the transport and the version of the same connection.
/// Shared by all delegates of one session.
///
class EndpointState final
{
public:
    using Ptr = std::shared_ptr<const EndpointState>;

    CETL_NODISCARD static Ptr make(Transport::Ptr        transport,
                                   const ProtocolVersion negotiated_version,
                                   FailoverGate::Ptr     gate)
    {
        return std::make_shared<const EndpointState>(std::move(transport), negotiated_version, std::move(gate));
    }

    EndpointState(Transport::Ptr transport, const ProtocolVersion negotiated_version, FailoverGate::Ptr gate)
        : transport_{std::move(transport)}
        , negotiated_version_{negotiated_version}
        , gate_{std::move(gate)}
    {
        CETL_DEBUG_ASSERT(transport_, "");
        CETL_DEBUG_ASSERT(gate_, "");
    }

    EndpointState(EndpointState&&)                 = delete;
    EndpointState(const EndpointState&)            = delete;
    EndpointState& operator=(EndpointState&&)      = delete;
    EndpointState& operator=(const EndpointState&) = delete;

    ~EndpointState() = default;

    CETL_NODISCARD Transport& transport() const noexcept
    {
        return *transport_;
    }

    CETL_NODISCARD const Transport::Ptr& transportPtr() const noexcept
    {
        return transport_;
    }

    CETL_NODISCARD ProtocolVersion negotiatedVersion() const noexcept
    {
        return negotiated_version_;
    }

    CETL_NODISCARD const FailoverGate& gate() const noexcept
    {
        return *gate_;
    }

private:
    const Transport::Ptr    transport_;
    const ProtocolVersion   negotiated_version_;
    const FailoverGate::Ptr gate_;

};  // EndpointState

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_ENDPOINT_STATE_HPP_INCLUDED
