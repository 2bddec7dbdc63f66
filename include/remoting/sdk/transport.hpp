//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_TRANSPORT_HPP_INCLUDED
#define REMOTING_SDK_TRANSPORT_HPP_INCLUDED

#include "invocation.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>

namespace remoting
{
namespace sdk
{

/// Defines the contract of a transport which carries invocation envelopes to the server and back.
///
/// Implementations must be safe to call concurrently from multiple threads.
///
class Transport
{
public:
    using Ptr = std::shared_ptr<Transport>;

    struct Request final
    {
        using Success = InvocationEnvelope;
        using Failure = int;  // `errno`-like error code
        using Result  = cetl::variant<Success, Failure>;
    };

    Transport(Transport&&)                 = delete;
    Transport(const Transport&)            = delete;
    Transport& operator=(Transport&&)      = delete;
    Transport& operator=(const Transport&) = delete;

    virtual ~Transport() = default;

    /// Sends the envelope without waiting for any server acknowledgment.
    ///
    /// @return Zero on success, otherwise `errno`-like send error.
    ///
    CETL_NODISCARD virtual int sendOneWay(const InvocationEnvelope& envelope) = 0;

    /// Sends the envelope, and blocks the calling thread until the reply envelope arrives.
    ///
    /// The transport owns the timeout of the round trip (`ETIMEDOUT` failure).
    ///
    CETL_NODISCARD virtual Request::Result sendRequest(const InvocationEnvelope& envelope) = 0;

protected:
    Transport() = default;

};  // Transport

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_TRANSPORT_HPP_INCLUDED
