//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_ERRORS_HPP_INCLUDED
#define REMOTING_SDK_ERRORS_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstdint>
#include <string>

namespace remoting
{
namespace sdk
{

/// Server-side identifier of a delegate's resource.
///
using DelegateId = std::int32_t;

/// Defines stable error codes of delegate operations.
///
/// Maps to `errno` values, hence `int` inheritance and zero on success.
/// These codes are also what travels in a server `Fault` reply.
///
enum class ErrorCode : int  // NOLINT
{
    Success         = 0,
    NotConnected    = ENOTCONN,
    Disconnected    = ESHUTDOWN,
    TimedOut        = ETIMEDOUT,
    ObjectClosed    = EBADF,
    InvalidState    = EINVAL,
    FailingOver     = EAGAIN,
    ProtocolVersion = EPROTONOSUPPORT,
    ServerFault     = EREMOTEIO,

};  // ErrorCode

/// Defines the kinds of failures a delegate invocation may end with.
///
struct Error final
{
    /// Send, receive or connection failure reported by the transport.
    /// Never retried by the delegate itself. Only connection loss and timeouts are worth resubmitting.
    struct TransportFailure final
    {
        int code;  // `errno`-like
    };

    /// A reply carries a version tag which is unsupported, or differs from the call's one.
    /// Fatal for the call.
    struct ProtocolVersion final
    {
        std::uint8_t version;  // zero if the transport rejected the reply before handing it over
    };

    /// The resource behind the delegate has been closed.
    struct ResourceClosed final
    {
        DelegateId id;
    };

    /// Programming error: invoke before attach, bad attach, or invalid synchronization source.
    struct InvalidState final
    {
        std::string reason;
    };

    /// The owning session is in the middle of a failover. Retryable.
    struct FailingOver final
    {};

    /// Exception reported by the server side.
    struct ServerFault final
    {
        std::int32_t code;
        std::string  message;
    };

    using Var = cetl::
        variant<TransportFailure, ProtocolVersion, ResourceClosed, InvalidState, FailingOver, ServerFault>;

};  // Error

using OptError = cetl::optional<Error::Var>;

/// Gets stable `errno`-like code of the given error.
///
CETL_NODISCARD int errorCodeOf(const Error::Var& error) noexcept;

/// Gets human-readable description of the given error.
///
CETL_NODISCARD std::string describe(const Error::Var& error);

/// Whether the operation failed only because of a transient condition, and may be resubmitted.
///
CETL_NODISCARD bool isRetryable(const Error::Var& error) noexcept;

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_ERRORS_HPP_INCLUDED
