//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <string>

namespace remoting
{
namespace sdk
{

int errorCodeOf(const Error::Var& error) noexcept
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [](const Error::TransportFailure& failure) { return failure.code; },
            [](const Error::ProtocolVersion&) { return static_cast<int>(ErrorCode::ProtocolVersion); },
            [](const Error::ResourceClosed&) { return static_cast<int>(ErrorCode::ObjectClosed); },
            [](const Error::InvalidState&) { return static_cast<int>(ErrorCode::InvalidState); },
            [](const Error::FailingOver&) { return static_cast<int>(ErrorCode::FailingOver); },
            [](const Error::ServerFault&) { return static_cast<int>(ErrorCode::ServerFault); }),
        error);
}

std::string describe(const Error::Var& error)
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [](const Error::TransportFailure& failure) {
                //
                return fmt::format("transport failure (err={})", failure.code);
            },
            [](const Error::ProtocolVersion& version) {
                //
                return fmt::format("protocol version mismatch (ver={})", static_cast<int>(version.version));
            },
            [](const Error::ResourceClosed& closed) {
                //
                return fmt::format("resource is closed (id={})", closed.id);
            },
            [](const Error::InvalidState& state) {
                //
                return fmt::format("invalid state ({})", state.reason);
            },
            [](const Error::FailingOver&) { return std::string{"failing over"}; },
            [](const Error::ServerFault& fault) {
                //
                return fmt::format("server fault (code={}, '{}')", fault.code, fault.message);
            }),
        error);
}

bool isRetryable(const Error::Var& error) noexcept
{
    if (cetl::get_if<Error::FailingOver>(&error) != nullptr)
    {
        return true;
    }
    if (const auto* const failure = cetl::get_if<Error::TransportFailure>(&error))
    {
        switch (static_cast<ErrorCode>(failure->code))
        {
        case ErrorCode::NotConnected:
        case ErrorCode::Disconnected:
        case ErrorCode::TimedOut:
            return true;
        default:
            return false;
        }
    }
    return false;
}

}  // namespace sdk
}  // namespace remoting
