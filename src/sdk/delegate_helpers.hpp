//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_DELEGATE_HELPERS_HPP_INCLUDED
#define REMOTING_SDK_DELEGATE_HELPERS_HPP_INCLUDED

#include "dsdl_helpers.hpp"

#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/invocation.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cerrno>
#include <utility>

namespace remoting
{
namespace sdk
{
namespace detail
{

struct Arguments final
{
    using Success = Bytes;
    using Failure = Error::Var;
    using Result  = cetl::variant<Success, Failure>;
};

/// Serializes a DSDL request into invocation arguments.
///
template <typename Request>
Arguments::Result serializeArguments(const Request& request)
{
    auto bytes_result = common::trySerializeToBytes(request);
    if (cetl::get_if<int>(&bytes_result) != nullptr)
    {
        return Error::Var{Error::InvalidState{"arguments don't fit their wire form"}};
    }
    return cetl::get<Bytes>(std::move(bytes_result));
}

/// Deserializes a DSDL response from the reply value of an invocation.
///
/// @return `Error::ServerFault` (with `EPROTO` code) if the value is missing or malformed.
///
template <typename Response>
cetl::optional<Error::Var> deserializeReply(const Invocation::Success& value, Response& out_response)
{
    if (!value)
    {
        return Error::ServerFault{EPROTO, "reply has no value"};
    }
    const auto result_size = common::tryDeserializePayload({value->data(), value->size()}, out_response);
    if (!result_size.has_value())
    {
        return Error::ServerFault{EPROTO, "malformed reply value"};
    }
    return cetl::nullopt;
}

/// Drops the (absent) value of a "void" operation.
///
inline OptError toOptError(Invocation::Result&& result)
{
    if (auto* const error = cetl::get_if<Invocation::Failure>(&result))
    {
        return std::move(*error);
    }
    return cetl::nullopt;
}

}  // namespace detail
}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_DELEGATE_HELPERS_HPP_INCLUDED
