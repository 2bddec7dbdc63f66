//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/session_delegate.hpp"

#include "common_helpers.hpp"
#include "delegate_helpers.hpp"
#include "logging.hpp"
#include "svc/close_spec.hpp"
#include "svc/session/create_delegate_spec.hpp"

#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/invocation.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <utility>

namespace remoting
{
namespace sdk
{

SessionDelegate::Ptr SessionDelegate::make(cetl::pmr::memory_resource& memory,
                                           OperationTable::Ptr         operations,
                                           const DelegateId            id)
{
    return std::make_shared<SessionDelegate>(Private(), memory, std::move(operations), id);
}

SessionDelegate::CreateDelegate::Result SessionDelegate::createProducer(const cetl::string_view address)
{
    return createDelegate(common::svc::session::CreateProducerSpec::svc_full_name, address);
}

SessionDelegate::CreateDelegate::Result SessionDelegate::createConsumer(const cetl::string_view address)
{
    return createDelegate(common::svc::session::CreateConsumerSpec::svc_full_name, address);
}

OptError SessionDelegate::close()
{
    if (isClosed())
    {
        return cetl::nullopt;
    }

    auto error = detail::toOptError(dispatch(common::svc::CloseSpec::svc_full_name, {}));
    if (!error)
    {
        markClosed();
        logger().debug("Session is closed (id={}).", id());
    }
    return error;
}

SessionDelegate::CreateDelegate::Result SessionDelegate::createDelegate(const cetl::string_view operation_name,
                                                                        const cetl::string_view address)
{
    // Both "create" operations share the same request and response types.
    using Spec = common::svc::session::CreateProducerSpec;

    Spec::Request request{&memory_};
    if (!common::assignBytes(request.address, address, common::svc::session::MaxAddressSize))
    {
        return Error::Var{Error::InvalidState{"address is too long"}};
    }

    auto arguments = detail::serializeArguments(request);
    if (auto* const error = cetl::get_if<Error::Var>(&arguments))
    {
        return std::move(*error);
    }

    auto result = dispatch(operation_name, cetl::get<Bytes>(std::move(arguments)));
    if (auto* const error = cetl::get_if<Invocation::Failure>(&result))
    {
        return std::move(*error);
    }

    Spec::Response response{&memory_};
    if (auto error = detail::deserializeReply(cetl::get<Invocation::Success>(result), response))
    {
        return std::move(*error);
    }

    logger().debug("Session created delegate (session_id={}, op='{}', id={}).",
                   id(),
                   operation_name,
                   response.delegate_id);
    return response.delegate_id;
}

}  // namespace sdk
}  // namespace remoting
