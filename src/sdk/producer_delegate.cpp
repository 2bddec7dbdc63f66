//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/producer_delegate.hpp"

#include "common_helpers.hpp"
#include "delegate_helpers.hpp"
#include "logging.hpp"
#include "svc/close_spec.hpp"
#include "svc/producer/send_spec.hpp"

#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/invocation.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <utility>

namespace remoting
{
namespace sdk
{

ProducerDelegate::Ptr ProducerDelegate::make(cetl::pmr::memory_resource& memory,
                                             OperationTable::Ptr         operations,
                                             const DelegateId            id)
{
    return std::make_shared<ProducerDelegate>(Private(), memory, std::move(operations), id);
}

OptError ProducerDelegate::send(const cetl::string_view address, const Bytes& body, const bool durable)
{
    using Spec = common::svc::producer::SendSpec;

    Spec::Request request{&memory_};
    request.durable = durable;
    if (!common::assignBytes(request.address, address, Spec::MaxAddressSize) ||
        !common::assignBytes(request.body, body, Spec::MaxBodySize))
    {
        return Error::InvalidState{"send address or body is too long"};
    }

    auto arguments = detail::serializeArguments(request);
    if (auto* const error = cetl::get_if<Error::Var>(&arguments))
    {
        return std::move(*error);
    }
    return detail::toOptError(dispatch(Spec::svc_full_name, cetl::get<Bytes>(std::move(arguments))));
}

OptError ProducerDelegate::close()
{
    if (isClosed())
    {
        return cetl::nullopt;
    }

    auto error = detail::toOptError(dispatch(common::svc::CloseSpec::svc_full_name, {}));
    if (!error)
    {
        markClosed();
        logger().debug("Producer is closed (id={}).", id());
    }
    return error;
}

}  // namespace sdk
}  // namespace remoting
