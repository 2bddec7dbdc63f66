//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/consumer_delegate.hpp"

#include "delegate_helpers.hpp"
#include "logging.hpp"
#include "svc/close_spec.hpp"
#include "svc/consumer/change_rate_spec.hpp"

#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/invocation.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <utility>

namespace remoting
{
namespace sdk
{

ConsumerDelegate::Ptr ConsumerDelegate::make(cetl::pmr::memory_resource& memory,
                                             OperationTable::Ptr         operations,
                                             const DelegateId            id)
{
    return std::make_shared<ConsumerDelegate>(Private(), memory, std::move(operations), id);
}

OptError ConsumerDelegate::changeRate(const float rate)
{
    using Spec = common::svc::consumer::ChangeRateSpec;

    Spec::Request request{&memory_};
    request.rate = rate;

    auto arguments = detail::serializeArguments(request);
    if (auto* const error = cetl::get_if<Error::Var>(&arguments))
    {
        return std::move(*error);
    }
    return detail::toOptError(dispatch(Spec::svc_full_name, cetl::get<Bytes>(std::move(arguments))));
}

OptError ConsumerDelegate::close()
{
    if (isClosed())
    {
        return cetl::nullopt;
    }

    auto error = detail::toOptError(dispatch(common::svc::CloseSpec::svc_full_name, {}));
    if (!error)
    {
        markClosed();
        logger().debug("Consumer is closed (id={}).", id());
    }
    return error;
}

}  // namespace sdk
}  // namespace remoting
