//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_COMMON_SVC_SESSION_CREATE_DELEGATE_SPEC_HPP_INCLUDED
#define REMOTING_COMMON_SVC_SESSION_CREATE_DELEGATE_SPEC_HPP_INCLUDED

#include "remoting/common/svc/session/CreateDelegateSvcRequest_0_1.hpp"
#include "remoting/common/svc/session/CreateDelegateSvcResponse_0_1.hpp"

#include <cstddef>

namespace remoting
{
namespace common
{
namespace svc
{
namespace session
{

struct CreateProducerSpec
{
    using Request  = CreateDelegateSvcRequest_0_1;
    using Response = CreateDelegateSvcResponse_0_1;

    constexpr auto static svc_full_name = "createProducer";

    CreateProducerSpec() = delete;
};

struct CreateConsumerSpec
{
    using Request  = CreateDelegateSvcRequest_0_1;
    using Response = CreateDelegateSvcResponse_0_1;

    constexpr auto static svc_full_name = "createConsumer";

    CreateConsumerSpec() = delete;
};

constexpr std::size_t MaxAddressSize = 255;

}  // namespace session
}  // namespace svc
}  // namespace common
}  // namespace remoting

#endif  // REMOTING_COMMON_SVC_SESSION_CREATE_DELEGATE_SPEC_HPP_INCLUDED
