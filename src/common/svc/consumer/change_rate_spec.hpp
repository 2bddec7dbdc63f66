//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_COMMON_SVC_CONSUMER_CHANGE_RATE_SPEC_HPP_INCLUDED
#define REMOTING_COMMON_SVC_CONSUMER_CHANGE_RATE_SPEC_HPP_INCLUDED

#include "remoting/common/svc/consumer/ChangeRateSvcRequest_0_1.hpp"

namespace remoting
{
namespace common
{
namespace svc
{
namespace consumer
{

/// One-way by default (see `OperationTable::defaultOneWayNames`).
///
struct ChangeRateSpec
{
    using Request = ChangeRateSvcRequest_0_1;

    constexpr auto static svc_full_name = "changeRate";

    ChangeRateSpec() = delete;
};

}  // namespace consumer
}  // namespace svc
}  // namespace common
}  // namespace remoting

#endif  // REMOTING_COMMON_SVC_CONSUMER_CHANGE_RATE_SPEC_HPP_INCLUDED
