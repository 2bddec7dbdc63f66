//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/operation_table.hpp"

#include "remoting/sdk/invocation.hpp"

#include "svc/consumer/change_rate_spec.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace remoting
{
namespace sdk
{

std::vector<std::string> OperationTable::defaultOneWayNames()
{
    return {common::svc::consumer::ChangeRateSpec::svc_full_name};
}

OperationTable::Ptr OperationTable::make(const std::vector<std::string>& one_way_names)
{
    std::unordered_map<Operation::Id, std::string> one_way;
    for (const auto& name : one_way_names)
    {
        one_way.emplace(Operation::idOf(name), name);
    }
    return std::make_shared<const OperationTable>(Private(), std::move(one_way));
}

OperationTable::Ptr OperationTable::makeDefault(const std::vector<std::string>& extra_one_way_names)
{
    auto names = defaultOneWayNames();
    names.insert(names.end(), extra_one_way_names.begin(), extra_one_way_names.end());
    return make(names);
}

}  // namespace sdk
}  // namespace remoting
