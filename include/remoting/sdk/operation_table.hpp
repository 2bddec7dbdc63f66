//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_OPERATION_TABLE_HPP_INCLUDED
#define REMOTING_SDK_OPERATION_TABLE_HPP_INCLUDED

#include "invocation.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace remoting
{
namespace sdk
{

/// Classifies operations into one-way ("notify and move on") and request/response ones.
///
/// The table is immutable once made, and is shared by all delegates of a session.
/// Any operation which is not listed as one-way is a request/response operation.
///
class OperationTable final
{
    struct Private
    {
        explicit Private() = default;
    };

public:
    using Ptr = std::shared_ptr<const OperationTable>;

    /// Names of the operations which are one-way by default.
    ///
    static std::vector<std::string> defaultOneWayNames();

    /// Makes a table with the given one-way operations.
    ///
    CETL_NODISCARD static Ptr make(const std::vector<std::string>& one_way_names);

    /// Makes a table with the default one-way operations plus the given extra ones.
    ///
    CETL_NODISCARD static Ptr makeDefault(const std::vector<std::string>& extra_one_way_names = {});

    CETL_NODISCARD bool isOneWay(const Operation::Id operation_id) const noexcept
    {
        return one_way_.find(operation_id) != one_way_.end();
    }

    CETL_NODISCARD bool isOneWay(const Operation& operation) const noexcept
    {
        return isOneWay(operation.id);
    }

    CETL_NODISCARD std::size_t oneWayCount() const noexcept
    {
        return one_way_.size();
    }

    OperationTable(Private, std::unordered_map<Operation::Id, std::string> one_way)
        : one_way_{std::move(one_way)}
    {
    }

private:
    std::unordered_map<Operation::Id, std::string> one_way_;

};  // OperationTable

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_OPERATION_TABLE_HPP_INCLUDED
