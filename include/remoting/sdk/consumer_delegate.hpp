//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_CONSUMER_DELEGATE_HPP_INCLUDED
#define REMOTING_SDK_CONSUMER_DELEGATE_HPP_INCLUDED

#include "delegate.hpp"
#include "errors.hpp"
#include "operation_table.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <utility>

namespace remoting
{
namespace sdk
{

/// Client-side handle of a server-side message consumer.
///
class ConsumerDelegate final : public DelegateHandle
{
public:
    using Ptr = std::shared_ptr<ConsumerDelegate>;

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory,
                                   OperationTable::Ptr         operations,
                                   const DelegateId            id);

    ConsumerDelegate(Private,
                     cetl::pmr::memory_resource& memory,
                     OperationTable::Ptr         operations,
                     const DelegateId            id)
        : DelegateHandle{Private(), std::move(operations), id}
        , memory_{memory}
    {
    }

    /// Notifies the server about the rate at which this consumer is able to take messages.
    ///
    /// One-way by default: returns as soon as the notification is handed over to the transport.
    ///
    CETL_NODISCARD OptError changeRate(const float rate);

    /// Closes the server-side consumer.
    ///
    /// Closing an already closed consumer is a no-op.
    ///
    CETL_NODISCARD OptError close();

private:
    cetl::pmr::memory_resource& memory_;

};  // ConsumerDelegate

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_CONSUMER_DELEGATE_HPP_INCLUDED
