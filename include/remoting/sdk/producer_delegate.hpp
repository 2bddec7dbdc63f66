//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_PRODUCER_DELEGATE_HPP_INCLUDED
#define REMOTING_SDK_PRODUCER_DELEGATE_HPP_INCLUDED

#include "delegate.hpp"
#include "errors.hpp"
#include "invocation.hpp"
#include "operation_table.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <utility>

namespace remoting
{
namespace sdk
{

/// Client-side handle of a server-side message producer.
///
class ProducerDelegate final : public DelegateHandle
{
public:
    using Ptr = std::shared_ptr<ProducerDelegate>;

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory,
                                   OperationTable::Ptr         operations,
                                   const DelegateId            id);

    ProducerDelegate(Private,
                     cetl::pmr::memory_resource& memory,
                     OperationTable::Ptr         operations,
                     const DelegateId            id)
        : DelegateHandle{Private(), std::move(operations), id}
        , memory_{memory}
    {
    }

    /// Sends a message to the given address.
    ///
    /// Blocks until the server has accepted the message.
    /// Address is limited to 255 characters, and body to 3072 bytes.
    ///
    CETL_NODISCARD OptError send(const cetl::string_view address, const Bytes& body, const bool durable);

    /// Closes the server-side producer.
    ///
    /// Closing an already closed producer is a no-op.
    ///
    CETL_NODISCARD OptError close();

private:
    cetl::pmr::memory_resource& memory_;

};  // ProducerDelegate

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_PRODUCER_DELEGATE_HPP_INCLUDED
