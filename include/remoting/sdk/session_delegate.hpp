//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_SESSION_DELEGATE_HPP_INCLUDED
#define REMOTING_SDK_SESSION_DELEGATE_HPP_INCLUDED

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

/// Client-side handle of a server-side session, the factory of producers and consumers.
///
/// The session delegate only asks the server to create a resource; constructing and adopting
/// the client-side handle of the new resource is up to the owning `ClientSession`.
///
class SessionDelegate final : public DelegateHandle
{
public:
    using Ptr = std::shared_ptr<SessionDelegate>;

    struct CreateDelegate final
    {
        using Success = DelegateId;  // server-side id of the new resource
        using Failure = Error::Var;
        using Result  = cetl::variant<Success, Failure>;
    };

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource& memory,
                                   OperationTable::Ptr         operations,
                                   const DelegateId            id);

    SessionDelegate(Private,
                    cetl::pmr::memory_resource& memory,
                    OperationTable::Ptr         operations,
                    const DelegateId            id)
        : DelegateHandle{Private(), std::move(operations), id}
        , memory_{memory}
    {
    }

    CETL_NODISCARD CreateDelegate::Result createProducer(const cetl::string_view address);

    CETL_NODISCARD CreateDelegate::Result createConsumer(const cetl::string_view address);

    /// Closes the server-side session (and all its resources).
    ///
    CETL_NODISCARD OptError close();

private:
    CreateDelegate::Result createDelegate(const cetl::string_view operation_name, const cetl::string_view address);

    cetl::pmr::memory_resource& memory_;

};  // SessionDelegate

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_SESSION_DELEGATE_HPP_INCLUDED
