//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_PIPE_TRANSPORT_HPP_INCLUDED
#define REMOTING_SDK_PIPE_TRANSPORT_HPP_INCLUDED

#include "client_pipe.hpp"
#include "transport.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace remoting
{
namespace sdk
{

/// Transport which carries envelopes over a client pipe.
///
/// Requests are correlated with their replies by a sequence number. A request waits for its reply
/// until the request timeout expires (`ETIMEDOUT`), or the pipe gets disconnected (`ESHUTDOWN`).
/// A reply of an unsupported protocol version fails its request at once (`EPROTONOSUPPORT`).
///
class PipeTransport : public Transport
{
public:
    using Ptr               = std::shared_ptr<PipeTransport>;
    using DisconnectHandler = std::function<void()>;

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource&     memory,
                                   ClientPipe::Ptr                 client_pipe,
                                   const std::chrono::milliseconds request_timeout);

    PipeTransport(PipeTransport&&)                 = delete;
    PipeTransport(const PipeTransport&)            = delete;
    PipeTransport& operator=(PipeTransport&&)      = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    ~PipeTransport() override = default;

    CETL_NODISCARD virtual int start() = 0;

    CETL_NODISCARD virtual bool isConnected() const = 0;

    /// Sets the handler which is called (once per connection) when the pipe gets disconnected.
    ///
    /// `ClientSession` hooks it to its `onTransportDisconnected`.
    ///
    virtual void setDisconnectHandler(DisconnectHandler handler) = 0;

protected:
    PipeTransport() = default;

};  // PipeTransport

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_PIPE_TRANSPORT_HPP_INCLUDED
