//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_CLIENT_PIPE_HPP_INCLUDED
#define REMOTING_SDK_CLIENT_PIPE_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstdint>
#include <functional>
#include <memory>

namespace remoting
{
namespace sdk
{

/// Defines the contract of a message-oriented byte pipe to the server.
///
/// The concrete (socket based) pipe is provided by the application.
/// Events may be delivered from any thread, but never concurrently with each other.
///
class ClientPipe
{
public:
    using Ptr      = std::unique_ptr<ClientPipe>;
    using Payload  = cetl::span<const std::uint8_t>;
    using Payloads = cetl::span<const Payload>;

    struct Event final
    {
        struct Connected final
        {};
        struct Disconnected final
        {};
        struct Message final
        {
            Payload payload;

        };  // Message

        using Var = cetl::variant<Message, Connected, Disconnected>;

    };  // Event

    using EventHandler = std::function<int(const Event::Var&)>;

    ClientPipe(const ClientPipe&)                = delete;
    ClientPipe(ClientPipe&&) noexcept            = delete;
    ClientPipe& operator=(const ClientPipe&)     = delete;
    ClientPipe& operator=(ClientPipe&&) noexcept = delete;

    virtual ~ClientPipe() = default;

    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;

    /// Sends all payloads as a single message.
    ///
    CETL_NODISCARD virtual int send(const Payloads payloads) = 0;

protected:
    ClientPipe() = default;

};  // ClientPipe

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_CLIENT_PIPE_HPP_INCLUDED
