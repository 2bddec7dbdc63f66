//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "envelope_codec.hpp"

#include "common_helpers.hpp"
#include "dsdl_helpers.hpp"
#include "ipc_types.hpp"

#include "remoting/sdk/invocation.hpp"

#include "remoting/common/ipc/Call_0_1.hpp"
#include "remoting/common/ipc/Envelope_0_1.hpp"
#include "remoting/common/ipc/Fault_0_1.hpp"
#include "remoting/common/ipc/Reply_0_1.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace remoting
{
namespace common
{
namespace ipc
{

int EnvelopeCodec::fillMessage(const Sequence                 sequence,
                               const sdk::InvocationEnvelope& envelope,
                               Envelope_0_1&                  out_message) const
{
    out_message.version  = static_cast<std::uint8_t>(envelope.version());
    out_message.sequence = sequence;

    return cetl::visit(  //
        cetl::make_overloaded(
            [&out_message](const sdk::InvocationEnvelope::Call& call) {
                //
                auto& msg_call        = out_message.payload.set_call();
                msg_call.target_id    = call.target_id;
                msg_call.operation_id = call.operation.id;
                if (!assignBytes(msg_call.operation_name, call.operation.name, MaxOperationNameSize) ||
                    !assignBytes(msg_call.arguments, call.arguments, MaxArgumentsSize))
                {
                    return EINVAL;
                }
                return 0;
            },
            [&out_message](const sdk::InvocationEnvelope::Reply& reply) {
                //
                auto& msg_reply     = out_message.payload.set_reply();
                msg_reply.has_value = reply.value.has_value();
                if (reply.value && !assignBytes(msg_reply.value, *reply.value, MaxArgumentsSize))
                {
                    return EINVAL;
                }
                return 0;
            },
            [&out_message](const sdk::InvocationEnvelope::Fault& fault) {
                //
                auto& msg_fault = out_message.payload.set_fault();
                msg_fault.code  = fault.code;

                // Too long server messages are truncated rather than rejected.
                const cetl::string_view message{fault.message.data(), fault.message.size()};
                const bool ok = assignBytes(msg_fault.message, message.substr(0, MaxMessageSize), MaxMessageSize);
                CETL_DEBUG_ASSERT(ok, "");
                (void) ok;
                return 0;
            }),
        envelope.payload());
}

EnvelopeCodec::Decode::Result EnvelopeCodec::decode(const Payload payload) const
{
    if (payload.empty())
    {
        return EINVAL;
    }
    if (!sdk::isSupportedVersion(payload.front()))
    {
        return EPROTONOSUPPORT;
    }

    Envelope_0_1 message{&memory_};
    const auto result_size = tryDeserializePayload(payload, message);
    if (!result_size.has_value())
    {
        return EINVAL;
    }

    const auto version = static_cast<sdk::ProtocolVersion>(message.version);

    auto envelope_payload = cetl::visit(  //
        cetl::make_overloaded(
            [](const Call_0_1& msg_call) -> sdk::InvocationEnvelope::Payload {
                //
                return sdk::InvocationEnvelope::Call{msg_call.target_id,
                                                     {msg_call.operation_id, textOf(msg_call.operation_name)},
                                                     bytesOf(msg_call.arguments)};
            },
            [](const Reply_0_1& msg_reply) -> sdk::InvocationEnvelope::Payload {
                //
                sdk::InvocationEnvelope::Reply reply{};
                if (msg_reply.has_value)
                {
                    reply.value = bytesOf(msg_reply.value);
                }
                return reply;
            },
            [](const Fault_0_1& msg_fault) -> sdk::InvocationEnvelope::Payload {
                //
                return sdk::InvocationEnvelope::Fault{msg_fault.code, textOf(msg_fault.message)};
            }),
        message.payload.union_value);

    return Decode::Success{message.sequence, sdk::InvocationEnvelope{version, std::move(envelope_payload)}};
}

cetl::optional<Sequence> EnvelopeCodec::peekSequence(const Payload payload)
{
    // `uint8 version`, then little-endian `uint64 sequence`.
    constexpr std::size_t SequenceOffset = 1;
    if (payload.size() < (SequenceOffset + sizeof(Sequence)))
    {
        return cetl::nullopt;
    }

    Sequence sequence = 0;
    for (std::size_t i = sizeof(Sequence); i > 0; --i)
    {
        sequence = (sequence << 8U) | payload[SequenceOffset + i - 1];  // NOLINT(*-magic-numbers)
    }
    return sequence;
}

}  // namespace ipc
}  // namespace common
}  // namespace remoting
