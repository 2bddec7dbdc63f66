//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_COMMON_IPC_ENVELOPE_CODEC_HPP_INCLUDED
#define REMOTING_COMMON_IPC_ENVELOPE_CODEC_HPP_INCLUDED

#include "dsdl_helpers.hpp"
#include "ipc_types.hpp"

#include "remoting/sdk/invocation.hpp"

#include "remoting/common/ipc/Envelope_0_1.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <utility>

namespace remoting
{
namespace common
{
namespace ipc
{

/// Converts invocation envelopes to and from their wire form (DSDL `remoting.common.ipc.Envelope.0.1`).
///
/// The first byte on the wire is always the protocol version.
///
class EnvelopeCodec final
{
public:
    constexpr static std::size_t MaxOperationNameSize = 64;
    constexpr static std::size_t MaxArgumentsSize     = 4096;
    constexpr static std::size_t MaxMessageSize       = 255;

    struct Decode final
    {
        struct Success final
        {
            Sequence                sequence;
            sdk::InvocationEnvelope envelope;
        };
        using Failure = int;  // `errno`-like error code
        using Result  = cetl::variant<Success, Failure>;
    };

    explicit EnvelopeCodec(cetl::pmr::memory_resource& memory)
        : memory_{memory}
    {
    }

    /// Serializes the envelope, and performs the given action on the resulting payload.
    ///
    /// The payload is valid only during the action.
    ///
    /// @return Result of the action, or `EINVAL` if the envelope does not fit into its wire form.
    ///
    template <typename Action>
    CETL_NODISCARD int encode(const Sequence sequence, const sdk::InvocationEnvelope& envelope, Action&& action) const
    {
        Envelope_0_1 message{&memory_};
        if (const int err = fillMessage(sequence, envelope, message))
        {
            return err;
        }
        return tryPerformOnSerialized(message, std::forward<Action>(action));
    }

    /// Deserializes the envelope.
    ///
    /// The version byte is checked before anything else.
    ///
    /// @return `EPROTONOSUPPORT` for an unsupported version, `EINVAL` for a malformed payload.
    ///
    CETL_NODISCARD Decode::Result decode(const Payload payload) const;

    /// Reads just the sequence number of an envelope, without decoding (or even version checking) the rest.
    ///
    /// The sequence follows the version byte in all protocol versions, so even an envelope
    /// which `decode` rejects as unsupported can be matched with its request.
    ///
    /// @return Empty optional if the payload is too short.
    ///
    CETL_NODISCARD static cetl::optional<Sequence> peekSequence(const Payload payload);

private:
    CETL_NODISCARD int fillMessage(const Sequence                 sequence,
                                   const sdk::InvocationEnvelope& envelope,
                                   Envelope_0_1&                  out_message) const;

    cetl::pmr::memory_resource& memory_;

};  // EnvelopeCodec

}  // namespace ipc
}  // namespace common
}  // namespace remoting

#endif  // REMOTING_COMMON_IPC_ENVELOPE_CODEC_HPP_INCLUDED
