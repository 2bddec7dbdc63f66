//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_COMMON_DSDL_HELPERS_HPP_INCLUDED
#define REMOTING_COMMON_DSDL_HELPERS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace remoting
{
namespace common
{

template <typename Message>
static auto tryDeserializePayload(const cetl::span<const std::uint8_t> payload, Message& out_message)
{
    return deserialize(out_message, {payload.data(), payload.size()});
}

template <typename Message, typename Action>
static int tryPerformOnSerialized(const Message& message, Action&& action)
{
    // Try to serialize the message to raw payload buffer.
    //
    // Next nolint b/c we use a buffer to serialize the message, so no need to zero it (and performance better).
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    std::array<std::uint8_t, Message::_traits_::SerializationBufferSizeBytes> buffer;
    //
    const auto result_size = serialize(message, {buffer.data(), buffer.size()});
    if (!result_size)
    {
        return EINVAL;
    }

    const cetl::span<const std::uint8_t> bytes{buffer.data(), result_size.value()};
    return std::forward<Action>(action)(bytes);
}

/// Serializes the message into a standalone byte vector (f.e. into invocation arguments).
///
/// @return The bytes on success, otherwise `EINVAL` (f.e. an array is longer than its DSDL capacity).
///
template <typename Message>
static cetl::variant<std::vector<std::uint8_t>, int> trySerializeToBytes(const Message& message)
{
    std::vector<std::uint8_t> bytes;
    const int                 err = tryPerformOnSerialized(message, [&bytes](const auto payload) {
        //
        bytes.assign(payload.begin(), payload.end());
        return 0;
    });
    if (err != 0)
    {
        return err;
    }
    return bytes;
}

}  // namespace common
}  // namespace remoting

#endif  // REMOTING_COMMON_DSDL_HELPERS_HPP_INCLUDED
