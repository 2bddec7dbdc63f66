//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_COMMON_IPC_TYPES_HPP_INCLUDED
#define REMOTING_COMMON_IPC_TYPES_HPP_INCLUDED

#include <cetl/pf20/cetlpf.hpp>

#include <cstdint>

namespace remoting
{
namespace common
{
namespace ipc
{

using Payload  = cetl::span<const std::uint8_t>;
using Payloads = cetl::span<const Payload>;

/// Sequence number which correlates a reply envelope with its request.
///
/// Zero is reserved for one-way envelopes (nobody waits for their replies).
///
using Sequence = std::uint64_t;

constexpr Sequence OneWaySequence = 0;

}  // namespace ipc
}  // namespace common
}  // namespace remoting

#endif  // REMOTING_COMMON_IPC_TYPES_HPP_INCLUDED
