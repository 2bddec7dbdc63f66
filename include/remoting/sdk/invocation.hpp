//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_INVOCATION_HPP_INCLUDED
#define REMOTING_SDK_INVOCATION_HPP_INCLUDED

#include "errors.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace remoting
{
namespace sdk
{

using Bytes = std::vector<std::uint8_t>;

/// Defines protocol versions known to this client.
///
/// A version is negotiated once per connection, and then tags every envelope sent over it.
///
enum class ProtocolVersion : std::uint8_t
{
    V1 = 1,
    V2 = 2,

    Current = V2,

};  // ProtocolVersion

CETL_NODISCARD bool isSupportedVersion(const std::uint8_t raw_version) noexcept;

/// Identity of a remote operation.
///
/// The `id` is derived from the `name` (CRC-64/WE), so it is stable across processes,
/// and could be used as a key of classification tables.
///
struct Operation final
{
    using Id = std::uint64_t;

    Id          id;
    std::string name;

    CETL_NODISCARD static Operation make(const cetl::string_view name);

    CETL_NODISCARD static Id idOf(const cetl::string_view name) noexcept;
};

inline bool operator==(const Operation& lhs, const Operation& rhs)
{
    return (lhs.id == rhs.id) && (lhs.name == rhs.name);
}

/// A local call on its way through a dispatch pipeline.
///
struct Invocation final
{
    /// Result value of the operation; empty for one-way operations and for "void" replies.
    using Success = cetl::optional<Bytes>;
    using Failure = Error::Var;
    using Result  = cetl::variant<Success, Failure>;

    Operation operation;
    Bytes     arguments;
};

/// Wire-level unit of a remote invocation.
///
/// The version tag is fixed at construction, and can't be changed afterwards.
///
class InvocationEnvelope final
{
public:
    /// Outbound call descriptor.
    struct Call final
    {
        DelegateId target_id;
        Operation  operation;
        Bytes      arguments;
    };

    /// Inbound result descriptor.
    struct Reply final
    {
        cetl::optional<Bytes> value;
    };

    /// Inbound error descriptor.
    struct Fault final
    {
        std::int32_t code;
        std::string  message;
    };

    using Payload = cetl::variant<Call, Reply, Fault>;

    InvocationEnvelope(const ProtocolVersion version, Payload payload)
        : version_{version}
        , payload_{std::move(payload)}
    {
    }

    CETL_NODISCARD ProtocolVersion version() const noexcept
    {
        return version_;
    }

    CETL_NODISCARD const Payload& payload() const noexcept
    {
        return payload_;
    }

    CETL_NODISCARD Payload&& releasePayload() && noexcept
    {
        return std::move(payload_);
    }

private:
    ProtocolVersion version_;
    Payload         payload_;

};  // InvocationEnvelope

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_INVOCATION_HPP_INCLUDED
