//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/invocation.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/common/crc.hpp>

#include <cstdint>
#include <string>

namespace remoting
{
namespace sdk
{

bool isSupportedVersion(const std::uint8_t raw_version) noexcept
{
    return (raw_version == static_cast<std::uint8_t>(ProtocolVersion::V1)) ||
           (raw_version == static_cast<std::uint8_t>(ProtocolVersion::V2));
}

Operation Operation::make(const cetl::string_view name)
{
    return {idOf(name), std::string{name.data(), name.size()}};
}

Operation::Id Operation::idOf(const cetl::string_view name) noexcept
{
    const libcyphal::common::CRC64WE crc64{name.cbegin(), name.cend()};
    return crc64.get();
}

}  // namespace sdk
}  // namespace remoting
