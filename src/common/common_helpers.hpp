//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_COMMON_HELPERS_HPP_INCLUDED
#define REMOTING_COMMON_HELPERS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace remoting
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Copies bytes (or characters) into a DSDL variable-length `uint8` array.
///
/// @return `false` if the source does not fit into `max_size` bytes (the array stays untouched then).
///
template <typename ByteArray, typename Source>
bool assignBytes(ByteArray& out_bytes, const Source& source, const std::size_t max_size)
{
    if (source.size() > max_size)
    {
        return false;
    }
    out_bytes.clear();
    out_bytes.reserve(source.size());
    for (const auto item : source)
    {
        out_bytes.push_back(static_cast<std::uint8_t>(item));
    }
    return true;
}

template <typename ByteArray>
std::string textOf(const ByteArray& bytes)
{
    return {bytes.begin(), bytes.end()};
}

template <typename ByteArray>
std::vector<std::uint8_t> bytesOf(const ByteArray& bytes)
{
    return {bytes.begin(), bytes.end()};
}

}  // namespace common
}  // namespace remoting

#endif  // REMOTING_COMMON_HELPERS_HPP_INCLUDED
