//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_COMMON_LOGGING_HPP_INCLUDED
#define REMOTING_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include "remoting/sdk/errors.hpp"
#include "remoting/sdk/invocation.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace remoting
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Gets (or clones from the default one) the logger of a subsystem, like "sdk" or "ipc".
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    apply_logger_env_levels(logger);

    performWithoutThrowing([&logger] {
        //
        register_logger(logger);
    });

    return logger;
}

}  // namespace common
}  // namespace remoting

#if (__cplusplus < CETL_CPP_STANDARD_17)
template <>
struct fmt::formatter<cetl::string_view> : formatter<string_view>
{
    auto format(cetl::string_view sv, format_context& ctx) const
    {
        return formatter<string_view>::format(string_view{sv.data(), sv.size()}, ctx);
    }
};
#endif

template <>
struct fmt::formatter<remoting::sdk::ProtocolVersion> : formatter<int>
{
    auto format(const remoting::sdk::ProtocolVersion version, format_context& ctx) const
    {
        return formatter<int>::format(static_cast<int>(version), ctx);
    }
};

template <>
struct fmt::formatter<remoting::sdk::Error::Var> : formatter<string_view>
{
    auto format(const remoting::sdk::Error::Var& error, format_context& ctx) const
    {
        const auto description = remoting::sdk::describe(error);
        return formatter<string_view>::format(string_view{description.data(), description.size()}, ctx);
    }
};

#endif  // REMOTING_COMMON_LOGGING_HPP_INCLUDED
