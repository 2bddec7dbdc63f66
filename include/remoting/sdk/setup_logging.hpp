//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_SETUP_LOGGING_HPP_INCLUDED
#define REMOTING_SDK_SETUP_LOGGING_HPP_INCLUDED

#include "config.hpp"

#include <cetl/cetl.hpp>

namespace remoting
{
namespace sdk
{

/// Sets up the logging system of a client process.
///
/// A rotating file sink is used for the default logger and for the "sdk" and "ipc" subsystem loggers.
/// Levels come from the `[logging]` table of the configuration (if any), and then from
/// `SPDLOG_LEVEL=` and `SPDLOG_FLUSH_LEVEL=` arguments (like `SPDLOG_LEVEL=info,sdk=trace`).
///
/// @param config Optional configuration; `nullptr` means all defaults.
/// @return Zero on success, otherwise `errno`-like error (the previous logging setup is kept then).
///
CETL_NODISCARD int setupLogging(const Config::Ptr& config, const int argc, const char** const argv);

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_SETUP_LOGGING_HPP_INCLUDED
