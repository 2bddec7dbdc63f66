//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REMOTING_SDK_CONFIG_HPP_INCLUDED
#define REMOTING_SDK_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace remoting
{
namespace sdk
{

/// Defines the interface of the client configuration (backed by a TOML file).
///
/// Getters return an empty optional (or an empty list) for absent or malformed keys.
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Parses the given TOML file.
    ///
    /// @return `nullptr` if the file can't be read or parsed (the reason is logged).
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    /// Writes modified values back to the file (if there were any modifications).
    ///
    virtual void save() = 0;

    CETL_NODISCARD virtual auto getDispatchOneWayOperations() const -> std::vector<std::string>         = 0;
    virtual void                setDispatchOneWayOperations(const std::vector<std::string>& operations) = 0;
    CETL_NODISCARD virtual auto getDispatchProtocolVersion() const -> cetl::optional<std::int64_t>      = 0;

    CETL_NODISCARD virtual auto getFailoverPolicy() const -> cetl::optional<std::string> = 0;
    virtual void                setFailoverPolicy(const std::string& policy)             = 0;
    CETL_NODISCARD virtual auto getFailoverTimeoutMs() const -> cetl::optional<std::int64_t> = 0;

    CETL_NODISCARD virtual auto getTransportRequestTimeoutMs() const -> cetl::optional<std::int64_t> = 0;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace sdk
}  // namespace remoting

#endif  // REMOTING_SDK_CONFIG_HPP_INCLUDED
