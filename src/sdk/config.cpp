//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/config.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <ios>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace remoting
{
namespace sdk
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
        , is_dirty_{false}
    {
    }

    // MARK: Config

    void save() override
    {
        if (is_dirty_)
        {
            try
            {
                root_["__meta__"]["last_modified"] = std::chrono::system_clock::now();

                const auto    cfg_str = format(root_);
                std::ofstream file{file_path_, std::ios_base::out | std::ios_base::binary};
                file << cfg_str;

                is_dirty_ = false;

            } catch (const std::exception& ex)
            {
                common::getLogger("sdk")->error("Failed to save config (file='{}'). Error: {}", file_path_, ex.what());
            }
        }
    }

    auto getDispatchOneWayOperations() const -> std::vector<std::string> override
    {
        return find_or(root_, "dispatch", "one_way_operations", std::vector<std::string>{});
    }

    void setDispatchOneWayOperations(const std::vector<std::string>& operations) override
    {
        auto& toml_operations = root_["dispatch"]["one_way_operations"];
        toml_operations       = operations;
        is_dirty_             = true;
    }

    auto getDispatchProtocolVersion() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("dispatch", "protocol_version");
    }

    auto getFailoverPolicy() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("failover", "policy");
    }

    void setFailoverPolicy(const std::string& policy) override
    {
        root_["failover"]["policy"] = policy;
        is_dirty_                   = true;
    }

    auto getFailoverTimeoutMs() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("failover", "timeout_ms");
    }

    auto getTransportRequestTimeoutMs() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("transport", "request_timeout_ms");
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    std::string file_path_;
    TomlValue   root_;
    bool        is_dirty_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    try
    {
        auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
        return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));

    } catch (const std::exception& ex)
    {
        common::getLogger("sdk")->error("Failed to load config (file='{}'). Error: {}", file_path, ex.what());
        return nullptr;
    }
}

}  // namespace sdk
}  // namespace remoting
