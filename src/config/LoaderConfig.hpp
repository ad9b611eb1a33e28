// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "LoaderTypes.hpp"
#include "LogManager.hpp"
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace gload
{
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Where load completions and cache hits are delivered
    enum class DeliveryMode
    {
        Queue,  // CallbackQueue drained by the host loop
        Strand  // SerialExecutor over the worker pool
    };

    struct LoaderConfig
    {
        size_t worker_threads = 2;
        DeliveryMode delivery = DeliveryMode::Queue;
        std::filesystem::path asset_root = ".";
        RequestDefaults request_defaults{};
        LogSettings log{};
    };

    /*
    {
      "worker_threads": 4,
      "delivery": "queue",
      "asset_root": "assets",
      "request_defaults": { "cacheable": true, "materialize": false },
      "log": { "echo": true, "file": "loader.log", "history": 500 }
    }
    */

    /// Missing keys keep their defaults. Throws ConfigError on bad values.
    LoaderConfig config_from_json(const nlohmann::json& j);
    nlohmann::json config_to_json(const LoaderConfig& config);

    /// Throws ConfigError if the file can't be read or parsed
    LoaderConfig load_config(const std::filesystem::path& path);

    const char* to_string(DeliveryMode mode);

    /// Batch manifest: an array of names or { "name", "cacheable"?, "materialize"? }
    /// objects. Missing flags come from `defaults`. Throws ConfigError.
    std::vector<RequestSpec> manifest_from_json(const nlohmann::json& j, const RequestDefaults& defaults = {});
    std::vector<RequestSpec> load_manifest(const std::filesystem::path& path, const RequestDefaults& defaults = {});
}
