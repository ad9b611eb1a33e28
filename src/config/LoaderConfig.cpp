// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LoaderConfig.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>

namespace
{
    nlohmann::json read_json_file(const std::filesystem::path& path)
    {
        std::ifstream in(path);
        if (!in)
            throw gload::ConfigError("Could not open " + path.string());

        try
        {
            nlohmann::json json;
            in >> json;
            return json;
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw gload::ConfigError("Could not parse " + path.string() + ": " + e.what());
        }
    }

    template<class T>
    T value_or(const nlohmann::json& j, const char* key, const T& fallback)
    {
        auto it = j.find(key);
        if (it == j.end())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const nlohmann::json::type_error&)
        {
            throw gload::ConfigError(std::string("Wrong type for '") + key + "'");
        }
    }

    gload::DeliveryMode parse_delivery(const std::string& s)
    {
        if (s == "queue") return gload::DeliveryMode::Queue;
        if (s == "strand") return gload::DeliveryMode::Strand;
        throw gload::ConfigError("Unknown delivery mode '" + s + "' (expected \"queue\" or \"strand\")");
    }

    gload::RequestDefaults parse_defaults(const nlohmann::json& j, const gload::RequestDefaults& fallback)
    {
        gload::RequestDefaults d = fallback;
        d.cacheable = value_or(j, "cacheable", d.cacheable);
        d.materialize = value_or(j, "materialize", d.materialize);
        return d;
    }
}

namespace gload
{
    const char* to_string(DeliveryMode mode)
    {
        switch (mode)
        {
        case DeliveryMode::Queue: return "queue";
        case DeliveryMode::Strand: return "strand";
        }
        return "unknown";
    }

    LoaderConfig config_from_json(const nlohmann::json& j)
    {
        if (!j.is_object())
            throw ConfigError("Loader config must be a JSON object");

        LoaderConfig config;
        // get<size_t>() would wrap a negative count around
        if (auto it = j.find("worker_threads"); it != j.end() && it->is_number_integer() && !it->is_number_unsigned()
            && it->get<std::int64_t>() < 0)
            throw ConfigError("'worker_threads' must not be negative");
        config.worker_threads = value_or(j, "worker_threads", config.worker_threads);
        if (config.worker_threads == 0)
            throw ConfigError("'worker_threads' must be at least 1");

        config.delivery = parse_delivery(value_or<std::string>(j, "delivery", to_string(config.delivery)));
        config.asset_root = value_or<std::string>(j, "asset_root", config.asset_root.string());

        if (auto it = j.find("request_defaults"); it != j.end())
        {
            if (!it->is_object())
                throw ConfigError("'request_defaults' must be an object");
            config.request_defaults = parse_defaults(*it, config.request_defaults);
        }

        if (auto it = j.find("log"); it != j.end())
        {
            if (!it->is_object())
                throw ConfigError("'log' must be an object");
            config.log.echo = value_or(*it, "echo", config.log.echo);
            config.log.file = value_or<std::string>(*it, "file", config.log.file.string());
            config.log.history = value_or(*it, "history", config.log.history);
        }
        return config;
    }

    nlohmann::json config_to_json(const LoaderConfig& config)
    {
        return nlohmann::json{
            { "worker_threads", config.worker_threads },
            { "delivery", to_string(config.delivery) },
            { "asset_root", config.asset_root.string() },
            { "request_defaults", {
                { "cacheable", config.request_defaults.cacheable },
                { "materialize", config.request_defaults.materialize } } },
            { "log", {
                { "echo", config.log.echo },
                { "file", config.log.file.string() },
                { "history", config.log.history } } }
        };
    }

    LoaderConfig load_config(const std::filesystem::path& path)
    {
        return config_from_json(read_json_file(path));
    }

    std::vector<RequestSpec> manifest_from_json(const nlohmann::json& j, const RequestDefaults& defaults)
    {
        if (!j.is_array())
            throw ConfigError("Manifest must be a JSON array");

        std::vector<RequestSpec> specs;
        specs.reserve(j.size());
        for (const auto& item : j)
        {
            RequestSpec spec;
            spec.cacheable = defaults.cacheable;
            spec.materialize = defaults.materialize;

            if (item.is_string())
            {
                spec.name = item.get<std::string>();
            }
            else if (item.is_object())
            {
                spec.name = value_or<std::string>(item, "name", "");
                spec.cacheable = value_or(item, "cacheable", spec.cacheable);
                spec.materialize = value_or(item, "materialize", spec.materialize);
            }
            else
            {
                throw ConfigError("Manifest entries must be strings or objects");
            }

            if (spec.name.empty())
                throw ConfigError("Manifest entry without a name");
            specs.push_back(std::move(spec));
        }
        return specs;
    }

    std::vector<RequestSpec> load_manifest(const std::filesystem::path& path, const RequestDefaults& defaults)
    {
        return manifest_from_json(read_json_file(path), defaults);
    }
}
