// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "LoaderConfig.hpp"
#include <filesystem>
#include <fstream>

using namespace gload;
using nlohmann::json;

TEST(LoaderConfigTest, MissingKeysKeepDefaults)
{
    auto config = config_from_json(json::object());
    LoaderConfig defaults;

    EXPECT_EQ(config.worker_threads, defaults.worker_threads);
    EXPECT_EQ(config.delivery, DeliveryMode::Queue);
    EXPECT_EQ(config.asset_root, defaults.asset_root);
    EXPECT_FALSE(config.request_defaults.cacheable);
    EXPECT_TRUE(config.log.echo);
}

TEST(LoaderConfigTest, ParsesAllKeys)
{
    auto j = json::parse(R"({
        "worker_threads": 6,
        "delivery": "strand",
        "asset_root": "data/assets",
        "request_defaults": { "cacheable": true, "materialize": true },
        "log": { "echo": false, "file": "out.log", "history": 25 }
    })");

    auto config = config_from_json(j);

    EXPECT_EQ(config.worker_threads, 6u);
    EXPECT_EQ(config.delivery, DeliveryMode::Strand);
    EXPECT_EQ(config.asset_root, std::filesystem::path("data/assets"));
    EXPECT_TRUE(config.request_defaults.cacheable);
    EXPECT_TRUE(config.request_defaults.materialize);
    EXPECT_FALSE(config.log.echo);
    EXPECT_EQ(config.log.file, std::filesystem::path("out.log"));
    EXPECT_EQ(config.log.history, 25u);
}

TEST(LoaderConfigTest, ToJsonRoundTrips)
{
    LoaderConfig config;
    config.worker_threads = 3;
    config.delivery = DeliveryMode::Strand;
    config.request_defaults.cacheable = true;

    auto back = config_from_json(config_to_json(config));

    EXPECT_EQ(back.worker_threads, 3u);
    EXPECT_EQ(back.delivery, DeliveryMode::Strand);
    EXPECT_TRUE(back.request_defaults.cacheable);
    EXPECT_EQ(config_to_json(back), config_to_json(config));
}

TEST(LoaderConfigTest, BadValuesThrow)
{
    EXPECT_THROW(config_from_json(json::array()), ConfigError);
    EXPECT_THROW(config_from_json(json{ { "worker_threads", 0 } }), ConfigError);
    EXPECT_THROW(config_from_json(json{ { "worker_threads", -1 } }), ConfigError);
    EXPECT_THROW(config_from_json(json::parse(R"({ "worker_threads": -4 })")), ConfigError);
    EXPECT_THROW(config_from_json(json{ { "worker_threads", "many" } }), ConfigError);
    EXPECT_THROW(config_from_json(json{ { "delivery", "carrier-pigeon" } }), ConfigError);
    EXPECT_THROW(config_from_json(json{ { "log", 5 } }), ConfigError);
}

TEST(LoaderConfigTest, LoadConfigReportsMissingAndMalformedFiles)
{
    const auto dir = std::filesystem::temp_directory_path() / "gload_config_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "broken.json";
    {
        std::ofstream out(path);
        out << "{ \"worker_threads\": ";
    }

    EXPECT_THROW(load_config(dir / "does_not_exist.json"), ConfigError);
    EXPECT_THROW(load_config(path), ConfigError);

    std::filesystem::remove_all(dir);
}

TEST(ManifestTest, StringsAndObjects)
{
    auto j = json::parse(R"([
        "plain",
        { "name": "shared", "cacheable": true },
        { "name": "placed", "materialize": true }
    ])");

    auto specs = manifest_from_json(j, RequestDefaults{ false, false });

    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[0].name, "plain");
    EXPECT_FALSE(specs[0].cacheable);
    EXPECT_EQ(specs[1].name, "shared");
    EXPECT_TRUE(specs[1].cacheable);
    EXPECT_FALSE(specs[1].materialize);
    EXPECT_TRUE(specs[2].materialize);
}

TEST(ManifestTest, DefaultsApplyToMissingFlags)
{
    auto specs = manifest_from_json(json::parse(R"(["a", { "name": "b", "cacheable": false }])"), RequestDefaults{ true, true });

    EXPECT_TRUE(specs[0].cacheable);
    EXPECT_TRUE(specs[0].materialize);
    EXPECT_FALSE(specs[1].cacheable);
    EXPECT_TRUE(specs[1].materialize);
}

TEST(ManifestTest, InvalidManifestsThrow)
{
    EXPECT_THROW(manifest_from_json(json::object()), ConfigError);
    EXPECT_THROW(manifest_from_json(json::parse("[42]")), ConfigError);
    EXPECT_THROW(manifest_from_json(json::parse(R"([{ "cacheable": true }])")), ConfigError);
    EXPECT_THROW(manifest_from_json(json::parse(R"([""])")), ConfigError);
}
