// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "application.hpp"
#include "test_helpers.hpp"
#include "util/files.hpp"

using namespace ziacoin;
using namespace ziacoin::app;
using ziacoin::test::TempDir;

TEST_CASE("Config file", "[application][config]") {
    TempDir dir("ziacoin_conf");
    const auto conf = dir.path() / "node.conf";
    AppConfig config;
    std::string error;

    SECTION("Missing file keeps the defaults") {
        REQUIRE(LoadConfigFile(conf, config, error));
        REQUIRE(config.network_config.listen_port == protocol::ports::MAINNET);
        REQUIRE_FALSE(config.difficulty.has_value());
        REQUIRE_FALSE(config.mining_enabled);
    }

    SECTION("Every section is read") {
        REQUIRE(util::atomic_write_file(conf, R"({
            "network": {
                "host": "192.168.1.5",
                "port": 9000,
                "bootstrap_nodes": [{"host": "seed1", "port": 8333},
                                    {"host": "seed2", "port": 8334}]
            },
            "blockchain": {"difficulty": 3, "block_time": 30.0},
            "mining": {"enabled": true}
        })"));
        REQUIRE(LoadConfigFile(conf, config, error));
        REQUIRE(config.network_config.host == "192.168.1.5");
        REQUIRE(config.network_config.listen_port == 9000);
        REQUIRE(config.network_config.bootstrap_nodes.size() == 2);
        REQUIRE(config.network_config.bootstrap_nodes[1].host == "seed2");
        REQUIRE(config.network_config.bootstrap_nodes[1].port == 8334);
        REQUIRE(config.difficulty == 3);
        REQUIRE(config.block_time == 30.0);
        REQUIRE(config.mining_enabled);
    }

    SECTION("Partial file only touches what it names") {
        REQUIRE(util::atomic_write_file(conf, R"({"mining": {"enabled": true}})"));
        REQUIRE(LoadConfigFile(conf, config, error));
        REQUIRE(config.mining_enabled);
        REQUIRE(config.network_config.host == "127.0.0.1");
    }

    SECTION("Broken JSON is an error") {
        REQUIRE(util::atomic_write_file(conf, "{\"network\": "));
        REQUIRE_FALSE(LoadConfigFile(conf, config, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Mistyped values are errors") {
        REQUIRE(util::atomic_write_file(conf, R"({"network": {"port": "9000"}})"));
        REQUIRE_FALSE(LoadConfigFile(conf, config, error));

        REQUIRE(util::atomic_write_file(conf, R"({"network": {"port": 70000}})"));
        REQUIRE_FALSE(LoadConfigFile(conf, config, error));

        REQUIRE(util::atomic_write_file(conf, R"({"network": {"bootstrap_nodes": [{"host": "x"}]}})"));
        REQUIRE_FALSE(LoadConfigFile(conf, config, error));

        REQUIRE(util::atomic_write_file(conf, R"([1, 2])"));
        REQUIRE_FALSE(LoadConfigFile(conf, config, error));
    }
}
