#include "config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <stdexcept>

namespace {

Config valid_config() {
    Config config;
    config.db_conn_string = "postgresql://router@localhost/swap";
    return config;
}

} // namespace

TEST_CASE("Defaults validate once a database is set", "[config]") {
    auto config = valid_config();
    CHECK_NOTHROW(config.validate());
    CHECK(config.route_cache_ttl_seconds == 7200);
    CHECK(config.default_max_hops == 3);
    CHECK(config.pool_update_channel == "swap:pool:instanceUpdated");

    Config missing_db;
    CHECK_THROWS_AS(missing_db.validate(), std::runtime_error);
}

TEST_CASE("Out of range settings are rejected", "[config]") {
    auto config = valid_config();

    SECTION("table name") {
        config.pools_table = "pools; DROP TABLE users";
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("ttl") {
        config.route_cache_ttl_seconds = 0;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("staleness") {
        config.max_staleness_seconds = -1;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("hops") {
        config.max_hops_ceiling = 0;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("workers") {
        config.max_concurrent_workers = 0;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("worker timeout") {
        config.route_worker_timeout_seconds = 0;
        CHECK_THROWS_AS(config.validate(), std::runtime_error);
    }
}

TEST_CASE("Supported chains cover default, preloaded and listed chains", "[config]") {
    auto config = valid_config();
    config.preload_chains = {"eos"};
    config.supported_chains = {"telos"};

    CHECK(config.is_supported_chain("wax"));
    CHECK(config.is_supported_chain("eos"));
    CHECK(config.is_supported_chain("telos"));
    CHECK_FALSE(config.is_supported_chain("junk"));
    CHECK_FALSE(config.is_supported_chain(""));
}

TEST_CASE("Environment overrides", "[config][env]") {
    setenv("DATABASE_URL", "postgresql://env@localhost/swap", 1);
    setenv("PRELOAD_CHAINS", "wax, eos ,", 1);
    setenv("ROUTE_CACHE_TTL_SECONDS", "60", 1);
    setenv("SUPPORTED_CHAINS", "telos", 1);

    auto config = Config::from_env();
    CHECK(config.db_conn_string == "postgresql://env@localhost/swap");
    CHECK(config.preload_chains == std::vector<std::string>{"wax", "eos"});
    CHECK(config.route_cache_ttl_seconds == 60);
    CHECK(config.is_supported_chain("telos"));

    setenv("ROUTE_CACHE_TTL_SECONDS", "two hours", 1);
    CHECK_THROWS(Config::from_env());

    unsetenv("ROUTE_CACHE_TTL_SECONDS");
    unsetenv("PRELOAD_CHAINS");
    unsetenv("SUPPORTED_CHAINS");
    unsetenv("DATABASE_URL");
    CHECK_THROWS(Config::from_env());
}
