#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <algorithm>
#include <spdlog/spdlog.h>

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = util::get_env_var("LOG_LEVEL", config.log_level);

    // Database
    config.db_conn_string = util::get_required_env_var("DATABASE_URL");
    config.pools_table = util::get_env_var("POOLS_TABLE", config.pools_table);

    // Redis
    config.redis_host = util::get_env_var("REDIS_HOST", config.redis_host);
    config.redis_port = util::get_env_int("REDIS_PORT", config.redis_port);
    config.redis_password = util::get_env_var("REDIS_PASSWORD");
    config.pool_update_channel = util::get_env_var("POOL_UPDATE_CHANNEL", config.pool_update_channel);

    // Chains (comma-separated)
    config.default_chain = util::get_env_var("DEFAULT_CHAIN", config.default_chain);
    config.preload_chains = util::split_string(util::get_env_var("PRELOAD_CHAINS"), ',');
    config.supported_chains = util::split_string(util::get_env_var("SUPPORTED_CHAINS"), ',');

    // Route cache
    config.route_cache_ttl_seconds = util::get_env_int("ROUTE_CACHE_TTL_SECONDS", config.route_cache_ttl_seconds);
    config.max_staleness_seconds = util::get_env_int("MAX_STALENESS_SECONDS", config.max_staleness_seconds);
    config.refresh_threads = util::get_env_int("REFRESH_THREADS", config.refresh_threads);

    // Route search
    config.default_max_hops = util::get_env_int("DEFAULT_MAX_HOPS", config.default_max_hops);
    config.max_hops_ceiling = util::get_env_int("MAX_HOPS_CEILING", config.max_hops_ceiling);
    config.max_route_results = util::get_env_int("MAX_ROUTE_RESULTS", config.max_route_results);

    // Worker
    config.route_worker_path = util::get_env_var("ROUTE_WORKER_PATH", config.route_worker_path);
    config.route_worker_timeout_seconds = util::get_env_int("ROUTE_WORKER_TIMEOUT_SECONDS", config.route_worker_timeout_seconds);
    config.max_concurrent_workers = util::get_env_int("MAX_CONCURRENT_WORKERS", config.max_concurrent_workers);

    // HTTP
    config.listen_host = util::get_env_var("LISTEN_HOST", config.listen_host);
    config.listen_port = util::get_env_int("LISTEN_PORT", config.listen_port);

    return config;
}

void Config::validate() const {
    if (db_conn_string.empty()) {
        throw std::runtime_error("DATABASE_URL is required");
    }

    if (pools_table.empty() ||
        pools_table.find_first_not_of("abcdefghijklmnopqrstuvwxyz0123456789_") != std::string::npos) {
        throw std::runtime_error("POOLS_TABLE must be a lowercase SQL identifier");
    }

    if (default_chain.empty()) {
        throw std::runtime_error("DEFAULT_CHAIN must not be empty");
    }

    if (route_cache_ttl_seconds < 1) {
        throw std::runtime_error("Route cache TTL must be at least 1 second");
    }

    if (max_staleness_seconds < 0) {
        throw std::runtime_error("Max staleness must not be negative");
    }

    if (max_hops_ceiling < 1 || default_max_hops < 1) {
        throw std::runtime_error("Hop limits must be at least 1");
    }

    if (max_route_results < 0) {
        throw std::runtime_error("Max route results must not be negative");
    }

    if (route_worker_timeout_seconds < 1) {
        throw std::runtime_error("Route worker timeout must be at least 1 second");
    }

    if (max_concurrent_workers < 1 || max_concurrent_workers > 64) {
        throw std::runtime_error("Max concurrent workers must be between 1 and 64");
    }

    if (refresh_threads < 1) {
        throw std::runtime_error("At least one refresh thread is required");
    }

    spdlog::info("Configuration validated successfully");
}

bool Config::is_supported_chain(const std::string& chain) const {
    if (chain == default_chain) {
        return true;
    }
    return std::find(preload_chains.begin(), preload_chains.end(), chain) != preload_chains.end() ||
           std::find(supported_chains.begin(), supported_chains.end(), chain) != supported_chains.end();
}
