#pragma once
#include <string>
#include <vector>

class Config {
public:
    // Service info
    std::string service_name = "swap-router";
    std::string log_level = "info";

    // Database (pool bootstrap source)
    std::string db_conn_string;
    std::string pools_table = "swap_pools";

    // Redis
    std::string redis_host = "localhost";
    int redis_port = 6379;
    std::string redis_password;
    std::string pool_update_channel = "swap:pool:instanceUpdated";

    // Chains
    std::string default_chain = "wax";
    std::vector<std::string> preload_chains;
    std::vector<std::string> supported_chains; // served in addition to default and preloaded chains

    // Route cache
    int route_cache_ttl_seconds = 60 * 60 * 2;
    int max_staleness_seconds = 0; // 0 = stale routes are served regardless of age
    int refresh_threads = 2;

    // Route search limits
    int default_max_hops = 3;
    int max_hops_ceiling = 3;
    int max_route_results = 0; // 0 = unlimited

    // Route worker process
    std::string route_worker_path = "swap_route_worker";
    int route_worker_timeout_seconds = 60;
    int max_concurrent_workers = 4;

    // HTTP
    std::string listen_host = "0.0.0.0";
    int listen_port = 8084;

    static Config from_env();
    void validate() const;

    bool is_supported_chain(const std::string& chain) const;
};
