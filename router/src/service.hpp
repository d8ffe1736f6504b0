#pragma once

#include "config.hpp"
#include "health.hpp"
#include "http_server.hpp"
#include "pg_pool_source.hpp"
#include "pool_registry.hpp"
#include "pool_update_subscriber.hpp"
#include "process_route_computer.hpp"
#include "route_cache.hpp"
#include "route_service.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>

class Service {
public:
    explicit Service(const Config& config);
    ~Service();

    void run();
    void stop();

private:
    void preload_chains();
    void handle_pool_update(const PoolUpdateMessage& message);
    void log_stats();

    const Config& config_;
    PgPoolSource pool_source_;
    PoolRegistry registry_;
    ProcessRouteComputer route_computer_;
    RouteCache route_cache_;
    RouteService route_service_;
    PoolUpdateSubscriber subscriber_;
    HealthChecker health_checker_;
    HttpServer http_server_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> updates_applied_{0};
    std::atomic<uint64_t> updates_bootstrapped_{0};
    std::atomic<uint64_t> updates_rejected_{0};
};
