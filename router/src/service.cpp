#include "service.hpp"
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>

namespace {

RouteCache::Options route_cache_options(const Config& config) {
    RouteCache::Options options;
    options.ttl = std::chrono::seconds(config.route_cache_ttl_seconds);
    options.max_staleness = std::chrono::seconds(config.max_staleness_seconds);
    options.max_results = static_cast<size_t>(config.max_route_results);
    options.refresh_threads = static_cast<size_t>(config.refresh_threads);
    return options;
}

} // namespace

Service::Service(const Config& config)
    : config_(config),
      pool_source_(config),
      registry_(pool_source_),
      route_computer_(config.route_worker_path,
                      std::chrono::seconds(config.route_worker_timeout_seconds),
                      config.max_concurrent_workers),
      route_cache_(route_computer_, route_cache_options(config)),
      route_service_(config, registry_, route_cache_),
      subscriber_(config),
      health_checker_(subscriber_, pool_source_, registry_, route_cache_),
      http_server_(config, route_service_, health_checker_) {
}

Service::~Service() {
    http_server_.stop();
    subscriber_.stop();
}

void Service::run() {
    running_ = true;
    spdlog::info("Route service starting; route cache TTL {} s, worker {}",
                 config_.route_cache_ttl_seconds, config_.route_worker_path);

    // Updates may arrive before the first request; they bootstrap their chain
    subscriber_.start([this](const PoolUpdateMessage& message) {
        handle_pool_update(message);
    });

    preload_chains();
    http_server_.start();

    auto next_stats = std::chrono::steady_clock::now() + std::chrono::minutes(1);
    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (std::chrono::steady_clock::now() >= next_stats) {
            log_stats();
            next_stats += std::chrono::minutes(1);
        }
    }

    spdlog::info("Stopping route service...");
    http_server_.stop();
    subscriber_.stop();
    spdlog::info("Route service run loop finished.");
}

void Service::stop() {
    running_ = false;
}

void Service::preload_chains() {
    for (const auto& chain : config_.preload_chains) {
        try {
            registry_.ensure_loaded(chain);
        } catch (const BootstrapError& e) {
            // Not fatal: the first request for the chain retries the bootstrap
            spdlog::error("Preloading {} failed: {}", chain, e.what());
        }
    }
}

void Service::handle_pool_update(const PoolUpdateMessage& message) {
    if (!config_.is_supported_chain(message.chain)) {
        spdlog::debug("Ignoring pool update for unsupported chain '{}'", message.chain);
        ++updates_rejected_;
        return;
    }

    switch (registry_.apply_update(message.chain, message.buffer)) {
        case PoolRegistry::UpdateOutcome::Applied:
            ++updates_applied_;
            break;
        case PoolRegistry::UpdateOutcome::Bootstrapped:
            ++updates_bootstrapped_;
            break;
        case PoolRegistry::UpdateOutcome::Rejected:
            ++updates_rejected_;
            break;
    }
}

void Service::log_stats() {
    for (const auto& chain : registry_.loaded_chains()) {
        spdlog::info("{}: {} pools in registry", chain, registry_.size(chain));
    }
    spdlog::info("Pool updates applied {}, bootstraps {}, rejected {}; {} cached route sets, {} refreshes in flight, {} workers busy",
                 updates_applied_.load(), updates_bootstrapped_.load(), updates_rejected_.load(),
                 route_cache_.size(), route_cache_.refreshes_in_flight(), route_computer_.active_workers());
}
