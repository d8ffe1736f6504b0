#include "route_cache.hpp"
#include "token_resolver.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <memory>

RouteCache::RouteCache(RouteComputer& computer, Options options, Clock clock)
    : computer_(computer),
      options_(options),
      clock_(std::move(clock)),
      refresh_pool_(options.refresh_threads, "route-refresh") {
}

std::vector<Route> RouteCache::get(const std::string& chain,
                                   const std::vector<Pool>& pools,
                                   const std::string& input_token_id,
                                   const std::string& output_token_id,
                                   int max_hops) {
    RouteCacheKey key{chain, input_token_id, output_token_id, max_hops};
    std::promise<std::vector<Route>> promise;
    RoutesFuture pending;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            const auto& entry = it->second;
            if (now <= entry.expires_at) {
                return entry.routes;
            }

            bool too_old = options_.max_staleness.count() > 0 &&
                           now > entry.expires_at + options_.max_staleness;
            if (!too_old) {
                if (in_flight_.find(key) == in_flight_.end()) {
                    schedule_refresh_unlocked(key, pools);
                }
                return entry.routes;
            }

            spdlog::warn("Cached routes for {} exceeded max staleness, recomputing", key.to_string());
        }

        auto flight = in_flight_.find(key);
        if (flight != in_flight_.end()) {
            pending = flight->second;
        } else {
            in_flight_.emplace(key, promise.get_future().share());
            owner = true;
        }
    }

    if (!owner) {
        spdlog::debug("Joining in-flight route computation for {}", key.to_string());
        return pending.get();
    }

    return refresh(key, pools, promise).value_or(std::vector<Route>{});
}

void RouteCache::schedule_refresh_unlocked(const RouteCacheKey& key, const std::vector<Pool>& pools) {
    auto promise = std::make_shared<std::promise<std::vector<Route>>>();
    in_flight_.emplace(key, promise->get_future().share());

    try {
        refresh_pool_.enqueue([this, key, pools, promise]() {
            spdlog::info("update background cache for {}", key.to_string());
            auto routes = refresh(key, pools, *promise);
            if (routes) {
                spdlog::info("cache updated in background {} ({} routes)", key.to_string(), routes->size());
            } else {
                spdlog::warn("background refresh of {} failed, keeping stale routes", key.to_string());
            }
        });
    } catch (const std::exception& e) {
        spdlog::error("Could not schedule background refresh for {}: {}", key.to_string(), e.what());
        in_flight_.erase(key);
        promise->set_value({});
        idle_cv_.notify_all();
    }
}

std::optional<std::vector<Route>> RouteCache::refresh(const RouteCacheKey& key,
                                                      const std::vector<Pool>& pools,
                                                      std::promise<std::vector<Route>>& promise) {
    std::optional<std::vector<Route>> routes;

    auto input = find_token(pools, key.input_token_id);
    auto output = find_token(pools, key.output_token_id);

    if (!input || !output) {
        spdlog::error("Route cache: invalid input/output for {}", key.to_string());
    } else {
        try {
            RouteSearchLimits limits;
            limits.max_hops = key.max_hops;
            limits.max_results = options_.max_results;
            routes = computer_.compute(*input, *output, pools, limits);
        } catch (const std::exception& e) {
            spdlog::error("Error computing routes for {}: {}", key.to_string(), e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (routes) {
            auto expires_at = clock_() + options_.ttl;
            entries_[key] = RouteCacheEntry{*routes, expires_at};
            spdlog::debug("{} routes for {} cached until {}", routes->size(), key.to_string(),
                          util::format_timestamp(expires_at));
        }
        in_flight_.erase(key);
    }
    idle_cv_.notify_all();

    promise.set_value(routes ? *routes : std::vector<Route>{});
    return routes;
}

std::optional<RouteCacheEntry> RouteCache::peek(const RouteCacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RouteCache::is_refreshing(const RouteCacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.find(key) != in_flight_.end();
}

size_t RouteCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t RouteCache::refreshes_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

bool RouteCache::wait_for_refreshes(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_.empty(); });
}
