#pragma once

#include "route_computer.hpp"
#include "thread_pool.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Stale-while-revalidate cache of candidate routes per
// (chain, input token, output token, max hops).
//
//  - miss: the caller blocks on the computation; concurrent callers for the
//    same key join it instead of starting another one
//  - fresh hit: cached routes, no side effect
//  - stale hit: cached routes returned at once; one background refresh is
//    scheduled unless one is already in flight for the key
//
// Entries are never evicted. A failed computation leaves any previous entry
// untouched and always clears the key's in-flight marker.
class RouteCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct Options {
        std::chrono::seconds ttl{60 * 60 * 2};
        // Past expires_at + max_staleness a stale entry is treated as a miss; 0 disables
        std::chrono::seconds max_staleness{0};
        size_t max_results = 0;
        size_t refresh_threads = 2;
    };

    RouteCache(RouteComputer& computer, Options options,
               Clock clock = [] { return std::chrono::system_clock::now(); });

    RouteCache(const RouteCache&) = delete;
    RouteCache& operator=(const RouteCache&) = delete;

    // Never throws for computation failures: a failed first population yields
    // an empty list, a failed refresh keeps serving the stale routes.
    std::vector<Route> get(const std::string& chain,
                           const std::vector<Pool>& pools,
                           const std::string& input_token_id,
                           const std::string& output_token_id,
                           int max_hops);

    std::optional<RouteCacheEntry> peek(const RouteCacheKey& key) const;
    bool is_refreshing(const RouteCacheKey& key) const;
    size_t size() const;
    size_t refreshes_in_flight() const;

    // Blocks until no computation is in flight or the timeout passes
    bool wait_for_refreshes(std::chrono::milliseconds timeout) const;

private:
    using RoutesFuture = std::shared_future<std::vector<Route>>;

    void schedule_refresh_unlocked(const RouteCacheKey& key, const std::vector<Pool>& pools);
    std::optional<std::vector<Route>> refresh(const RouteCacheKey& key,
                                              const std::vector<Pool>& pools,
                                              std::promise<std::vector<Route>>& promise);

    RouteComputer& computer_;
    Options options_;
    Clock clock_;

    mutable std::mutex mutex_;
    mutable std::condition_variable idle_cv_;
    std::unordered_map<RouteCacheKey, RouteCacheEntry, RouteCacheKeyHash> entries_;
    std::unordered_map<RouteCacheKey, RoutesFuture, RouteCacheKeyHash> in_flight_;

    // Declared last: joined before the state its tasks touch is destroyed
    ThreadPool refresh_pool_;
};
