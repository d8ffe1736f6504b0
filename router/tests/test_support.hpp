#pragma once

#include "pool_source.hpp"
#include "route_computer.hpp"
#include "route_finder.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace test_support {

inline Token make_token(const std::string& symbol, const std::string& contract = "eosio.token",
                        int decimals = 4) {
    Token token;
    token.id = symbol + "-" + contract;
    token.contract = contract;
    token.symbol = symbol;
    token.decimals = decimals;
    return token;
}

inline Pool make_pool(uint64_t id, const Token& a, const Token& b, const std::string& liquidity = "1000000") {
    Pool pool;
    pool.id = id;
    pool.token_a = a;
    pool.token_b = b;
    pool.fee = 3000;
    pool.sqrt_price_x64 = "18446744073709551616";
    pool.liquidity = liquidity;
    pool.tick_current = 0;
    pool.ticks = {{-60, "1000000", "1000000"}, {60, "-1000000", "1000000"}};
    pool.active = true;
    return pool;
}

inline std::vector<std::vector<uint64_t>> route_ids(const std::vector<Route>& routes) {
    std::vector<std::vector<uint64_t>> ids;
    for (const auto& route : routes) {
        ids.push_back(route.pool_ids());
    }
    return ids;
}

// Opens once; every waiter is released together
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

class FakePoolSource : public PoolSource {
public:
    std::vector<Pool> fetch_pools(const std::string& chain) override {
        ++fetch_count;
        if (gate) {
            gate->wait();
        }
        if (fail_next > 0) {
            --fail_next;
            throw BootstrapError("pool source unreachable for " + chain);
        }
        std::lock_guard<std::mutex> lock(mutex);
        return pools;
    }

    void set_pools(std::vector<Pool> value) {
        std::lock_guard<std::mutex> lock(mutex);
        pools = std::move(value);
    }

    std::atomic<int> fetch_count{0};
    std::atomic<int> fail_next{0};
    Gate* gate = nullptr;
    std::mutex mutex;
    std::vector<Pool> pools;
};

// Computes routes in-process with compute_all_routes. Can be told to fail
// or to hold every call until a gate opens.
class FakeRouteComputer : public RouteComputer {
public:
    std::vector<Route> compute(const Token& input, const Token& output,
                               const std::vector<Pool>& pools,
                               const RouteSearchLimits& limits) override {
        ++calls;
        if (gate) {
            gate->wait();
        }
        if (fail) {
            throw ComputationError("worker stopped with exit code 1");
        }
        return compute_all_routes(pools, input, output, limits);
    }

    std::atomic<int> calls{0};
    std::atomic<bool> fail{false};
    Gate* gate = nullptr;
};

class ManualClock {
public:
    ManualClock() : now_(start_) {}

    std::chrono::system_clock::time_point now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::seconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    std::chrono::system_clock::time_point start() const { return start_; }

private:
    const std::chrono::system_clock::time_point start_{std::chrono::hours(24 * 365 * 50)};
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point now_;
};

} // namespace test_support
