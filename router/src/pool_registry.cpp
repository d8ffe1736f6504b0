#include "pool_registry.hpp"
#include "codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>

PoolRegistry::PoolRegistry(PoolSource& source)
    : source_(source) {
}

bool PoolRegistry::is_routable(const Pool& pool) {
    return pool.active && util::is_positive_integer_string(pool.liquidity);
}

std::vector<Pool> PoolRegistry::ensure_loaded(const std::string& chain) {
    std::unique_lock<std::mutex> lock(mutex_);

    // Join a bootstrap another caller already started; its failure is ours too
    uint64_t attempt = 0;
    while (true) {
        auto& state = chains_[chain];
        if (state.loaded) {
            return snapshot_unlocked(state);
        }
        if (!state.loading) {
            state.loading = true;
            attempt = ++state.attempt;
            break;
        }

        const uint64_t joined = state.attempt;
        bootstrap_cv_.wait(lock, [this, &chain, joined] {
            const auto& current = chains_[chain];
            return current.loaded || !current.loading || current.attempt != joined;
        });

        auto& settled = chains_[chain];
        if (!settled.loaded && settled.failed_attempt == joined && settled.failure) {
            std::rethrow_exception(settled.failure);
        }
    }
    lock.unlock();

    auto start_time = std::chrono::steady_clock::now();
    std::unordered_map<uint64_t, Pool> pools;
    std::exception_ptr failure;

    try {
        auto fetched = source_.fetch_pools(chain);
        for (auto& pool : fetched) {
            if (is_routable(pool)) {
                pools[pool.id] = std::move(pool);
            }
        }
    } catch (const BootstrapError& e) {
        spdlog::error("Bootstrap of {} pools failed: {}", chain, e.what());
        failure = std::current_exception();
    } catch (const std::exception& e) {
        spdlog::error("Bootstrap of {} pools failed: {}", chain, e.what());
        failure = std::make_exception_ptr(
            BootstrapError(std::string("pool source failed for ") + chain + ": " + e.what()));
    }

    if (failure) {
        lock.lock();
        auto& state = chains_[chain];
        state.loading = false;
        state.failure = failure;
        state.failed_attempt = attempt;
        bootstrap_cv_.notify_all();
        lock.unlock();
        std::rethrow_exception(failure);
    }

    lock.lock();
    auto& state = chains_[chain];
    state.pools = std::move(pools);
    state.loaded = true;
    state.loading = false;
    state.failure = nullptr;
    bootstrap_cv_.notify_all();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::info("{} initial {} pools fetched in {} ms", state.pools.size(), chain, duration);

    return snapshot_unlocked(state);
}

PoolRegistry::UpdateOutcome PoolRegistry::apply_update(const std::string& chain,
                                                       const std::vector<uint8_t>& encoded_pool) {
    auto pool = codec::decode_pool(encoded_pool);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = chains_.find(chain);
        if (it != chains_.end() && it->second.loaded) {
            if (!pool) {
                spdlog::error("Rejected undecodable pool update for {} ({} bytes)", chain, encoded_pool.size());
                return UpdateOutcome::Rejected;
            }

            spdlog::debug("Pool {} updated on {}", pool->id, chain);
            it->second.pools[pool->id] = std::move(*pool);
            return UpdateOutcome::Applied;
        }
    }

    spdlog::info("Pool update for {} arrived before bootstrap, fetching full pool set", chain);
    ensure_loaded(chain);
    return UpdateOutcome::Bootstrapped;
}

bool PoolRegistry::is_loaded(const std::string& chain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chains_.find(chain);
    return it != chains_.end() && it->second.loaded;
}

size_t PoolRegistry::size(const std::string& chain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chains_.find(chain);
    return it != chains_.end() ? it->second.pools.size() : 0;
}

std::optional<Pool> PoolRegistry::get_pool(const std::string& chain, uint64_t pool_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto chain_it = chains_.find(chain);
    if (chain_it == chains_.end()) {
        return std::nullopt;
    }

    auto pool_it = chain_it->second.pools.find(pool_id);
    if (pool_it == chain_it->second.pools.end()) {
        return std::nullopt;
    }
    return pool_it->second;
}

std::vector<std::string> PoolRegistry::loaded_chains() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    for (const auto& [chain, state] : chains_) {
        if (state.loaded) {
            result.push_back(chain);
        }
    }
    return result;
}

std::vector<Pool> PoolRegistry::snapshot_unlocked(const ChainState& state) const {
    std::vector<Pool> result;
    result.reserve(state.pools.size());
    for (const auto& entry : state.pools) {
        result.push_back(entry.second);
    }
    std::sort(result.begin(), result.end(),
              [](const Pool& lhs, const Pool& rhs) { return lhs.id < rhs.id; });
    return result;
}
