#pragma once

#include "pool_source.hpp"
#include "types.hpp"
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Per-chain view of live pools. A chain is bootstrapped once from the
// PoolSource and afterwards only receives upserts; it is never reset.
class PoolRegistry {
public:
    enum class UpdateOutcome {
        Applied,       // pool upserted into an existing registry
        Bootstrapped,  // chain had no registry; update dropped, full fetch done
        Rejected       // payload did not decode to a usable pool
    };

    explicit PoolRegistry(PoolSource& source);

    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    // Returns every pool of the chain ordered by id, bootstrapping it first if needed.
    // Concurrent first calls for one chain share a single fetch and its
    // outcome: when it fails, every caller that joined it gets the same
    // BootstrapError. Only a call made after the failure fetches again.
    // No registry is created on failure.
    std::vector<Pool> ensure_loaded(const std::string& chain);

    // Decodes and upserts a pool. Bootstrap errors propagate.
    UpdateOutcome apply_update(const std::string& chain, const std::vector<uint8_t>& encoded_pool);

    bool is_loaded(const std::string& chain) const;
    size_t size(const std::string& chain) const;
    std::optional<Pool> get_pool(const std::string& chain, uint64_t pool_id) const;
    std::vector<std::string> loaded_chains() const;

    // Bootstrap filter: active pools with positive liquidity
    static bool is_routable(const Pool& pool);

private:
    struct ChainState {
        bool loaded = false;
        bool loading = false;
        uint64_t attempt = 0;
        uint64_t failed_attempt = 0;
        std::exception_ptr failure;
        std::unordered_map<uint64_t, Pool> pools;
    };

    std::vector<Pool> snapshot_unlocked(const ChainState& state) const;

    PoolSource& source_;
    mutable std::mutex mutex_;
    std::condition_variable bootstrap_cv_;
    std::unordered_map<std::string, ChainState> chains_;
};
