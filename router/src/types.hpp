#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

struct Token {
    std::string id;        // "<symbol>-<contract>", e.g. "wax-eosio.token"
    std::string contract;
    std::string symbol;
    int decimals = 0;

    bool operator==(const Token& other) const {
        return id == other.id && contract == other.contract &&
               symbol == other.symbol && decimals == other.decimals;
    }
};

struct Tick {
    int32_t id = 0;
    std::string liquidity_net = "0";
    std::string liquidity_gross = "0";
};

struct Pool {
    uint64_t id = 0;
    Token token_a;
    Token token_b;
    uint32_t fee = 0;
    std::string sqrt_price_x64 = "0";
    std::string liquidity = "0";
    int32_t tick_current = 0;
    std::vector<Tick> ticks;
    bool active = true;

    bool involves_token(const std::string& token_id) const {
        return token_a.id == token_id || token_b.id == token_id;
    }

    // Caller must check involves_token first
    const Token& other_token(const std::string& token_id) const {
        return token_a.id == token_id ? token_b : token_a;
    }
};

struct Route {
    Token input;
    Token output;
    std::vector<Pool> pools;

    std::vector<uint64_t> pool_ids() const {
        std::vector<uint64_t> ids;
        ids.reserve(pools.size());
        for (const auto& pool : pools) {
            ids.push_back(pool.id);
        }
        return ids;
    }
};

enum class TradeType {
    ExactInput,
    ExactOutput
};

std::optional<TradeType> parse_trade_type(const std::string& value);

struct RouteCacheKey {
    std::string chain;
    std::string input_token_id;
    std::string output_token_id;
    int max_hops = 0;

    bool operator==(const RouteCacheKey& other) const {
        return chain == other.chain && input_token_id == other.input_token_id &&
               output_token_id == other.output_token_id && max_hops == other.max_hops;
    }

    std::string to_string() const;
};

struct RouteCacheKeyHash {
    size_t operator()(const RouteCacheKey& key) const;
};

struct RouteCacheEntry {
    std::vector<Route> routes;
    std::chrono::system_clock::time_point expires_at;
};

struct PoolUpdateMessage {
    std::string chain;
    std::vector<uint8_t> buffer;
};
