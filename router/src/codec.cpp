#include "codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

// Reads an integer field, throwing instead of wrapping when it does not fit T
template<typename T>
T get_integer(const json& j, const char* field) {
    const auto& value = j.at(field);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("field ") + field + " is not an integer");
    }

    if (value.is_number_unsigned()) {
        auto raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw std::out_of_range(std::string("field ") + field + " is out of range");
        }
        return static_cast<T>(raw);
    }

    auto raw = value.get<int64_t>();
    if (raw < 0 && !std::numeric_limits<T>::is_signed) {
        throw std::out_of_range(std::string("field ") + field + " is negative");
    }
    if (std::numeric_limits<T>::is_signed &&
        (raw < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
         raw > static_cast<int64_t>(std::numeric_limits<T>::max()))) {
        throw std::out_of_range(std::string("field ") + field + " is out of range");
    }
    if (!std::numeric_limits<T>::is_signed &&
        static_cast<uint64_t>(raw) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw std::out_of_range(std::string("field ") + field + " is out of range");
    }
    return static_cast<T>(raw);
}

} // namespace

namespace codec {

json token_to_json(const Token& token) {
    return {
        {"id", token.id},
        {"contract", token.contract},
        {"symbol", token.symbol},
        {"decimals", token.decimals}
    };
}

Token token_from_json(const json& j) {
    Token token;
    token.id = j.at("id").get<std::string>();
    token.contract = j.at("contract").get<std::string>();
    token.symbol = j.at("symbol").get<std::string>();
    token.decimals = get_integer<int>(j, "decimals");
    return token;
}

json pool_to_json(const Pool& pool) {
    json ticks = json::array();
    for (const auto& tick : pool.ticks) {
        ticks.push_back({
            {"id", tick.id},
            {"liquidity_net", tick.liquidity_net},
            {"liquidity_gross", tick.liquidity_gross}
        });
    }

    return {
        {"id", pool.id},
        {"token_a", token_to_json(pool.token_a)},
        {"token_b", token_to_json(pool.token_b)},
        {"fee", pool.fee},
        {"sqrt_price_x64", pool.sqrt_price_x64},
        {"liquidity", pool.liquidity},
        {"tick_current", pool.tick_current},
        {"ticks", ticks},
        {"active", pool.active}
    };
}

Pool pool_from_json(const json& j) {
    Pool pool;
    pool.id = get_integer<uint64_t>(j, "id");
    pool.token_a = token_from_json(j.at("token_a"));
    pool.token_b = token_from_json(j.at("token_b"));
    pool.fee = get_integer<uint32_t>(j, "fee");
    pool.sqrt_price_x64 = j.at("sqrt_price_x64").get<std::string>();
    pool.liquidity = j.at("liquidity").get<std::string>();
    pool.tick_current = get_integer<int32_t>(j, "tick_current");
    pool.active = j.value("active", true);

    for (const auto& item : j.at("ticks")) {
        Tick tick;
        tick.id = get_integer<int32_t>(item, "id");
        tick.liquidity_net = item.at("liquidity_net").get<std::string>();
        tick.liquidity_gross = item.at("liquidity_gross").get<std::string>();
        pool.ticks.push_back(std::move(tick));
    }

    if (pool.token_a.id.empty() || pool.token_b.id.empty()) {
        throw std::invalid_argument("pool " + std::to_string(pool.id) + " has an empty token id");
    }
    return pool;
}

Bytes encode_pool(const Pool& pool) {
    return json::to_msgpack(pool_to_json(pool));
}

std::optional<Pool> decode_pool(const Bytes& buffer) {
    try {
        return pool_from_json(json::from_msgpack(buffer));
    } catch (const std::exception& e) {
        spdlog::debug("Failed to decode pool buffer ({} bytes): {}", buffer.size(), e.what());
        return std::nullopt;
    }
}

Bytes encode_route(const Route& route) {
    json pools = json::array();
    for (const auto& pool : route.pools) {
        pools.push_back(pool_to_json(pool));
    }

    json j = {
        {"input", token_to_json(route.input)},
        {"output", token_to_json(route.output)},
        {"pools", pools}
    };
    return json::to_msgpack(j);
}

std::optional<Route> decode_route(const Bytes& buffer) {
    try {
        auto j = json::from_msgpack(buffer);

        Route route;
        route.input = token_from_json(j.at("input"));
        route.output = token_from_json(j.at("output"));
        for (const auto& item : j.at("pools")) {
            route.pools.push_back(pool_from_json(item));
        }

        if (route.pools.empty()) {
            spdlog::debug("Rejecting decoded route without pools");
            return std::nullopt;
        }
        return route;
    } catch (const std::exception& e) {
        spdlog::debug("Failed to decode route buffer ({} bytes): {}", buffer.size(), e.what());
        return std::nullopt;
    }
}

std::optional<PoolUpdateMessage> parse_pool_update_message(const std::string& payload) {
    try {
        auto j = json::parse(payload);

        PoolUpdateMessage message;
        message.chain = j.at("chain").get<std::string>();
        auto buffer = util::from_hex(j.at("buffer").get<std::string>());
        if (message.chain.empty() || !buffer) {
            return std::nullopt;
        }
        message.buffer = std::move(*buffer);
        return message;
    } catch (const json::exception& e) {
        spdlog::debug("Malformed pool update payload: {}", e.what());
        return std::nullopt;
    }
}

} // namespace codec
