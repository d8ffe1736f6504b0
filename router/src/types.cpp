#include "types.hpp"
#include <functional>

std::optional<TradeType> parse_trade_type(const std::string& value) {
    if (value == "EXACT_INPUT") return TradeType::ExactInput;
    if (value == "EXACT_OUTPUT") return TradeType::ExactOutput;
    return std::nullopt;
}

std::string RouteCacheKey::to_string() const {
    return chain + "-" + input_token_id + "-" + output_token_id + "-" + std::to_string(max_hops);
}

size_t RouteCacheKeyHash::operator()(const RouteCacheKey& key) const {
    std::hash<std::string> hasher;
    size_t seed = hasher(key.chain);
    auto combine = [&seed](size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    combine(hasher(key.input_token_id));
    combine(hasher(key.output_token_id));
    combine(std::hash<int>{}(key.max_hops));
    return seed;
}
