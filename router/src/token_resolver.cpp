#include "token_resolver.hpp"
#include <algorithm>

std::optional<Token> find_token(const std::vector<Pool>& pools, const std::string& token_id) {
    auto by_a = std::find_if(pools.begin(), pools.end(),
        [&token_id](const Pool& pool) { return pool.token_a.id == token_id; });
    if (by_a != pools.end()) {
        return by_a->token_a;
    }

    auto by_b = std::find_if(pools.begin(), pools.end(),
        [&token_id](const Pool& pool) { return pool.token_b.id == token_id; });
    if (by_b != pools.end()) {
        return by_b->token_b;
    }

    return std::nullopt;
}
