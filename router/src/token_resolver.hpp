#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Finds the token with the given id on either side of any pool.
// Side A matches across all pools win over side B matches.
std::optional<Token> find_token(const std::vector<Pool>& pools, const std::string& token_id);
