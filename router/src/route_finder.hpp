#pragma once

#include "types.hpp"
#include <cstddef>
#include <vector>

struct RouteSearchLimits {
    int max_hops = 3;
    size_t max_results = 0; // 0 = unlimited
};

// Enumerates every simple path (no pool used twice) of at most
// limits.max_hops pools leading from input to output. Paths are produced
// depth-first in pool order; enumeration stops once max_results is reached.
std::vector<Route> compute_all_routes(const std::vector<Pool>& pools,
                                      const Token& input,
                                      const Token& output,
                                      const RouteSearchLimits& limits);
