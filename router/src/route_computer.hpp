#pragma once

#include "route_finder.hpp"
#include "types.hpp"
#include <stdexcept>
#include <vector>

class ComputationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Runs a route search off the serving path. Throws ComputationError when the
// computation fails, times out or its execution unit dies.
class RouteComputer {
public:
    virtual ~RouteComputer() = default;

    virtual std::vector<Route> compute(const Token& input,
                                       const Token& output,
                                       const std::vector<Pool>& pools,
                                       const RouteSearchLimits& limits) = 0;
};
