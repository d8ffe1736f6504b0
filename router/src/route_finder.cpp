#include "route_finder.hpp"
#include <string>
#include <unordered_map>

namespace {

class RouteSearch {
public:
    RouteSearch(const std::vector<Pool>& pools, const Token& input, const Token& output,
                const RouteSearchLimits& limits)
        : pools_(pools), input_(input), output_(output), limits_(limits), used_(pools.size(), false) {
        for (size_t i = 0; i < pools_.size(); ++i) {
            by_token_[pools_[i].token_a.id].push_back(i);
            if (pools_[i].token_b.id != pools_[i].token_a.id) {
                by_token_[pools_[i].token_b.id].push_back(i);
            }
        }
    }

    std::vector<Route> run() {
        if (limits_.max_hops >= 1 && input_.id != output_.id) {
            search(input_.id, limits_.max_hops);
        }
        return std::move(routes_);
    }

private:
    bool done() const {
        return limits_.max_results > 0 && routes_.size() >= limits_.max_results;
    }

    void search(const std::string& current, int hops_left) {
        auto it = by_token_.find(current);
        if (it == by_token_.end()) {
            return;
        }

        for (size_t index : it->second) {
            if (used_[index]) continue;

            const Pool& pool = pools_[index];
            const Token& next = pool.other_token(current);

            used_[index] = true;
            path_.push_back(index);

            if (next.id == output_.id) {
                emit();
            } else if (hops_left > 1) {
                search(next.id, hops_left - 1);
            }

            path_.pop_back();
            used_[index] = false;

            if (done()) return;
        }
    }

    void emit() {
        Route route;
        route.input = input_;
        route.output = output_;
        route.pools.reserve(path_.size());
        for (size_t index : path_) {
            route.pools.push_back(pools_[index]);
        }
        routes_.push_back(std::move(route));
    }

    const std::vector<Pool>& pools_;
    const Token& input_;
    const Token& output_;
    const RouteSearchLimits& limits_;
    std::unordered_map<std::string, std::vector<size_t>> by_token_;
    std::vector<bool> used_;
    std::vector<size_t> path_;
    std::vector<Route> routes_;
};

} // namespace

std::vector<Route> compute_all_routes(const std::vector<Pool>& pools,
                                      const Token& input,
                                      const Token& output,
                                      const RouteSearchLimits& limits) {
    return RouteSearch(pools, input, output, limits).run();
}
