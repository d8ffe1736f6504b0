#include "route_service.hpp"
#include "token_resolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <chrono>

std::string format_swap_memo(TradeType trade_type, const TradeQuote& trade, const std::string& receiver) {
    std::string ids;
    for (auto id : trade.route.pool_ids()) {
        if (!ids.empty()) ids += ",";
        ids += std::to_string(id);
    }

    const char* method = trade_type == TradeType::ExactInput ? "swapexactin" : "swapexactout";
    return std::string(method) + "#" + ids + "#" + receiver + "#" + trade.min_received_asset + "#0";
}

RouteService::RouteService(const Config& config, PoolRegistry& registry, RouteCache& cache,
                           TradeSelector* trade_selector)
    : config_(config), registry_(registry), cache_(cache), trade_selector_(trade_selector) {
}

RouteQueryResult RouteService::invalid(const std::string& message) {
    RouteQueryResult result;
    result.status = RouteQueryResult::Status::InvalidInput;
    result.message = message;
    return result;
}

RouteQueryResult RouteService::find_routes(const RouteQuery& query) {
    if (query.chain.empty() || query.input_token_id.empty() || query.output_token_id.empty()) {
        return invalid("Invalid request");
    }

    auto trade_type = parse_trade_type(query.trade_type);
    if (!trade_type) {
        return invalid("Invalid request");
    }

    if (query.max_hops && *query.max_hops < 1) {
        return invalid("Invalid maxHops");
    }

    if (!config_.is_supported_chain(query.chain)) {
        spdlog::warn("Route query for unsupported chain '{}'", query.chain);
        return invalid("Unsupported chain");
    }

    auto start_time = std::chrono::steady_clock::now();

    auto all_pools = registry_.ensure_loaded(query.chain);

    // Only pools with initialized ticks can carry a swap
    std::vector<Pool> pools;
    pools.reserve(all_pools.size());
    std::copy_if(all_pools.begin(), all_pools.end(), std::back_inserter(pools),
                 [](const Pool& pool) { return !pool.ticks.empty(); });

    auto input = find_token(all_pools, query.input_token_id);
    auto output = find_token(all_pools, query.output_token_id);
    if (!input || !output) {
        return invalid("Invalid input/output");
    }

    RouteQueryResult result;
    result.input = *input;
    result.output = *output;
    result.max_hops = std::min(query.max_hops.value_or(config_.default_max_hops), config_.max_hops_ceiling);

    result.routes = cache_.get(query.chain, pools, query.input_token_id, query.output_token_id, result.max_hops);
    rebind_to_current_pools(query.chain, result.routes);

    if (trade_selector_) {
        result.trade = trade_selector_->best_trade(result.routes, pools, *trade_type,
                                                   query.amount, query.slippage);
        if (!result.trade) {
            result.status = RouteQueryResult::Status::NoRoute;
            result.message = "No route found";
        } else {
            result.memo = format_swap_memo(*trade_type, *result.trade, query.receiver);
        }
    } else if (result.routes.empty()) {
        result.status = RouteQueryResult::Status::NoRoute;
        result.message = "No route found";
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::info("{} find route {} hop {} ms {} -> {} ({} candidates)",
                 query.chain, result.max_hops, elapsed, input->symbol, output->symbol, result.routes.size());

    return result;
}

void RouteService::rebind_to_current_pools(const std::string& chain, std::vector<Route>& routes) const {
    for (auto& route : routes) {
        for (auto& pool : route.pools) {
            auto current = registry_.get_pool(chain, pool.id);
            if (!current) {
                spdlog::warn("Pool {} of a cached {} route is missing from the registry", pool.id, chain);
                continue;
            }
            pool = std::move(*current);
        }
    }
}
