#pragma once

#include "config.hpp"
#include "pool_registry.hpp"
#include "route_cache.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

struct TradeQuote {
    Route route;
    std::string input_amount;
    std::string output_amount;
    std::string min_received;
    std::string max_sent;
    std::string price_impact;
    // Minimum received as an extended asset, e.g. "1.2345 USDT@usdt.alcor"
    std::string min_received_asset;
    std::string execution_price_numerator;
    std::string execution_price_denominator;
};

// Best-trade selection over a fixed candidate route set. Implemented outside
// this service; amount parsing and slippage belong to it as well.
class TradeSelector {
public:
    virtual ~TradeSelector() = default;

    virtual std::optional<TradeQuote> best_trade(const std::vector<Route>& routes,
                                                 const std::vector<Pool>& pools,
                                                 TradeType trade_type,
                                                 const std::string& amount,
                                                 const std::string& slippage) = 0;
};

struct RouteQuery {
    std::string chain;
    std::string input_token_id;
    std::string output_token_id;
    std::string trade_type;
    std::optional<int> max_hops;
    std::string amount;
    std::string slippage = "0.3"; // percent
    std::string receiver = "<receiver>";
};

struct RouteQueryResult {
    enum class Status { Ok, InvalidInput, NoRoute };

    Status status = Status::Ok;
    std::string message;
    Token input;
    Token output;
    int max_hops = 0;
    std::vector<Route> routes;
    std::optional<TradeQuote> trade;
    std::string memo;
};

// Transfer memo the swap contract executes:
// swapexactin#<pool ids>#<receiver>#<min received asset>#0 (swapexactout for exact output)
std::string format_swap_memo(TradeType trade_type, const TradeQuote& trade, const std::string& receiver);

class RouteService {
public:
    RouteService(const Config& config, PoolRegistry& registry, RouteCache& cache,
                 TradeSelector* trade_selector = nullptr);

    // Throws BootstrapError when the chain cannot be loaded
    RouteQueryResult find_routes(const RouteQuery& query);

private:
    static RouteQueryResult invalid(const std::string& message);
    void rebind_to_current_pools(const std::string& chain, std::vector<Route>& routes) const;

    const Config& config_;
    PoolRegistry& registry_;
    RouteCache& cache_;
    TradeSelector* trade_selector_;
};
