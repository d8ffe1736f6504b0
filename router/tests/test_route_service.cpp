#include "codec.hpp"
#include "route_service.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace test_support;
using namespace std::chrono_literals;

namespace {

class FirstRouteSelector : public TradeSelector {
public:
    std::optional<TradeQuote> best_trade(const std::vector<Route>& routes,
                                         const std::vector<Pool>&,
                                         TradeType trade_type,
                                         const std::string& amount,
                                         const std::string& slippage) override {
        last_trade_type = trade_type;
        last_slippage = slippage;
        if (routes.empty()) {
            return std::nullopt;
        }

        TradeQuote quote;
        quote.route = routes.front();
        quote.input_amount = amount;
        quote.output_amount = "0.9970";
        quote.min_received = "0.9940";
        quote.max_sent = amount;
        quote.price_impact = "0.01";
        quote.min_received_asset = "0.9940 USDT@usdt.alcor";
        quote.execution_price_numerator = "9970";
        quote.execution_price_denominator = "10000";
        return quote;
    }

    std::optional<TradeType> last_trade_type;
    std::string last_slippage;
};

struct ServiceFixture {
    Token wax = make_token("WAX");
    Token tlm = make_token("TLM", "alien.worlds");
    Token usdt = make_token("USDT", "usdt.alcor");
    Token lone = make_token("LONE", "lone.token");
    Token a = make_token("A");
    Token b = make_token("B");
    Token c = make_token("C");
    Token d = make_token("D");
    Token e = make_token("E");

    Config config;
    FakePoolSource source;
    FakeRouteComputer computer;
    PoolRegistry registry{source};
    RouteCache cache{computer, RouteCache::Options{}};

    ServiceFixture() {
        auto tickless = make_pool(4, wax, lone);
        tickless.ticks.clear();

        source.set_pools({
            make_pool(1, wax, tlm),
            make_pool(2, tlm, usdt),
            make_pool(3, wax, usdt),
            tickless,
            // A - B - C - D - E chain, four hops end to end
            make_pool(10, a, b),
            make_pool(11, b, c),
            make_pool(12, c, d),
            make_pool(13, d, e),
        });
    }

    RouteQuery query(const Token& input, const Token& output) const {
        RouteQuery q;
        q.chain = "wax";
        q.input_token_id = input.id;
        q.output_token_id = output.id;
        q.trade_type = "EXACT_INPUT";
        q.amount = "1.0000";
        return q;
    }
};

} // namespace

TEST_CASE("Malformed requests are rejected before any lookup", "[route_service]") {
    ServiceFixture f;
    RouteService service(f.config, f.registry, f.cache);

    auto no_input = f.query(f.wax, f.usdt);
    no_input.input_token_id.clear();
    auto result = service.find_routes(no_input);
    CHECK(result.status == RouteQueryResult::Status::InvalidInput);
    CHECK(result.message == "Invalid request");

    auto bad_trade = f.query(f.wax, f.usdt);
    bad_trade.trade_type = "SIDEWAYS";
    CHECK(service.find_routes(bad_trade).message == "Invalid request");

    auto zero_hops = f.query(f.wax, f.usdt);
    zero_hops.max_hops = 0;
    CHECK(service.find_routes(zero_hops).status == RouteQueryResult::Status::InvalidInput);

    CHECK(f.source.fetch_count.load() == 0);
}

TEST_CASE("Only configured chains are served", "[route_service]") {
    ServiceFixture f;
    RouteService service(f.config, f.registry, f.cache);

    for (int i = 0; i < 50; ++i) {
        auto query = f.query(f.wax, f.usdt);
        query.chain = "junk" + std::to_string(i);
        auto result = service.find_routes(query);
        CHECK(result.status == RouteQueryResult::Status::InvalidInput);
        CHECK(result.message == "Unsupported chain");
    }
    CHECK(f.source.fetch_count.load() == 0);
    CHECK(f.registry.loaded_chains().empty());

    f.config.supported_chains = {"eos"};
    auto query = f.query(f.wax, f.usdt);
    query.chain = "eos";
    CHECK(service.find_routes(query).status == RouteQueryResult::Status::Ok);
    CHECK(f.registry.loaded_chains() == std::vector<std::string>{"eos"});
}

TEST_CASE("Unknown tokens are reported as invalid input/output", "[route_service]") {
    ServiceFixture f;
    RouteService service(f.config, f.registry, f.cache);

    auto query = f.query(f.wax, f.usdt);
    query.output_token_id = "GHOST-nowhere";
    auto result = service.find_routes(query);
    CHECK(result.status == RouteQueryResult::Status::InvalidInput);
    CHECK(result.message == "Invalid input/output");
}

TEST_CASE("Routes come from the cache with the default hop limit", "[route_service]") {
    ServiceFixture f;
    RouteService service(f.config, f.registry, f.cache);

    auto result = service.find_routes(f.query(f.wax, f.usdt));
    REQUIRE(result.status == RouteQueryResult::Status::Ok);
    CHECK(result.input == f.wax);
    CHECK(result.output == f.usdt);
    CHECK(result.max_hops == 3);
    CHECK(route_ids(result.routes) == std::vector<std::vector<uint64_t>>{{1, 2}, {3}});
    CHECK(f.cache.peek({"wax", f.wax.id, f.usdt.id, 3}).has_value());

    service.find_routes(f.query(f.wax, f.usdt));
    CHECK(f.computer.calls.load() == 1);
}

TEST_CASE("Requested hop limits are clamped to the ceiling", "[route_service]") {
    ServiceFixture f;
    RouteService service(f.config, f.registry, f.cache);

    auto query = f.query(f.a, f.e);
    query.max_hops = 10;
    auto result = service.find_routes(query);
    CHECK(result.max_hops == 3);
    CHECK(result.status == RouteQueryResult::Status::NoRoute);
    CHECK(result.message == "No route found");

    f.config.max_hops_ceiling = 4;
    result = service.find_routes(query);
    CHECK(result.max_hops == 4);
    REQUIRE(result.status == RouteQueryResult::Status::Ok);
    CHECK(route_ids(result.routes) == std::vector<std::vector<uint64_t>>{{10, 11, 12, 13}});
}

TEST_CASE("Pools without ticks never carry a route", "[route_service]") {
    ServiceFixture f;
    RouteService service(f.config, f.registry, f.cache);

    // LONE is only reachable through the tickless pool
    auto result = service.find_routes(f.query(f.wax, f.lone));
    CHECK(result.status == RouteQueryResult::Status::NoRoute);
    CHECK(result.routes.empty());
}

TEST_CASE("Cached routes are rebound to the latest pool state", "[route_service]") {
    ServiceFixture f;
    RouteService service(f.config, f.registry, f.cache);

    service.find_routes(f.query(f.wax, f.usdt));

    auto updated = make_pool(3, f.wax, f.usdt, "424242");
    REQUIRE(f.registry.apply_update("wax", codec::encode_pool(updated)) ==
            PoolRegistry::UpdateOutcome::Applied);

    auto result = service.find_routes(f.query(f.wax, f.usdt));
    CHECK(f.computer.calls.load() == 1);
    REQUIRE(result.routes.size() == 2);
    CHECK(result.routes[1].pools[0].liquidity == "424242");
}

TEST_CASE("Trade selection picks from the candidate routes", "[route_service]") {
    ServiceFixture f;
    FirstRouteSelector selector;
    RouteService service(f.config, f.registry, f.cache, &selector);

    auto query = f.query(f.wax, f.usdt);
    query.trade_type = "EXACT_OUTPUT";
    auto result = service.find_routes(query);
    REQUIRE(result.status == RouteQueryResult::Status::Ok);
    REQUIRE(result.trade.has_value());
    CHECK(result.trade->route.pool_ids() == std::vector<uint64_t>{1, 2});
    CHECK(selector.last_trade_type == TradeType::ExactOutput);
    CHECK(selector.last_slippage == "0.3");
    CHECK(result.trade->min_received == "0.9940");
    CHECK(result.memo == "swapexactout#1,2#<receiver>#0.9940 USDT@usdt.alcor#0");

    query.trade_type = "EXACT_INPUT";
    query.receiver = "alice.wam";
    query.slippage = "1";
    result = service.find_routes(query);
    CHECK(selector.last_slippage == "1");
    CHECK(result.memo == "swapexactin#1,2#alice.wam#0.9940 USDT@usdt.alcor#0");

    auto none = service.find_routes(f.query(f.wax, f.lone));
    CHECK(none.status == RouteQueryResult::Status::NoRoute);
    CHECK_FALSE(none.trade.has_value());
}

TEST_CASE("Pool source outages surface as bootstrap errors", "[route_service]") {
    ServiceFixture f;
    f.source.fail_next = 1;
    RouteService service(f.config, f.registry, f.cache);

    CHECK_THROWS_AS(service.find_routes(f.query(f.wax, f.usdt)), BootstrapError);
    CHECK(service.find_routes(f.query(f.wax, f.usdt)).status == RouteQueryResult::Status::Ok);
}
