#include "http_server.hpp"
#include "codec.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

std::optional<int> parse_max_hops(const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

json route_to_json(const Route& route) {
    return route.pool_ids();
}

} // namespace

HttpServer::HttpServer(const Config& config, RouteService& route_service, HealthChecker& health_checker)
    : config_(config),
      route_service_(route_service),
      health_checker_(health_checker),
      server_(std::make_unique<httplib::Server>()),
      running_(false) {
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting route server on {}:{}", config_.listen_host, config_.listen_port);
        if (!server_->listen(config_.listen_host.c_str(), config_.listen_port)) {
            spdlog::error("Route server failed to listen on {}:{}", config_.listen_host, config_.listen_port);
            running_ = false;
        }
    });
}

void HttpServer::stop() {
    if (running_.exchange(false) || server_thread_.joinable()) {
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }
}

bool HttpServer::is_running() const {
    return running_;
}

void HttpServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto status = health_checker_.check_health();

        json chains = json::array();
        for (const auto& chain : status.chains) {
            chains.push_back({{"chain", chain.chain}, {"pools", chain.pools}});
        }

        json health = {
            {"ok", status.ok},
            {"redis", status.redis_connected},
            {"database", status.database_connected},
            {"chains", chains},
            {"cached_route_sets", status.cached_route_sets},
            {"refreshes_in_flight", status.refreshes_in_flight}
        };
        if (!status.last_error.empty()) {
            health["last_error"] = status.last_error;
        }

        res.set_content(health.dump(), "application/json");
        res.status = status.ok ? 200 : 503;
    });

    server_->Get("/getRoute", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_route(req, res);
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404) {
            res.set_content("Not Found", "text/plain");
        }
    });
}

void HttpServer::handle_get_route(const httplib::Request& req, httplib::Response& res) {
    RouteQuery query;
    query.chain = req.has_param("chain") ? req.get_param_value("chain") : config_.default_chain;
    query.trade_type = req.get_param_value("trade_type");
    query.input_token_id = req.get_param_value("input");
    query.output_token_id = req.get_param_value("output");
    query.amount = req.get_param_value("amount");
    if (req.has_param("slippage")) {
        query.slippage = req.get_param_value("slippage");
    }
    if (req.has_param("receiver")) {
        query.receiver = req.get_param_value("receiver");
    }
    if (req.has_param("maxHops")) {
        query.max_hops = parse_max_hops(req.get_param_value("maxHops"));
    }

    try {
        auto result = route_service_.find_routes(query);

        if (result.status != RouteQueryResult::Status::Ok) {
            res.status = 403;
            res.set_content(result.message, "text/plain");
            return;
        }

        json body;
        if (result.trade) {
            const auto& trade = *result.trade;
            body = {
                {"input", trade.input_amount},
                {"output", trade.output_amount},
                {"minReceived", trade.min_received},
                {"maxSent", trade.max_sent},
                {"priceImpact", trade.price_impact},
                {"memo", result.memo},
                {"route", route_to_json(trade.route)},
                {"executionPrice", {
                    {"numerator", trade.execution_price_numerator},
                    {"denominator", trade.execution_price_denominator}
                }}
            };
        } else {
            json routes = json::array();
            for (const auto& route : result.routes) {
                routes.push_back(route_to_json(route));
            }

            body = {
                {"input", codec::token_to_json(result.input)},
                {"output", codec::token_to_json(result.output)},
                {"maxHops", result.max_hops},
                {"routes", routes}
            };
        }

        res.status = 200;
        res.set_content(body.dump(), "application/json");
    } catch (const BootstrapError& e) {
        spdlog::error("GET ROUTE ERROR for {}: {}", query.chain, e.what());
        res.status = 503;
        res.set_content("Pools unavailable", "text/plain");
    } catch (const std::exception& e) {
        spdlog::error("GET ROUTE ERROR: {}", e.what());
        res.status = 403;
        res.set_content(std::string("Get Route error: ") + e.what(), "text/plain");
    }
}
