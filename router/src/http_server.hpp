#pragma once
#include "config.hpp"
#include "health.hpp"
#include "route_service.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

// GET /getRoute and GET /health on a background thread
class HttpServer {
public:
    HttpServer(const Config& config, RouteService& route_service, HealthChecker& health_checker);
    ~HttpServer();

    void start();
    void stop();
    bool is_running() const;

private:
    void setup_routes();
    void handle_get_route(const httplib::Request& req, httplib::Response& res);

    const Config& config_;
    RouteService& route_service_;
    HealthChecker& health_checker_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
};
