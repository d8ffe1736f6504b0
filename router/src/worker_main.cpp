// swap_route_worker: reads one route request on stdin, writes one response on
// stdout and exits. stdout is the response channel, so diagnostics go to stderr.
#include "route_finder.hpp"
#include "worker_protocol.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>
#include <iterator>
#include <iostream>

namespace {

bool write_all(const codec::Bytes& bytes) {
    size_t written = std::fwrite(bytes.data(), 1, bytes.size(), stdout);
    return written == bytes.size() && std::fflush(stdout) == 0;
}

} // namespace

int main() {
    auto logger = spdlog::stderr_color_mt("swap_route_worker");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(util::get_env_var("LOG_LEVEL", "warn")));

    RouteComputeResponse response;
    int exit_code = 0;

    try {
        std::ios::sync_with_stdio(false);
        codec::Bytes input_bytes((std::istreambuf_iterator<char>(std::cin)),
                                 std::istreambuf_iterator<char>());

        auto request = worker_protocol::decode_request(input_bytes);
        response.routes = compute_all_routes(request.pools, request.input, request.output, request.limits);
        response.ok = true;
        spdlog::debug("Computed {} routes {} -> {} over {} pools",
                      response.routes.size(), request.input.id, request.output.id, request.pools.size());
    } catch (const std::exception& e) {
        spdlog::error("Route computation failed: {}", e.what());
        response.ok = false;
        response.error = e.what();
        response.routes.clear();
        exit_code = 1;
    }

    try {
        if (!write_all(worker_protocol::encode_response(response))) {
            spdlog::error("Failed to write route response");
            return 2;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to encode route response: {}", e.what());
        return 2;
    }

    return exit_code;
}
