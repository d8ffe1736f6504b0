#include "worker_protocol.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace worker_protocol {

codec::Bytes encode_request(const RouteComputeRequest& request) {
    json pools = json::array();
    for (const auto& pool : request.pools) {
        pools.push_back(json::binary(codec::encode_pool(pool)));
    }

    json j = {
        {"input", codec::token_to_json(request.input)},
        {"output", codec::token_to_json(request.output)},
        {"pools", pools},
        {"max_hops", request.limits.max_hops},
        {"max_results", request.limits.max_results}
    };
    return json::to_msgpack(j);
}

RouteComputeRequest decode_request(const codec::Bytes& buffer) {
    auto j = json::from_msgpack(buffer);

    RouteComputeRequest request;
    request.input = codec::token_from_json(j.at("input"));
    request.output = codec::token_from_json(j.at("output"));
    request.limits.max_hops = j.at("max_hops").get<int>();
    request.limits.max_results = j.at("max_results").get<size_t>();

    for (const auto& item : j.at("pools")) {
        auto pool = codec::decode_pool(item.get_binary());
        if (!pool) {
            throw std::runtime_error("request carries an undecodable pool");
        }
        request.pools.push_back(std::move(*pool));
    }
    return request;
}

codec::Bytes encode_response(const RouteComputeResponse& response) {
    json routes = json::array();
    for (const auto& route : response.routes) {
        routes.push_back(json::binary(codec::encode_route(route)));
    }

    json j = {
        {"ok", response.ok},
        {"error", response.error},
        {"routes", routes}
    };
    return json::to_msgpack(j);
}

RouteComputeResponse decode_response(const codec::Bytes& buffer) {
    auto j = json::from_msgpack(buffer);

    RouteComputeResponse response;
    response.ok = j.at("ok").get<bool>();
    response.error = j.value("error", "");

    for (const auto& item : j.at("routes")) {
        auto route = codec::decode_route(item.get_binary());
        if (!route) {
            throw std::runtime_error("response carries an undecodable route");
        }
        response.routes.push_back(std::move(*route));
    }
    return response;
}

} // namespace worker_protocol
