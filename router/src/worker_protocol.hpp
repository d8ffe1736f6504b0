#pragma once

#include "codec.hpp"
#include "route_finder.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Messages exchanged with the swap_route_worker process over its stdin/stdout.
// Both directions are single MessagePack documents; the stream ends the message.

struct RouteComputeRequest {
    Token input;
    Token output;
    std::vector<Pool> pools;
    RouteSearchLimits limits;
};

struct RouteComputeResponse {
    bool ok = false;
    std::string error;
    std::vector<Route> routes;
};

namespace worker_protocol {

codec::Bytes encode_request(const RouteComputeRequest& request);
RouteComputeRequest decode_request(const codec::Bytes& buffer);

codec::Bytes encode_response(const RouteComputeResponse& response);
RouteComputeResponse decode_response(const codec::Bytes& buffer);

} // namespace worker_protocol
