#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Binary form of pools and routes as they travel over the update channel
// and across the worker process boundary. MessagePack via nlohmann::json.
namespace codec {

using Bytes = std::vector<uint8_t>;

nlohmann::json token_to_json(const Token& token);
Token token_from_json(const nlohmann::json& j);

nlohmann::json pool_to_json(const Pool& pool);
Pool pool_from_json(const nlohmann::json& j);

Bytes encode_pool(const Pool& pool);
std::optional<Pool> decode_pool(const Bytes& buffer);

Bytes encode_route(const Route& route);
std::optional<Route> decode_route(const Bytes& buffer);

// Pool update channel payload: {"chain": "...", "buffer": "<hex pool>"}.
// Empty on malformed JSON, missing fields or bad hex; the pool itself is not decoded here.
std::optional<PoolUpdateMessage> parse_pool_update_message(const std::string& payload);

} // namespace codec
