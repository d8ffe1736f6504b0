#include "codec.hpp"
#include "test_support.hpp"
#include "util.hpp"
#include "worker_protocol.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace test_support;

TEST_CASE("Pool encoding keeps every field", "[codec][pool]") {
    auto wax = make_token("WAX");
    auto usdt = make_token("USDT", "usdt.alcor", 4);
    auto pool = make_pool(42, wax, usdt, "123456789012345678901234567890");
    pool.tick_current = -1200;
    pool.active = false;

    auto decoded = codec::decode_pool(codec::encode_pool(pool));
    REQUIRE(decoded.has_value());
    CHECK(decoded->id == 42);
    CHECK(decoded->token_a == wax);
    CHECK(decoded->token_b == usdt);
    CHECK(decoded->liquidity == "123456789012345678901234567890");
    CHECK(decoded->tick_current == -1200);
    CHECK_FALSE(decoded->active);
    REQUIRE(decoded->ticks.size() == 2);
    CHECK(decoded->ticks[1].liquidity_net == "-1000000");
}

TEST_CASE("Undecodable pool buffers yield nothing", "[codec][pool]") {
    CHECK_FALSE(codec::decode_pool({}).has_value());
    CHECK_FALSE(codec::decode_pool({0xc1, 0xff, 0x00}).has_value());

    // Valid MessagePack, wrong shape
    CHECK_FALSE(codec::decode_pool(nlohmann::json::to_msgpack({{"id", 1}})).has_value());

    auto pool = make_pool(1, make_token("A"), make_token("B"));
    pool.token_b.id.clear();
    CHECK_FALSE(codec::decode_pool(codec::encode_pool(pool)).has_value());
}

TEST_CASE("Out of range integers are rejected, not wrapped", "[codec][pool]") {
    auto pool_json = codec::pool_to_json(make_pool(5, make_token("A"), make_token("B")));

    auto decodes = [](const nlohmann::json& j) {
        return codec::decode_pool(nlohmann::json::to_msgpack(j)).has_value();
    };
    REQUIRE(decodes(pool_json));

    auto negative_id = pool_json;
    negative_id["id"] = -1;
    CHECK_FALSE(decodes(negative_id));

    auto huge_fee = pool_json;
    huge_fee["fee"] = uint64_t(1) << 40;
    CHECK_FALSE(decodes(huge_fee));

    auto negative_fee = pool_json;
    negative_fee["fee"] = -3000;
    CHECK_FALSE(decodes(negative_fee));

    auto wide_tick = pool_json;
    wide_tick["tick_current"] = int64_t(1) << 31;
    CHECK_FALSE(decodes(wide_tick));

    auto wide_tick_id = pool_json;
    wide_tick_id["ticks"][0]["id"] = -(int64_t(1) << 32);
    CHECK_FALSE(decodes(wide_tick_id));

    auto fractional_id = pool_json;
    fractional_id["id"] = 1.5;
    CHECK_FALSE(decodes(fractional_id));

    auto extreme_ticks = pool_json;
    extreme_ticks["tick_current"] = -443636;
    auto decoded = codec::decode_pool(nlohmann::json::to_msgpack(extreme_ticks));
    REQUIRE(decoded.has_value());
    CHECK(decoded->tick_current == -443636);
}

TEST_CASE("Route decoding keeps pool order", "[codec][route]") {
    auto a = make_token("A");
    auto b = make_token("B");
    auto c = make_token("C");

    Route route{a, c, {make_pool(7, a, b), make_pool(3, b, c)}};
    auto decoded = codec::decode_route(codec::encode_route(route));
    REQUIRE(decoded.has_value());
    CHECK(decoded->input == a);
    CHECK(decoded->output == c);
    CHECK(decoded->pool_ids() == std::vector<uint64_t>{7, 3});
}

TEST_CASE("Routes without pools are rejected", "[codec][route]") {
    Route route{make_token("A"), make_token("B"), {}};
    CHECK_FALSE(codec::decode_route(codec::encode_route(route)).has_value());
}

TEST_CASE("Pool update payloads", "[codec][update]") {
    auto pool = make_pool(9, make_token("A"), make_token("B"));
    auto bytes = codec::encode_pool(pool);

    SECTION("well formed") {
        nlohmann::json payload = {{"chain", "wax"}, {"buffer", util::to_hex(bytes)}};
        auto message = codec::parse_pool_update_message(payload.dump());
        REQUIRE(message.has_value());
        CHECK(message->chain == "wax");
        CHECK(message->buffer == bytes);
    }

    SECTION("malformed") {
        CHECK_FALSE(codec::parse_pool_update_message("not json").has_value());
        CHECK_FALSE(codec::parse_pool_update_message("[1,2]").has_value());
        CHECK_FALSE(codec::parse_pool_update_message(R"({"chain":"wax"})").has_value());
        CHECK_FALSE(codec::parse_pool_update_message(R"({"chain":"","buffer":"00"})").has_value());
        CHECK_FALSE(codec::parse_pool_update_message(R"({"chain":"wax","buffer":"abc"})").has_value());
        CHECK_FALSE(codec::parse_pool_update_message(R"({"chain":"wax","buffer":"zz"})").has_value());
    }
}

TEST_CASE("Hex helpers", "[codec][util]") {
    std::vector<uint8_t> bytes{0x00, 0x0f, 0xab, 0xff};
    CHECK(util::to_hex(bytes) == "000fabff");
    CHECK(util::from_hex("000FABff") == bytes);
    CHECK(util::from_hex("")->empty());
    CHECK_FALSE(util::from_hex("0").has_value());
    CHECK_FALSE(util::from_hex("0g").has_value());
}

TEST_CASE("Worker protocol carries failures", "[codec][worker]") {
    RouteComputeResponse response;
    response.ok = false;
    response.error = "search exploded";

    auto decoded = worker_protocol::decode_response(worker_protocol::encode_response(response));
    CHECK_FALSE(decoded.ok);
    CHECK(decoded.error == "search exploded");
    CHECK(decoded.routes.empty());

    CHECK_THROWS(worker_protocol::decode_request({0x01, 0x02}));
}
