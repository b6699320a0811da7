#include <catch2/catch_all.hpp>
#include "packgraph/core/types/type_descriptor.hpp"
#include "packgraph/core/util/json_view.hpp"

using namespace packgraph;
using nlohmann::json;

TEST_CASE("Scalars map to JSON scalars", "[json]") {
    REQUIRE(toJson(Value()).is_null());
    REQUIRE(toJson(Value(true)) == json(true));
    REQUIRE(toJson(Value(int32_t{ -3 })) == json(-3));
    REQUIRE(toJson(Value(int64_t{ 1 } << 40)).get<int64_t>() == (int64_t{ 1 } << 40));
    REQUIRE(toJson(Value(0.25f)).get<double>() == 0.25);
    REQUIRE(toJson(Value("hi")) == json("hi"));
    REQUIRE(toJson(Value(U'€')) == json("\xe2\x82\xac"));
}

TEST_CASE("Binary renders as an array of byte values", "[json]") {
    REQUIRE(toJson(Value(Binary{ 0, 255 })) == json::array({ 0, 255 }));
}

TEST_CASE("Containers render recursively", "[json]") {
    auto m = makeMap();
    m->put(Value("xs"), Value(makeList({ Value(int32_t{ 1 }), Value() })));
    m->put(Value(int32_t{ 7 }), Value("seven"));

    json j = toJson(Value(m));
    REQUIRE(j["xs"] == json::array({ 1, nullptr }));
    REQUIRE(j["7"] == json("seven"));
}

TEST_CASE("Records render their assigned fields", "[json]") {
    auto t = TypeDescriptor::record("Pair", { { "a" }, { "b" } });
    auto rec = std::make_shared<Record>(t);
    rec->set("b", Value("only"));

    json j = toJson(Value(rec));
    REQUIRE(j.size() == 1);
    REQUIRE(j["b"] == json("only"));
    REQUIRE(toJson(Value::object(42)) == json("<object>"));
}
