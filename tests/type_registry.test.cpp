#include <catch2/catch_all.hpp>
#include "packgraph/core/types/type_registry.hpp"
#include "packgraph/core/util/error_types.hpp"
#include <cmath>

using namespace packgraph;

namespace {
    Value convert(const Value& raw, const TypeRef& t) {
        TypeRegistry reg;
        return reg.convertScalar(raw, *t);
    }
}

TEST_CASE("Boolean conversion", "[registry][convert]") {
    REQUIRE(convert(Value(true), TypeDescriptor::boolean()) == Value(true));
    REQUIRE(convert(Value(int32_t{ 0 }), TypeDescriptor::boolean()) == Value(false));
    REQUIRE(convert(Value(int64_t{ -7 }), TypeDescriptor::boolean()) == Value(true));
    REQUIRE(convert(Value("TRUE"), TypeDescriptor::boolean()) == Value(true));
    REQUIRE(convert(Value("false"), TypeDescriptor::boolean()) == Value(false));
    REQUIRE_THROWS_AS(convert(Value("yes"), TypeDescriptor::boolean()), ScalarConversionError);
    REQUIRE_THROWS_AS(convert(Value(1.0), TypeDescriptor::boolean()), ScalarConversionError);
}

TEST_CASE("Number conversion widens, narrows with range checks and truncates", "[registry][convert]") {
    REQUIRE(convert(Value(int32_t{ 7 }), TypeDescriptor::int64()) == Value(int64_t{ 7 }));
    REQUIRE(convert(Value(int64_t{ 7 }), TypeDescriptor::int32()) == Value(int32_t{ 7 }));
    REQUIRE_THROWS_AS(convert(Value(int64_t{ 1 } << 40), TypeDescriptor::int32()), ScalarConversionError);
    REQUIRE(convert(Value(2.9), TypeDescriptor::int32()) == Value(int32_t{ 2 }));
    REQUIRE(convert(Value(-2.9), TypeDescriptor::int64()) == Value(int64_t{ -2 }));
    REQUIRE(convert(Value(int32_t{ 3 }), TypeDescriptor::float64()) == Value(3.0));
    REQUIRE(convert(Value(0.5), TypeDescriptor::float32()) == Value(0.5f));
    REQUIRE_THROWS_AS(convert(Value(1e300), TypeDescriptor::float32()), ScalarConversionError);
    REQUIRE_THROWS_AS(convert(Value(std::nan("")), TypeDescriptor::int64()), ScalarConversionError);
    REQUIRE_THROWS_AS(convert(Value(true), TypeDescriptor::int32()), ScalarConversionError);
}

TEST_CASE("Number conversion parses strings with a full match", "[registry][convert]") {
    REQUIRE(convert(Value("42"), TypeDescriptor::int32()) == Value(int32_t{ 42 }));
    REQUIRE(convert(Value("-1.25"), TypeDescriptor::float64()) == Value(-1.25));
    REQUIRE_THROWS_AS(convert(Value("12abc"), TypeDescriptor::int32()), ScalarConversionError);
    REQUIRE_THROWS_AS(convert(Value("abc"), TypeDescriptor::int64()), ScalarConversionError);
    REQUIRE_THROWS_AS(convert(Value("99999999999999999999"), TypeDescriptor::int64()), ScalarConversionError);
}

TEST_CASE("CharSequence conversion stringifies scalars", "[registry][convert]") {
    REQUIRE(convert(Value("x"), TypeDescriptor::string()) == Value("x"));
    REQUIRE(convert(Value(true), TypeDescriptor::string()) == Value("true"));
    REQUIRE(convert(Value(int64_t{ -12 }), TypeDescriptor::string()) == Value("-12"));
    REQUIRE(convert(Value(U'é'), TypeDescriptor::string()) == Value("\xc3\xa9"));
    REQUIRE_THROWS_AS(convert(Value(Binary{ 1 }), TypeDescriptor::string()), ScalarConversionError);
}

TEST_CASE("Character conversion", "[registry][convert]") {
    REQUIRE(convert(Value("a"), TypeDescriptor::character()) == Value(U'a'));
    REQUIRE(convert(Value("\xe2\x82\xac"), TypeDescriptor::character()) == Value(U'€'));
    REQUIRE(convert(Value(int32_t{ 65 }), TypeDescriptor::character()) == Value(U'A'));
    REQUIRE_THROWS_AS(convert(Value("ab"), TypeDescriptor::character()), ScalarConversionError);
    REQUIRE_THROWS_AS(convert(Value(""), TypeDescriptor::character()), ScalarConversionError);
    REQUIRE_THROWS_AS(convert(Value(int32_t{ 0xD800 }), TypeDescriptor::character()), ScalarConversionError);
}

TEST_CASE("ByteArray conversion", "[registry][convert]") {
    REQUIRE(convert(Value(Binary{ 1, 2 }), TypeDescriptor::bytes()) == Value(Binary{ 1, 2 }));
    REQUIRE(convert(Value("AB"), TypeDescriptor::bytes()) == Value(Binary{ 'A', 'B' }));
    REQUIRE_THROWS_AS(convert(Value(int32_t{ 1 }), TypeDescriptor::bytes()), ScalarConversionError);
}

TEST_CASE("Conversion errors name source kind and target", "[registry][convert]") {
    try {
        convert(Value("abc"), TypeDescriptor::int32());
        FAIL("expected ScalarConversionError");
    }
    catch (const ScalarConversionError& e) {
        const std::string msg = e.what();
        REQUIRE(msg.find("string") != std::string::npos);
        REQUIRE(msg.find("int32") != std::string::npos);
        REQUIRE(e.code() == DecodeErr::ScalarConversion);
    }
}

TEST_CASE("Record descriptors reject duplicate fields", "[registry][types]") {
    REQUIRE_THROWS_AS(TypeDescriptor::record("Dup", { { "a" }, { "a" } }), std::invalid_argument);

    auto t = TypeDescriptor::record("Point", { { "x", TypeDescriptor::int32() }, { "y" } });
    REQUIRE(t->field("x")->index == 0);
    REQUIRE(t->field("y")->type == TypeDescriptor::any());
    REQUIRE(t->field("z") == nullptr);
}

TEST_CASE("Decorators return modified copies", "[registry][types]") {
    auto base = TypeDescriptor::record("Shape", {});
    auto named = base->withTypeName("shape");
    REQUIRE(base->typeName().empty());
    REQUIRE(named->typeName() == "shape");
    REQUIRE(named->typeClass() == TypeClass::Record);
    REQUIRE(TypeDescriptor::mapOf(nullptr, nullptr)->name() == "map<string,any>");
    REQUIRE(TypeDescriptor::tupleOf({ TypeDescriptor::int32(), TypeDescriptor::string() })->name() == "args<int32,string>");
}

TEST_CASE("Type dictionary lookups", "[registry][dictionary]") {
    TypeRegistry reg;
    auto circle = TypeDescriptor::record("Circle", { { "r", TypeDescriptor::float64() } })->withTypeName("circle");
    reg.registerType(circle);

    REQUIRE(reg.lookup("circle") == circle);
    REQUIRE(reg.lookup("Circle") == nullptr);
    REQUIRE_NOTHROW(reg.registerType(circle));
    REQUIRE_THROWS_AS(reg.registerType(TypeDescriptor::record("Other", {})->withTypeName("circle")),
                      std::invalid_argument);

    // a descriptor-local dictionary wins over the registry
    auto localCircle = TypeDescriptor::record("LocalCircle", {})->withTypeName("circle");
    auto shape = TypeDescriptor::any()->withDictionary({ localCircle });
    REQUIRE(reg.resolveTypeName("circle", *shape) == localCircle);
    REQUIRE(reg.resolveTypeName("circle", *TypeDescriptor::any()) == circle);
    REQUIRE(reg.resolveTypeName("square", *shape) == nullptr);
}

TEST_CASE("Discriminator name defaults and overrides", "[registry][dictionary]") {
    TypeRegistry reg;
    auto plain = TypeDescriptor::record("Plain", {});
    REQUIRE(reg.reservedDiscriminatorName(*plain) == "_type");

    reg.setDiscriminatorName("kind");
    REQUIRE(reg.reservedDiscriminatorName(*plain) == "kind");
    REQUIRE(reg.reservedDiscriminatorName(*plain->withTypeProperty("@t")) == "@t");
}

TEST_CASE("constructRecord only builds record types", "[registry]") {
    TypeRegistry reg;
    auto t = TypeDescriptor::record("R", { { "a" } });
    auto rec = reg.constructRecord(*t);
    REQUIRE(rec);
    REQUIRE(rec->type() == t);
    REQUIRE(reg.constructRecord(*TypeDescriptor::string()) == nullptr);

    auto arr = reg.constructArray(*TypeDescriptor::arrayOf(nullptr), 3);
    REQUIRE(arr->fixed());
}

TEST_CASE("setField runs the validator before assigning", "[registry]") {
    TypeRegistry reg;
    auto t = TypeDescriptor::record("Age", {
        { "years", TypeDescriptor::int32(), [](const Value& v) {
              if (v.asInt32() < 0) throw std::invalid_argument("negative age");
          } },
    });
    Record r(t);
    const FieldDescriptor& f = *t->field("years");

    reg.setField(r, f, Value(int32_t{ 3 }));
    REQUIRE(r.get("years") == Value(int32_t{ 3 }));
    REQUIRE_THROWS_AS(reg.setField(r, f, Value(int32_t{ -1 })), std::invalid_argument);
    REQUIRE(r.get("years") == Value(int32_t{ 3 }));
}
