#include <catch2/catch_all.hpp>
#include "packgraph/core/decoder/decoder.hpp"
#include "packgraph/core/io/memory_source.hpp"
#include "packgraph/core/types/type_registry.hpp"
#include "packgraph/core/util/error_types.hpp"
#include "wire.hpp"
#include <algorithm>
#include <cctype>

using namespace packgraph;
using packgraph::test::Wire;

namespace {

    struct DecodeFixture {
        TypeRegistry reg;
        std::vector<UnknownFieldNotice> notices;

        DecodeFixture() {
            reg.setUnknownPropertyListener([this](const UnknownFieldNotice& n) { notices.push_back(n); });
        }

        Value decode(const std::vector<uint8_t>& bytes, const TypeRef& type, const DecoderOptions& opts = {}) {
            StreamReader r(std::make_unique<MemorySource>(bytes));
            Decoder d(r, reg, opts);
            return d.decode(type);
        }

        template<typename Err>
        DecodeFailure failure(const std::vector<uint8_t>& bytes, const TypeRef& type, const DecoderOptions& opts = {}) {
            try {
                decode(bytes, type, opts);
            }
            catch (const Err& e) {
                return e.failure();
            }
            FAIL("expected decode to fail");
            return {};
        }
    };

    TypeRef personType() {
        return TypeDescriptor::record("Person", {
            { "name", TypeDescriptor::string() },
            { "age", TypeDescriptor::int32() },
        });
    }

    TypeRef circleType() {
        return TypeDescriptor::record("Circle", { { "r", TypeDescriptor::float64() } })->withTypeName("circle");
    }

    TypeRef pointType() {
        return TypeDescriptor::record("Point", { { "x", TypeDescriptor::int32() } });
    }

}

TEST_CASE_METHOD(DecodeFixture, "Empty map decodes to an empty generic map", "[decoder]") {
    Value v = decode(Wire().map(0).bytes(), nullptr);
    REQUIRE(v.isMap());
    REQUIRE(v.asMap().empty());
}

TEST_CASE_METHOD(DecodeFixture, "Nested arrays decode with typed elements and parents", "[decoder]") {
    Value v = decode(Wire().array(2).array(2).i(1).i(2).array(1).i(3).bytes(),
                     TypeDescriptor::listOf(TypeDescriptor::listOf(TypeDescriptor::int32())));
    REQUIRE(v.isList());
    const List& outer = v.asList();
    REQUIRE(outer.size() == 2);
    REQUIRE(outer[0].asList().size() == 2);
    REQUIRE(outer[0].asList()[1] == Value(int32_t{ 2 }));
    REQUIRE(outer[1].asList()[0] == Value(int32_t{ 3 }));
    REQUIRE(outer[0].asList().parent() == &outer);
    REQUIRE(outer.parent() == nullptr);
}

TEST_CASE_METHOD(DecodeFixture, "Generic values keep their natural wire kinds", "[decoder]") {
    Value v = decode(Wire().array(5).i(1).i64(2).f32(0.5f).f64(1.5).bin({ 7 }).bytes(), nullptr);
    const List& l = v.asList();
    REQUIRE(l[0].kind() == ValueKind::Int32);
    REQUIRE(l[1].kind() == ValueKind::Int64);
    REQUIRE(l[2].kind() == ValueKind::Float32);
    REQUIRE(l[3].kind() == ValueKind::Float64);
    REQUIRE(l[4] == Value(Binary{ 7 }));
    REQUIRE_FALSE(l.fixed());
}

TEST_CASE_METHOD(DecodeFixture, "Scalars convert to the declared type", "[decoder]") {
    REQUIRE(decode(Wire().i(7).bytes(), TypeDescriptor::int64()) == Value(int64_t{ 7 }));
    REQUIRE(decode(Wire().str("12").bytes(), TypeDescriptor::int32()) == Value(int32_t{ 12 }));
    REQUIRE(decode(Wire().i(1).bytes(), TypeDescriptor::boolean()) == Value(true));
    REQUIRE(decode(Wire().str("x").bytes(), TypeDescriptor::character()) == Value(U'x'));
    REQUIRE(decode(Wire().str("ab").bytes(), TypeDescriptor::bytes()) == Value(Binary{ 'a', 'b' }));
    REQUIRE(decode(Wire().f64(2.5).bytes(), TypeDescriptor::string()) == Value("2.5"));
}

TEST_CASE_METHOD(DecodeFixture, "Record with an unknown key reports it once", "[decoder][record]") {
    auto bytes = Wire().map(3)
        .str("name").str("Ann")
        .str("extra").map(1).str("k").boolean(true)
        .str("age").i(30)
        .bytes();
    Value v = decode(bytes, personType());

    REQUIRE(v.isRecord());
    const Record& r = v.asRecord();
    REQUIRE(r.get("name") == Value("Ann"));
    REQUIRE(r.get("age") == Value(int32_t{ 30 }));

    REQUIRE(notices.size() == 1);
    REQUIRE(notices[0].name == "extra");
    REQUIRE(notices[0].recordType == "Person");
    REQUIRE(notices[0].value.isMap());
    REQUIRE(notices[0].value.asMap().at("k") == Value(true));
    REQUIRE(notices[0].record == &r);
}

TEST_CASE_METHOD(DecodeFixture, "Missing record fields stay unassigned", "[decoder][record]") {
    Value v = decode(Wire().map(1).str("age").i(4).bytes(), personType());
    REQUIRE_FALSE(v.asRecord().isSet("name"));
    REQUIRE(v.asRecord().isSet("age"));
}

TEST_CASE_METHOD(DecodeFixture, "Nil short-circuits at any target", "[decoder][nil]") {
    REQUIRE(decode(Wire().nil().bytes(), personType()).isNil());
    REQUIRE(decode(Wire().nil().bytes(), TypeDescriptor::int32()).isNil());
    REQUIRE(decode(Wire().nil().bytes(), TypeDescriptor::listOf(nullptr)).isNil());

    Value v = decode(Wire().array(3).nil().i(5).nil().bytes(), TypeDescriptor::listOf(TypeDescriptor::int32()));
    const List& l = v.asList();
    REQUIRE(l.size() == 3);
    REQUIRE(l[0].isNil());
    REQUIRE(l[1] == Value(int32_t{ 5 }));
    REQUIRE(l[2].isNil());
}

TEST_CASE_METHOD(DecodeFixture, "Nil consumes exactly one byte", "[decoder][nil]") {
    StreamReader r(std::make_unique<MemorySource>(Wire().nil().i(9).bytes()));
    Decoder d(r, reg);
    REQUIRE(d.decode(personType()).isNil());
    REQUIRE(r.position() == 1);
    REQUIRE(d.decode(TypeDescriptor::int32()) == Value(int32_t{ 9 }));
}

TEST_CASE_METHOD(DecodeFixture, "A string cannot become a map", "[decoder][errors]") {
    auto f = failure<TypeMismatchError>(Wire().str("oops").bytes(),
                                        TypeDescriptor::mapOf(nullptr, TypeDescriptor::int32()));
    REQUIRE(f.code == DecodeErr::TypeMismatch);
    REQUIRE(f.path == "$");
    REQUIRE(f.targetType == "map<string,int32>");
    REQUIRE(f.offset == 0);
}

TEST_CASE_METHOD(DecodeFixture, "A truncated array is a truncation error", "[decoder][errors]") {
    auto f = failure<TruncatedStreamError>(Wire().array(3).i(1).bytes(), nullptr);
    REQUIRE(f.code == DecodeErr::TruncatedStream);
    REQUIRE(f.path == "$[1]");
}

TEST_CASE_METHOD(DecodeFixture, "Malformed bytes inside a map", "[decoder][errors]") {
    auto f = failure<MalformedStreamError>(Wire().map(1).str("a").raw({ 0xc1 }).bytes(), nullptr);
    REQUIRE(f.path == "$.a");
    REQUIRE(f.offset == 3);
}

TEST_CASE_METHOD(DecodeFixture, "Errors carry the path of the deepest failing node", "[decoder][errors]") {
    auto bytes = Wire().array(2)
        .map(1).str("x").i(1)
        .map(1).str("x").str("bad")
        .bytes();
    auto f = failure<ScalarConversionError>(bytes, TypeDescriptor::listOf(pointType()));
    REQUIRE(f.path == "$[1].x");
    REQUIRE(f.targetType == "int32 (field 'x')");
    REQUIRE(f.offset == 8);
}

TEST_CASE_METHOD(DecodeFixture, "Discriminator keys on a typed record are skipped", "[decoder][record]") {
    auto bytes = Wire().map(2)
        .str("_type").str("circle")
        .str("r").f64(2.0)
        .bytes();
    Value v = decode(bytes, circleType());
    REQUIRE(v.asRecord().get("r") == Value(2.0));
    REQUIRE(notices.empty());
}

TEST_CASE_METHOD(DecodeFixture, "Discriminator values of any shape are skipped whole", "[decoder][record]") {
    auto bytes = Wire().map(2)
        .str("_type").array(2).str("nested").map(1).str("k").nil()
        .str("r").f64(1.0)
        .bytes();
    Value v = decode(bytes, circleType());
    REQUIRE(v.asRecord().get("r") == Value(1.0));
    REQUIRE(notices.empty());
}

TEST_CASE_METHOD(DecodeFixture, "Generic maps with a known type name become records", "[decoder][dictionary]") {
    auto bytes = Wire().map(2)
        .str("_type").str("circle")
        .str("r").i(3)
        .bytes();

    SECTION("through the descriptor dictionary") {
        Value v = decode(bytes, TypeDescriptor::any()->withDictionary({ circleType() }));
        REQUIRE(v.isRecord());
        REQUIRE(v.asRecord().typeName() == "Circle");
        REQUIRE(v.asRecord().get("r") == Value(3.0));
    }
    SECTION("through the registry dictionary") {
        reg.registerType(circleType());
        Value v = decode(bytes, nullptr);
        REQUIRE(v.isRecord());
        REQUIRE(v.asRecord().get("r") == Value(3.0));
    }
    SECTION("unknown names keep the map") {
        Value v = decode(bytes, nullptr);
        REQUIRE(v.isMap());
        REQUIRE(v.asMap().at("_type") == Value("circle"));
    }
}

TEST_CASE_METHOD(DecodeFixture, "Typed maps can be cast into collections only through a record", "[decoder][dictionary]") {
    reg.registerType(circleType());
    auto typed = Wire().map(1).str("_type").str("circle").bytes();
    REQUIRE(decode(typed, TypeDescriptor::listOf(nullptr)).isRecord());

    auto untyped = Wire().map(1).str("a").i(1).bytes();
    REQUIRE_THROWS_AS(decode(untyped, TypeDescriptor::listOf(nullptr)), TypeMismatchError);
}

TEST_CASE_METHOD(DecodeFixture, "Discriminator name can be overridden per type", "[decoder][dictionary]") {
    auto square = TypeDescriptor::record("Square", { { "side", TypeDescriptor::int32() } })->withTypeName("sq");
    auto shape = TypeDescriptor::any()->withDictionary({ square })->withTypeProperty("kind");
    auto bytes = Wire().map(2).str("kind").str("sq").str("side").i(4).bytes();

    Value v = decode(bytes, shape);
    REQUIRE(v.isRecord());
    REQUIRE(v.asRecord().get("side") == Value(int32_t{ 4 }));
    REQUIRE(notices.empty());
}

TEST_CASE_METHOD(DecodeFixture, "Field validators surface as FieldAssignmentError", "[decoder][record]") {
    auto age = TypeDescriptor::record("Age", {
        { "years", TypeDescriptor::int32(), [](const Value& v) {
              if (v.asInt32() < 0) throw std::invalid_argument("negative");
          } },
    });
    auto f = failure<FieldAssignmentError>(Wire().map(1).str("years").i(-3).bytes(), age);
    REQUIRE(f.path == "$.years");
    REQUIRE(f.targetType == "Age (field 'years')");
    REQUIRE(f.msg.find("negative") != std::string::npos);
}

TEST_CASE_METHOD(DecodeFixture, "Nesting deeper than maxDepth is rejected", "[decoder][depth]") {
    DecoderOptions opts;
    opts.maxDepth = 3;

    REQUIRE_NOTHROW(decode(Wire().array(1).array(1).array(1).i(1).bytes(), nullptr, opts));

    auto f = failure<DepthExceededError>(Wire().array(1).array(1).array(1).array(1).i(1).bytes(), nullptr, opts);
    REQUIRE(f.msg.find("Depth too deep") != std::string::npos);
    REQUIRE(f.path == "$[0][0][0]");
}

TEST_CASE_METHOD(DecodeFixture, "Records and maps count toward the depth limit", "[decoder][depth]") {
    DecoderOptions opts;
    opts.maxDepth = 1;
    auto outer = TypeDescriptor::record("Outer", { { "p", pointType() } });
    auto bytes = Wire().map(1).str("p").map(1).str("x").i(1).bytes();
    REQUIRE_THROWS_AS(decode(bytes, outer, opts), DepthExceededError);
}

TEST_CASE_METHOD(DecodeFixture, "trimStrings trims every string read", "[decoder][options]") {
    DecoderOptions opts;
    opts.trimStrings = true;
    auto bytes = Wire().map(2)
        .str(" name ").str("  Ann\t")
        .str("age").str(" 41 ")
        .bytes();
    Value v = decode(bytes, personType(), opts);
    REQUIRE(v.asRecord().get("name") == Value("Ann"));
    REQUIRE(v.asRecord().get("age") == Value(int32_t{ 41 }));
    REQUIRE(notices.empty());

    REQUIRE(decode(Wire().str("  x  ").bytes(), nullptr) == Value("  x  "));
    REQUIRE(decode(Wire().str("  x  ").bytes(), nullptr, opts) == Value("x"));
}

TEST_CASE_METHOD(DecodeFixture, "Byte arrays decode from arrays of small integers", "[decoder]") {
    REQUIRE(decode(Wire().array(3).i(1).i(255).i(-128).bytes(), TypeDescriptor::bytes())
            == Value(Binary{ 1, 255, 128 }));
    REQUIRE(decode(Wire().bin({ 4, 5 }).bytes(), TypeDescriptor::bytes()) == Value(Binary{ 4, 5 }));
    REQUIRE_THROWS_AS(decode(Wire().array(1).i(256).bytes(), TypeDescriptor::bytes()), ScalarConversionError);
    REQUIRE_THROWS_AS(decode(Wire().array(1).i(-129).bytes(), TypeDescriptor::bytes()), ScalarConversionError);
}

TEST_CASE_METHOD(DecodeFixture, "Fixed arrays are pre-sized and typed", "[decoder]") {
    Value v = decode(Wire().array(2).str("1").i(2).bytes(), TypeDescriptor::arrayOf(TypeDescriptor::int64()));
    const List& a = v.asList();
    REQUIRE(a.fixed());
    REQUIRE(a[0] == Value(int64_t{ 1 }));
    REQUIRE(a[1] == Value(int64_t{ 2 }));
    REQUIRE(a[1].kind() == ValueKind::Int64);
}

TEST_CASE_METHOD(DecodeFixture, "Argument tuples decode positionally", "[decoder][args]") {
    auto args = TypeDescriptor::tupleOf({ TypeDescriptor::int32(), TypeDescriptor::string() });

    Value v = decode(Wire().array(2).i(1).str("a").bytes(), args);
    REQUIRE(v.asList().size() == 2);
    REQUIRE(v.asList()[0] == Value(int32_t{ 1 }));
    REQUIRE(v.asList()[1] == Value("a"));

    REQUIRE(decode(Wire().array(1).i(1).bytes(), args).asList().size() == 1);

    auto f = failure<TypeMismatchError>(Wire().array(3).i(1).str("a").boolean(true).bytes(), args);
    REQUIRE(f.path == "$[2]");
}

TEST_CASE_METHOD(DecodeFixture, "String-constructible types go through their factory", "[decoder]") {
    auto upper = TypeDescriptor::stringConstructible("Upper", [](const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return Value(out);
    });
    REQUIRE(decode(Wire().str("abc").bytes(), upper) == Value("ABC"));
    REQUIRE_THROWS_AS(decode(Wire().i(1).bytes(), upper), TypeMismatchError);

    auto point = pointType()->withStringFactory([](const std::string& s) {
        auto rec = std::make_shared<Record>(pointType());
        rec->set("x", Value(static_cast<int32_t>(std::stoi(s))));
        return Value(rec);
    });
    Value p = decode(Wire().str("12").bytes(), point);
    REQUIRE(p.asRecord().get("x") == Value(int32_t{ 12 }));
}

TEST_CASE_METHOD(DecodeFixture, "Factory failures are construction errors", "[decoder][errors]") {
    auto broken = TypeDescriptor::stringConstructible("Broken", [](const std::string&) -> Value {
        throw std::runtime_error("no");
    });
    auto f = failure<ConstructionError>(Wire().str("x").bytes(), broken);
    REQUIRE(f.targetType == "Broken");
}

TEST_CASE_METHOD(DecodeFixture, "Generic map keys are read as strings", "[decoder][map]") {
    Value v = decode(Wire().map(2).i(1).str("a").nil().str("b").bytes(), nullptr);
    const Map& m = v.asMap();
    REQUIRE(m.entries()[0].first == Value("1"));
    REQUIRE(m.entries()[1].first.isNil());
}

TEST_CASE_METHOD(DecodeFixture, "Typed map keys use the key type", "[decoder][map]") {
    auto t = TypeDescriptor::mapOf(TypeDescriptor::int32(), TypeDescriptor::string(), MapOrder::Sorted);
    Value v = decode(Wire().map(2).i(9).str("nine").str("2").str("two").bytes(), t);
    const Map& m = v.asMap();
    REQUIRE(m.order() == MapOrder::Sorted);
    REQUIRE(m.entries()[0].first == Value(int32_t{ 2 }));
    REQUIRE(m.entries()[1].first == Value(int32_t{ 9 }));
    REQUIRE(*m.find(Value(int32_t{ 9 })) == Value("nine"));

    auto f = failure<ScalarConversionError>(Wire().map(1).i(1).i(2).bytes(),
                                            TypeDescriptor::mapOf(TypeDescriptor::int32(), TypeDescriptor::bytes()));
    REQUIRE(f.path == "$[1]");
}

TEST_CASE_METHOD(DecodeFixture, "Record keys must be strings", "[decoder][record]") {
    REQUIRE_THROWS_AS(decode(Wire().map(1).nil().i(1).bytes(), personType()), TypeMismatchError);
}

TEST_CASE_METHOD(DecodeFixture, "Map values are told their key and child records their parent", "[decoder][record]") {
    auto t = TypeDescriptor::mapOf(nullptr, pointType());
    Value v = decode(Wire().map(1).str("origin").map(1).str("x").i(0).bytes(), t);
    const Record& p = v.asMap().at("origin").asRecord();
    REQUIRE(p.name() == Value("origin"));
    REQUIRE(p.parent() == &v.asMap());

    auto line = TypeDescriptor::record("Line", {
        { "from", pointType() },
        { "to", pointType()->withParentProperty(false) },
    });
    auto bytes = Wire().map(2)
        .str("from").map(1).str("x").i(1)
        .str("to").map(1).str("x").i(2)
        .bytes();
    Value l = decode(bytes, line);
    const Record& rec = l.asRecord();
    REQUIRE(rec.get("from").asRecord().parent() == &rec);
    REQUIRE(rec.get("to").asRecord().parent() == nullptr);
}

TEST_CASE_METHOD(DecodeFixture, "Record-typed map keys get no parent", "[decoder][map]") {
    auto t = TypeDescriptor::listOf(TypeDescriptor::mapOf(pointType(), TypeDescriptor::int32()));
    Value v = decode(Wire().array(1).map(1).map(1).str("x").i(5).i(2).bytes(), t);
    const Map& m = v.asList()[0].asMap();
    REQUIRE(m.size() == 1);
    const Value& key = m.entries()[0].first;
    REQUIRE(key.asRecord().get("x") == Value(int32_t{ 5 }));
    REQUIRE(key.asRecord().parent() == nullptr);
    REQUIRE(m.parent() == &v.asList());
}

TEST_CASE_METHOD(DecodeFixture, "Cast records must fit the declared field type", "[decoder][dictionary]") {
    reg.registerType(circleType());
    auto holder = TypeDescriptor::record("Holder", { { "p", pointType() } })->withTypeName("holder");
    reg.registerType(holder);
    auto bytes = Wire().map(2)
        .str("_type").str("holder")
        .str("p").map(2).str("_type").str("circle").str("r").f64(1.0)
        .bytes();

    auto f = failure<TypeMismatchError>(bytes, nullptr);
    REQUIRE(f.path == "$.p");
    REQUIRE(f.targetType == "Holder (field 'p')");

    auto shaped = TypeDescriptor::record("Holder", {
        { "p", TypeDescriptor::record("Shape", {})->withDictionary({ circleType() }) },
    })->withTypeName("holder");
    TypeRegistry other;
    other.registerType(circleType());
    other.registerType(shaped);
    StreamReader r(std::make_unique<MemorySource>(bytes));
    Decoder d(r, other);
    Value v = d.decode(nullptr);
    REQUIRE(v.asRecord().get("p").asRecord().typeName() == "Circle");
}

TEST_CASE_METHOD(DecodeFixture, "Listener failures become decode errors with a path", "[decoder][errors]") {
    reg.setUnknownPropertyListener([](const UnknownFieldNotice&) { throw std::runtime_error("no extras"); });

    auto f = failure<FieldAssignmentError>(Wire().map(1).str("extra").i(1).bytes(), personType());
    REQUIRE(f.code == DecodeErr::FieldAssignment);
    REQUIRE(f.path == "$.extra");
    REQUIRE(f.msg.find("no extras") != std::string::npos);

    auto typed = TypeDescriptor::record("Person", { { "name", TypeDescriptor::string() } })->withTypeName("person");
    reg.registerType(typed);
    auto cast = failure<FieldAssignmentError>(Wire().map(2).str("_type").str("person").str("nick").str("al").bytes(),
                                              nullptr);
    REQUIRE(cast.path == "$.nick");
}

TEST_CASE_METHOD(DecodeFixture, "Optional targets decode their element type", "[decoder]") {
    auto t = TypeDescriptor::optionalOf(TypeDescriptor::int64());
    REQUIRE(decode(Wire().i(3).bytes(), t) == Value(int64_t{ 3 }));
    REQUIRE(decode(Wire().nil().bytes(), t).isNil());
}

TEST_CASE_METHOD(DecodeFixture, "decodeInto merges into an existing map", "[decoder][into]") {
    Map target;
    target.put(Value("keep"), Value(true));

    {
        StreamReader r(std::make_unique<MemorySource>(Wire().map(1).str("n").i(1).bytes()));
        Decoder d(r, reg);
        d.decodeInto(target, nullptr, TypeDescriptor::int64());
    }
    REQUIRE(target.size() == 2);
    REQUIRE(target.at("n") == Value(int64_t{ 1 }));

    {
        StreamReader r(std::make_unique<MemorySource>(Wire().nil().bytes()));
        Decoder d(r, reg);
        d.decodeInto(target, nullptr, nullptr);
    }
    REQUIRE(target.size() == 2);

    StreamReader r(std::make_unique<MemorySource>(Wire().array(0).bytes()));
    Decoder d(r, reg);
    REQUIRE_THROWS_AS(d.decodeInto(target, nullptr, nullptr), TypeMismatchError);
}

TEST_CASE_METHOD(DecodeFixture, "decodeInto appends to an existing list", "[decoder][into]") {
    List target{ Value(int32_t{ 0 }) };
    StreamReader r(std::make_unique<MemorySource>(Wire().array(2).i(1).i(2).bytes()));
    Decoder d(r, reg);
    d.decodeInto(target, TypeDescriptor::int32());
    REQUIRE(target.size() == 3);
    REQUIRE(target[2] == Value(int32_t{ 2 }));
    REQUIRE(d.currentPath() == "$");
}
