#include "packgraph/core/util/json_view.hpp"
#include "packgraph/core/types/type_descriptor.hpp"
#include "packgraph/core/util/utf8.hpp"

namespace packgraph {

nlohmann::json toJson(const Value& value) {
    switch (value.kind()) {
    case ValueKind::Nil:       return nullptr;
    case ValueKind::Boolean:   return value.asBool();
    case ValueKind::Int32:
    case ValueKind::Int64:     return value.asInt64();
    case ValueKind::Float32:
    case ValueKind::Float64:   return value.asDouble();
    case ValueKind::Character: return utf8::encode(value.asChar());
    case ValueKind::String:    return value.asString();
    case ValueKind::Binary: {
        nlohmann::json::array_t arr;
        for (uint8_t b : value.asBinary()) arr.push_back(b);
        return arr;
    }
    case ValueKind::List: {
        nlohmann::json::array_t arr;
        for (const auto& e : value.asList()) arr.push_back(toJson(e));
        return arr;
    }
    case ValueKind::Map: {
        nlohmann::json::object_t map;
        for (const auto& [k, v] : value.asMap())
            map[k.isString() ? k.asString() : k.toDebugString()] = toJson(v);
        return map;
    }
    case ValueKind::Record: {
        const Record& rec = value.asRecord();
        const auto& fields = rec.type()->fields();
        nlohmann::json::object_t map;
        for (size_t i = 0; i < rec.fieldCount(); ++i) {
            if (rec.isSet(i)) map[fields[i].name] = toJson(rec.at(i));
        }
        return map;
    }
    case ValueKind::Object:
        return "<object>";
    }
    return nullptr;
}

}
