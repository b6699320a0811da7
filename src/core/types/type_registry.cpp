#include "packgraph/core/types/type_registry.hpp"
#include "packgraph/core/interfaces/iswap.hpp"
#include "packgraph/core/util/error_types.hpp"
#include "packgraph/core/util/utf8.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace packgraph {

namespace {

    [[noreturn]] void conversionFailure(const Value& raw, const TypeDescriptor& target, const std::string& why = {}) {
        std::string msg = std::format("Cannot convert {} {} to {}", raw.kindName(), raw.toDebugString(), target.name());
        if (!why.empty()) msg += ": " + why;
        throw ScalarConversionError(msg);
    }

    bool equalsIgnoreCase(std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
            });
    }

    Value toBoolean(const Value& raw, const TypeDescriptor& target) {
        switch (raw.kind()) {
        case ValueKind::Boolean: return raw;
        case ValueKind::Int32:
        case ValueKind::Int64:   return Value(raw.asInt64() != 0);
        case ValueKind::String:
            if (equalsIgnoreCase(raw.asString(), "true")) return Value(true);
            if (equalsIgnoreCase(raw.asString(), "false")) return Value(false);
            break;
        default:
            break;
        }
        conversionFailure(raw, target);
    }

    Value integerToNumber(int64_t v, const Value& raw, const TypeDescriptor& target) {
        switch (target.numberKind()) {
        case NumberKind::Int32:
            if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max())
                conversionFailure(raw, target, "out of int32 range");
            return Value(static_cast<int32_t>(v));
        case NumberKind::Int64:   return Value(v);
        case NumberKind::Float32: return Value(static_cast<float>(v));
        case NumberKind::Float64: return Value(static_cast<double>(v));
        }
        conversionFailure(raw, target);
    }

    Value floatingToNumber(double d, const Value& raw, const TypeDescriptor& target) {
        switch (target.numberKind()) {
        case NumberKind::Int32:
        case NumberKind::Int64: {
            if (!std::isfinite(d)) conversionFailure(raw, target, "not a finite number");
            const double t = std::trunc(d);
            // 2^63 is exactly representable; anything at or above it overflows int64
            if (t < -9223372036854775808.0 || t >= 9223372036854775808.0)
                conversionFailure(raw, target, "out of int64 range");
            return integerToNumber(static_cast<int64_t>(t), raw, target);
        }
        case NumberKind::Float32:
            if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max())
                conversionFailure(raw, target, "out of float32 range");
            return Value(static_cast<float>(d));
        case NumberKind::Float64:
            return Value(d);
        }
        conversionFailure(raw, target);
    }

    Value stringToNumber(const std::string& s, const Value& raw, const TypeDescriptor& target) {
        size_t pos = 0;
        try {
            if (target.numberKind() == NumberKind::Int32 || target.numberKind() == NumberKind::Int64) {
                const long long v = std::stoll(s, &pos, 10);
                if (pos == s.size()) return integerToNumber(static_cast<int64_t>(v), raw, target);
            } else {
                const double d = std::stod(s, &pos);
                if (pos == s.size()) return floatingToNumber(d, raw, target);
            }
        }
        catch (const std::logic_error& ex) {
            // std::invalid_argument / std::out_of_range from the sto* family
            conversionFailure(raw, target, ex.what());
        }
        conversionFailure(raw, target, "trailing characters");
    }

    Value toNumber(const Value& raw, const TypeDescriptor& target) {
        switch (raw.kind()) {
        case ValueKind::Int32:
        case ValueKind::Int64:   return integerToNumber(raw.asInt64(), raw, target);
        case ValueKind::Float32:
        case ValueKind::Float64: return floatingToNumber(raw.asDouble(), raw, target);
        case ValueKind::String:  return stringToNumber(raw.asString(), raw, target);
        default:                 break;
        }
        conversionFailure(raw, target);
    }

    Value toCharSequence(const Value& raw, const TypeDescriptor& target) {
        switch (raw.kind()) {
        case ValueKind::String:    return raw;
        case ValueKind::Boolean:   return Value(std::string(raw.asBool() ? "true" : "false"));
        case ValueKind::Int32:
        case ValueKind::Int64:     return Value(std::to_string(raw.asInt64()));
        case ValueKind::Float32:   return Value(std::format("{}", raw.asFloat()));
        case ValueKind::Float64:   return Value(std::format("{}", raw.asDouble()));
        case ValueKind::Character: return Value(utf8::encode(raw.asChar()));
        default:                   break;
        }
        conversionFailure(raw, target);
    }

    Value toCharacter(const Value& raw, const TypeDescriptor& target) {
        switch (raw.kind()) {
        case ValueKind::Character:
            return raw;
        case ValueKind::String:
            if (auto cp = utf8::singleCodePoint(raw.asString())) return Value(*cp);
            conversionFailure(raw, target, "expected exactly one character");
        case ValueKind::Int32: {
            const int32_t v = raw.asInt32();
            if (v >= 0 && v <= 0x10FFFF && !(v >= 0xD800 && v <= 0xDFFF))
                return Value(static_cast<char32_t>(v));
            conversionFailure(raw, target, "not a Unicode scalar value");
        }
        default:
            break;
        }
        conversionFailure(raw, target);
    }

    Value toByteArray(const Value& raw, const TypeDescriptor& target) {
        switch (raw.kind()) {
        case ValueKind::Binary:
            return raw;
        case ValueKind::String: {
            const auto& s = raw.asString();
            return Value(Binary(s.begin(), s.end()));
        }
        default:
            break;
        }
        conversionFailure(raw, target);
    }

}

void TypeRegistry::registerType(TypeRef type) {
    if (!type)
        throw std::invalid_argument("TypeRegistry::registerType: null type");
    const std::string& key = type->typeName().empty() ? type->name() : type->typeName();
    auto [it, inserted] = dictionary_.emplace(key, type);
    if (!inserted && it->second != type)
        throw std::invalid_argument("TypeRegistry::registerType: name '" + key + "' already registered");
}

TypeRef TypeRegistry::lookup(std::string_view name) const {
    auto it = dictionary_.find(std::string(name));
    return it == dictionary_.end() ? nullptr : it->second;
}

TypeClass TypeRegistry::classify(const TypeDescriptor& type) const {
    return type.typeClass();
}

TypeRef TypeRegistry::elementType(const TypeDescriptor& type) const {
    return type.elementType() ? type.elementType() : TypeDescriptor::any();
}

TypeRef TypeRegistry::keyType(const TypeDescriptor& type) const {
    return type.keyType() ? type.keyType() : TypeDescriptor::string();
}

TypeRef TypeRegistry::valueType(const TypeDescriptor& type) const {
    return type.valueType() ? type.valueType() : TypeDescriptor::any();
}

TypeRef TypeRegistry::argType(const TypeDescriptor& type, size_t index) const {
    const auto& args = type.argTypes();
    return index < args.size() ? args[index] : nullptr;
}

const IObjectSwap* TypeRegistry::swapFor(const TypeDescriptor& type) const {
    return type.swap().get();
}

const IBuilderSwap* TypeRegistry::builderSwapFor(const TypeDescriptor& type) const {
    return type.builderSwap().get();
}

Value TypeRegistry::convertScalar(const Value& raw, const TypeDescriptor& target) const {
    switch (target.typeClass()) {
    case TypeClass::Any:          return raw;
    case TypeClass::Boolean:      return toBoolean(raw, target);
    case TypeClass::Number:       return toNumber(raw, target);
    case TypeClass::CharSequence: return toCharSequence(raw, target);
    case TypeClass::Character:    return toCharacter(raw, target);
    case TypeClass::ByteArray:    return toByteArray(raw, target);
    default:
        break;
    }
    conversionFailure(raw, target, std::string(toString(target.typeClass())) + " is not a scalar target");
}

MapPtr TypeRegistry::constructMap(const TypeDescriptor& type) const {
    return std::make_shared<Map>(type.mapOrder());
}

ListPtr TypeRegistry::constructCollection(const TypeDescriptor&) const {
    return std::make_shared<List>();
}

ListPtr TypeRegistry::constructArray(const TypeDescriptor&, size_t length) const {
    auto l = std::make_shared<List>(true);
    // length comes off the wire
    l->reserve(std::min<size_t>(length, 1024));
    return l;
}

RecordPtr TypeRegistry::constructRecord(const TypeDescriptor& type) const {
    if (type.typeClass() != TypeClass::Record) return nullptr;
    return std::make_shared<Record>(type.shared_from_this());
}

bool TypeRegistry::canConstructFromString(const TypeDescriptor& type) const {
    return type.hasStringFactory();
}

Value TypeRegistry::constructFromString(const TypeDescriptor& type, const std::string& text) const {
    if (!type.hasStringFactory())
        throw ConstructionError("Type '" + type.name() + "' cannot be constructed from a string");
    return type.stringFactory()(text);
}

const FieldDescriptor* TypeRegistry::fieldDescriptor(const TypeDescriptor& record, std::string_view name) const {
    return record.field(name);
}

void TypeRegistry::setField(Record& record, const FieldDescriptor& field, Value value) const {
    if (field.validator) field.validator(value);
    record.set(field.index, std::move(value));
}

std::string TypeRegistry::reservedDiscriminatorName(const TypeDescriptor& type) const {
    return type.typeProperty() ? *type.typeProperty() : discriminator_;
}

TypeRef TypeRegistry::resolveTypeName(std::string_view name, const TypeDescriptor& expected) const {
    for (const auto& sub : expected.dictionary()) {
        if (!sub) continue;
        const std::string& n = sub->typeName().empty() ? sub->name() : sub->typeName();
        if (n == name) return sub;
    }
    return lookup(name);
}

void TypeRegistry::onUnknownProperty(Record& record, const std::string& name, const Value& raw) const {
    if (unknownListener_)
        unknownListener_(UnknownFieldNotice{ record.typeName(), name, raw, &record });
}

void TypeRegistry::setParent(const TypeDescriptor& type, Value& value, const Node* parent) const {
    if (value.isRecord()) {
        if (type.typeClass() == TypeClass::Record && !type.parentProperty()) return;
        value.asRecord().setParent(parent);
    }
    else if (Node* n = value.node()) {
        n->setParent(parent);
    }
}

void TypeRegistry::setName(const TypeDescriptor&, Value& value, const Value& name) const {
    if (value.isRecord()) value.asRecord().setName(name);
}

Value TypeRegistry::wrapOptional(const TypeDescriptor&, Value value) const {
    return value;
}

}
