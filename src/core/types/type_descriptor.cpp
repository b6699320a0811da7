#include "packgraph/core/types/type_descriptor.hpp"
#include "packgraph/core/interfaces/iswap.hpp"
#include <stdexcept>

namespace packgraph {

const char* toString(TypeClass c) {
    switch (c) {
    case TypeClass::Any:                 return "Any";
    case TypeClass::Boolean:             return "Boolean";
    case TypeClass::Number:              return "Number";
    case TypeClass::Character:           return "Character";
    case TypeClass::CharSequence:        return "CharSequence";
    case TypeClass::ByteArray:           return "ByteArray";
    case TypeClass::Map:                 return "Map";
    case TypeClass::Collection:          return "Collection";
    case TypeClass::Array:               return "Array";
    case TypeClass::Args:                return "Args";
    case TypeClass::Record:              return "Record";
    case TypeClass::StringConstructible: return "StringConstructible";
    case TypeClass::Optional:            return "Optional";
    }
    return "Unknown";
}

TypeDescriptor::TypeDescriptor(TypeClass c, std::string name)
    : class_(c), name_(std::move(name)) {}

std::shared_ptr<TypeDescriptor> TypeDescriptor::make(TypeClass c, std::string name) {
    return std::shared_ptr<TypeDescriptor>(new TypeDescriptor(c, std::move(name)));
}

std::shared_ptr<TypeDescriptor> TypeDescriptor::copy() const {
    return std::shared_ptr<TypeDescriptor>(new TypeDescriptor(*this));
}

/* ---- scalars ---- */

TypeRef TypeDescriptor::any() {
    static const TypeRef t = make(TypeClass::Any, "any");
    return t;
}

TypeRef TypeDescriptor::boolean() {
    static const TypeRef t = make(TypeClass::Boolean, "boolean");
    return t;
}

TypeRef TypeDescriptor::number(NumberKind kind) {
    auto build = [](NumberKind k, const char* name) {
        auto t = make(TypeClass::Number, name);
        t->numberKind_ = k;
        return TypeRef(std::move(t));
    };
    static const TypeRef i32 = build(NumberKind::Int32, "int32");
    static const TypeRef i64 = build(NumberKind::Int64, "int64");
    static const TypeRef f32 = build(NumberKind::Float32, "float32");
    static const TypeRef f64 = build(NumberKind::Float64, "float64");
    switch (kind) {
    case NumberKind::Int32:   return i32;
    case NumberKind::Int64:   return i64;
    case NumberKind::Float32: return f32;
    case NumberKind::Float64: return f64;
    }
    return i64;
}

TypeRef TypeDescriptor::character() {
    static const TypeRef t = make(TypeClass::Character, "char");
    return t;
}

TypeRef TypeDescriptor::string() {
    static const TypeRef t = make(TypeClass::CharSequence, "string");
    return t;
}

TypeRef TypeDescriptor::bytes() {
    static const TypeRef t = make(TypeClass::ByteArray, "bytes");
    return t;
}

/* ---- composites ---- */

TypeRef TypeDescriptor::mapOf(TypeRef key, TypeRef value, MapOrder order) {
    if (!key) key = string();
    if (!value) value = any();
    auto t = make(TypeClass::Map, "map<" + key->name() + "," + value->name() + ">");
    t->key_ = std::move(key);
    t->value_ = std::move(value);
    t->mapOrder_ = order;
    return t;
}

TypeRef TypeDescriptor::listOf(TypeRef element) {
    if (!element) element = any();
    auto t = make(TypeClass::Collection, "list<" + element->name() + ">");
    t->element_ = std::move(element);
    return t;
}

TypeRef TypeDescriptor::arrayOf(TypeRef element) {
    if (!element) element = any();
    auto t = make(TypeClass::Array, element->name() + "[]");
    t->element_ = std::move(element);
    return t;
}

TypeRef TypeDescriptor::tupleOf(std::vector<TypeRef> args) {
    std::string name = "args<";
    for (size_t i = 0; i < args.size(); ++i) {
        if (!args[i]) args[i] = any();
        if (i) name += ",";
        name += args[i]->name();
    }
    name += ">";
    auto t = make(TypeClass::Args, std::move(name));
    t->args_ = std::move(args);
    return t;
}

TypeRef TypeDescriptor::optionalOf(TypeRef element) {
    if (!element) element = any();
    auto t = make(TypeClass::Optional, "optional<" + element->name() + ">");
    t->element_ = std::move(element);
    return t;
}

TypeRef TypeDescriptor::record(std::string name, std::vector<FieldDescriptor> fields) {
    auto t = make(TypeClass::Record, std::move(name));
    for (size_t i = 0; i < fields.size(); ++i) {
        auto& f = fields[i];
        if (!f.type) f.type = any();
        f.index = i;
        if (!t->fieldIndex_.emplace(f.name, i).second)
            throw std::invalid_argument("TypeDescriptor::record: duplicate field '" + f.name +
                                        "' in '" + t->name_ + "'");
    }
    t->fields_ = std::move(fields);
    return t;
}

TypeRef TypeDescriptor::stringConstructible(std::string name, StringFactory factory) {
    if (!factory)
        throw std::invalid_argument("TypeDescriptor::stringConstructible: factory must be set");
    auto t = make(TypeClass::StringConstructible, std::move(name));
    t->stringFactory_ = std::move(factory);
    return t;
}

/* ---- decorators ---- */

TypeRef TypeDescriptor::withSwap(std::shared_ptr<const IObjectSwap> swap) const {
    auto t = copy();
    t->swap_ = std::move(swap);
    return t;
}

TypeRef TypeDescriptor::withBuilderSwap(std::shared_ptr<const IBuilderSwap> builder) const {
    auto t = copy();
    t->builderSwap_ = std::move(builder);
    return t;
}

TypeRef TypeDescriptor::withStringFactory(StringFactory factory) const {
    auto t = copy();
    t->stringFactory_ = std::move(factory);
    return t;
}

TypeRef TypeDescriptor::withName(std::string name) const {
    auto t = copy();
    t->name_ = std::move(name);
    return t;
}

TypeRef TypeDescriptor::withTypeName(std::string typeName) const {
    auto t = copy();
    t->typeName_ = std::move(typeName);
    return t;
}

TypeRef TypeDescriptor::withTypeProperty(std::string propertyName) const {
    auto t = copy();
    t->typeProperty_ = std::move(propertyName);
    return t;
}

TypeRef TypeDescriptor::withDictionary(std::vector<TypeRef> subtypes) const {
    auto t = copy();
    t->dictionary_ = std::move(subtypes);
    return t;
}

TypeRef TypeDescriptor::withParentProperty(bool enabled) const {
    auto t = copy();
    t->parentProperty_ = enabled;
    return t;
}

/* ---- accessors ---- */

const FieldDescriptor* TypeDescriptor::field(std::string_view name) const {
    auto it = fieldIndex_.find(std::string(name));
    return it == fieldIndex_.end() ? nullptr : &fields_[it->second];
}

bool TypeDescriptor::isScalar() const {
    switch (class_) {
    case TypeClass::Boolean:
    case TypeClass::Number:
    case TypeClass::Character:
    case TypeClass::CharSequence:
    case TypeClass::ByteArray:
        return true;
    default:
        return false;
    }
}

}
