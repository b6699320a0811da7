#include "packgraph/core/value/value.hpp"
#include "packgraph/core/types/type_descriptor.hpp"
#include "packgraph/core/util/utf8.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace packgraph {

const char* toString(ValueKind k) {
    switch (k) {
    case ValueKind::Nil:       return "nil";
    case ValueKind::Boolean:   return "boolean";
    case ValueKind::Int32:     return "int32";
    case ValueKind::Int64:     return "int64";
    case ValueKind::Float32:   return "float32";
    case ValueKind::Float64:   return "float64";
    case ValueKind::Character: return "char";
    case ValueKind::String:    return "string";
    case ValueKind::Binary:    return "binary";
    case ValueKind::List:      return "list";
    case ValueKind::Map:       return "map";
    case ValueKind::Record:    return "record";
    case ValueKind::Object:    return "object";
    }
    return "unknown";
}

/* ---------------- Value ---------------- */

Value::Value(ListPtr v) {
    if (v) v_ = std::move(v);
}

Value::Value(MapPtr v) {
    if (v) v_ = std::move(v);
}

Value::Value(RecordPtr v) {
    if (v) v_ = std::move(v);
}

int64_t Value::asInt64() const {
    if (auto p = std::get_if<int32_t>(&v_)) return *p;
    return std::get<int64_t>(v_);
}

double Value::asDouble() const {
    switch (kind()) {
    case ValueKind::Int32:   return static_cast<double>(std::get<int32_t>(v_));
    case ValueKind::Int64:   return static_cast<double>(std::get<int64_t>(v_));
    case ValueKind::Float32: return static_cast<double>(std::get<float>(v_));
    default:                 return std::get<double>(v_);
    }
}

List& Value::asList() const { return *std::get<ListPtr>(v_); }
Map& Value::asMap() const { return *std::get<MapPtr>(v_); }
Record& Value::asRecord() const { return *std::get<RecordPtr>(v_); }

Node* Value::node() const {
    switch (kind()) {
    case ValueKind::List:   return std::get<ListPtr>(v_).get();
    case ValueKind::Map:    return std::get<MapPtr>(v_).get();
    case ValueKind::Record: return std::get<RecordPtr>(v_).get();
    default:                return nullptr;
    }
}

namespace {

    Value cloneInto(const Value& v, const Node* parent);

    void cloneChildren(const List& src, List& dst) {
        dst.reserve(src.size());
        for (const auto& e : src) dst.push_back(cloneInto(e, &dst));
    }

    Value cloneInto(const Value& v, const Node* parent) {
        switch (v.kind()) {
        case ValueKind::List: {
            auto out = std::make_shared<List>(v.asList().fixed());
            cloneChildren(v.asList(), *out);
            if (v.asList().parent()) out->setParent(parent);
            return out;
        }
        case ValueKind::Map: {
            const Map& src = v.asMap();
            auto out = std::make_shared<Map>(src.order());
            for (const auto& [k, val] : src)
                out->put(cloneInto(k, parent), cloneInto(val, out.get()));
            if (src.parent()) out->setParent(parent);
            return out;
        }
        case ValueKind::Record: {
            const Record& src = v.asRecord();
            auto out = std::make_shared<Record>(src.type());
            for (size_t i = 0; i < src.fieldCount(); ++i) {
                if (src.isSet(i)) out->set(i, cloneInto(src.at(i), out.get()));
            }
            out->setName(src.name());
            if (src.parent()) out->setParent(parent);
            return out;
        }
        default:
            return v;
        }
    }

}

Value Value::clone() const {
    return cloneInto(*this, nullptr);
}

std::string Value::toDebugString() const {
    std::ostringstream os;
    switch (kind()) {
    case ValueKind::Nil:       os << "nil"; break;
    case ValueKind::Boolean:   os << (asBool() ? "true" : "false"); break;
    case ValueKind::Int32:     os << asInt32(); break;
    case ValueKind::Int64:     os << std::get<int64_t>(v_); break;
    case ValueKind::Float32:   os << asFloat(); break;
    case ValueKind::Float64:   os << std::get<double>(v_); break;
    case ValueKind::Character: os << '\'' << utf8::encode(asChar()) << '\''; break;
    case ValueKind::String:    os << '"' << asString() << '"'; break;
    case ValueKind::Binary:    os << "binary[" << asBinary().size() << "]"; break;
    case ValueKind::List:      os << "list[" << asList().size() << "]"; break;
    case ValueKind::Map:       os << "map[" << asMap().size() << "]"; break;
    case ValueKind::Record:    os << "record<" << asRecord().typeName() << ">"; break;
    case ValueKind::Object:    os << "object<" << asObject().type().name() << ">"; break;
    }
    return os.str();
}

bool Value::operator==(const Value& o) const {
    if (kind() != o.kind()) return false;
    switch (kind()) {
    case ValueKind::Nil:       return true;
    case ValueKind::List:      return asList() == o.asList();
    case ValueKind::Map:       return asMap() == o.asMap();
    case ValueKind::Record:    return asRecord() == o.asRecord();
    case ValueKind::Object:    return asObject().type() == o.asObject().type();
    case ValueKind::Boolean:   return asBool() == o.asBool();
    case ValueKind::Int32:     return asInt32() == o.asInt32();
    case ValueKind::Int64:     return asInt64() == o.asInt64();
    case ValueKind::Float32:   return asFloat() == o.asFloat();
    case ValueKind::Float64:   return asDouble() == o.asDouble();
    case ValueKind::Character: return asChar() == o.asChar();
    case ValueKind::String:    return asString() == o.asString();
    case ValueKind::Binary:    return asBinary() == o.asBinary();
    }
    return false;
}

bool Value::operator<(const Value& o) const {
    if (kind() != o.kind()) {
        // numbers of different widths still order by magnitude
        if (isNumber() && o.isNumber()) {
            if (isInteger() && o.isInteger()) return asInt64() < o.asInt64();
            return asDouble() < o.asDouble();
        }
        return kind() < o.kind();
    }
    switch (kind()) {
    case ValueKind::Boolean:   return asBool() < o.asBool();
    case ValueKind::Int32:     return asInt32() < o.asInt32();
    case ValueKind::Int64:     return asInt64() < o.asInt64();
    case ValueKind::Float32:   return asFloat() < o.asFloat();
    case ValueKind::Float64:   return asDouble() < o.asDouble();
    case ValueKind::Character: return asChar() < o.asChar();
    case ValueKind::String:    return asString() < o.asString();
    case ValueKind::Binary:    return asBinary() < o.asBinary();
    default:                   return false;
    }
}

size_t ValueHash::operator()(const Value& v) const noexcept {
    const auto kindSalt = static_cast<size_t>(v.kind()) * 0x9E3779B97F4A7C15ull;
    switch (v.kind()) {
    case ValueKind::Boolean:   return kindSalt ^ std::hash<bool>{}(v.asBool());
    case ValueKind::Int32:     return kindSalt ^ std::hash<int32_t>{}(v.asInt32());
    case ValueKind::Int64:     return kindSalt ^ std::hash<int64_t>{}(v.asInt64());
    case ValueKind::Float32:   return kindSalt ^ std::hash<float>{}(v.asFloat());
    case ValueKind::Float64:   return kindSalt ^ std::hash<double>{}(v.asDouble());
    case ValueKind::Character: return kindSalt ^ std::hash<char32_t>{}(v.asChar());
    case ValueKind::String:
        return ankerl::unordered_dense::hash<std::string>{}(v.asString());
    case ValueKind::Binary: {
        const auto& b = v.asBinary();
        return kindSalt ^ std::hash<std::string_view>{}(
            std::string_view(reinterpret_cast<const char*>(b.data()), b.size()));
    }
    default:
        return kindSalt;
    }
}

/* ---------------- Map ---------------- */

void Map::put(Value key, Value value) {
    if (order_ == MapOrder::Sorted) {
        auto it = std::lower_bound(entries_.begin(), entries_.end(), key,
            [](const Entry& e, const Value& k) { return e.first < k; });
        if (it != entries_.end() && it->first == key)
            it->second = std::move(value);
        else
            entries_.emplace(it, std::move(key), std::move(value));
        return;
    }
    if (auto it = index_.find(key); it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
}

const Value* Map::find(const Value& key) const {
    return const_cast<Map*>(this)->find(key);
}

Value* Map::find(const Value& key) {
    if (order_ == MapOrder::Sorted) {
        auto it = std::lower_bound(entries_.begin(), entries_.end(), key,
            [](const Entry& e, const Value& k) { return e.first < k; });
        if (it != entries_.end() && it->first == key) return &it->second;
        return nullptr;
    }
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

const Value& Map::at(std::string_view key) const {
    if (auto v = find(key)) return *v;
    throw std::out_of_range("Map::at: no entry for key '" + std::string(key) + "'");
}

bool Map::erase(const Value& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    if (order_ == MapOrder::Insertion) rebuildIndex();
    return true;
}

void Map::clear() {
    entries_.clear();
    index_.clear();
}

void Map::rebuildIndex() {
    index_.clear();
    for (size_t i = 0; i < entries_.size(); ++i)
        index_.emplace(entries_[i].first, i);
}

bool Map::operator==(const Map& o) const {
    if (size() != o.size()) return false;
    for (const auto& [k, v] : entries_) {
        const Value* other = o.find(k);
        if (!other || !(*other == v)) return false;
    }
    return true;
}

/* ---------------- Record ---------------- */

Record::Record(TypeRef type) : type_(std::move(type)) {
    if (!type_)
        throw std::invalid_argument("Record: type must not be null");
    slots_.resize(type_->fields().size());
    assigned_.resize(type_->fields().size(), false);
}

const std::string& Record::typeName() const {
    return type_->name();
}

size_t Record::indexOf(std::string_view field) const {
    const FieldDescriptor* fd = type_->field(field);
    if (!fd)
        throw std::out_of_range("Record '" + type_->name() + "' has no field '" + std::string(field) + "'");
    return fd->index;
}

const Value& Record::get(std::string_view field) const {
    return slots_[indexOf(field)];
}

void Record::set(size_t index, Value v) {
    slots_.at(index) = std::move(v);
    assigned_[index] = true;
}

void Record::set(std::string_view field, Value v) {
    set(indexOf(field), std::move(v));
}

bool Record::isSet(std::string_view field) const {
    return assigned_[indexOf(field)];
}

bool Record::operator==(const Record& o) const {
    if (type_ != o.type_ && type_->name() != o.type_->name()) return false;
    return slots_ == o.slots_ && assigned_ == o.assigned_;
}

}
