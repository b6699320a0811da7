/**
 * @file value.hpp
 * @brief Decoded value graph for packgraph.
 *
 * Defines Value, the tagged union produced by the decoder, and the aggregate
 * nodes (List, Map, Record) it refers to. Aggregates live on the heap behind
 * shared pointers so the non-owning parent back-references stay valid while
 * the graph is being built.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <any>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <ankerl/unordered_dense.h>

namespace packgraph {

    class TypeDescriptor;
    using TypeRef = std::shared_ptr<const TypeDescriptor>;

    class List;
    class Map;
    class Record;

    using Binary    = std::vector<uint8_t>;
    using ListPtr   = std::shared_ptr<List>;
    using MapPtr    = std::shared_ptr<Map>;
    using RecordPtr = std::shared_ptr<Record>;

    /**
     * @enum ValueKind
     * @brief Runtime kind of a Value.
     */
    enum class ValueKind {
        Nil,
        Boolean,
        Int32,
        Int64,
        Float32,
        Float64,
        Character,
        String,
        Binary,
        List,
        Map,
        Record,
        Object   ///< Opaque payload produced by a swap or a string factory
    };

    const char* toString(ValueKind k);

    /**
     * @class Node
     * @brief Base of every aggregate in the graph; carries the parent back-reference.
     *
     * The parent pointer never owns. It is wired by the decoder's parent hook and
     * stays valid for as long as the enclosing graph is alive.
     */
    class Node {
    public:
        virtual ~Node() = default;

        const Node* parent() const { return parent_; }
        void setParent(const Node* p) { parent_ = p; }

    protected:
        Node() = default;
        Node(const Node&) = default;
        Node& operator=(const Node&) = default;

    private:
        const Node* parent_{ nullptr };
    };

    /**
     * @class Value
     * @brief Tagged union over the scalar and aggregate kinds of a decoded graph.
     *
     * Copying a Value copies scalars and shares aggregates. Use clone() for a
     * deep, independent copy.
     */
    class Value {
    public:
        using Storage = std::variant<
            std::monostate,
            bool,
            int32_t,
            int64_t,
            float,
            double,
            char32_t,
            std::string,
            Binary,
            ListPtr,
            MapPtr,
            RecordPtr,
            std::any>;

        Value() = default;
        Value(std::nullptr_t) {}
        Value(bool v) : v_(v) {}
        Value(int32_t v) : v_(v) {}
        Value(int64_t v) : v_(v) {}
        Value(float v) : v_(v) {}
        Value(double v) : v_(v) {}
        Value(char32_t v) : v_(v) {}
        Value(std::string v) : v_(std::move(v)) {}
        Value(const char* v) : v_(std::string(v)) {}
        Value(Binary v) : v_(std::move(v)) {}
        Value(ListPtr v);
        Value(MapPtr v);
        Value(RecordPtr v);

        /**
         * @brief Wrap an opaque payload (swap or string factory output).
         */
        static Value object(std::any payload) {
            Value v;
            v.v_ = std::move(payload);
            return v;
        }

        ValueKind kind() const { return static_cast<ValueKind>(v_.index()); }
        const char* kindName() const { return toString(kind()); }

        bool isNil() const       { return kind() == ValueKind::Nil; }
        bool isBool() const      { return kind() == ValueKind::Boolean; }
        bool isInteger() const   { return kind() == ValueKind::Int32 || kind() == ValueKind::Int64; }
        bool isFloating() const  { return kind() == ValueKind::Float32 || kind() == ValueKind::Float64; }
        bool isNumber() const    { return isInteger() || isFloating(); }
        bool isString() const    { return kind() == ValueKind::String; }
        bool isBinary() const    { return kind() == ValueKind::Binary; }
        bool isList() const      { return kind() == ValueKind::List; }
        bool isMap() const       { return kind() == ValueKind::Map; }
        bool isRecord() const    { return kind() == ValueKind::Record; }
        bool isObject() const    { return kind() == ValueKind::Object; }
        bool isAggregate() const { return isList() || isMap() || isRecord(); }

        /* Typed accessors throw std::bad_variant_access on a kind mismatch. */
        bool asBool() const                   { return std::get<bool>(v_); }
        int32_t asInt32() const               { return std::get<int32_t>(v_); }
        int64_t asInt64() const;              ///< Any integer kind, widened
        float asFloat() const                 { return std::get<float>(v_); }
        double asDouble() const;              ///< Any numeric kind, widened
        char32_t asChar() const               { return std::get<char32_t>(v_); }
        const std::string& asString() const   { return std::get<std::string>(v_); }
        const Binary& asBinary() const        { return std::get<Binary>(v_); }
        const std::any& asObject() const      { return std::get<std::any>(v_); }

        List& asList() const;
        Map& asMap() const;
        Record& asRecord() const;
        const ListPtr& listPtr() const        { return std::get<ListPtr>(v_); }
        const MapPtr& mapPtr() const          { return std::get<MapPtr>(v_); }
        const RecordPtr& recordPtr() const    { return std::get<RecordPtr>(v_); }

        /**
         * @brief Aggregate node behind this value, or nullptr for scalars.
         */
        Node* node() const;

        const Storage& storage() const { return v_; }

        /**
         * @brief Deep copy; aggregates are duplicated, parent links are rewired to the copies.
         */
        Value clone() const;

        /**
         * @brief Short diagnostic rendering (scalars in full, aggregates summarized).
         */
        std::string toDebugString() const;

        /**
         * @brief Structural equality. Opaque objects compare by payload type only.
         */
        bool operator==(const Value& o) const;
        bool operator!=(const Value& o) const { return !(*this == o); }

        /**
         * @brief Total order used by sorted maps: kind first, then value for scalars.
         */
        bool operator<(const Value& o) const;

    private:
        Storage v_;
    };

    /**
     * @struct ValueHash
     * @brief Hash functor for scalar keys; aggregates hash by kind only.
     */
    struct ValueHash {
        size_t operator()(const Value& v) const noexcept;
    };

    /**
     * @class List
     * @brief Ordered sequence of values. fixed() marks arrays and argument tuples.
     */
    class List : public Node {
    public:
        using iterator = std::vector<Value>::iterator;
        using const_iterator = std::vector<Value>::const_iterator;

        List() = default;
        explicit List(bool fixed) : fixed_(fixed) {}
        List(std::initializer_list<Value> items) : items_(items) {}

        void push_back(Value v) { items_.push_back(std::move(v)); }
        void reserve(size_t n) { items_.reserve(n); }
        void clear() { items_.clear(); }

        size_t size() const { return items_.size(); }
        bool empty() const { return items_.empty(); }

        Value& operator[](size_t i) { return items_[i]; }
        const Value& operator[](size_t i) const { return items_[i]; }
        const Value& at(size_t i) const { return items_.at(i); }

        iterator begin() { return items_.begin(); }
        iterator end() { return items_.end(); }
        const_iterator begin() const { return items_.begin(); }
        const_iterator end() const { return items_.end(); }

        std::vector<Value>& items() { return items_; }
        const std::vector<Value>& items() const { return items_; }

        bool fixed() const { return fixed_; }
        void setFixed(bool f) { fixed_ = f; }

        bool operator==(const List& o) const { return fixed_ == o.fixed_ && items_ == o.items_; }

    private:
        std::vector<Value> items_;
        bool fixed_{ false };
    };

    /**
     * @enum MapOrder
     * @brief Iteration order of a Map.
     */
    enum class MapOrder {
        Insertion,  ///< Keys iterate in first-insertion order
        Sorted      ///< Keys iterate in Value::operator< order
    };

    /**
     * @class Map
     * @brief Map with unique keys and a configurable iteration order.
     *
     * Insertion-ordered maps keep a hash index next to the entry vector so
     * lookups stay O(1) on large wire maps.
     */
    class Map : public Node {
    public:
        using Entry = std::pair<Value, Value>;
        using const_iterator = std::vector<Entry>::const_iterator;

        explicit Map(MapOrder order = MapOrder::Insertion) : order_(order) {}

        /**
         * @brief Insert or replace the value stored under @p key.
         */
        void put(Value key, Value value);

        const Value* find(const Value& key) const;
        Value* find(const Value& key);
        const Value* find(std::string_view key) const { return find(Value(std::string(key))); }

        bool contains(const Value& key) const { return find(key) != nullptr; }
        bool contains(std::string_view key) const { return find(key) != nullptr; }

        /**
         * @brief Value under @p key; throws std::out_of_range if absent.
         */
        const Value& at(std::string_view key) const;

        bool erase(const Value& key);
        void clear();

        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        const_iterator begin() const { return entries_.begin(); }
        const_iterator end() const { return entries_.end(); }
        const std::vector<Entry>& entries() const { return entries_; }

        MapOrder order() const { return order_; }

        /**
         * @brief Order-insensitive equality of the key/value sets.
         */
        bool operator==(const Map& o) const;

    private:
        void rebuildIndex();

        MapOrder order_;
        std::vector<Entry> entries_;
        ankerl::unordered_dense::map<Value, size_t, ValueHash> index_;
    };

    /**
     * @class Record
     * @brief Materialized instance of a record type: one slot per declared field.
     */
    class Record : public Node {
    public:
        explicit Record(TypeRef type);

        const TypeRef& type() const { return type_; }
        const std::string& typeName() const;

        size_t fieldCount() const { return slots_.size(); }

        /**
         * @brief Field value by name; Nil when unassigned.
         * @throws std::out_of_range if the record type has no such field
         */
        const Value& get(std::string_view field) const;
        const Value& at(size_t index) const { return slots_.at(index); }

        /**
         * @brief Assign a field by declaration index or by name.
         * @throws std::out_of_range if the field does not exist
         */
        void set(size_t index, Value v);
        void set(std::string_view field, Value v);

        bool isSet(size_t index) const { return assigned_.at(index); }
        bool isSet(std::string_view field) const;

        /**
         * @brief Name given by the enclosing map key, if any.
         */
        const Value& name() const { return name_; }
        void setName(Value n) { name_ = std::move(n); }

        bool operator==(const Record& o) const;

    private:
        size_t indexOf(std::string_view field) const;

        TypeRef type_;
        std::vector<Value> slots_;
        std::vector<bool> assigned_;
        Value name_;
    };

    /**
     * @brief Convenience constructors for aggregates.
     */
    inline ListPtr makeList(std::initializer_list<Value> items = {}) { return std::make_shared<List>(items); }
    inline MapPtr makeMap(MapOrder order = MapOrder::Insertion) { return std::make_shared<Map>(order); }

}
