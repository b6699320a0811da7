/**
 * @file type_descriptor.hpp
 * @brief Target type descriptors for packgraph.
 *
 * A TypeDescriptor tells the decoder what shape the next decoded value should
 * take: a scalar, a container with element/key/value sub-descriptors, a record
 * with named fields, or one of the wrapper forms. Descriptors are immutable and
 * shared through TypeRef; decorators return modified copies.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/value/value.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ankerl/unordered_dense.h>

namespace packgraph {

    class IObjectSwap;
    class IBuilderSwap;

    /**
     * @enum TypeClass
     * @brief Classification of a decode target.
     */
    enum class TypeClass {
        Any,                  ///< Natural wire type, generic containers
        Boolean,
        Number,               ///< See NumberKind
        Character,            ///< Single Unicode code point
        CharSequence,         ///< UTF-8 string
        ByteArray,
        Map,
        Collection,           ///< Growable ordered list
        Array,                ///< Fixed-size homogeneous array
        Args,                 ///< Fixed-size heterogeneous tuple
        Record,               ///< Named, typed fields
        StringConstructible,  ///< Built from a string through a factory
        Optional              ///< Wraps one element type
    };

    const char* toString(TypeClass c);

    /**
     * @enum NumberKind
     * @brief Concrete width of a Number target.
     */
    enum class NumberKind { Int32, Int64, Float32, Float64 };

    using StringFactory  = std::function<Value(const std::string&)>;
    using FieldValidator = std::function<void(const Value&)>;

    /**
     * @struct FieldDescriptor
     * @brief One named field of a record type.
     *
     * A validator that throws rejects the assignment; the decoder reports it as
     * a FieldAssignmentError.
     */
    struct FieldDescriptor {
        std::string    name;        ///< Property name on the wire
        TypeRef        type;        ///< Declared type; null means Any
        FieldValidator validator;   ///< Optional setter check
        size_t         index{ 0 };  ///< Slot index, assigned by TypeDescriptor::record()
    };

    /**
     * @class TypeDescriptor
     * @brief Immutable description of a decode target.
     *
     * Only ever created behind a shared pointer, so shared_from_this() is always valid.
     */
    class TypeDescriptor : public std::enable_shared_from_this<TypeDescriptor> {
    public:
        /* ---- scalar factories (shared singletons) ---- */
        static TypeRef any();
        static TypeRef boolean();
        static TypeRef number(NumberKind kind);
        static TypeRef int32()   { return number(NumberKind::Int32); }
        static TypeRef int64()   { return number(NumberKind::Int64); }
        static TypeRef float32() { return number(NumberKind::Float32); }
        static TypeRef float64() { return number(NumberKind::Float64); }
        static TypeRef character();
        static TypeRef string();
        static TypeRef bytes();

        /* ---- composite factories ---- */
        static TypeRef mapOf(TypeRef key, TypeRef value, MapOrder order = MapOrder::Insertion);
        static TypeRef listOf(TypeRef element);
        static TypeRef arrayOf(TypeRef element);
        static TypeRef tupleOf(std::vector<TypeRef> args);
        static TypeRef optionalOf(TypeRef element);

        /**
         * @brief Record type with the given fields; field indexes are assigned in order.
         * @throws std::invalid_argument on duplicate field names
         */
        static TypeRef record(std::string name, std::vector<FieldDescriptor> fields);

        /**
         * @brief Type materialized from a string through @p factory.
         */
        static TypeRef stringConstructible(std::string name, StringFactory factory);

        /* ---- decorators (return modified copies) ---- */
        TypeRef withSwap(std::shared_ptr<const IObjectSwap> swap) const;
        TypeRef withBuilderSwap(std::shared_ptr<const IBuilderSwap> builder) const;
        TypeRef withStringFactory(StringFactory factory) const;
        TypeRef withName(std::string name) const;
        /// Dictionary name used by the discriminator property
        TypeRef withTypeName(std::string typeName) const;
        /// Override of the discriminator property name for this type
        TypeRef withTypeProperty(std::string propertyName) const;
        /// Subtypes resolvable by discriminator value from this type
        TypeRef withDictionary(std::vector<TypeRef> subtypes) const;
        /// Record-only: enable or disable the parent back-reference
        TypeRef withParentProperty(bool enabled = true) const;

        /* ---- accessors ---- */
        TypeClass typeClass() const { return class_; }
        NumberKind numberKind() const { return numberKind_; }
        const std::string& name() const { return name_; }

        const TypeRef& keyType() const { return key_; }
        const TypeRef& valueType() const { return value_; }
        const TypeRef& elementType() const { return element_; }
        const std::vector<TypeRef>& argTypes() const { return args_; }
        MapOrder mapOrder() const { return mapOrder_; }

        const std::vector<FieldDescriptor>& fields() const { return fields_; }
        const FieldDescriptor* field(std::string_view name) const;

        const std::shared_ptr<const IObjectSwap>& swap() const { return swap_; }
        const std::shared_ptr<const IBuilderSwap>& builderSwap() const { return builderSwap_; }
        const StringFactory& stringFactory() const { return stringFactory_; }
        bool hasStringFactory() const { return static_cast<bool>(stringFactory_); }

        const std::string& typeName() const { return typeName_; }
        const std::optional<std::string>& typeProperty() const { return typeProperty_; }
        const std::vector<TypeRef>& dictionary() const { return dictionary_; }
        bool parentProperty() const { return parentProperty_; }

        bool isScalar() const;

    private:
        TypeDescriptor(TypeClass c, std::string name);
        static std::shared_ptr<TypeDescriptor> make(TypeClass c, std::string name);
        std::shared_ptr<TypeDescriptor> copy() const;

        TypeClass   class_;
        NumberKind  numberKind_{ NumberKind::Int64 };
        std::string name_;

        TypeRef key_;
        TypeRef value_;
        TypeRef element_;
        std::vector<TypeRef> args_;
        MapOrder mapOrder_{ MapOrder::Insertion };

        std::vector<FieldDescriptor> fields_;
        ankerl::unordered_dense::map<std::string, size_t> fieldIndex_;

        std::shared_ptr<const IObjectSwap>  swap_;
        std::shared_ptr<const IBuilderSwap> builderSwap_;
        StringFactory stringFactory_;

        std::string typeName_;
        std::optional<std::string> typeProperty_;
        std::vector<TypeRef> dictionary_;
        bool parentProperty_{ true };
    };

    /**
     * @brief Name of a type for diagnostics; "any" for a null reference.
     */
    inline std::string describe(const TypeRef& t) {
        return t ? t->name() : std::string("any");
    }

}
