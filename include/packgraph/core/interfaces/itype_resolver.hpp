/**
 * @file itype_resolver.hpp
 * @brief Interface to the type resolution collaborator used by the decoder.
 *
 * The decoder never inspects types on its own: every classification, factory,
 * conversion and hook goes through an ITypeResolver. TypeRegistry is the
 * default implementation; callers can provide their own to bind decoded graphs
 * to application objects.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/types/type_descriptor.hpp"
#include "packgraph/core/value/value.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace packgraph {

    class IObjectSwap;
    class IBuilderSwap;

    /**
     * @class ITypeResolver
     * @brief Type classification, construction and conversion hooks.
     *
     * Implementations are shared by every decode that uses them and must be safe
     * for the caller's threading model (stateless or externally synchronized).
     */
    class ITypeResolver {
    public:
        virtual ~ITypeResolver() = default;

        virtual TypeClass classify(const TypeDescriptor& type) const = 0;

        virtual TypeRef elementType(const TypeDescriptor& type) const = 0;
        virtual TypeRef keyType(const TypeDescriptor& type) const = 0;
        virtual TypeRef valueType(const TypeDescriptor& type) const = 0;
        /**
         * @brief Positional type of a tuple-like target.
         * @return The type of argument @p index, or nullptr past the last argument
         */
        virtual TypeRef argType(const TypeDescriptor& type, size_t index) const = 0;

        virtual const IObjectSwap* swapFor(const TypeDescriptor& type) const = 0;
        virtual const IBuilderSwap* builderSwapFor(const TypeDescriptor& type) const = 0;

        /**
         * @brief Convert a natural wire scalar to a scalar target.
         * @throws ScalarConversionError naming source kind and target type
         */
        virtual Value convertScalar(const Value& raw, const TypeDescriptor& target) const = 0;

        /* Factory hooks; nullptr means "cannot construct". */
        virtual MapPtr constructMap(const TypeDescriptor& type) const = 0;
        virtual ListPtr constructCollection(const TypeDescriptor& type) const = 0;
        virtual ListPtr constructArray(const TypeDescriptor& type, size_t length) const = 0;
        virtual RecordPtr constructRecord(const TypeDescriptor& type) const = 0;

        virtual bool canConstructFromString(const TypeDescriptor& type) const = 0;
        virtual Value constructFromString(const TypeDescriptor& type, const std::string& text) const = 0;

        virtual const FieldDescriptor* fieldDescriptor(const TypeDescriptor& record, std::string_view name) const = 0;
        /**
         * @brief Assign a decoded value to a record field.
         *
         * May throw to reject the value; the decoder reports that as a
         * FieldAssignmentError.
         */
        virtual void setField(Record& record, const FieldDescriptor& field, Value value) const = 0;

        /**
         * @brief Name of the reserved discriminator property for @p type.
         */
        virtual std::string reservedDiscriminatorName(const TypeDescriptor& type) const = 0;

        /**
         * @brief Resolve a discriminator value to a concrete type.
         * @return The resolved type, or nullptr if the name is unknown
         */
        virtual TypeRef resolveTypeName(std::string_view name, const TypeDescriptor& expected) const = 0;

        /**
         * @brief Called once per record key with no matching field. Must not abort the decode.
         */
        virtual void onUnknownProperty(Record& record, const std::string& name, const Value& raw) const = 0;

        /**
         * @brief Wire the non-owning parent back-reference of a decoded child.
         */
        virtual void setParent(const TypeDescriptor& type, Value& value, const Node* parent) const = 0;

        /**
         * @brief Tell a map value which key it was stored under.
         */
        virtual void setName(const TypeDescriptor& type, Value& value, const Value& name) const = 0;

        /**
         * @brief Re-wrap a value decoded for an Optional target.
         */
        virtual Value wrapOptional(const TypeDescriptor& type, Value value) const = 0;
    };

}
