/**
 * @file type_registry.hpp
 * @brief Default ITypeResolver implementation for packgraph.
 *
 * TypeRegistry answers resolver queries straight from the descriptors and adds
 * a process-wide type dictionary for discriminator lookups, the discriminator
 * property name, scalar conversion rules and an unknown-property listener.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/interfaces/itype_resolver.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <ankerl/unordered_dense.h>

namespace packgraph {

    /**
     * @struct UnknownFieldNotice
     * @brief Report of a record key that matched no field. Not an error.
     */
    struct UnknownFieldNotice {
        std::string   recordType;  ///< Name of the record type being decoded
        std::string   name;        ///< Unmatched property name
        Value         value;       ///< Raw value decoded at Any
        const Record* record;      ///< Record under construction
    };

    /**
     * @class TypeRegistry
     * @brief Descriptor-driven type resolver with a type dictionary.
     *
     * Populate the registry before decoding; afterwards it is read-only and can
     * be shared across threads as long as the installed listener is thread-safe.
     */
    class TypeRegistry : public ITypeResolver {
    public:
        using UnknownPropertyListener = std::function<void(const UnknownFieldNotice&)>;

        static constexpr const char* DefaultDiscriminator = "_type";

        TypeRegistry() = default;

        /**
         * @brief Add a type to the dictionary under its type name (or its name).
         * @throws std::invalid_argument on a null type or a name clash
         */
        void registerType(TypeRef type);

        /**
         * @brief Dictionary lookup by name; nullptr if absent.
         */
        TypeRef lookup(std::string_view name) const;

        void setDiscriminatorName(std::string name) { discriminator_ = std::move(name); }
        const std::string& discriminatorName() const { return discriminator_; }

        void setUnknownPropertyListener(UnknownPropertyListener l) { unknownListener_ = std::move(l); }

        /* ---- ITypeResolver ---- */
        TypeClass classify(const TypeDescriptor& type) const override;
        TypeRef elementType(const TypeDescriptor& type) const override;
        TypeRef keyType(const TypeDescriptor& type) const override;
        TypeRef valueType(const TypeDescriptor& type) const override;
        TypeRef argType(const TypeDescriptor& type, size_t index) const override;
        const IObjectSwap* swapFor(const TypeDescriptor& type) const override;
        const IBuilderSwap* builderSwapFor(const TypeDescriptor& type) const override;
        Value convertScalar(const Value& raw, const TypeDescriptor& target) const override;
        MapPtr constructMap(const TypeDescriptor& type) const override;
        ListPtr constructCollection(const TypeDescriptor& type) const override;
        ListPtr constructArray(const TypeDescriptor& type, size_t length) const override;
        RecordPtr constructRecord(const TypeDescriptor& type) const override;
        bool canConstructFromString(const TypeDescriptor& type) const override;
        Value constructFromString(const TypeDescriptor& type, const std::string& text) const override;
        const FieldDescriptor* fieldDescriptor(const TypeDescriptor& record, std::string_view name) const override;
        void setField(Record& record, const FieldDescriptor& field, Value value) const override;
        std::string reservedDiscriminatorName(const TypeDescriptor& type) const override;
        TypeRef resolveTypeName(std::string_view name, const TypeDescriptor& expected) const override;
        void onUnknownProperty(Record& record, const std::string& name, const Value& raw) const override;
        void setParent(const TypeDescriptor& type, Value& value, const Node* parent) const override;
        void setName(const TypeDescriptor& type, Value& value, const Value& name) const override;
        Value wrapOptional(const TypeDescriptor& type, Value value) const override;

    private:
        ankerl::unordered_dense::map<std::string, TypeRef> dictionary_;
        std::string discriminator_{ DefaultDiscriminator };
        UnknownPropertyListener unknownListener_;
    };

}
