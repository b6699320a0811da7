/**
 * @file iswap.hpp
 * @brief Value transform interfaces for packgraph.
 *
 * Defines IObjectSwap (reversible mapping between a declared type and an
 * intermediate wire-friendly type) and IBuilderSwap (decode into a builder
 * record, then finish it into the declared value).
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/value/value.hpp"

namespace packgraph {

    /**
     * @class IObjectSwap
     * @brief Reversible transform between a declared type and an intermediate type.
     *
     * The decoder decodes at swapType() and hands the result to unswap(). The
     * serializer calls swap() before writing. Implementations must be stateless
     * or externally synchronized.
     */
    class IObjectSwap {
    public:
        virtual ~IObjectSwap() = default;

        /**
         * @brief Intermediate type values are decoded into before unswap().
         */
        virtual TypeRef swapType() const = 0;

        /**
         * @brief Forward mapping: declared value to intermediate value.
         */
        virtual Value swap(const Value& value) const = 0;

        /**
         * @brief Reverse mapping: intermediate value to declared value.
         * @param value Decoded intermediate value, never nil
         * @param declared The declared type being decoded
         */
        virtual Value unswap(Value value, const TypeDescriptor& declared) const = 0;
    };

    /**
     * @class IBuilderSwap
     * @brief Builds a declared value through an intermediate builder record.
     */
    class IBuilderSwap {
    public:
        virtual ~IBuilderSwap() = default;

        /**
         * @brief Record type describing the builder's settable fields.
         */
        virtual TypeRef builderType() const = 0;

        /**
         * @brief Create an empty builder for @p declared.
         */
        virtual RecordPtr newBuilder(const TypeDescriptor& declared) const = 0;

        /**
         * @brief Finish a populated builder into the declared value.
         */
        virtual Value build(RecordPtr builder, const TypeDescriptor& declared) const = 0;
    };

}
