/**
 * @file msgpack_serializer.hpp
 * @brief MsgPackSerializer, the inverse of the decoder.
 *
 * Writes a value graph as MessagePack using msgpack-c's packer. Integer and
 * float widths are chosen so that decoding the output yields the same value
 * kinds that were written.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/value/value.hpp"
#include <string>
#include <vector>
#include <msgpack.hpp>

namespace packgraph {

    /**
     * @struct SerializerOptions
     * @brief Configuration for MsgPackSerializer.
     */
    struct SerializerOptions {
        bool        addTypeProperty{ false };     ///< Write the discriminator for records with a dictionary name
        std::string typePropertyName{ "_type" };  ///< Discriminator used when the descriptor has no override
    };

    /**
     * @class MsgPackSerializer
     * @brief Encodes Value graphs as MessagePack.
     */
    class MsgPackSerializer {
    public:
        explicit MsgPackSerializer(SerializerOptions options = {}) : options_(std::move(options)) {}

        /**
         * @brief Encode @p value; @p declared drives swaps and nested declared types.
         * @throws std::invalid_argument for an Object value with no swap to encode it
         * @throws std::overflow_error if a string, binary or container exceeds 4 GiB / 2^32 entries
         */
        std::vector<uint8_t> serialize(const Value& value, const TypeRef& declared = nullptr) const;

        /**
         * @brief Append the encoding of @p value to @p out.
         */
        void serialize(msgpack::sbuffer& out, const Value& value, const TypeRef& declared = nullptr) const;

    private:
        void write(msgpack::packer<msgpack::sbuffer>& pk, const Value& value, const TypeRef& declared) const;
        void writeRecord(msgpack::packer<msgpack::sbuffer>& pk, const Record& rec) const;

        SerializerOptions options_;
    };

}
