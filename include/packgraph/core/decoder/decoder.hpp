/**
 * @file decoder.hpp
 * @brief Type-directed decoder that materializes value graphs from a StreamReader.
 *
 * The decoder borrows a reader and a type resolver for the duration of one
 * top-level decode. It walks the stream depth-first, choosing for every node
 * how to materialize it from the pair (wire tag, target type class), and
 * delegates every type question to the ITypeResolver.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/decoder/decoder_options.hpp"
#include "packgraph/core/interfaces/itype_resolver.hpp"
#include "packgraph/core/io/stream_reader.hpp"
#include <memory>
#include <string>

namespace packgraph {

    /**
     * @class Decoder
     * @brief Recursive, type-directed MessagePack decoder.
     *
     * Not thread-safe. Create one per decode call; it holds no state between
     * top-level values except the reader's cursor.
     */
    class Decoder {
    public:
        /**
         * @param reader Reader positioned at the value to decode (borrowed)
         * @param resolver Type resolver consulted for every node (borrowed)
         * @param options Decode options
         */
        Decoder(StreamReader& reader, const ITypeResolver& resolver, const DecoderOptions& options = {});
        ~Decoder();

        Decoder(const Decoder&) = delete;
        Decoder& operator=(const Decoder&) = delete;

        /**
         * @brief Decode the next value on the stream as @p type.
         *
         * @param type Target type; nullptr means Any
         * @param parent Structural parent of the value, or nullptr at top level
         * @param field Record field the value is decoded for, if any
         * @return The materialized value; Nil for a Nil tag
         * @throws DecodeError (or a subclass) carrying path, target type and offset
         */
        Value decode(const TypeRef& type, const Node* parent = nullptr, const FieldDescriptor* field = nullptr);

        /**
         * @brief Decode a map from the stream into an existing map.
         *
         * A Nil tag leaves @p target untouched.
         * @throws TypeMismatchError if the next value is not a map
         */
        void decodeInto(Map& target, const TypeRef& keyType, const TypeRef& valueType);

        /**
         * @brief Decode an array from the stream into an existing list.
         *
         * A Nil tag leaves @p target untouched.
         * @throws TypeMismatchError if the next value is not an array
         */
        void decodeInto(List& target, const TypeRef& elementType);

        /**
         * @brief Field path of the node being decoded, e.g. "$.items[2]".
         */
        std::string currentPath() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
