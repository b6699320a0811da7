/**
 * @file msgpack_parser.hpp
 * @brief Public entry point for decoding MessagePack input into value graphs.
 *
 * MsgPackParser binds a type resolver and a set of DecoderOptions. Every call
 * builds its own StreamReader and Decoder, closes the byte source on every
 * exit path and either returns a complete graph or fails as a whole.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/decoder/decoder_options.hpp"
#include "packgraph/core/interfaces/ibyte_source.hpp"
#include "packgraph/core/interfaces/itype_resolver.hpp"
#include "packgraph/core/util/error_types.hpp"
#include "packgraph/core/value/value.hpp"
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace packgraph {

    /**
     * @struct ParseResult
     * @brief Outcome of tryParse(): a value or a structured failure.
     */
    struct ParseResult {
        Value value;                          ///< Decoded value; Nil on failure
        std::optional<DecodeFailure> error;   ///< Set when the decode failed

        bool ok() const { return !error.has_value(); }
        explicit operator bool() const { return ok(); }
    };

    /**
     * @class MsgPackParser
     * @brief Stateless MessagePack parser bound to a resolver and options.
     *
     * The parser keeps only immutable configuration and may be shared between
     * threads, provided the resolver is. Each call is independent.
     */
    class MsgPackParser {
    public:
        /**
         * @param resolver Type resolver used for every call (must outlive the parser)
         * @param options Decode options
         */
        explicit MsgPackParser(const ITypeResolver& resolver, DecoderOptions options = {});

        /**
         * @brief Decode one top-level value from a byte buffer.
         * @throws DecodeError on any fatal decode failure
         */
        Value parse(const std::vector<uint8_t>& bytes, const TypeRef& type) const;

        /**
         * @brief Decode one top-level value from a stream. The stream is not closed.
         * @throws DecodeError on any fatal decode failure
         */
        Value parse(std::istream& in, const TypeRef& type) const;

        /**
         * @brief Decode one top-level value from a byte source; the source is closed afterwards.
         * @throws DecodeError on any fatal decode failure
         */
        Value parse(std::unique_ptr<IByteSource> source, const TypeRef& type) const;

        /**
         * @brief Open @p path and decode one top-level value from it.
         * @throws IoError if the file cannot be opened
         * @throws DecodeError on any fatal decode failure
         */
        Value parseFile(const std::string& path, const TypeRef& type) const;

        /**
         * @brief Like parse(), but reports failures in the result instead of throwing.
         */
        ParseResult tryParse(const std::vector<uint8_t>& bytes, const TypeRef& type) const;
        ParseResult tryParse(std::istream& in, const TypeRef& type) const;

        /**
         * @brief Decode a map and add its entries to @p target.
         *
         * @p target is only modified when the whole map decoded successfully.
         * @throws DecodeError on any fatal decode failure
         */
        void parseIntoMap(const std::vector<uint8_t>& bytes, Map& target,
                          const TypeRef& keyType, const TypeRef& valueType) const;

        /**
         * @brief Decode an array and append its elements to @p target.
         *
         * @p target is only modified when the whole array decoded successfully.
         * @throws DecodeError on any fatal decode failure
         */
        void parseIntoCollection(const std::vector<uint8_t>& bytes, List& target, const TypeRef& elementType) const;

        /**
         * @brief Decode a heterogeneous argument array, one type per position.
         * @return Fixed list of decoded arguments, or nullptr for a Nil input
         * @throws TypeMismatchError if the stream holds more arguments than @p argTypes
         */
        ListPtr parseArgs(const std::vector<uint8_t>& bytes, const std::vector<TypeRef>& argTypes) const;

        const DecoderOptions& options() const { return options_; }
        const ITypeResolver& resolver() const { return resolver_; }

    private:
        const ITypeResolver& resolver_;
        DecoderOptions options_;
    };

}
