/**
 * @file stream_reader.hpp
 * @brief Pull reader that turns MessagePack bytes into tagged values.
 *
 * The reader owns the cursor over an IByteSource and nothing else: it does not
 * know about target types, trimming or object graphs. Callers alternate between
 * readTag() and one of the typed reads, or hand the whole value to skipValue().
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include "packgraph/core/interfaces/ibyte_source.hpp"
#include "packgraph/core/value/value.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace packgraph {

    /**
     * @enum TagKind
     * @brief Wire-level kind of the value at the cursor.
     */
    enum class TagKind {
        Nil,
        Boolean,
        Int32,        ///< fixint, uint8, uint16, int8, int16, int32
        Int64,        ///< uint32, uint64, int64
        Float32,
        Float64,
        String,
        Binary,
        ArrayHeader,  ///< followed by length() values
        MapHeader     ///< followed by length() key/value pairs
    };

    const char* toString(TagKind k);

    /**
     * @brief Whether the tag carries a payload that a typed read must consume.
     */
    inline bool hasPayload(TagKind k) {
        return k != TagKind::Nil && k != TagKind::ArrayHeader && k != TagKind::MapHeader;
    }

    /**
     * @class StreamReader
     * @brief Sequential MessagePack tag reader over an owned byte source.
     *
     * The source is closed when the reader is closed or destroyed. Bytes are
     * pulled from the source in bounded chunks, so the reader may consume bytes
     * past the last value it returned.
     */
    class StreamReader {
    public:
        /**
         * @param source Byte source; ownership is taken
         * @param validateUtf8 Reject strings that are not well-formed UTF-8
         */
        explicit StreamReader(std::unique_ptr<IByteSource> source, bool validateUtf8 = false);
        ~StreamReader();

        StreamReader(const StreamReader&) = delete;
        StreamReader& operator=(const StreamReader&) = delete;

        /**
         * @brief Read the next tag header, including any length bytes.
         * @throws MalformedStreamError on an invalid header byte
         * @throws TruncatedStreamError if the stream ends inside the header
         * @throws std::logic_error if the previous scalar payload was not consumed
         */
        TagKind readTag();

        /**
         * @brief Byte count (String/Binary) or element count (Array/Map) of the current tag.
         * @throws std::logic_error for any other tag
         */
        uint64_t readLength() const;

        bool readBoolean();
        int32_t readInt32();
        /// Accepts any integer tag.
        int64_t readInt64();
        float readFloat32();
        /// Accepts Float32 and Float64 tags.
        double readFloat64();
        std::string readString();
        Binary readBinary();

        /**
         * @brief Read the current scalar at its natural type. Nil yields a nil Value.
         * @throws std::logic_error if the current tag is an aggregate header
         */
        Value readScalar();

        /**
         * @brief Consume the current value, or the next one if none is pending.
         *
         * Nested aggregates are skipped whole, without materializing them.
         */
        void skipValue();

        /**
         * @brief True when no bytes remain after the last consumed value.
         */
        bool atEnd();

        /// Number of bytes consumed so far.
        uint64_t position() const { return position_; }
        /// Offset of the last tag header read.
        uint64_t tagOffset() const { return tagOffset_; }
        TagKind currentTag() const { return tag_; }

        /**
         * @brief Close the underlying source. Idempotent.
         */
        void close();
        bool closed() const { return !source_ || source_->closed(); }

    private:
        enum class State { Idle, Tagged };

        bool refill();
        uint8_t readByte();
        void readExact(uint8_t* dst, size_t n);
        void discard(uint64_t n);
        template<typename T> T readBigEndian();
        template<typename Out> void readChunked(Out& out, uint64_t n);

        void expect(TagKind k, const char* op) const;
        void consumed() { state_ = State::Idle; }

        std::unique_ptr<IByteSource> source_;
        bool validateUtf8_;

        std::vector<uint8_t> buf_;
        size_t bufPos_{ 0 };
        size_t bufLen_{ 0 };

        uint64_t position_{ 0 };
        uint64_t tagOffset_{ 0 };

        State    state_{ State::Idle };
        TagKind  tag_{ TagKind::Nil };
        uint8_t  header_{ 0 };
        uint64_t length_{ 0 };
    };

}
