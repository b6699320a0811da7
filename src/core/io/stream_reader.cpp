#include "packgraph/core/io/stream_reader.hpp"
#include "packgraph/core/util/byteorder.hpp"
#include "packgraph/core/util/error_types.hpp"
#include "packgraph/core/util/logger.hpp"
#include "packgraph/core/util/utf8.hpp"
#include <algorithm>
#include <cstring>
#include <format>
#include <limits>

namespace packgraph {

namespace {

    constexpr size_t kChunkSize = 8 * 1024;

    const char* tagNames[]{ "Nil", "Boolean", "Int32", "Int64", "Float32", "Float64",
                            "String", "Binary", "ArrayHeader", "MapHeader" };

}

const char* toString(TagKind k) {
    return tagNames[static_cast<int>(k)];
}

StreamReader::StreamReader(std::unique_ptr<IByteSource> source, bool validateUtf8)
    : source_(std::move(source)), validateUtf8_(validateUtf8), buf_(kChunkSize) {
    if (!source_)
        throw std::invalid_argument("StreamReader: null byte source");
}

StreamReader::~StreamReader() {
    try {
        close();
    }
    catch (const std::exception& ex) {
        LOG_WARN(std::string("StreamReader: close failed: ") + ex.what());
    }
}

void StreamReader::close() {
    if (source_ && !source_->closed()) {
        source_->close();
        LOG_TRACE(std::format("StreamReader: source closed at offset {}", position_));
    }
}

/* ---- byte level ---- */

bool StreamReader::refill() {
    if (closed()) return false;
    bufPos_ = 0;
    bufLen_ = source_->read(buf_.data(), buf_.size());
    return bufLen_ > 0;
}

uint8_t StreamReader::readByte() {
    if (bufPos_ == bufLen_ && !refill())
        throw TruncatedStreamError(std::format("Unexpected end of stream at offset {}", position_));
    ++position_;
    return buf_[bufPos_++];
}

void StreamReader::readExact(uint8_t* dst, size_t n) {
    size_t done = 0;
    while (done < n) {
        if (bufPos_ == bufLen_ && !refill())
            throw TruncatedStreamError(std::format(
                "Unexpected end of stream: expected {} more bytes at offset {}", n - done, position_));
        const size_t take = std::min(n - done, bufLen_ - bufPos_);
        std::memcpy(dst + done, buf_.data() + bufPos_, take);
        bufPos_ += take;
        position_ += take;
        done += take;
    }
}

void StreamReader::discard(uint64_t n) {
    while (n > 0) {
        if (bufPos_ == bufLen_ && !refill())
            throw TruncatedStreamError(std::format(
                "Unexpected end of stream: expected {} more bytes at offset {}", n, position_));
        const auto take = static_cast<size_t>(std::min<uint64_t>(n, bufLen_ - bufPos_));
        bufPos_ += take;
        position_ += take;
        n -= take;
    }
}

template<typename T>
T StreamReader::readBigEndian() {
    uint8_t raw[sizeof(T)];
    readExact(raw, sizeof(T));
    return loadBigEndian<T>(raw);
}

// Declared lengths come from the wire; grow the output chunk by chunk so a
// bogus length fails on truncation instead of on allocation.
template<typename Out>
void StreamReader::readChunked(Out& out, uint64_t n) {
    out.clear();
    out.reserve(static_cast<size_t>(std::min<uint64_t>(n, kChunkSize)));
    while (n > 0) {
        if (bufPos_ == bufLen_ && !refill())
            throw TruncatedStreamError(std::format(
                "Unexpected end of stream: payload short by {} bytes at offset {}", n, position_));
        const auto take = static_cast<size_t>(std::min<uint64_t>(n, bufLen_ - bufPos_));
        const auto* p = buf_.data() + bufPos_;
        out.insert(out.end(), p, p + take);
        bufPos_ += take;
        position_ += take;
        n -= take;
    }
}

bool StreamReader::atEnd() {
    if (bufPos_ < bufLen_) return false;
    return !refill();
}

/* ---- tags ---- */

TagKind StreamReader::readTag() {
    if (state_ == State::Tagged && hasPayload(tag_))
        throw std::logic_error(std::format(
            "StreamReader::readTag: {} payload at offset {} not consumed", toString(tag_), tagOffset_));

    tagOffset_ = position_;
    const uint8_t h = readByte();
    header_ = h;
    length_ = 0;

    auto tagged = [this](TagKind k, uint64_t len = 0) {
        tag_ = k;
        length_ = len;
        state_ = State::Tagged;
        return k;
    };

    if (h <= 0x7f) return tagged(TagKind::Int32);                 // positive fixint
    if (h >= 0xe0) return tagged(TagKind::Int32);                 // negative fixint
    if ((h & 0xf0) == 0x80) return tagged(TagKind::MapHeader, h & 0x0f);
    if ((h & 0xf0) == 0x90) return tagged(TagKind::ArrayHeader, h & 0x0f);
    if ((h & 0xe0) == 0xa0) return tagged(TagKind::String, h & 0x1f);

    switch (h) {
    case 0xc0: return tagged(TagKind::Nil);
    case 0xc2:
    case 0xc3: return tagged(TagKind::Boolean);
    case 0xc4: return tagged(TagKind::Binary, readBigEndian<uint8_t>());
    case 0xc5: return tagged(TagKind::Binary, readBigEndian<uint16_t>());
    case 0xc6: return tagged(TagKind::Binary, readBigEndian<uint32_t>());
    case 0xca: return tagged(TagKind::Float32);
    case 0xcb: return tagged(TagKind::Float64);
    case 0xcc:
    case 0xcd:
    case 0xd0:
    case 0xd1:
    case 0xd2: return tagged(TagKind::Int32);
    case 0xce:
    case 0xcf:
    case 0xd3: return tagged(TagKind::Int64);
    case 0xd9: return tagged(TagKind::String, readBigEndian<uint8_t>());
    case 0xda: return tagged(TagKind::String, readBigEndian<uint16_t>());
    case 0xdb: return tagged(TagKind::String, readBigEndian<uint32_t>());
    case 0xdc: return tagged(TagKind::ArrayHeader, readBigEndian<uint16_t>());
    case 0xdd: return tagged(TagKind::ArrayHeader, readBigEndian<uint32_t>());
    case 0xde: return tagged(TagKind::MapHeader, readBigEndian<uint16_t>());
    case 0xdf: return tagged(TagKind::MapHeader, readBigEndian<uint32_t>());
    default:
        break;
    }
    // 0xc1 is never used; 0xc7-0xc9 and 0xd4-0xd8 are extension types
    state_ = State::Idle;
    throw MalformedStreamError(std::format("Unrecognized tag byte 0x{:02x} at offset {}", h, tagOffset_));
}

uint64_t StreamReader::readLength() const {
    switch (tag_) {
    case TagKind::String:
    case TagKind::Binary:
    case TagKind::ArrayHeader:
    case TagKind::MapHeader:
        return length_;
    default:
        throw std::logic_error(std::format("StreamReader::readLength: {} tag has no length", toString(tag_)));
    }
}

void StreamReader::expect(TagKind k, const char* op) const {
    if (state_ != State::Tagged || tag_ != k)
        throw std::logic_error(std::format("StreamReader::{}: current tag is {}{}", op, toString(tag_),
                                           state_ == State::Tagged ? "" : " (consumed)"));
}

/* ---- typed reads ---- */

bool StreamReader::readBoolean() {
    expect(TagKind::Boolean, "readBoolean");
    consumed();
    return header_ == 0xc3;
}

int32_t StreamReader::readInt32() {
    expect(TagKind::Int32, "readInt32");
    consumed();
    const uint8_t h = header_;
    if (h <= 0x7f) return h;
    if (h >= 0xe0) return static_cast<int8_t>(h);
    switch (h) {
    case 0xcc: return readBigEndian<uint8_t>();
    case 0xcd: return readBigEndian<uint16_t>();
    case 0xd0: return static_cast<int8_t>(readBigEndian<uint8_t>());
    case 0xd1: return static_cast<int16_t>(readBigEndian<uint16_t>());
    default:   return static_cast<int32_t>(readBigEndian<uint32_t>());
    }
}

int64_t StreamReader::readInt64() {
    if (state_ == State::Tagged && tag_ == TagKind::Int32)
        return readInt32();
    expect(TagKind::Int64, "readInt64");
    consumed();
    switch (header_) {
    case 0xce:
        return readBigEndian<uint32_t>();
    case 0xcf: {
        const uint64_t u = readBigEndian<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw ScalarConversionError(std::format(
                "Unsigned value {} at offset {} does not fit in int64", u, tagOffset_));
        return static_cast<int64_t>(u);
    }
    default:
        return static_cast<int64_t>(readBigEndian<uint64_t>());
    }
}

float StreamReader::readFloat32() {
    expect(TagKind::Float32, "readFloat32");
    consumed();
    const uint32_t bits = readBigEndian<uint32_t>();
    float f;
    std::memcpy(&f, &bits, sizeof f);
    return f;
}

double StreamReader::readFloat64() {
    if (state_ == State::Tagged && tag_ == TagKind::Float32)
        return readFloat32();
    expect(TagKind::Float64, "readFloat64");
    consumed();
    const uint64_t bits = readBigEndian<uint64_t>();
    double d;
    std::memcpy(&d, &bits, sizeof d);
    return d;
}

std::string StreamReader::readString() {
    expect(TagKind::String, "readString");
    consumed();
    std::string s;
    readChunked(s, length_);
    if (validateUtf8_ && !utf8::isValid(s))
        throw MalformedStreamError(std::format("Invalid UTF-8 in string at offset {}", tagOffset_));
    return s;
}

Binary StreamReader::readBinary() {
    expect(TagKind::Binary, "readBinary");
    consumed();
    Binary b;
    readChunked(b, length_);
    return b;
}

Value StreamReader::readScalar() {
    if (state_ != State::Tagged)
        throw std::logic_error("StreamReader::readScalar: no current tag");
    switch (tag_) {
    case TagKind::Nil:     consumed(); return Value();
    case TagKind::Boolean: return Value(readBoolean());
    case TagKind::Int32:   return Value(readInt32());
    case TagKind::Int64:   return Value(readInt64());
    case TagKind::Float32: return Value(readFloat32());
    case TagKind::Float64: return Value(readFloat64());
    case TagKind::String:  return Value(readString());
    case TagKind::Binary:  return Value(readBinary());
    default:
        throw std::logic_error(std::format("StreamReader::readScalar: {} is not a scalar", toString(tag_)));
    }
}

void StreamReader::skipValue() {
    if (state_ != State::Tagged) readTag();

    // Values still to skip after the current one; avoids recursion on deep input.
    uint64_t pending = 0;
    for (;;) {
        switch (tag_) {
        case TagKind::Nil:
        case TagKind::Boolean:
            break;
        case TagKind::Int32:
        case TagKind::Int64:
            if (header_ >= 0xcc && header_ <= 0xd3)
                discard(uint64_t{ 1 } << (header_ & 0x03));
            break;
        case TagKind::Float32: discard(4); break;
        case TagKind::Float64: discard(8); break;
        case TagKind::String:
        case TagKind::Binary:  discard(length_); break;
        case TagKind::ArrayHeader: pending += length_; break;
        case TagKind::MapHeader:   pending += 2 * length_; break;
        }
        consumed();
        if (pending == 0) return;
        --pending;
        readTag();
    }
}

}
