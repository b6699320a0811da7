#include "packgraph/core/parser/msgpack_parser.hpp"
#include "packgraph/core/decoder/decoder.hpp"
#include "packgraph/core/io/memory_source.hpp"
#include "packgraph/core/io/stream_reader.hpp"
#include "packgraph/core/io/stream_source.hpp"
#include "packgraph/core/types/type_descriptor.hpp"
#include "packgraph/core/util/logger.hpp"
#include <format>
#include <fstream>

namespace packgraph {

namespace {

    /**
     * @brief Run @p body against a fresh reader/decoder pair over @p source.
     *
     * The reader owns the source and closes it when it goes out of scope,
     * whether @p body returns or throws.
     */
    template<typename F>
    auto runSession(std::unique_ptr<IByteSource> source, const ITypeResolver& resolver,
                    const DecoderOptions& options, F&& body) {
        StreamReader reader(std::move(source), options.validateUtf8);
        Decoder decoder(reader, resolver, options);
        auto result = body(decoder);

        if (options.strict && !reader.atEnd()) {
            LOG_WARN(std::format("MsgPackParser: trailing bytes after top-level value at offset {}", reader.position()));
            MalformedStreamError err(std::format("Trailing bytes after top-level value at offset {}", reader.position()));
            err.attachContext("$", "", reader.position());
            throw err;
        }
        return result;
    }

    ParseResult failureOf(const DecodeError& e) {
        LOG_WARN(std::format("MsgPackParser: {} at {}: {}", toString(e.code()), e.failure().path, e.what()));
        ParseResult r;
        r.error = e.failure();
        return r;
    }

}

MsgPackParser::MsgPackParser(const ITypeResolver& resolver, DecoderOptions options)
    : resolver_(resolver), options_(options) {}

Value MsgPackParser::parse(std::unique_ptr<IByteSource> source, const TypeRef& type) const {
    if (!source)
        throw std::invalid_argument("MsgPackParser::parse: null byte source");
    return runSession(std::move(source), resolver_, options_,
                      [&](Decoder& d) { return d.decode(type); });
}

Value MsgPackParser::parse(const std::vector<uint8_t>& bytes, const TypeRef& type) const {
    return parse(std::make_unique<MemorySource>(bytes), type);
}

Value MsgPackParser::parse(std::istream& in, const TypeRef& type) const {
    return parse(std::make_unique<StreamSource>(in), type);
}

Value MsgPackParser::parseFile(const std::string& path, const TypeRef& type) const {
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!in->is_open())
        throw IoError("Cannot open '" + path + "'");
    LOG_DEBUG("MsgPackParser: parsing " + path);
    return parse(std::make_unique<StreamSource>(std::move(in)), type);
}

ParseResult MsgPackParser::tryParse(const std::vector<uint8_t>& bytes, const TypeRef& type) const {
    try {
        return ParseResult{ parse(bytes, type), std::nullopt };
    }
    catch (const DecodeError& e) {
        return failureOf(e);
    }
}

ParseResult MsgPackParser::tryParse(std::istream& in, const TypeRef& type) const {
    try {
        return ParseResult{ parse(in, type), std::nullopt };
    }
    catch (const DecodeError& e) {
        return failureOf(e);
    }
}

void MsgPackParser::parseIntoMap(const std::vector<uint8_t>& bytes, Map& target,
                                 const TypeRef& keyType, const TypeRef& valueType) const {
    // Decode into a scratch map so a failure leaves target untouched.
    Map scratch(target.order());
    runSession(std::make_unique<MemorySource>(bytes), resolver_, options_, [&](Decoder& d) {
        d.decodeInto(scratch, keyType, valueType);
        return true;
    });

    const TypeRef vt = valueType ? valueType : TypeDescriptor::any();
    for (const auto& [k, v] : scratch) {
        Value value = v;
        if (!value.isNil()) resolver_.setParent(*vt, value, &target);
        target.put(k, std::move(value));
    }
}

void MsgPackParser::parseIntoCollection(const std::vector<uint8_t>& bytes, List& target,
                                        const TypeRef& elementType) const {
    List scratch;
    runSession(std::make_unique<MemorySource>(bytes), resolver_, options_, [&](Decoder& d) {
        d.decodeInto(scratch, elementType);
        return true;
    });

    const TypeRef et = elementType ? elementType : TypeDescriptor::any();
    target.reserve(target.size() + scratch.size());
    for (auto& v : scratch) {
        if (!v.isNil()) resolver_.setParent(*et, v, &target);
        target.push_back(std::move(v));
    }
}

ListPtr MsgPackParser::parseArgs(const std::vector<uint8_t>& bytes, const std::vector<TypeRef>& argTypes) const {
    Value v = parse(bytes, TypeDescriptor::tupleOf(argTypes));
    if (v.isNil()) return nullptr;
    return v.listPtr();
}

}
