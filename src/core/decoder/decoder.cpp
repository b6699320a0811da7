#include "packgraph/core/decoder/decoder.hpp"
#include "packgraph/core/interfaces/iswap.hpp"
#include "packgraph/core/util/error_types.hpp"
#include "packgraph/core/util/logger.hpp"
#include "internal/core/decoder/path_tracker.hpp"
#include <algorithm>
#include <format>

namespace packgraph {

namespace {

    // Upper bound for reserve() calls driven by wire lengths.
    constexpr uint64_t kReserveCap = 1024;

    std::string trimAscii(const std::string& s) {
        auto isWs = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; };
        auto b = std::find_if_not(s.begin(), s.end(), isWs);
        auto e = std::find_if_not(s.rbegin(), std::string::const_reverse_iterator(b), isWs).base();
        return std::string(b, e);
    }

    /**
     * @brief Run a resolver or transform hook, reporting foreign exceptions as @p Err.
     */
    template<typename Err, typename F>
    auto guarded(const char* what, F&& f) -> decltype(f()) {
        try {
            return f();
        }
        catch (const DecodeError&) {
            throw;
        }
        catch (const std::exception& ex) {
            throw Err(std::string(what) + " failed: " + ex.what());
        }
    }

    std::string valueSegment(const Value& key) {
        if (key.isString()) return "." + key.asString();
        return "[" + key.toDebugString() + "]";
    }

    // A materialized record fits a declared record type when it is that type or one listed in its dictionary.
    bool isRecordOf(const Record& rec, const TypeDescriptor& declared) {
        auto effectiveName = [](const TypeDescriptor& t) -> const std::string& {
            return t.typeName().empty() ? t.name() : t.typeName();
        };
        const TypeDescriptor& actual = *rec.type();
        if (&actual == &declared || effectiveName(actual) == effectiveName(declared)) return true;
        for (const auto& sub : declared.dictionary())
            if (sub && (sub.get() == &actual || effectiveName(*sub) == effectiveName(actual))) return true;
        return false;
    }

    bool isScalarClass(TypeClass c) {
        switch (c) {
        case TypeClass::Boolean:
        case TypeClass::Number:
        case TypeClass::Character:
        case TypeClass::CharSequence:
        case TypeClass::ByteArray:
            return true;
        default:
            return false;
        }
    }

}

struct Decoder::Impl {
    Impl(StreamReader& r, const ITypeResolver& res, const DecoderOptions& o)
        : reader(r), resolver(res), opts(o) {}

    StreamReader& reader;
    const ITypeResolver& resolver;
    DecoderOptions opts;
    PathTracker path;
    uint32_t depth{ 0 };

    /**
     * @brief Counts one level of aggregate nesting for its lifetime.
     */
    struct DepthGuard {
        explicit DepthGuard(Impl& impl) : d(impl) {
            if (d.depth >= d.opts.maxDepth) {
                LOG_WARN(std::format("Decoder: depth limit {} reached at {}", d.opts.maxDepth, d.path.str()));
                throw DepthExceededError(std::format("Depth too deep: nesting exceeds {}", d.opts.maxDepth));
            }
            ++d.depth;
        }
        ~DepthGuard() { --d.depth; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        Impl& d;
    };

    template<typename F>
    auto withContext(const TypeDescriptor& target, const FieldDescriptor* field, F&& f) -> decltype(f()) {
        try {
            return f();
        }
        catch (DecodeError& e) {
            if (!e.hasContext()) {
                std::string t = target.name();
                if (field) t += " (field '" + field->name + "')";
                e.attachContext(path.str(), t, reader.tagOffset());
            }
            throw;
        }
    }

    [[noreturn]] void mismatch(TagKind tag, const TypeDescriptor& target) const {
        throw TypeMismatchError(std::format("Cannot decode wire {} as '{}' ({})",
                                            toString(tag), target.name(), toString(resolver.classify(target))));
    }

    [[noreturn]] void mismatch(const Value& v, const TypeDescriptor& target) const {
        throw TypeMismatchError(std::format("Cannot convert {} to '{}' ({})",
                                            v.kindName(), target.name(), toString(resolver.classify(target))));
    }

    Value readNatural() {
        Value v = reader.readScalar();
        if (opts.trimStrings && v.isString())
            return Value(trimAscii(v.asString()));
        return v;
    }

    Value decode(const TypeRef& type, const Node* parent, const FieldDescriptor* field);
    Value dispatch(TagKind tag, const TypeDescriptor& eType, const TypeDescriptor& sType,
                   const IBuilderSwap* builder, const Node* parent);

    Value genericList(uint64_t n);
    MapPtr genericMap(uint64_t n);
    Value typedMap(uint64_t n, const TypeDescriptor& sType, const Node* parent);
    Value collection(uint64_t n, const TypeDescriptor& sType);
    Value fixedArray(uint64_t n, const TypeDescriptor& sType);
    Value byteArray(uint64_t n);
    void fillRecord(Record& rec, const TypeDescriptor& recType, uint64_t n);

    void assign(Record& rec, const TypeDescriptor& recType, const FieldDescriptor& fd, Value v, const Value& key);
    Value castIfTyped(const MapPtr& m, const TypeDescriptor& declared);
    RecordPtr mapToRecord(const Map& m, const TypeDescriptor& recType, const std::string& castKey = {});
    Value coerce(const Value& v, const TypeRef& type, const Node* parent);
};

/* ---- entry ---- */

Value Decoder::Impl::decode(const TypeRef& type, const Node* parent, const FieldDescriptor* field) {
    const TypeRef eType = type ? type : TypeDescriptor::any();
    const IBuilderSwap* builder = resolver.builderSwapFor(*eType);
    const IObjectSwap* swap = builder ? nullptr : resolver.swapFor(*eType);

    TypeRef sType = eType;
    if (builder) sType = builder->builderType();
    else if (swap) sType = swap->swapType();
    if (!sType) sType = TypeDescriptor::any();

    return withContext(*eType, field, [&]() -> Value {
        Value v;
        if (resolver.classify(*sType) == TypeClass::Optional) {
            Value inner = decode(resolver.elementType(*sType), parent, field);
            v = guarded<ConstructionError>("wrapOptional", [&] { return resolver.wrapOptional(*sType, std::move(inner)); });
        }
        else {
            const TagKind tag = reader.readTag();
            if (tag == TagKind::Nil)
                return Value();
            v = dispatch(tag, *eType, *sType, builder, parent);
        }

        if (swap && !v.isNil())
            v = guarded<ScalarConversionError>("unswap", [&] { return swap->unswap(std::move(v), *eType); });
        if (parent && !v.isNil())
            guarded<ConstructionError>("setParent", [&] { resolver.setParent(*eType, v, parent); });
        return v;
    });
}

Value Decoder::Impl::dispatch(TagKind tag, const TypeDescriptor& eType, const TypeDescriptor& sType,
                              const IBuilderSwap* builder, const Node* parent) {
    if (builder) {
        if (tag != TagKind::MapHeader) mismatch(tag, sType);
        const uint64_t n = reader.readLength();
        DepthGuard g(*this);
        RecordPtr rec = guarded<ConstructionError>("newBuilder", [&] { return builder->newBuilder(eType); });
        if (!rec)
            throw ConstructionError("Builder for '" + eType.name() + "' could not be created");
        fillRecord(*rec, sType, n);
        return guarded<ConstructionError>("build", [&] { return builder->build(rec, eType); });
    }

    const TypeClass cls = resolver.classify(sType);

    switch (tag) {
    case TagKind::ArrayHeader: {
        const uint64_t n = reader.readLength();
        switch (cls) {
        case TypeClass::Any:        return genericList(n);
        case TypeClass::Collection: return collection(n, sType);
        case TypeClass::Array:
        case TypeClass::Args:       return fixedArray(n, sType);
        case TypeClass::ByteArray:  return byteArray(n);
        default:                    break;
        }
        break;
    }
    case TagKind::MapHeader: {
        const uint64_t n = reader.readLength();
        switch (cls) {
        case TypeClass::Any:
            return castIfTyped(genericMap(n), sType);
        case TypeClass::Map:
            return typedMap(n, sType, parent);
        case TypeClass::Record: {
            DepthGuard g(*this);
            RecordPtr rec = guarded<ConstructionError>("constructRecord", [&] { return resolver.constructRecord(sType); });
            if (!rec)
                throw ConstructionError("Record type '" + sType.name() + "' could not be instantiated");
            fillRecord(*rec, sType, n);
            return Value(rec);
        }
        case TypeClass::Collection:
        case TypeClass::Array:
        case TypeClass::Args: {
            Value v = castIfTyped(genericMap(n), sType);
            if (v.isRecord()) return v;
            throw TypeMismatchError("Map without a resolvable type name cannot be decoded as '" + sType.name() + "'");
        }
        default:
            break;
        }
        break;
    }
    default:
        if (cls == TypeClass::Any)
            return readNatural();
        if (isScalarClass(cls)) {
            Value raw = readNatural();
            return guarded<ScalarConversionError>("convertScalar", [&] { return resolver.convertScalar(raw, sType); });
        }
        if (tag == TagKind::String && resolver.canConstructFromString(sType)) {
            Value raw = readNatural();
            return guarded<ConstructionError>("constructFromString",
                                              [&] { return resolver.constructFromString(sType, raw.asString()); });
        }
        break;
    }
    mismatch(tag, sType);
}

/* ---- aggregates ---- */

Value Decoder::Impl::genericList(uint64_t n) {
    DepthGuard g(*this);
    auto l = std::make_shared<List>();
    l->reserve(static_cast<size_t>(std::min(n, kReserveCap)));
    for (uint64_t i = 0; i < n; ++i) {
        auto s = path.index(static_cast<size_t>(i));
        l->push_back(decode(TypeDescriptor::any(), l.get(), nullptr));
    }
    return Value(l);
}

MapPtr Decoder::Impl::genericMap(uint64_t n) {
    DepthGuard g(*this);
    auto m = std::make_shared<Map>();
    for (uint64_t i = 0; i < n; ++i) {
        Value key = decode(TypeDescriptor::string(), nullptr, nullptr);
        auto s = path.segment(valueSegment(key));
        Value val = decode(TypeDescriptor::any(), m.get(), nullptr);
        m->put(std::move(key), std::move(val));
    }
    return m;
}

Value Decoder::Impl::typedMap(uint64_t n, const TypeDescriptor& sType, const Node* parent) {
    DepthGuard g(*this);
    MapPtr m = guarded<ConstructionError>("constructMap", [&] { return resolver.constructMap(sType); });
    if (!m) m = std::make_shared<Map>();
    const TypeRef kt = resolver.keyType(sType);
    const TypeRef vt = resolver.valueType(sType);
    for (uint64_t i = 0; i < n; ++i) {
        Value key = decode(kt, nullptr, nullptr);
        auto s = path.segment(valueSegment(key));
        Value val = decode(vt, m.get(), nullptr);
        if (vt)
            withContext(*vt, nullptr, [&] {
                guarded<ConstructionError>("setName", [&] { resolver.setName(*vt, val, key); });
            });
        m->put(std::move(key), std::move(val));
    }
    return Value(m);
}

Value Decoder::Impl::collection(uint64_t n, const TypeDescriptor& sType) {
    DepthGuard g(*this);
    ListPtr l = guarded<ConstructionError>("constructCollection", [&] { return resolver.constructCollection(sType); });
    if (!l) l = std::make_shared<List>();
    l->reserve(static_cast<size_t>(std::min(n, kReserveCap)));
    const TypeRef et = resolver.elementType(sType);
    for (uint64_t i = 0; i < n; ++i) {
        auto s = path.index(static_cast<size_t>(i));
        l->push_back(decode(et, l.get(), nullptr));
    }
    return Value(l);
}

Value Decoder::Impl::fixedArray(uint64_t n, const TypeDescriptor& sType) {
    DepthGuard g(*this);
    const bool args = resolver.classify(sType) == TypeClass::Args;
    ListPtr a = guarded<ConstructionError>("constructArray",
                                           [&] { return resolver.constructArray(sType, static_cast<size_t>(n)); });
    if (!a)
        throw ConstructionError("Array type '" + sType.name() + "' could not be instantiated");
    const TypeRef et = args ? nullptr : resolver.elementType(sType);
    for (uint64_t i = 0; i < n; ++i) {
        auto s = path.index(static_cast<size_t>(i));
        TypeRef t = et;
        if (args) {
            t = resolver.argType(sType, static_cast<size_t>(i));
            if (!t)
                withContext(sType, nullptr, [&] {
                    throw TypeMismatchError(std::format("'{}' takes {} arguments but the stream has {}", sType.name(), i, n));
                });
        }
        a->push_back(decode(t, a.get(), nullptr));
    }
    return Value(a);
}

Value Decoder::Impl::byteArray(uint64_t n) {
    DepthGuard g(*this);
    Binary out;
    out.reserve(static_cast<size_t>(std::min(n, kReserveCap)));
    for (uint64_t i = 0; i < n; ++i) {
        auto s = path.index(static_cast<size_t>(i));
        Value e = decode(TypeDescriptor::int32(), nullptr, nullptr);
        if (e.isNil())
            throw ScalarConversionError("Null element in byte array");
        const int32_t v = e.asInt32();
        if (v < -128 || v > 255)
            throw ScalarConversionError(std::format("Value {} does not fit in a byte", v));
        out.push_back(static_cast<uint8_t>(v));
    }
    return Value(std::move(out));
}

/* ---- records ---- */

void Decoder::Impl::assign(Record& rec, const TypeDescriptor& recType, const FieldDescriptor& fd, Value v, const Value& key) {
    if (fd.type)
        guarded<ConstructionError>("setName", [&] { resolver.setName(*fd.type, v, key); });
    try {
        resolver.setField(rec, fd, std::move(v));
    }
    catch (const DecodeError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw FieldAssignmentError(std::format("Field '{}' of '{}' rejected value: {}", fd.name, recType.name(), ex.what()));
    }
}

void Decoder::Impl::fillRecord(Record& rec, const TypeDescriptor& recType, uint64_t n) {
    const std::string disc = resolver.reservedDiscriminatorName(recType);
    for (uint64_t i = 0; i < n; ++i) {
        Value key = decode(TypeDescriptor::string(), nullptr, nullptr);
        if (!key.isString())
            throw TypeMismatchError(std::format("Property name of '{}' decoded as {}", recType.name(), key.kindName()));
        const std::string& name = key.asString();
        auto s = path.field(name);

        const FieldDescriptor* fd = resolver.fieldDescriptor(recType, name);
        if (!fd) {
            if (name == disc) {
                LOG_TRACE(std::format("Decoder: skipping discriminator '{}' at {}", name, path.str()));
                withContext(recType, nullptr, [&] { reader.skipValue(); });
                continue;
            }
            Value raw = decode(TypeDescriptor::any(), &rec, nullptr);
            LOG_DEBUG(std::format("Decoder: unknown property '{}' on '{}' at {}", name, recType.name(), path.str()));
            withContext(recType, nullptr, [&] {
                guarded<FieldAssignmentError>("onUnknownProperty", [&] { resolver.onUnknownProperty(rec, name, raw); });
            });
            continue;
        }
        Value v = decode(fd->type, &rec, fd);
        withContext(recType, fd, [&] { assign(rec, recType, *fd, std::move(v), key); });
    }
}

/* ---- casting generic maps to typed values ---- */

Value Decoder::Impl::castIfTyped(const MapPtr& m, const TypeDescriptor& declared) {
    const std::string disc = resolver.reservedDiscriminatorName(declared);
    const Value* tv = m->find(std::string_view(disc));
    if (!tv || !tv->isString())
        return Value(m);

    TypeRef t = resolver.resolveTypeName(tv->asString(), declared);
    if (!t) {
        LOG_DEBUG(std::format("Decoder: type name '{}' at {} is not in the dictionary", tv->asString(), path.str()));
        return Value(m);
    }
    if (resolver.classify(*t) != TypeClass::Record) {
        LOG_DEBUG(std::format("Decoder: type name '{}' does not name a record type", tv->asString()));
        return Value(m);
    }
    return withContext(*t, nullptr, [&] { return Value(mapToRecord(*m, *t, disc)); });
}

// castKey is the discriminator the map was resolved through; it is consumed like the record's own.
RecordPtr Decoder::Impl::mapToRecord(const Map& m, const TypeDescriptor& recType, const std::string& castKey) {
    RecordPtr rec = guarded<ConstructionError>("constructRecord", [&] { return resolver.constructRecord(recType); });
    if (!rec)
        throw ConstructionError("Record type '" + recType.name() + "' could not be instantiated");

    const std::string disc = resolver.reservedDiscriminatorName(recType);
    for (const auto& [key, val] : m) {
        if (!key.isString())
            throw TypeMismatchError(std::format("Property name of '{}' is {}", recType.name(), key.kindName()));
        const std::string& name = key.asString();
        auto s = path.field(name);
        const FieldDescriptor* fd = resolver.fieldDescriptor(recType, name);
        if (!fd) {
            if (name != disc && name != castKey)
                withContext(recType, nullptr, [&] {
                    guarded<FieldAssignmentError>("onUnknownProperty",
                                                  [&] { resolver.onUnknownProperty(*rec, name, val); });
                });
            continue;
        }
        withContext(recType, fd, [&] {
            Value v = coerce(val, fd->type, rec.get());
            assign(*rec, recType, *fd, std::move(v), key);
        });
    }
    return rec;
}

Value Decoder::Impl::coerce(const Value& v, const TypeRef& type, const Node* parent) {
    const TypeRef t = type ? type : TypeDescriptor::any();
    if (v.isNil()) return Value();

    const IObjectSwap* swap = resolver.swapFor(*t);
    TypeRef sType = swap && swap->swapType() ? swap->swapType() : t;

    Value out;
    switch (resolver.classify(*sType)) {
    case TypeClass::Any:
        out = v;
        break;
    case TypeClass::Boolean:
    case TypeClass::Number:
    case TypeClass::Character:
    case TypeClass::CharSequence:
    case TypeClass::ByteArray:
        if (v.isAggregate()) mismatch(v, *sType);
        out = guarded<ScalarConversionError>("convertScalar", [&] { return resolver.convertScalar(v, *sType); });
        break;
    case TypeClass::Map: {
        if (!v.isMap()) mismatch(v, *sType);
        MapPtr m = guarded<ConstructionError>("constructMap", [&] { return resolver.constructMap(*sType); });
        if (!m) m = std::make_shared<Map>();
        const TypeRef kt = resolver.keyType(*sType);
        const TypeRef vt = resolver.valueType(*sType);
        for (const auto& [k, val] : v.asMap()) {
            auto s = path.segment(valueSegment(k));
            Value ck = coerce(k, kt, nullptr);
            Value cv = coerce(val, vt, m.get());
            if (vt)
                withContext(*vt, nullptr, [&] {
                    guarded<ConstructionError>("setName", [&] { resolver.setName(*vt, cv, ck); });
                });
            m->put(std::move(ck), std::move(cv));
        }
        out = Value(m);
        break;
    }
    case TypeClass::Collection: {
        if (!v.isList()) mismatch(v, *sType);
        ListPtr l = guarded<ConstructionError>("constructCollection", [&] { return resolver.constructCollection(*sType); });
        if (!l) l = std::make_shared<List>();
        const TypeRef et = resolver.elementType(*sType);
        size_t i = 0;
        for (const auto& e : v.asList()) {
            auto s = path.index(i++);
            l->push_back(coerce(e, et, l.get()));
        }
        out = Value(l);
        break;
    }
    case TypeClass::Array:
    case TypeClass::Args: {
        if (!v.isList()) mismatch(v, *sType);
        const bool args = resolver.classify(*sType) == TypeClass::Args;
        const List& src = v.asList();
        ListPtr a = guarded<ConstructionError>("constructArray", [&] { return resolver.constructArray(*sType, src.size()); });
        if (!a)
            throw ConstructionError("Array type '" + sType->name() + "' could not be instantiated");
        for (size_t i = 0; i < src.size(); ++i) {
            auto s = path.index(i);
            TypeRef et = args ? resolver.argType(*sType, i) : resolver.elementType(*sType);
            if (args && !et)
                throw TypeMismatchError(std::format("'{}' takes {} arguments but got {}", sType->name(), i, src.size()));
            a->push_back(coerce(src[i], et, a.get()));
        }
        out = Value(a);
        break;
    }
    case TypeClass::Record: {
        if (v.isRecord()) {
            if (!isRecordOf(v.asRecord(), *sType)) mismatch(v, *sType);
            out = v;
        }
        else if (v.isMap()) {
            const MapPtr& m = v.mapPtr();
            Value cast = castIfTyped(m, *sType);
            out = cast.isRecord() ? cast : Value(mapToRecord(*m, *sType));
        }
        else if (v.isString() && resolver.canConstructFromString(*sType)) {
            out = guarded<ConstructionError>("constructFromString",
                                             [&] { return resolver.constructFromString(*sType, v.asString()); });
        }
        else {
            mismatch(v, *sType);
        }
        break;
    }
    case TypeClass::StringConstructible:
        if (!v.isString()) mismatch(v, *sType);
        out = guarded<ConstructionError>("constructFromString",
                                         [&] { return resolver.constructFromString(*sType, v.asString()); });
        break;
    case TypeClass::Optional: {
        Value inner = coerce(v, resolver.elementType(*sType), parent);
        out = guarded<ConstructionError>("wrapOptional", [&] { return resolver.wrapOptional(*sType, std::move(inner)); });
        break;
    }
    }

    if (swap && !out.isNil())
        out = guarded<ScalarConversionError>("unswap", [&] { return swap->unswap(std::move(out), *t); });
    if (parent && !out.isNil())
        guarded<ConstructionError>("setParent", [&] { resolver.setParent(*t, out, parent); });
    return out;
}

/* ---- Decoder ---- */

Decoder::Decoder(StreamReader& reader, const ITypeResolver& resolver, const DecoderOptions& options)
    : pImpl_(std::make_unique<Impl>(reader, resolver, options)) {}

Decoder::~Decoder() = default;

Value Decoder::decode(const TypeRef& type, const Node* parent, const FieldDescriptor* field) {
    return pImpl_->decode(type, parent, field);
}

void Decoder::decodeInto(Map& target, const TypeRef& keyType, const TypeRef& valueType) {
    Impl& d = *pImpl_;
    const TypeRef kt = keyType ? keyType : TypeDescriptor::string();
    const TypeRef vt = valueType ? valueType : TypeDescriptor::any();
    const TypeRef shape = TypeDescriptor::mapOf(kt, vt, target.order());

    d.withContext(*shape, nullptr, [&] {
        const TagKind tag = d.reader.readTag();
        if (tag == TagKind::Nil) return;
        if (tag != TagKind::MapHeader) d.mismatch(tag, *shape);
        const uint64_t n = d.reader.readLength();
        Impl::DepthGuard g(d);
        for (uint64_t i = 0; i < n; ++i) {
            Value key = d.decode(kt, nullptr, nullptr);
            auto s = d.path.segment(valueSegment(key));
            Value val = d.decode(vt, &target, nullptr);
            d.withContext(*vt, nullptr, [&] {
                guarded<ConstructionError>("setName", [&] { d.resolver.setName(*vt, val, key); });
            });
            target.put(std::move(key), std::move(val));
        }
    });
}

void Decoder::decodeInto(List& target, const TypeRef& elementType) {
    Impl& d = *pImpl_;
    const TypeRef et = elementType ? elementType : TypeDescriptor::any();
    const TypeRef shape = TypeDescriptor::listOf(et);

    d.withContext(*shape, nullptr, [&] {
        const TagKind tag = d.reader.readTag();
        if (tag == TagKind::Nil) return;
        if (tag != TagKind::ArrayHeader) d.mismatch(tag, *shape);
        const uint64_t n = d.reader.readLength();
        Impl::DepthGuard g(d);
        for (uint64_t i = 0; i < n; ++i) {
            auto s = d.path.index(target.size());
            target.push_back(d.decode(et, &target, nullptr));
        }
    });
}

std::string Decoder::currentPath() const {
    return pImpl_->path.str();
}

}
