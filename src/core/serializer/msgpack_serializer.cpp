#include "packgraph/core/serializer/msgpack_serializer.hpp"
#include "packgraph/core/interfaces/iswap.hpp"
#include "packgraph/core/types/type_descriptor.hpp"
#include "packgraph/core/util/utf8.hpp"
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace packgraph {

    //------------------------------------------------------------------------------
    // Safe narrowing conversion: size_t → uint32_t
    // Returns false if src > UINT32_MAX
    template<typename S>
    [[nodiscard]] static bool safe_u32(S src, uint32_t& dst) noexcept {
        if constexpr (std::is_unsigned_v<S>) {
            if (src > std::numeric_limits<uint32_t>::max()) return false;
        }
        else {
            if (src < 0 || static_cast<uint64_t>(src) > std::numeric_limits<uint32_t>::max()) return false;
        }
        dst = static_cast<uint32_t>(src);
        return true;
    }
    //------------------------------------------------------------------------------

    static uint32_t checkedLength(size_t n, const char* what) {
        uint32_t len32;
        if (!safe_u32(n, len32))
            throw std::overflow_error(std::string("MsgPackSerializer: ") + what + " exceeds 2^32 - 1");
        return len32;
    }

    static void packString(msgpack::packer<msgpack::sbuffer>& pk, const std::string& s) {
        const uint32_t len32 = checkedLength(s.size(), "string length");
        pk.pack_str(len32);
        pk.pack_str_body(s.data(), len32);
    }

    std::vector<uint8_t> MsgPackSerializer::serialize(const Value& value, const TypeRef& declared) const {
        msgpack::sbuffer buf;
        serialize(buf, value, declared);
        return { buf.data(), buf.data() + buf.size() };
    }

    void MsgPackSerializer::serialize(msgpack::sbuffer& out, const Value& value, const TypeRef& declared) const {
        msgpack::packer<msgpack::sbuffer> pk(&out);
        write(pk, value, declared);
    }

    void MsgPackSerializer::write(msgpack::packer<msgpack::sbuffer>& pk, const Value& in, const TypeRef& declared) const {
        Value value = in;
        TypeRef type = declared;
        // Same order as the decoder: the declared swap first, then one Optional level at a time.
        while (type) {
            if (type->swap() && !value.isNil()) {
                const auto swap = type->swap();
                value = swap->swap(value);
                type = swap->swapType();
            }
            if (!type || type->typeClass() != TypeClass::Optional)
                break;
            type = type->elementType();
        }

        switch (value.kind()) {
        case ValueKind::Nil:
            pk.pack_nil();
            break;
        case ValueKind::Boolean:
            if (value.asBool()) pk.pack_true(); else pk.pack_false();
            break;
        case ValueKind::Int32: {
            const int32_t v = value.asInt32();
            // uint32 would decode as Int64
            if (v > 0xffff) pk.pack_fix_int32(v);
            else pk.pack_int32(v);
            break;
        }
        case ValueKind::Int64: {
            const int64_t v = value.asInt64();
            if (v >= 0 && v <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
                pk.pack_fix_uint32(static_cast<uint32_t>(v));
            else
                pk.pack_fix_int64(v);
            break;
        }
        case ValueKind::Float32:
            pk.pack_float(value.asFloat());
            break;
        case ValueKind::Float64:
            pk.pack_double(value.asDouble());
            break;
        case ValueKind::Character:
            packString(pk, utf8::encode(value.asChar()));
            break;
        case ValueKind::String:
            packString(pk, value.asString());
            break;
        case ValueKind::Binary: {
            const Binary& b = value.asBinary();
            const uint32_t len32 = checkedLength(b.size(), "binary length");
            pk.pack_bin(len32);
            pk.pack_bin_body(reinterpret_cast<const char*>(b.data()), len32);
            break;
        }
        case ValueKind::List: {
            const List& l = value.asList();
            pk.pack_array(checkedLength(l.size(), "array length"));
            const bool args = type && type->typeClass() == TypeClass::Args;
            for (size_t i = 0; i < l.size(); ++i) {
                TypeRef et;
                if (args) et = i < type->argTypes().size() ? type->argTypes()[i] : nullptr;
                else if (type) et = type->elementType();
                write(pk, l[i], et);
            }
            break;
        }
        case ValueKind::Map: {
            const Map& m = value.asMap();
            pk.pack_map(checkedLength(m.size(), "map size"));
            const TypeRef kt = type ? type->keyType() : nullptr;
            const TypeRef vt = type ? type->valueType() : nullptr;
            for (const auto& [k, v] : m) {
                write(pk, k, kt);
                write(pk, v, vt);
            }
            break;
        }
        case ValueKind::Record:
            writeRecord(pk, value.asRecord());
            break;
        case ValueKind::Object:
            throw std::invalid_argument("MsgPackSerializer: object value of declared type '" + describe(declared) +
                                        "' has no swap");
        }
    }

    void MsgPackSerializer::writeRecord(msgpack::packer<msgpack::sbuffer>& pk, const Record& rec) const {
        const TypeDescriptor& t = *rec.type();
        const bool withType = options_.addTypeProperty && !t.typeName().empty();

        size_t count = withType ? 1 : 0;
        for (size_t i = 0; i < rec.fieldCount(); ++i)
            if (rec.isSet(i)) ++count;
        pk.pack_map(checkedLength(count, "record size"));

        if (withType) {
            packString(pk, t.typeProperty() ? *t.typeProperty() : options_.typePropertyName);
            packString(pk, t.typeName());
        }
        const auto& fields = t.fields();
        for (size_t i = 0; i < rec.fieldCount(); ++i) {
            if (!rec.isSet(i)) continue;
            packString(pk, fields[i].name);
            write(pk, rec.at(i), fields[i].type);
        }
    }

}
