#pragma once
#include <cstdint>
#include <cstring>
#ifdef _WIN32
#include <intrin.h>
#else
#include <endian.h>
#endif

namespace packgraph {
    /**
     * @brief Converts a 16-bit integer from network byte order (big endian) to host byte order.
     * @param value The value to convert.
     * @return The value in host byte order.
     */
    inline uint16_t networkToHost16(uint16_t value) {
#ifdef _WIN32
        return _byteswap_ushort(value);
#else
        return be16toh(value);
#endif
    }

    /**
     * @brief Converts a 32-bit integer from network byte order (big endian) to host byte order.
     * @param value The value to convert.
     * @return The value in host byte order.
     */
    inline uint32_t networkToHost32(uint32_t value) {
#ifdef _WIN32
        return _byteswap_ulong(value);
#else
        return be32toh(value);
#endif
    }

    /**
     * @brief Converts a 64-bit integer from network byte order (big endian) to host byte order.
     * @param value The value to convert.
     * @return The value in host byte order.
     */
    inline uint64_t networkToHost64(uint64_t value) {
#ifdef _WIN32
        return _byteswap_uint64(value);
#else
        return be64toh(value);
#endif
    }

    /**
     * @brief Load a big-endian unsigned integer of width T from a byte buffer.
     */
    template<typename T>
    inline T loadBigEndian(const uint8_t* p) {
        T raw;
        std::memcpy(&raw, p, sizeof(T));
        if constexpr (sizeof(T) == 1) return raw;
        else if constexpr (sizeof(T) == 2) return static_cast<T>(networkToHost16(static_cast<uint16_t>(raw)));
        else if constexpr (sizeof(T) == 4) return static_cast<T>(networkToHost32(static_cast<uint32_t>(raw)));
        else return static_cast<T>(networkToHost64(static_cast<uint64_t>(raw)));
    }
}
