/**
 * @file ibyte_source.hpp
 * @brief Interface for the byte sources a StreamReader pulls from.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstddef>
#include <cstdint>

namespace packgraph {

    /**
     * @class IByteSource
     * @brief Sequential, non-seekable source of bytes.
     */
    class IByteSource {
    public:
        virtual ~IByteSource() = default;

        /**
         * @brief Read up to @p n bytes into @p dst.
         * @return Number of bytes read; fewer than @p n only at end of input
         * @throws IoError if the underlying source fails
         */
        virtual size_t read(uint8_t* dst, size_t n) = 0;

        /**
         * @brief Release the underlying resource. Idempotent.
         */
        virtual void close() = 0;

        virtual bool closed() const = 0;
    };

}
