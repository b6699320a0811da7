#pragma once
#include "packgraph/core/interfaces/ibyte_source.hpp"
#include <vector>

namespace packgraph {

    /**
     * @class MemorySource
     * @brief Byte source over an in-memory buffer, borrowed or owned.
     */
    class MemorySource : public IByteSource {
    public:
        /**
         * @brief Borrow @p size bytes at @p data; the buffer must outlive the source.
         */
        MemorySource(const uint8_t* data, size_t size) : data_(data), size_(size) {}

        /**
         * @brief Borrow the contents of @p data.
         */
        explicit MemorySource(const std::vector<uint8_t>& data) : MemorySource(data.data(), data.size()) {}

        /**
         * @brief Take ownership of @p data.
         */
        explicit MemorySource(std::vector<uint8_t>&& data)
            : owned_(std::move(data)), data_(owned_.data()), size_(owned_.size()) {}

        MemorySource(const MemorySource&) = delete;
        MemorySource& operator=(const MemorySource&) = delete;

        size_t read(uint8_t* dst, size_t n) override;
        void close() override;
        bool closed() const override { return closed_; }

        size_t remaining() const { return closed_ ? 0 : size_ - pos_; }

    private:
        std::vector<uint8_t> owned_;
        const uint8_t* data_;
        size_t size_;
        size_t pos_{ 0 };
        bool closed_{ false };
    };

}
