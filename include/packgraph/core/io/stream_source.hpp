#pragma once
#include "packgraph/core/interfaces/ibyte_source.hpp"
#include <istream>
#include <memory>

namespace packgraph {

    /**
     * @class StreamSource
     * @brief Byte source over a std::istream.
     *
     * A borrowed stream is left open on close() unless closeOnRelease is set,
     * in which case file streams are closed. An owned stream is destroyed.
     */
    class StreamSource : public IByteSource {
    public:
        explicit StreamSource(std::istream& in, bool closeOnRelease = false)
            : in_(&in), closeOnRelease_(closeOnRelease) {}

        explicit StreamSource(std::unique_ptr<std::istream> in)
            : owned_(std::move(in)), in_(owned_.get()) {}

        StreamSource(const StreamSource&) = delete;
        StreamSource& operator=(const StreamSource&) = delete;

        size_t read(uint8_t* dst, size_t n) override;
        void close() override;
        bool closed() const override { return in_ == nullptr; }

    private:
        std::unique_ptr<std::istream> owned_;
        std::istream* in_;
        bool closeOnRelease_{ false };
    };

}
