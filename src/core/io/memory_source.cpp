#include "packgraph/core/io/memory_source.hpp"
#include "packgraph/core/util/error_types.hpp"
#include <algorithm>
#include <cstring>

namespace packgraph {

size_t MemorySource::read(uint8_t* dst, size_t n) {
    if (closed_)
        throw IoError("MemorySource::read: source is closed");
    const size_t take = std::min(n, size_ - pos_);
    if (take) std::memcpy(dst, data_ + pos_, take);
    pos_ += take;
    return take;
}

void MemorySource::close() {
    if (closed_) return;
    closed_ = true;
    owned_.clear();
    owned_.shrink_to_fit();
    data_ = nullptr;
}

}
