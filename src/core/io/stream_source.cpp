#include "packgraph/core/io/stream_source.hpp"
#include "packgraph/core/util/error_types.hpp"
#include "packgraph/core/util/logger.hpp"
#include <fstream>

namespace packgraph {

size_t StreamSource::read(uint8_t* dst, size_t n) {
    if (!in_)
        throw IoError("StreamSource::read: source is closed");
    if (n == 0) return 0;
    in_->read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    const auto got = static_cast<size_t>(in_->gcount());
    if (in_->bad())
        throw IoError("StreamSource::read: I/O error on underlying stream");
    return got;
}

void StreamSource::close() {
    if (!in_) return;
    if (owned_) {
        owned_.reset();
    }
    else if (closeOnRelease_) {
        if (auto* f = dynamic_cast<std::ifstream*>(in_)) {
            f->close();
            LOG_TRACE("StreamSource: closed borrowed file stream");
        }
    }
    in_ = nullptr;
}

}
