#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace takeout {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(64 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    if (!source_) {
        throw std::invalid_argument("GzipReader: null source");
    }
    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (finished_) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0 && !drained_source_) {
            const ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return -1;
            if (n == 0) {
                drained_source_ = true;
            } else {
                strm_.avail_in = static_cast<uInt>(n);
                strm_.next_in = in_buffer_.data();
            }
        }

        if (strm_.avail_in == 0 && drained_source_) {
            // Clean end only on a member boundary; anything else is truncation.
            if (member_done_) finished_ = true;
            break;
        }

        if (member_done_) {
            // Another member follows, unless the rest is padding.
            if (strm_.next_in[0] != 0x1f) {
                finished_ = true;
                break;
            }
            if (inflateReset(&strm_) != Z_OK) return -1;
            member_done_ = false;
        }

        const int ret = inflate(&strm_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            member_done_ = true;
            continue;
        }

        // Z_BUF_ERROR is not fatal; it just means we need more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }
    }

    const size_t produced = out.size() - strm_.avail_out;
    if (produced == 0 && !finished_) {
        return -1;
    }
    return static_cast<ssize_t>(produced);
}

} // namespace takeout
