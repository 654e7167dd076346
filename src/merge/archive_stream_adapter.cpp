#include "merge/archive_stream_adapter.hpp"

#include "system/signals.hpp"

#include <cerrno>

namespace takeout {

namespace {

la_ssize_t ReadCb(struct archive* a, void* client_data, const void** out_buf) {
    if (CancelRequested()) {
        archive_set_error(a, EINTR, "interrupted");
        return -1;
    }

    auto* bridge = static_cast<ReaderBridge*>(client_data);
    const ssize_t n = bridge->reader->Read(
        std::span<std::uint8_t>(bridge->buffer.data(), bridge->buffer.size()));
    if (n < 0) {
        archive_set_error(a, EIO, "corrupt or truncated input stream");
        return -1;
    }

    *out_buf = bridge->buffer.data();
    return static_cast<la_ssize_t>(n);
}

la_ssize_t WriteCb(struct archive* a, void* client_data, const void* buff, size_t length) {
    if (CancelRequested()) {
        archive_set_error(a, EINTR, "interrupted");
        return -1;
    }

    auto* bridge = static_cast<WriterBridge*>(client_data);
    const auto chunk = std::span<const std::uint8_t>(static_cast<const std::uint8_t*>(buff), length);
    auto res = bridge->writer->WriteAll(chunk);
    if (!res.is_ok()) {
        archive_set_error(a, res.err > 0 ? res.err : EIO, "%s", res.msg.c_str());
        return -1;
    }
    if (bridge->on_chunk) {
        bridge->on_chunk(chunk);
    }
    return static_cast<la_ssize_t>(length);
}

} // namespace

int OpenArchiveFromReader(struct archive* ar, ReaderBridge& bridge) {
    return archive_read_open(ar, &bridge, nullptr, ReadCb, nullptr);
}

int OpenArchiveToWriter(struct archive* aw, WriterBridge& bridge) {
    return archive_write_open(aw, &bridge, nullptr, WriteCb, nullptr);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace takeout
