#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace takeout {

// Client state for a libarchive handle reading from an IReader. It has to
// outlive the handle: declare it before the owning unique_ptr.
struct ReaderBridge {
    explicit ReaderBridge(IReader& in, size_t buffer_size = 256 * 1024)
        : reader(&in), buffer(buffer_size) {}

    IReader* reader = nullptr;
    std::vector<std::uint8_t> buffer;
};

// Client state for a libarchive handle writing into an IWriter. `on_chunk`
// sees every block after it was written.
struct WriterBridge {
    explicit WriterBridge(IWriter& out) : writer(&out) {}

    IWriter* writer = nullptr;
    std::function<void(std::span<const std::uint8_t>)> on_chunk;
};

int OpenArchiveFromReader(struct archive* ar, ReaderBridge& bridge);
int OpenArchiveToWriter(struct archive* aw, WriterBridge& bridge);

std::string ArchiveErr(struct archive* ar);

} // namespace takeout
