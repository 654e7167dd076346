#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace takeout {

// Sequential reader over a regular file. Position() is the number of bytes
// handed out so far, which callers use as "compressed bytes consumed".
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    ssize_t Read(std::span<std::uint8_t> out) override;

    std::uint64_t Position() const { return position_; }
    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    std::uint64_t position_ = 0;
};

} // namespace takeout
