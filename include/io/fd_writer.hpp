#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>

namespace takeout {

// Writes to a descriptor owned elsewhere (typically a TempFile).
class FdWriter final : public IWriter {
  public:
    explicit FdWriter(int fd) : fd_(fd) {}

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    std::uint64_t BytesWritten() const { return written_; }

  private:
    int fd_ = -1;
    std::uint64_t written_ = 0;
};

} // namespace takeout
