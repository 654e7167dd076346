#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/stat.h>

namespace takeout {

// Owning file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added, retried on EINTR.
    static Result Open(const std::string& path, int flags, Fd& out);

    int Get() const;
    bool Valid() const;

    Result Stat(struct stat& st) const;
    Result Sync() const;

    void Reset(int fd);
    void Close();

    // Gives up ownership without closing.
    int Release();

  private:
    int fd_{-1};
};

} // namespace takeout
