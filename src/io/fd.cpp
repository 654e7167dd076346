#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace takeout {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::Open(const std::string& path, int flags, Fd& out) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return Result::Fail(errno, "cannot open " + path + " (" + std::strerror(errno) + ")");
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

Result Fd::Stat(struct stat& st) const {
    if (::fstat(fd_, &st) != 0) {
        return Result::Fail(errno, std::string("fstat failed (") + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result Fd::Sync() const {
    if (::fsync(fd_) != 0) {
        return Result::Fail(errno, std::string("fsync failed (") + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

void Fd::Reset(int fd) {
    if (fd_ >= 0 && fd_ != fd) {
        ::close(fd_);
    }
    fd_ = fd;
}

void Fd::Close() { Reset(-1); }

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

} // namespace takeout
