#include "io/file_reader.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace takeout {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);
    out.size_.reset();
    out.position_ = 0;

    auto res = Fd::Open(out.path_, O_RDONLY, out.fd_);
    if (!res.ok) {
        res.msg = "Failed to open input: " + res.msg;
        return res;
    }

    struct stat st{};
    if (auto sr = out.fd_.Stat(st); !sr.ok) {
        out.fd_.Close();
        return sr;
    }
    if (S_ISDIR(st.st_mode)) {
        out.fd_.Close();
        return Result::Fail(EISDIR, "Failed to open input: " + out.path_ + " is a directory");
    }
    if (S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    }
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    ssize_t n;
    do {
        n = ::read(fd_.Get(), out.data(), out.size());
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        position_ += static_cast<std::uint64_t>(n);
    }
    return n;
}

} // namespace takeout
