#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace takeout {

Result TempFile::CreateIn(const std::string& dir, const std::string& prefix, TempFile& out) {
    out.Cleanup();

    std::string tmpl = (dir.empty() ? std::string(".") : dir) + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return Result::Fail(errno,
                            "mkstemp failed in " + dir + ": " + std::string(std::strerror(errno)));
    }
    // mkstemp creates 0600; the artifact should look like any other user file.
    const mode_t mask = ::umask(0);
    ::umask(mask);
    (void)::fchmod(fd, 0666 & ~mask);

    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

Result TempFile::CommitTo(const std::string& final_path) {
    if (path_.empty())
        return Result::Fail(-1, "temporary file already committed or never created");

    if (fd_.Valid()) {
        auto synced = fd_.Sync();
        if (!synced.ok) {
            synced.msg = path_ + ": " + synced.msg;
            return synced;
        }
        fd_.Close();
    }

    if (std::rename(path_.c_str(), final_path.c_str()) != 0) {
        return Result::Fail(errno,
                            "rename " + path_ + " -> " + final_path + ": " + std::strerror(errno));
    }
    path_.clear();
    return Result::Ok();
}

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace takeout
