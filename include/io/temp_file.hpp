#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace takeout {

// A file created next to its final destination. It is unlinked on destruction
// unless CommitTo() renamed it into place.
class TempFile {
public:
    // Creates `<dir>/<prefix>XXXXXX` with mkstemp.
    static Result CreateIn(const std::string& dir, const std::string& prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    void Close();

    // fsync, close and rename over `final_path` (atomic within one filesystem).
    Result CommitTo(const std::string& final_path);

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace takeout
