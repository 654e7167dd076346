#include "merge/work_directory.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace takeout {

Result WorkDirectory::Create(const std::string& root, WorkDirectory& out) {
    out.Cleanup();

    const fs::path requested = root.empty() ? fs::path(".") : fs::path(root);
    std::error_code ec;
    fs::create_directories(requested, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create " + requested.string() + ": " + ec.message());
    }
    // Extraction unlinks symlinks found inside target paths, so no component
    // of the scratch path may be one.
    const fs::path base = fs::canonical(requested, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot resolve " + requested.string() + ": " + ec.message());
    }

    std::string tmpl = (base / (std::string(kPrefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) {
        return Result::Fail(errno, "mkdtemp failed in " + base.string() + ": " + std::strerror(errno));
    }
    out.dir_ = created;

    fs::create_directory(out.MergedDir(), ec);
    if (ec) {
        const Result res = Result::Fail(ec.value(), "cannot create " + out.MergedDir() + ": " + ec.message());
        out.Cleanup();
        return res;
    }
    return Result::Ok();
}

WorkDirectory::WorkDirectory(WorkDirectory&& other) noexcept : dir_(std::move(other.dir_)) {
    other.dir_.clear();
}

WorkDirectory& WorkDirectory::operator=(WorkDirectory&& other) noexcept {
    if (this == &other)
        return *this;
    Cleanup();
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    return *this;
}

WorkDirectory::~WorkDirectory() { Cleanup(); }

std::string WorkDirectory::ExtractDir() const { return (fs::path(dir_) / "extract").string(); }

std::string WorkDirectory::MergedDir() const { return (fs::path(dir_) / "merged").string(); }

Result WorkDirectory::PrepareExtractDir() const {
    auto res = DiscardExtractDir();
    if (!res.is_ok()) return res;

    std::error_code ec;
    fs::create_directory(ExtractDir(), ec);
    if (ec) return Result::Fail(ec.value(), "cannot create " + ExtractDir() + ": " + ec.message());
    return Result::Ok();
}

Result WorkDirectory::DiscardExtractDir() const {
    if (dir_.empty()) return Result::Fail(-1, "work directory not created");

    std::error_code ec;
    fs::remove_all(ExtractDir(), ec);
    if (ec) return Result::Fail(ec.value(), "cannot remove " + ExtractDir() + ": " + ec.message());
    return Result::Ok();
}

Result WorkDirectory::Remove() {
    if (dir_.empty()) return Result::Ok();

    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) return Result::Fail(ec.value(), "cannot remove " + dir_ + ": " + ec.message());
    dir_.clear();
    return Result::Ok();
}

void WorkDirectory::Cleanup() {
    if (dir_.empty()) return;
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        LogWarn("could not remove work directory %s: %s", dir_.c_str(), ec.message().c_str());
    }
    dir_.clear();
}

} // namespace takeout
