#include "merge/tree_merger.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <filesystem>

namespace fs = std::filesystem;

namespace takeout {

namespace {

Result FsFail(const std::error_code& ec, const std::string& what, const fs::path& p) {
    return Result::Fail(ec.value(), what + " " + p.string() + ": " + ec.message());
}

Result Interrupted() {
    return Result::Fail(ErrorKind::Cancelled, "interrupted while merging");
}

bool IsCrossDevice(const std::error_code& ec) {
    return ec.value() == EXDEV;
}

// Tallies a subtree that is about to be moved in one rename.
Result TallySubtree(const fs::path& dir, MergeStats& stats) {
    std::error_code ec;
    ++stats.directories_created;
    fs::recursive_directory_iterator it(dir, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        const auto st = it->symlink_status(ec);
        if (ec) break;
        if (fs::is_directory(st)) {
            ++stats.directories_created;
        } else if (fs::is_symlink(st)) {
            ++stats.symlinks;
        } else if (fs::is_regular_file(st)) {
            ++stats.files_added;
        }
    }
    if (ec) return FsFail(ec, "cannot walk", dir);
    return Result::Ok();
}

class OverlayWalker {
  public:
    OverlayWalker(MergeMode mode, MergeStats& stats) : mode_(mode), stats_(stats) {}

    Result MergeDir(const fs::path& src, const fs::path& dst) {
        std::error_code ec;
        const auto src_perms = fs::status(src, ec).permissions();
        if (ec) return FsFail(ec, "cannot stat", src);
        // Captured first: moving children out changes the source's mtime.
        const auto src_mtime = fs::last_write_time(src, ec);
        if (ec) return FsFail(ec, "cannot stat", src);

        fs::directory_iterator it(src, ec);
        for (const fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
            if (CancelRequested()) return Interrupted();

            const fs::path s = it->path();
            const fs::path d = dst / s.filename();
            const auto st = it->symlink_status(ec);
            if (ec) return FsFail(ec, "cannot stat", s);

            auto res = MergeEntry(s, st, d);
            if (!res.is_ok()) return res;
        }
        if (ec) return FsFail(ec, "cannot list", src);

        // Directory metadata follows the source, like `rsync -a`.
        fs::permissions(dst, src_perms, ec);
        if (ec) LogWarn("cannot set permissions on %s: %s", dst.c_str(), ec.message().c_str());
        fs::last_write_time(dst, src_mtime, ec);
        if (ec) LogWarn("cannot set mtime on %s: %s", dst.c_str(), ec.message().c_str());
        return Result::Ok();
    }

  private:
    Result MergeEntry(const fs::path& s, const fs::file_status& st, const fs::path& d) {
        std::error_code ec;
        fs::file_status dt = fs::symlink_status(d, ec);
        if (ec && dt.type() != fs::file_type::not_found) return FsFail(ec, "cannot stat", d);
        const bool existed = fs::exists(dt);

        if (fs::is_directory(st)) {
            if (existed && !fs::is_directory(dt)) {
                fs::remove(d, ec);
                if (ec) return FsFail(ec, "cannot replace", d);
                ++stats_.files_replaced;
                dt = fs::file_status(fs::file_type::not_found);
            }
            if (!fs::exists(dt)) {
                if (mode_ == MergeMode::Move) {
                    auto tally = TallySubtree(s, stats_);
                    if (!tally.is_ok()) return tally;
                    fs::rename(s, d, ec);
                    if (!ec) return Result::Ok();
                    if (!IsCrossDevice(ec)) return FsFail(ec, "cannot move", s);
                    // Counted already; the copy below must not count twice.
                    MergeStats discard;
                    OverlayWalker copier(MergeMode::Copy, discard);
                    fs::create_directory(d, ec);
                    if (ec) return FsFail(ec, "cannot create", d);
                    return copier.MergeDir(s, d);
                }
                fs::create_directory(d, ec);
                if (ec) return FsFail(ec, "cannot create", d);
                ++stats_.directories_created;
            }
            return MergeDir(s, d);
        }

        if (!fs::is_regular_file(st) && !fs::is_symlink(st)) {
            LogWarn("skipping non-regular file \"%s\"", s.c_str());
            ++stats_.skipped_special;
            return Result::Ok();
        }

        // rename() and copy_file() overwrite plain files in place; anything
        // else at the destination is removed first.
        if (existed && (fs::is_directory(dt) || fs::is_symlink(dt) || fs::is_symlink(st))) {
            fs::remove_all(d, ec);
            if (ec) return FsFail(ec, "cannot replace", d);
        }

        if (fs::is_symlink(st)) {
            auto res = TransferSymlink(s, d);
            if (!res.is_ok()) return res;
            ++stats_.symlinks;
            return Result::Ok();
        }

        auto res = TransferFile(s, d);
        if (!res.is_ok()) return res;
        if (existed) {
            ++stats_.files_replaced;
        } else {
            ++stats_.files_added;
        }
        return Result::Ok();
    }

    Result TransferFile(const fs::path& s, const fs::path& d) {
        std::error_code ec;
        if (mode_ == MergeMode::Move) {
            fs::rename(s, d, ec);
            if (!ec) return Result::Ok();
            if (!IsCrossDevice(ec)) return FsFail(ec, "cannot move", s);
            ec.clear();
        }

        fs::copy_file(s, d, fs::copy_options::overwrite_existing, ec);
        if (ec) return FsFail(ec, "cannot copy", s);
        const auto mtime = fs::last_write_time(s, ec);
        if (!ec) fs::last_write_time(d, mtime, ec);
        if (ec) LogWarn("cannot preserve mtime of %s: %s", d.c_str(), ec.message().c_str());
        return Result::Ok();
    }

    Result TransferSymlink(const fs::path& s, const fs::path& d) {
        std::error_code ec;
        if (mode_ == MergeMode::Move) {
            fs::rename(s, d, ec);
            if (!ec) return Result::Ok();
            if (!IsCrossDevice(ec)) return FsFail(ec, "cannot move", s);
            ec.clear();
        }
        fs::copy_symlink(s, d, ec);
        if (ec) return FsFail(ec, "cannot copy symlink", s);
        return Result::Ok();
    }

    MergeMode mode_;
    MergeStats& stats_;
};

} // namespace

Result OverlayTreeMerger::Merge(const std::string& src_dir,
                                const std::string& dst_dir,
                                MergeStats& stats) const {
    stats = MergeStats{};

    std::error_code ec;
    if (!fs::is_directory(src_dir, ec)) {
        return Result::Fail(ec ? ec.value() : ENOTDIR, "merge source is not a directory: " + src_dir);
    }
    fs::create_directories(dst_dir, ec);
    if (ec) return FsFail(ec, "cannot create", dst_dir);

    OverlayWalker walker(mode_, stats);
    return walker.MergeDir(fs::path(src_dir), fs::path(dst_dir));
}

std::string SelectMergeSource(const std::string& extract_root, std::string_view wrapper_name) {
    if (wrapper_name.empty()) return extract_root;

    std::error_code ec;
    fs::directory_iterator it(extract_root, ec);
    if (ec) return extract_root;

    int count = 0;
    bool wrapper_found = false;
    for (const fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (++count > 1) return extract_root;
        std::error_code st_ec;
        wrapper_found = it->path().filename().string() == wrapper_name &&
                        fs::is_directory(it->symlink_status(st_ec)) && !st_ec;
    }
    if (ec || !wrapper_found) return extract_root;
    return (fs::path(extract_root) / std::string(wrapper_name)).string();
}

Result CountRegularFiles(const std::string& dir, TreeCount& out) {
    out = TreeCount{};

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (CancelRequested()) return Interrupted();
        const auto st = it->symlink_status(ec);
        if (ec) break;
        if (!fs::is_regular_file(st)) continue;
        ++out.files;
        const auto size = it->file_size(ec);
        if (ec) break;
        out.bytes += static_cast<std::uint64_t>(size);
    }
    if (ec) return FsFail(ec, "cannot walk", dir);
    return Result::Ok();
}

} // namespace takeout
