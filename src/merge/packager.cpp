#include "merge/packager.hpp"

#include "crypto/sha256.hpp"
#include "io/fd_writer.hpp"
#include "io/temp_file.hpp"
#include "merge/archive_stream_adapter.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace takeout {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

Result Fail(const std::string& what) {
    return Result::Fail(ErrorKind::PackagingFailure, "Failed to create archive: " + what);
}

Result Interrupted() {
    return Result::Fail(ErrorKind::Cancelled, "interrupted while creating archive");
}

// Fills sparse holes with zeros; pax_restricted has no sparse entries.
Result WriteZeros(archive* aw, std::uint64_t count) {
    static const std::vector<char> kZeros(64 * 1024, 0);
    while (count > 0) {
        const size_t n = static_cast<size_t>(std::min<std::uint64_t>(count, kZeros.size()));
        if (archive_write_data(aw, kZeros.data(), n) < 0) {
            return Fail("archive_write_data: " + ArchiveErr(aw));
        }
        count -= n;
    }
    return Result::Ok();
}

std::string StripTrailingSlashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

} // namespace

XzCapabilities ProbeXzSupport() {
    XzCapabilities caps;

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) {
        caps.detail = "archive_write_new failed";
        return caps;
    }

    const int r = archive_write_add_filter_xz(aw.get());
    if (r < ARCHIVE_WARN) {
        caps.detail = ArchiveErr(aw.get());
        return caps;
    }
    caps.available = true;
    if (r == ARCHIVE_WARN) {
        // libarchive without liblzma falls back to an external `xz`.
        caps.detail = ArchiveErr(aw.get());
    }
    caps.threads = archive_write_set_filter_option(aw.get(), "xz", "threads", "0") == ARCHIVE_OK;
    return caps;
}

Result TarXzPackager::CheckAvailable() const {
    const XzCapabilities caps = ProbeXzSupport();
    if (!caps.available) {
        return Result::Fail(ErrorKind::MissingDependency,
                            "xz compression is not available (" + caps.detail + ")");
    }
    if (!caps.detail.empty()) {
        LogWarn("xz: %s", caps.detail.c_str());
    }
    if (opt_.threads != 1 && !caps.threads) {
        LogWarn("xz encoder does not support threads; compressing on one core");
    }
    return Result::Ok();
}

Result TarXzPackager::Package(const PackageRequest& req, ArtifactInfo& out) const {
    out = ArtifactInfo{};
    const std::string& final_path = req.final_path;

    const fs::path final_fs(final_path);
    const std::string out_dir =
        final_fs.has_parent_path() ? final_fs.parent_path().string() : std::string(".");
    const std::string artifact_name = final_fs.filename().string();

    std::error_code ec;
    const bool replacing = fs::exists(final_fs, ec);

    TempFile tmp;
    auto tmp_res = TempFile::CreateIn(out_dir, "." + artifact_name + ".part", tmp);
    if (!tmp_res.is_ok()) return Fail(tmp_res.msg);
    LogDebug("writing %s", tmp.Path().c_str());

    FdWriter writer(tmp.GetFd());
    Sha256Hasher hasher;
    WriterBridge bridge(writer);
    bridge.on_chunk = [&hasher](std::span<const std::uint8_t> chunk) { hasher.Update(chunk); };

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) return Fail("archive_write_new failed");

    if (archive_write_set_format_pax_restricted(aw.get()) != ARCHIVE_OK) {
        return Fail("pax format: " + ArchiveErr(aw.get()));
    }
    if (archive_write_add_filter_xz(aw.get()) < ARCHIVE_WARN) {
        return Result::Fail(ErrorKind::MissingDependency,
                            "xz compression is not available (" + ArchiveErr(aw.get()) + ")");
    }

    const std::string level = std::to_string(opt_.compression_level);
    if (archive_write_set_filter_option(aw.get(), "xz", "compression-level", level.c_str()) !=
        ARCHIVE_OK) {
        return Fail("xz compression-level=" + level + ": " + ArchiveErr(aw.get()));
    }
    const std::string threads = std::to_string(opt_.threads);
    if (archive_write_set_filter_option(aw.get(), "xz", "threads", threads.c_str()) != ARCHIVE_OK) {
        LogDebug("xz threads=%s rejected: %s", threads.c_str(), ArchiveErr(aw.get()).c_str());
    }
    LogInfo("Using xz compression: level %d, %s",
            opt_.compression_level,
            opt_.threads == 0 ? "all CPU cores" : (threads + " thread(s)").c_str());

    if (OpenArchiveToWriter(aw.get(), bridge) != ARCHIVE_OK) {
        return Fail("open output: " + ArchiveErr(aw.get()));
    }

    std::unique_ptr<archive, ArchiveReadDeleter> disk(archive_read_disk_new());
    if (!disk) return Fail("archive_read_disk_new failed");
    archive_read_disk_set_standard_lookup(disk.get());
    archive_read_disk_set_symlink_physical(disk.get());

    const std::string root = StripTrailingSlashes(req.src_dir);
    if (archive_read_disk_open(disk.get(), root.c_str()) != ARCHIVE_OK) {
        return Fail("cannot read " + root + ": " + ArchiveErr(disk.get()));
    }

    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    if (!entry) return Fail("archive_entry_new failed");

    std::uint64_t done_bytes = 0;
    auto emit_progress = [&]() {
        if (!req.progress_sink) return;
        ProgressEvent event{};
        event.stage = artifact_name;
        event.stage_done = done_bytes;
        event.stage_total = req.src_bytes;
        event.overall_done = done_bytes;
        event.overall_total = req.src_bytes;
        req.progress_sink->OnProgress(event);
    };

    while (true) {
        if (CancelRequested()) return Interrupted();

        const int r = archive_read_next_header2(disk.get(), entry.get());
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("%s", ArchiveErr(disk.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return Fail("archive_read_next_header2: " + ArchiveErr(disk.get()));
        }
        (void)archive_read_disk_descend(disk.get());

        std::string rel = archive_entry_pathname(entry.get());
        if (HasPrefix(rel, root)) rel.erase(0, root.size());
        while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
        if (rel.empty()) continue;  // the merged root itself
        archive_entry_set_pathname(entry.get(), rel.c_str());

        const int wh = archive_write_header(aw.get(), entry.get());
        if (wh == ARCHIVE_WARN) {
            LogWarn("%s: %s", rel.c_str(), ArchiveErr(aw.get()).c_str());
        } else if (wh != ARCHIVE_OK) {
            return Fail("archive_write_header " + rel + ": " + ArchiveErr(aw.get()));
        }

        if (archive_entry_filetype(entry.get()) != AE_IFREG || archive_entry_size(entry.get()) <= 0) {
            continue;
        }

        const auto declared = static_cast<std::uint64_t>(archive_entry_size(entry.get()));
        std::uint64_t written = 0;
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rr = archive_read_data_block(disk.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr < ARCHIVE_WARN) {
                if (CancelRequested()) return Interrupted();
                return Fail("read " + rel + ": " + ArchiveErr(disk.get()));
            }
            const auto at = static_cast<std::uint64_t>(offset);
            if (at > written) {
                auto zr = WriteZeros(aw.get(), at - written);
                if (!zr.is_ok()) return zr;
                written = at;
            }
            if (size > 0 && archive_write_data(aw.get(), buff, size) < 0) {
                if (CancelRequested()) return Interrupted();
                return Fail("archive_write_data " + rel + ": " + ArchiveErr(aw.get()));
            }
            written += size;
            done_bytes += size;
            emit_progress();
        }
        if (written < declared) {
            auto zr = WriteZeros(aw.get(), declared - written);
            if (!zr.is_ok()) return zr;
        }
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        if (CancelRequested()) return Interrupted();
        return Fail("finishing xz stream: " + ArchiveErr(aw.get()));
    }
    (void)archive_read_close(disk.get());

    if (replacing) {
        LogWarn("Replacing existing file %s", final_path.c_str());
    }
    auto commit = tmp.CommitTo(final_path);
    if (!commit.is_ok()) return Fail(commit.msg);

    out.path = final_path;
    out.size_bytes = writer.BytesWritten();
    out.sha256 = hasher.FinalHex();
    return Result::Ok();
}

Result WriteChecksumFile(const ArtifactInfo& artifact, std::string& out_path) {
    if (artifact.sha256.empty()) {
        return Result::Fail(ErrorKind::PackagingFailure, "no digest for " + artifact.path);
    }

    const fs::path artifact_fs(artifact.path);
    const std::string dir =
        artifact_fs.has_parent_path() ? artifact_fs.parent_path().string() : std::string(".");
    out_path = artifact.path + ".sha256";

    TempFile tmp;
    auto tr = TempFile::CreateIn(dir, "." + artifact_fs.filename().string() + ".sha256.part", tmp);
    if (!tr.is_ok()) return tr.As(ErrorKind::PackagingFailure);

    const std::string line = artifact.sha256 + "  " + artifact_fs.filename().string() + "\n";
    FdWriter writer(tmp.GetFd());
    auto wr = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(line.data()), line.size()));
    if (!wr.is_ok()) return wr.As(ErrorKind::PackagingFailure);

    return tmp.CommitTo(out_path).As(ErrorKind::PackagingFailure);
}

} // namespace takeout
