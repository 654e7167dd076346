#include "merge/archive_extractor.hpp"

#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "merge/archive_stream_adapter.hpp"
#include "merge/entry_path_policy.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <functional>
#include <memory>

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

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;
using ArchiveWritePtr = std::unique_ptr<archive, ArchiveWriteDeleter>;

Result Fail(const ArchiveRef& ref, const std::string& what) {
    return Result::Fail(ErrorKind::ExtractionFailure,
                        "Failed to extract " + ref.file_name + ": " + what);
}

Result Fail(const ArchiveRef& ref, const Result& inner) {
    if (inner.kind == ErrorKind::Cancelled) return inner;
    return Fail(ref, inner.msg);
}

Result Interrupted(const ArchiveRef& ref) {
    return Result::Fail(ErrorKind::Cancelled, "interrupted while extracting " + ref.file_name);
}

// Drains every entry of an opened read handle onto disk below `base_dir`.
// `consumed` reports how many archive bytes have been read so far.
Result CopyEntriesToDisk(archive* ar,
                         const ArchiveRef& ref,
                         const fs::path& base_dir,
                         const IArchiveExtractor::Options& opt,
                         const std::function<std::uint64_t()>& consumed,
                         ExtractStats& stats) {
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Fail(ref, "destination is not a directory: " + base_dir.string());
    }

    ArchiveWritePtr aw(archive_write_disk_new());
    if (!aw) return Fail(ref, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under base_dir, so
    // NOABSOLUTEPATHS would reject every valid target.
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    const EntryPathPolicy path_policy(opt.safe_paths_only);
    const std::string tag = ref.file_name;

    auto emit_progress = [&]() {
        if (!opt.progress_sink) return;
        stats.compressed_bytes = consumed();
        ProgressEvent event{};
        event.stage = tag;
        event.stage_done = stats.compressed_bytes;
        event.stage_total = ref.size_bytes;
        event.overall_done = opt.overall_done_base_bytes + stats.compressed_bytes;
        event.overall_total = opt.overall_total_bytes;
        opt.progress_sink->OnProgress(event);
    };

    archive_entry* entry = nullptr;
    while (true) {
        if (CancelRequested()) return Interrupted(ref);

        const int r = archive_read_next_header(ar, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("%s: %s", tag.c_str(), ArchiveErr(ar).c_str());
        } else if (r != ARCHIVE_OK) {
            if (CancelRequested()) return Interrupted(ref);
            return Fail(ref, "archive_read_next_header: " + ArchiveErr(ar));
        }

        std::string rel;
        auto path_res = path_policy.Normalize(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return Fail(ref, path_res);
        if (rel.empty()) {
            (void)archive_read_data_skip(ar);
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlink(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return Fail(ref, hl_res);
        if (!rel_hl.empty()) {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("[%s] entry: %s", tag.c_str(), rel.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh == ARCHIVE_WARN) {
            LogWarn("%s: %s: %s", tag.c_str(), rel.c_str(), ArchiveErr(aw.get()).c_str());
        } else if (wh != ARCHIVE_OK) {
            return Fail(ref, "archive_write_header " + rel + ": " + ArchiveErr(aw.get()));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar, &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK && rr != ARCHIVE_WARN) {
                if (CancelRequested()) return Interrupted(ref);
                return Fail(ref, "archive_read_data_block " + rel + ": " + ArchiveErr(ar));
            }

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww < ARCHIVE_WARN) {
                return Fail(ref, "archive_write_data_block " + rel + ": " + ArchiveErr(aw.get()));
            }

            stats.bytes_written += static_cast<std::uint64_t>(size);
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf < ARCHIVE_WARN) {
            return Fail(ref, "archive_write_finish_entry " + rel + ": " + ArchiveErr(aw.get()));
        }
        ++stats.entries;
        emit_progress();
    }

    // Directory timestamps and permissions are applied on close.
    if (archive_write_close(aw.get()) < ARCHIVE_WARN) {
        return Fail(ref, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    stats.compressed_bytes = consumed();
    if (opt.progress_sink && ref.size_bytes > 0) {
        ProgressEvent event{};
        event.stage = tag;
        event.stage_done = ref.size_bytes;
        event.stage_total = ref.size_bytes;
        event.overall_done = opt.overall_done_base_bytes + ref.size_bytes;
        event.overall_total = opt.overall_total_bytes;
        opt.progress_sink->OnProgress(event);
    }
    return Result::Ok();
}

} // namespace

Result ZipExtractor::Extract(const ArchiveRef& archive,
                             const std::string& dst_dir,
                             const Options& opt,
                             ExtractStats& stats) const {
    stats = ExtractStats{};

    ArchiveReadPtr ar(archive_read_new());
    if (!ar) return Fail(archive, "archive_read_new failed");

    archive_read_support_format_zip(ar.get());

    if (archive_read_open_filename(ar.get(), archive.path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Fail(archive, "cannot open: " + ArchiveErr(ar.get()));
    }

    struct archive* raw = ar.get();
    auto consumed = [raw]() -> std::uint64_t {
        const la_int64_t n = archive_filter_bytes(raw, -1);
        return n > 0 ? static_cast<std::uint64_t>(n) : 0;
    };
    return CopyEntriesToDisk(raw, archive, fs::path(dst_dir), opt, consumed, stats);
}

Result TarGzExtractor::Extract(const ArchiveRef& archive,
                               const std::string& dst_dir,
                               const Options& opt,
                               ExtractStats& stats) const {
    stats = ExtractStats{};

    auto file = std::make_unique<FileReader>();
    auto open_result = FileReader::Open(archive.path, *file);
    if (!open_result.is_ok()) return Fail(archive, open_result);

    // Owned by the gzip layer below; only read for progress.
    const FileReader* source = file.get();
    std::unique_ptr<IReader> gz;
    try {
        gz = std::make_unique<GzipReader>(std::move(file));
    } catch (const std::exception& e) {
        return Fail(archive, std::string("gzip init failed: ") + e.what());
    }

    ReaderBridge bridge(*gz);
    ArchiveReadPtr ar(archive_read_new());
    if (!ar) return Fail(archive, "archive_read_new failed");

    archive_read_support_format_tar(ar.get());

    if (OpenArchiveFromReader(ar.get(), bridge) != ARCHIVE_OK) {
        return Fail(archive, "not a gzip-compressed tar archive: " + ArchiveErr(ar.get()));
    }

    auto consumed = [source]() { return source->Position(); };
    return CopyEntriesToDisk(ar.get(), archive, fs::path(dst_dir), opt, consumed, stats);
}

ExtractorSet::ExtractorSet() : extractors_(CreateDefaultExtractors()) {}

ExtractorSet::ExtractorSet(std::vector<std::unique_ptr<IArchiveExtractor>> extractors)
    : extractors_(std::move(extractors)) {}

bool ExtractorSet::Supports(ArchiveKind kind) const {
    for (const auto& extractor : extractors_) {
        if (extractor->Supports(kind)) return true;
    }
    return false;
}

Result ExtractorSet::Extract(const ArchiveRef& archive,
                             const std::string& dst_dir,
                             const Options& opt,
                             ExtractStats& stats) const {
    for (const auto& extractor : extractors_) {
        if (extractor->Supports(archive.kind)) {
            return extractor->Extract(archive, dst_dir, opt, stats);
        }
    }
    return Result::Fail(ErrorKind::ExtractionFailure,
                        std::string("no extractor for ") + ArchiveKindName(archive.kind) +
                            " archive " + archive.file_name);
}

std::vector<std::unique_ptr<IArchiveExtractor>> CreateDefaultExtractors() {
    std::vector<std::unique_ptr<IArchiveExtractor>> out;
    out.push_back(std::make_unique<ZipExtractor>());
    out.push_back(std::make_unique<TarGzExtractor>());
    return out;
}

} // namespace takeout
